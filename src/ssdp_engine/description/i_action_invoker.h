/**
 * @file i_action_invoker.h
 * @brief SOAP action capability applications use after a device is reported.
 */
#ifndef SSDPTRACK_DESCRIPTION_I_ACTION_INVOKER_H
#define SSDPTRACK_DESCRIPTION_I_ACTION_INVOKER_H

#include "../tracker/ssdp_device.h"

#include <map>
#include <string>

namespace ssdptrack {
namespace ssdp {

class IActionInvoker {
public:
    using Arguments = std::map<std::string, std::string>;

    virtual ~IActionInvoker() = default;

    /**
     * @brief Invokes `action_name` of service `service_type` on `device`.
     * @return The action's out arguments.
     */
    virtual Arguments call_action(const SsdpDevice& device,
                                  const std::string& service_type,
                                  const std::string& action_name,
                                  const Arguments& args) = 0;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_DESCRIPTION_I_ACTION_INVOKER_H
