/**
 * @file description_cache.h
 * @brief Fetch-once cache of device description documents, keyed by location.
 */
#ifndef SSDPTRACK_DESCRIPTION_DESCRIPTION_CACHE_H
#define SSDPTRACK_DESCRIPTION_DESCRIPTION_CACHE_H

#include "i_upnp_requester.h"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ssdptrack {
namespace ssdp {

/**
 * @class DescriptionCache
 * @brief Downloads a description once per location and remembers the result.
 * @details Failed downloads are remembered too, so an unreachable device is not
 *          asked again until `uncache_description()`. Concurrent callers asking for
 *          the same location share one download. An exception that is not a
 *          `std::exception` reaches every waiting caller and is not cached.
 */
class DescriptionCache {
public:
    explicit DescriptionCache(std::shared_ptr<IUpnpRequester> requester);

    /** @brief Description XML for `location`, or std::nullopt if it could not be fetched. */
    std::optional<std::string> get_description_xml(const std::string& location);

    void uncache_description(const std::string& location);

    bool is_cached(const std::string& location) const;

private:
    std::optional<std::string> fetch_description(const std::string& location);

    std::string logger_prefix_;
    std::shared_ptr<IUpnpRequester> requester_;
    mutable std::mutex cache_mutex_;
    std::map<std::string, std::shared_future<std::optional<std::string>>> cache_;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_DESCRIPTION_DESCRIPTION_CACHE_H
