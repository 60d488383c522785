/**
 * @file i_upnp_requester.h
 * @brief HTTP requester consumed by the description layer.
 * @details Applications inject their own HTTP client. Implementations report
 *          transport failures by throwing a `std::exception`; HTTP error statuses are
 *          returned, not thrown.
 */
#ifndef SSDPTRACK_DESCRIPTION_I_UPNP_REQUESTER_H
#define SSDPTRACK_DESCRIPTION_I_UPNP_REQUESTER_H

#include <map>
#include <string>

namespace ssdptrack {
namespace ssdp {

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
};

class IUpnpRequester {
public:
    virtual ~IUpnpRequester() = default;

    virtual HttpResponse http_request(const std::string& method,
                                      const std::string& url,
                                      const std::map<std::string, std::string>& headers = {},
                                      const std::string& body = "") = 0;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_DESCRIPTION_I_UPNP_REQUESTER_H
