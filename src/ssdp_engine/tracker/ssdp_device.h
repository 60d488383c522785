/**
 * @file ssdp_device.h
 * @brief One UPnP root device as seen on the network.
 */
#ifndef SSDPTRACK_TRACKER_SSDP_DEVICE_H
#define SSDPTRACK_TRACKER_SSDP_DEVICE_H

#include "../protocol/ssdp_headers.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ssdptrack {
namespace ssdp {

struct DeviceLocation {
    std::string url;
    TimePoint valid_to;
};

/**
 * @class SsdpDevice
 * @brief Identity, locations and per-type header snapshots of a tracked device.
 * @details Header snapshots are kept separately for search responses and
 *          advertisements, keyed by device-or-service type (ST or NT). Each
 *          location expires on its own.
 */
class SsdpDevice {
public:
    using HeadersByType = std::map<std::string, SsdpHeaders>;

    SsdpDevice(std::string udn, TimePoint valid_to);

    const std::string& udn() const { return udn_; }

    TimePoint valid_to() const { return valid_to_; }
    void set_valid_to(TimePoint valid_to) { valid_to_ = valid_to; }

    std::optional<TimePoint> last_seen() const { return last_seen_; }
    void set_last_seen(TimePoint last_seen) { last_seen_ = last_seen; }

    /**
     * @brief The most recently seen location, if any.
     * @details Expired locations are only dropped by `purge_locations()`, which the
     *          tracker runs on every sighting.
     */
    std::optional<std::string> location() const;

    /** @brief Known locations, most recently seen first. */
    const std::vector<DeviceLocation>& locations() const { return locations_; }

    bool has_location(const std::string& url) const;

    /** @brief Adds `url` or refreshes its expiry, moving it to the front. */
    void add_location(const std::string& url, TimePoint valid_to);

    /** @brief Drops every location whose expiry lies before `now`. */
    void purge_locations(TimePoint now);

    HeadersByType& search_headers() { return search_headers_; }
    const HeadersByType& search_headers() const { return search_headers_; }
    HeadersByType& advertisement_headers() { return advertisement_headers_; }
    const HeadersByType& advertisement_headers() const { return advertisement_headers_; }

    /**
     * @brief Search and advertisement headers for `type` merged.
     * @details Advertisement values win over search values; `_source` is removed.
     */
    SsdpHeaders combined_headers(const std::string& type) const;

    /** @brief `combined_headers()` for every type seen through either channel. */
    std::map<std::string, SsdpHeaders> all_combined_headers() const;

private:
    std::string udn_;
    TimePoint valid_to_;
    std::optional<TimePoint> last_seen_;
    std::vector<DeviceLocation> locations_;
    HeadersByType search_headers_;
    HeadersByType advertisement_headers_;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_TRACKER_SSDP_DEVICE_H
