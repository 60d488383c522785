#include "ssdp_device.h"

#include <algorithm>

namespace ssdptrack {
namespace ssdp {

SsdpDevice::SsdpDevice(std::string udn, TimePoint valid_to)
    : udn_(std::move(udn)),
      valid_to_(valid_to) {}

std::optional<std::string> SsdpDevice::location() const {
    if (locations_.empty()) {
        return std::nullopt;
    }
    return locations_.front().url;
}

bool SsdpDevice::has_location(const std::string& url) const {
    return std::any_of(locations_.begin(), locations_.end(),
                       [&url](const DeviceLocation& location) { return location.url == url; });
}

void SsdpDevice::add_location(const std::string& url, TimePoint valid_to) {
    locations_.erase(std::remove_if(locations_.begin(), locations_.end(),
                                    [&url](const DeviceLocation& location) { return location.url == url; }),
                     locations_.end());
    locations_.insert(locations_.begin(), DeviceLocation{url, valid_to});
}

void SsdpDevice::purge_locations(TimePoint now) {
    locations_.erase(std::remove_if(locations_.begin(), locations_.end(),
                                    [now](const DeviceLocation& location) { return now > location.valid_to; }),
                     locations_.end());
}

SsdpHeaders SsdpDevice::combined_headers(const std::string& type) const {
    SsdpHeaders combined;
    auto search_it = search_headers_.find(type);
    if (search_it != search_headers_.end()) {
        combined.update(search_it->second);
    }
    auto advertisement_it = advertisement_headers_.find(type);
    if (advertisement_it != advertisement_headers_.end()) {
        combined.update(advertisement_it->second);
    }
    combined.erase("_source");
    return combined;
}

std::map<std::string, SsdpHeaders> SsdpDevice::all_combined_headers() const {
    std::map<std::string, SsdpHeaders> all;
    for (const auto& entry : search_headers_) {
        all[entry.first] = combined_headers(entry.first);
    }
    for (const auto& entry : advertisement_headers_) {
        if (all.count(entry.first) == 0) {
            all[entry.first] = combined_headers(entry.first);
        }
    }
    return all;
}

} // namespace ssdp
} // namespace ssdptrack
