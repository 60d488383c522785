#include "device_tracker.h"

#include "../protocol/ssdp_codec.h"
#include "../net/address.h"
#include "../utils/cpp_logger.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace ssdptrack {
namespace ssdp {

namespace {

const char* const kIgnoredHeaders[] = {"date", "cache-control", "server", "location"};

bool is_ignored_header(const std::string& key) {
    const std::string lowered = lowercase_copy(key);
    for (const char* ignored : kIgnoredHeaders) {
        if (lowered == ignored) {
            return true;
        }
    }
    return false;
}

std::string format_time(TimePoint time) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    return std::to_string(seconds);
}

} // namespace

bool is_valid_location(const std::string& location) {
    return location.rfind("http", 0) == 0 &&
           location.find("://127.0.0.1") == std::string::npos &&
           location.find("://[::1]") == std::string::npos &&
           location.find("://169.254") == std::string::npos;
}

bool valid_search_headers(const SsdpHeaders& headers) {
    return headers.contains("_udn") &&
           headers.contains("st") &&
           is_valid_location(headers.get_or("location", ""));
}

bool valid_advertisement_headers(const SsdpHeaders& headers) {
    return headers.contains("_udn") &&
           headers.contains("nt") &&
           headers.contains("nts") &&
           is_valid_location(headers.get_or("location", ""));
}

bool valid_byebye_headers(const SsdpHeaders& headers) {
    return headers.contains("_udn") &&
           headers.contains("nt") &&
           headers.contains("nts");
}

std::optional<int> extract_max_age(const SsdpHeaders& headers) {
    const std::string cache_control = lowercase_copy(headers.get_or("cache-control", ""));
    std::size_t pos = cache_control.find("max-age");
    while (pos != std::string::npos) {
        std::size_t cursor = pos + std::string("max-age").size();
        while (cursor < cache_control.size() && std::isspace(static_cast<unsigned char>(cache_control[cursor]))) {
            ++cursor;
        }
        if (cursor < cache_control.size() && cache_control[cursor] == '=') {
            ++cursor;
            while (cursor < cache_control.size() && std::isspace(static_cast<unsigned char>(cache_control[cursor]))) {
                ++cursor;
            }
            const char* digits = cache_control.c_str() + cursor;
            char* end_ptr = nullptr;
            if (std::isdigit(static_cast<unsigned char>(*digits))) {
                errno = 0;
                const long parsed = std::strtol(digits, &end_ptr, 10);
                if (errno == ERANGE || parsed > std::numeric_limits<int>::max()) {
                    LOG_CPP_DEBUG("[SsdpDeviceTracker] Out of range max-age in '%s', using default", cache_control.c_str());
                    return std::nullopt;
                }
                if (end_ptr != digits && parsed >= 0) {
                    return static_cast<int>(parsed);
                }
            }
        }
        pos = cache_control.find("max-age", pos + 1);
    }
    return std::nullopt;
}

bool same_headers_differ(const SsdpHeaders& current, const SsdpHeaders& incoming) {
    for (const auto& entry : current) {
        if (is_internal_header(entry.first) || is_ignored_header(entry.first)) {
            continue;
        }
        auto incoming_value = incoming.get(entry.first);
        if (!incoming_value) {
            continue;
        }
        if (*incoming_value != entry.second) {
            LOG_CPP_DEBUG("[SsdpDeviceTracker] Header %s changed: '%s' -> '%s'", entry.first.c_str(),
                          entry.second.c_str(), incoming_value->c_str());
            return true;
        }
    }
    return false;
}

bool headers_differ_from_existing(const SsdpDevice::HeadersByType& snapshots,
                                  const std::string& type,
                                  const SsdpHeaders& incoming) {
    auto it = snapshots.find(type);
    if (it == snapshots.end()) {
        return false;
    }
    return same_headers_differ(it->second, incoming);
}

SsdpDeviceTracker::SsdpDeviceTracker(SsdpEngineSettings settings, Clock clock)
    : logger_prefix_("[SsdpDeviceTracker]"),
      settings_(sanitize_settings(std::move(settings))),
      clock_(clock ? std::move(clock) : Clock([]() { return std::chrono::system_clock::now(); })) {}

TrackerResult SsdpDeviceTracker::see_search(const SsdpHeaders& headers) {
    TrackerResult result;
    if (!valid_search_headers(headers)) {
        LOG_CPP_DEBUG("%s Ignoring invalid search headers from %s", logger_prefix_.c_str(),
                      headers.get_or("_host", "?").c_str());
        return result;
    }

    Sighting sighting = see_device(headers);
    if (!sighting.device) {
        return result;
    }
    SsdpDevice& device = *sighting.device;

    const std::string search_target = headers.get_or("st", "");
    const bool is_new_service = device.search_headers().count(search_target) == 0 &&
                                device.advertisement_headers().count(search_target) == 0;
    const bool changed = sighting.is_new_device ||
                         is_new_service ||
                         headers_differ_from_existing(device.search_headers(), search_target, headers) ||
                         headers_differ_from_existing(device.advertisement_headers(), search_target, headers) ||
                         sighting.location_changed;

    // Merged, not replaced: fields absent from this response keep their last value.
    device.search_headers()[search_target].update(headers);

    result.propagate = true;
    result.device = sighting.device;
    result.device_or_service_type = search_target;
    result.source = changed ? SsdpSource::SEARCH_CHANGED : SsdpSource::SEARCH_ALIVE;
    LOG_CPP_DEBUG("%s Search %s for %s (%s)", logger_prefix_.c_str(), to_string(*result.source),
                  device.udn().c_str(), search_target.c_str());
    return result;
}

TrackerResult SsdpDeviceTracker::see_advertisement(const SsdpHeaders& headers) {
    TrackerResult result;
    if (!valid_advertisement_headers(headers)) {
        LOG_CPP_DEBUG("%s Ignoring invalid advertisement headers from %s", logger_prefix_.c_str(),
                      headers.get_or("_host", "?").c_str());
        return result;
    }

    Sighting sighting = see_device(headers);
    if (!sighting.device) {
        return result;
    }
    SsdpDevice& device = *sighting.device;

    const std::string notification_type = headers.get_or("nt", "");
    const auto sub_type = notification_sub_type_from_string(headers.get_or("nts", ""));
    const bool is_update = sub_type && *sub_type == NotificationSubType::UPDATE;
    const bool is_new_service = device.advertisement_headers().count(notification_type) == 0 &&
                                device.search_headers().count(notification_type) == 0;
    const bool propagate = is_update ||
                           sighting.is_new_device ||
                           is_new_service ||
                           headers_differ_from_existing(device.advertisement_headers(), notification_type, headers) ||
                           headers_differ_from_existing(device.search_headers(), notification_type, headers) ||
                           sighting.location_changed;

    device.advertisement_headers()[notification_type].update(headers);

    result.propagate = propagate;
    result.device = sighting.device;
    result.device_or_service_type = notification_type;
    result.source = is_update ? SsdpSource::ADVERTISEMENT_UPDATE : SsdpSource::ADVERTISEMENT_ALIVE;
    return result;
}

TrackerResult SsdpDeviceTracker::unsee_advertisement(const SsdpHeaders& headers) {
    TrackerResult result;
    if (!valid_byebye_headers(headers)) {
        LOG_CPP_DEBUG("%s Ignoring invalid byebye headers from %s", logger_prefix_.c_str(),
                      headers.get_or("_host", "?").c_str());
        return result;
    }

    const std::string udn = headers.get_or("_udn", "");
    auto it = devices_.find(udn);
    if (it == devices_.end()) {
        LOG_CPP_DEBUG("%s Byebye for unknown device %s", logger_prefix_.c_str(), udn.c_str());
        return result;
    }

    std::shared_ptr<SsdpDevice> device = it->second;
    devices_.erase(it);
    LOG_CPP_INFO("%s Device %s said byebye", logger_prefix_.c_str(), udn.c_str());

    const std::string notification_type = headers.get_or("nt", "");
    device->advertisement_headers()[notification_type].update(headers);

    result.propagate = true;
    result.device = device;
    result.device_or_service_type = notification_type;
    result.source = SsdpSource::ADVERTISEMENT_BYEBYE;
    return result;
}

std::shared_ptr<SsdpDevice> SsdpDeviceTracker::get_device(const SsdpHeaders& headers) const {
    auto udn = udn_from_headers(headers);
    if (!udn) {
        return nullptr;
    }
    auto it = devices_.find(*udn);
    return it == devices_.end() ? nullptr : it->second;
}

void SsdpDeviceTracker::purge_devices(std::optional<TimePoint> override_now) {
    const TimePoint now = override_now ? *override_now : clock_();
    if (next_valid_to_ && *next_valid_to_ > now) {
        return;
    }

    next_valid_to_.reset();
    for (auto it = devices_.begin(); it != devices_.end();) {
        SsdpDevice& device = *it->second;
        if (now > device.valid_to()) {
            LOG_CPP_INFO("%s Device %s expired", logger_prefix_.c_str(), device.udn().c_str());
            it = devices_.erase(it);
            continue;
        }

        device.purge_locations(now);
        if (device.locations().empty()) {
            LOG_CPP_INFO("%s Device %s has no valid locations left", logger_prefix_.c_str(), device.udn().c_str());
            it = devices_.erase(it);
            continue;
        }

        if (!next_valid_to_ || device.valid_to() < *next_valid_to_) {
            next_valid_to_ = device.valid_to();
        }
        ++it;
    }
}

SsdpDeviceTracker::Sighting SsdpDeviceTracker::see_device(const SsdpHeaders& headers) {
    Sighting sighting;

    const TimePoint now = clock_();
    purge_devices(now);

    auto udn = headers.get("_udn");
    if (!udn || udn->empty()) {
        return sighting;
    }

    const TimePoint valid_to = extract_valid_to(headers, now);
    auto it = devices_.find(*udn);
    if (it == devices_.end()) {
        auto device = std::make_shared<SsdpDevice>(*udn, valid_to);
        it = devices_.emplace(*udn, device).first;
        sighting.is_new_device = true;
        LOG_CPP_INFO("%s See new device %s, expires at %s", logger_prefix_.c_str(), udn->c_str(),
                     format_time(valid_to).c_str());
    } else {
        it->second->set_valid_to(valid_to);
    }

    SsdpDevice& device = *it->second;
    const std::string new_location = headers.get_or("location", "");
    sighting.location_changed = location_changed(device, new_location);
    if (!new_location.empty()) {
        device.add_location(new_location, valid_to);
    }

    auto timestamp = get_timestamp(headers);
    device.set_last_seen(timestamp ? *timestamp : now);

    if (!next_valid_to_ || *next_valid_to_ > device.valid_to()) {
        next_valid_to_ = device.valid_to();
    }

    sighting.device = it->second;
    return sighting;
}

bool SsdpDeviceTracker::location_changed(const SsdpDevice& device, const std::string& new_location) const {
    if (new_location.empty()) {
        return false;
    }
    if (device.locations().empty()) {
        return true;
    }
    if (device.has_location(new_location)) {
        return false;
    }

    const auto new_version = url_ip_version(new_location);
    if (!new_version) {
        return true;
    }
    // A location of the other IP family is an additional path, not a change.
    for (const auto& location : device.locations()) {
        const auto version = url_ip_version(location.url);
        if (!version || *version == *new_version) {
            return true;
        }
    }
    return false;
}

TimePoint SsdpDeviceTracker::extract_valid_to(const SsdpHeaders& headers, TimePoint now) const {
    const auto max_age = extract_max_age(headers);
    const int seconds = max_age ? *max_age : settings_.default_max_age_seconds;
    return now + std::chrono::seconds(seconds);
}

} // namespace ssdp
} // namespace ssdptrack
