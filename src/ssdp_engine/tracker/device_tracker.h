/**
 * @file device_tracker.h
 * @brief Merges search responses and advertisements into one view of the network.
 * @details The tracker decides, for every incoming header set, whether the
 *          application should hear about it. State is mutated only through the
 *          entry points below, each of which expects the caller to hold `lock()`.
 *          One tracker may be shared by several listeners (e.g. IPv4 and IPv6).
 */
#ifndef SSDPTRACK_TRACKER_DEVICE_TRACKER_H
#define SSDPTRACK_TRACKER_DEVICE_TRACKER_H

#include "ssdp_device.h"
#include "../configuration/ssdp_engine_settings.h"
#include "../protocol/ssdp_headers.h"
#include "../ssdp_types.h"
#include "../utils/fair_mutex.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ssdptrack {
namespace ssdp {

/**
 * @brief Outcome of feeding one header set to the tracker.
 * @details `device` and `device_or_service_type` are set whenever the headers passed
 *          validation, even if `propagate` is false.
 */
struct TrackerResult {
    bool propagate = false;
    std::shared_ptr<SsdpDevice> device;
    std::string device_or_service_type;
    std::optional<SsdpSource> source;
};

/** @brief `location` is an http(s) url that does not point at loopback or 169.254/16. */
bool is_valid_location(const std::string& location);

bool valid_search_headers(const SsdpHeaders& headers);
bool valid_advertisement_headers(const SsdpHeaders& headers);
bool valid_byebye_headers(const SsdpHeaders& headers);

/** @brief Seconds from `max-age=N` in CACHE-CONTROL, or std::nullopt when absent or beyond `int` range. */
std::optional<int> extract_max_age(const SsdpHeaders& headers);

/**
 * @brief Compares a stored snapshot with newly received headers.
 * @details Only keys present in `current` are looked at, skipping `_` fields and
 *          date, cache-control, server and location. A key missing from `incoming`
 *          does not count as a difference.
 */
bool same_headers_differ(const SsdpHeaders& current, const SsdpHeaders& incoming);

/** @brief `same_headers_differ()` against `snapshots[type]`; false if there is none. */
bool headers_differ_from_existing(const SsdpDevice::HeadersByType& snapshots,
                                  const std::string& type,
                                  const SsdpHeaders& incoming);

class SsdpDeviceTracker {
public:
    using Clock = std::function<TimePoint()>;
    using DeviceMap = std::map<std::string, std::shared_ptr<SsdpDevice>>;

    explicit SsdpDeviceTracker(SsdpEngineSettings settings = SsdpEngineSettings(), Clock clock = nullptr);

    SsdpDeviceTracker(const SsdpDeviceTracker&) = delete;
    SsdpDeviceTracker& operator=(const SsdpDeviceTracker&) = delete;

    /** @brief Scoped, FIFO-fair acquisition of the tracker lock. */
    std::unique_lock<utils::FairMutex> lock() { return std::unique_lock<utils::FairMutex>(mutex_); }

    /**
     * @brief A search response was received.
     * @details Propagates every valid response; `source` is SEARCH_CHANGED for a new
     *          device, a new type, changed headers or a changed location, otherwise
     *          SEARCH_ALIVE.
     */
    TrackerResult see_search(const SsdpHeaders& headers);

    /**
     * @brief An `ssdp:alive` or `ssdp:update` was received.
     * @details Propagates updates always, alives only when something is new or changed.
     */
    TrackerResult see_advertisement(const SsdpHeaders& headers);

    /**
     * @brief An `ssdp:byebye` was received.
     * @details Removes the device and always propagates if it was known.
     */
    TrackerResult unsee_advertisement(const SsdpHeaders& headers);

    /** @brief The tracked device named by the `usn` in `headers`, or null. */
    std::shared_ptr<SsdpDevice> get_device(const SsdpHeaders& headers) const;

    /**
     * @brief Removes expired devices and locations.
     * @details Does nothing until the earliest known expiry has passed.
     */
    void purge_devices(std::optional<TimePoint> override_now = std::nullopt);

    /** @brief Tracked devices. Not synchronized; hold `lock()` for a consistent view. */
    const DeviceMap& devices() const { return devices_; }

    std::optional<TimePoint> next_valid_to() const { return next_valid_to_; }

    TimePoint now() const { return clock_(); }

private:
    struct Sighting {
        std::shared_ptr<SsdpDevice> device;
        bool is_new_device = false;
        bool location_changed = false;
    };

    Sighting see_device(const SsdpHeaders& headers);
    bool location_changed(const SsdpDevice& device, const std::string& new_location) const;
    TimePoint extract_valid_to(const SsdpHeaders& headers, TimePoint now) const;

    std::string logger_prefix_;
    SsdpEngineSettings settings_;
    Clock clock_;
    DeviceMap devices_;
    std::optional<TimePoint> next_valid_to_;
    utils::FairMutex mutex_;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_TRACKER_DEVICE_TRACKER_H
