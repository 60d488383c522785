/**
 * @file ssdp_listener.h
 * @brief Search and advertisement listening combined behind one device callback.
 */
#ifndef SSDPTRACK_LISTENERS_SSDP_LISTENER_H
#define SSDPTRACK_LISTENERS_SSDP_LISTENER_H

#include "advertisement_listener.h"
#include "search_listener.h"
#include "../tracker/device_tracker.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ssdptrack {
namespace ssdp {

/**
 * @class SsdpListener
 * @brief Feeds both listeners into a device tracker and reports tracked changes.
 * @details The callback receives the device, the device-or-service type and the
 *          tracker's verdict. It runs on the event loop thread with the tracker lock
 *          held, so it must not block for long nor take the lock itself.
 *          Pass the same tracker to an IPv4 and an IPv6 listener to track both
 *          families together.
 */
class SsdpListener {
public:
    using DeviceCallback = std::function<void(const std::shared_ptr<SsdpDevice>& device,
                                              const std::string& device_or_service_type,
                                              SsdpSource source)>;

    SsdpListener(DeviceCallback callback,
                 std::optional<AddressTuple> source = std::nullopt,
                 std::optional<AddressTuple> target = std::nullopt,
                 std::shared_ptr<SsdpDeviceTracker> device_tracker = nullptr,
                 SsdpEngineSettings settings = SsdpEngineSettings(),
                 EventLoop* loop = nullptr,
                 TransportFactory transport_factory = udp_transport_factory());
    ~SsdpListener();

    SsdpListener(const SsdpListener&) = delete;
    SsdpListener& operator=(const SsdpListener&) = delete;

    /** @throws SsdpSocketError if either endpoint cannot be bound. */
    void start();
    void stop();

    /** @throws std::logic_error if not started. */
    void search(const std::optional<AddressTuple>& override_target = std::nullopt);

    /** @brief Tracked devices. Hold `device_tracker()->lock()` for a consistent view. */
    const SsdpDeviceTracker::DeviceMap& devices() const { return device_tracker_->devices(); }

    std::shared_ptr<SsdpDeviceTracker> device_tracker() const { return device_tracker_; }

    bool is_started() const;

    void handle_search(const SsdpHeaders& headers);
    void handle_alive(const SsdpHeaders& headers);
    void handle_byebye(const SsdpHeaders& headers);
    void handle_update(const SsdpHeaders& headers);

private:
    void dispatch(const TrackerResult& result);

    std::string logger_prefix_;
    DeviceCallback callback_;
    std::shared_ptr<SsdpDeviceTracker> device_tracker_;

    std::unique_ptr<EventLoop> owned_loop_;
    EventLoop* loop_;
    std::unique_ptr<SsdpAdvertisementListener> advertisement_listener_;
    std::unique_ptr<SsdpSearchListener> search_listener_;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_LISTENERS_SSDP_LISTENER_H
