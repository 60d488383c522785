/**
 * @file advertisement_listener.h
 * @brief Passive discovery: receives NOTIFY advertisements from the multicast group.
 */
#ifndef SSDPTRACK_LISTENERS_ADVERTISEMENT_LISTENER_H
#define SSDPTRACK_LISTENERS_ADVERTISEMENT_LISTENER_H

#include "../configuration/ssdp_engine_settings.h"
#include "../net/address.h"
#include "../net/event_loop.h"
#include "../protocol/ssdp_headers.h"
#include "../transport/i_ssdp_transport.h"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ssdptrack {
namespace ssdp {

/**
 * @class SsdpAdvertisementListener
 * @brief Dispatches `ssdp:alive`, `ssdp:byebye` and `ssdp:update` to their callbacks.
 * @details Receive only. Search requests leaking in through the group and packets
 *          without `NTS` are dropped, as are unknown `NTS` values.
 */
class SsdpAdvertisementListener {
public:
    using AdvertisementCallback = std::function<void(const SsdpHeaders& headers)>;

    SsdpAdvertisementListener(AdvertisementCallback on_alive,
                              AdvertisementCallback on_byebye,
                              AdvertisementCallback on_update,
                              std::optional<AddressTuple> source = std::nullopt,
                              std::optional<AddressTuple> target = std::nullopt,
                              SsdpEngineSettings settings = SsdpEngineSettings(),
                              EventLoop* loop = nullptr,
                              TransportFactory transport_factory = udp_transport_factory());
    ~SsdpAdvertisementListener();

    SsdpAdvertisementListener(const SsdpAdvertisementListener&) = delete;
    SsdpAdvertisementListener& operator=(const SsdpAdvertisementListener&) = delete;

    /** @throws SsdpSocketError if the transport cannot be bound. */
    void start();
    void stop();

    /** @brief Transport data callback. */
    void on_data(const std::string& request_line, const SsdpHeaders& headers);

    bool is_started() const { return state_ == State::STARTED; }
    const AddressTuple& source() const { return source_; }
    const AddressTuple& target() const { return target_; }

private:
    enum class State {
        IDLE,
        STARTED,
        STOPPED
    };

    std::string logger_prefix_;
    AdvertisementCallback on_alive_;
    AdvertisementCallback on_byebye_;
    AdvertisementCallback on_update_;
    std::optional<AddressTuple> requested_source_;
    std::optional<AddressTuple> requested_target_;
    AddressTuple source_;
    AddressTuple target_;
    SsdpEngineSettings settings_;
    TransportFactory transport_factory_;

    std::unique_ptr<EventLoop> owned_loop_;
    EventLoop* loop_;
    std::unique_ptr<ISsdpTransport> transport_;
    std::atomic<State> state_;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_LISTENERS_ADVERTISEMENT_LISTENER_H
