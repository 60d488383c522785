/**
 * @file search_listener.h
 * @brief Active discovery: sends M-SEARCH requests and collects the responses.
 */
#ifndef SSDPTRACK_LISTENERS_SEARCH_LISTENER_H
#define SSDPTRACK_LISTENERS_SEARCH_LISTENER_H

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
 * @class SsdpSearchListener
 * @brief Issues searches on demand and forwards every search response to a callback.
 * @details Lifecycle is idle -> started -> stopped. Requests from other clients
 *          (`MAN: "ssdp:discover"`) and advertisements (any `NTS`) arriving on the
 *          socket are dropped. When the target is a unicast address only responses
 *          from that host are forwarded.
 *          All callbacks run on the event loop thread.
 */
class SsdpSearchListener {
public:
    using SearchCallback = std::function<void(const SsdpHeaders& headers)>;
    using ConnectCallback = std::function<void()>;

    /**
     * @param callback Invoked with each accepted response, `_source` set to "search".
     * @param source Local address to send from; derived from the routing table if unset.
     * @param target Where searches go; IPv4 multicast by default, or the IPv6
     *               link-local group on the source's interface for an IPv6 source.
     * @param loop Loop to run on. The listener owns a loop of its own if null.
     * @param transport_factory Creates the datagram endpoint.
     * @param connect_callback Invoked once the endpoint is ready.
     */
    SsdpSearchListener(SearchCallback callback,
                       std::optional<AddressTuple> source = std::nullopt,
                       std::optional<AddressTuple> target = std::nullopt,
                       SsdpEngineSettings settings = SsdpEngineSettings(),
                       EventLoop* loop = nullptr,
                       TransportFactory transport_factory = udp_transport_factory(),
                       ConnectCallback connect_callback = nullptr);
    ~SsdpSearchListener();

    SsdpSearchListener(const SsdpSearchListener&) = delete;
    SsdpSearchListener& operator=(const SsdpSearchListener&) = delete;

    /**
     * @brief Resolves the address pair and opens the transport.
     * @throws SsdpSocketError if the transport cannot be bound.
     */
    void start();

    /**
     * @brief Sends one M-SEARCH to `override_target`, or to the configured target.
     * @throws std::logic_error if the listener is not started.
     */
    void search(const std::optional<AddressTuple>& override_target = std::nullopt);

    /** @brief Closes the transport. Safe to call repeatedly. */
    void stop();

    /** @brief Transport data callback. */
    void on_data(const std::string& request_line, const SsdpHeaders& headers);

    bool is_started() const { return state_ == State::STARTED; }
    const AddressTuple& source() const { return source_; }
    const AddressTuple& target() const { return target_; }
    const SsdpEngineSettings& settings() const { return settings_; }
    EventLoop& loop() { return *loop_; }

private:
    enum class State {
        IDLE,
        STARTED,
        STOPPED
    };

    void on_connect(ISsdpTransport& transport);
    void send_search(ISsdpTransport& transport, const AddressTuple& destination);

    std::string logger_prefix_;
    SearchCallback callback_;
    ConnectCallback connect_callback_;
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

/**
 * @brief One-shot discovery.
 * @details Starts a listener, searches once the endpoint is ready, collects
 *          responses for `timeout_seconds` and stops. The call always blocks for
 *          the full window.
 * @throws std::invalid_argument if `timeout_seconds` is not positive.
 * @throws SsdpSocketError if the endpoint cannot be bound.
 */
void search(const SsdpSearchListener::SearchCallback& callback,
            int timeout_seconds = kDefaultSearchMx,
            const std::string& search_target = kDefaultSearchTarget,
            std::optional<AddressTuple> source = std::nullopt,
            std::optional<AddressTuple> target = std::nullopt,
            TransportFactory transport_factory = udp_transport_factory());

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_LISTENERS_SEARCH_LISTENER_H
