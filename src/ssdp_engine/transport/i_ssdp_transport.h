/**
 * @file i_ssdp_transport.h
 * @brief Defines the ISsdpTransport interface used by the search and advertisement listeners.
 * @details A transport owns one datagram endpoint for a (source, target) address pair.
 *          It reports readiness once through `on_connect` and hands every datagram that
 *          passes the SSDP shape check to `on_data` already decoded. Listeners obtain
 *          transports through a `TransportFactory` so tests can substitute a mock.
 */
#ifndef SSDPTRACK_TRANSPORT_I_SSDP_TRANSPORT_H
#define SSDPTRACK_TRANSPORT_I_SSDP_TRANSPORT_H

#include "../configuration/ssdp_engine_settings.h"
#include "../net/address.h"
#include "../protocol/ssdp_headers.h"

#include <functional>
#include <memory>
#include <string>

namespace ssdptrack {
namespace ssdp {

class EventLoop;

/** @brief Which listener a transport serves; selects the bind strategy. */
enum class TransportRole {
    SEARCH,
    ADVERTISEMENT
};

struct TransportSpec {
    AddressTuple source;
    AddressTuple target;
    TransportRole role = TransportRole::SEARCH;
    SsdpEngineSettings settings;
};

class ISsdpTransport;

struct TransportCallbacks {
    std::function<void(ISsdpTransport&)> on_connect;
    std::function<void(const std::string& request_line, const SsdpHeaders& headers)> on_data;
};

class ISsdpTransport {
public:
    virtual ~ISsdpTransport() = default;

    /**
     * @brief Sends a raw packet to `target`.
     * @details Send failures are logged; a closed transport ignores the call.
     */
    virtual void send(const std::string& packet, const AddressTuple& target) = 0;

    /** @brief Closes the endpoint. No callbacks fire afterwards. Idempotent. */
    virtual void close() = 0;

    virtual bool is_closed() const = 0;
};

/**
 * @brief Creates and binds a transport.
 * @throws SsdpSocketError if the endpoint cannot be created or bound.
 */
using TransportFactory = std::function<std::unique_ptr<ISsdpTransport>(
    const TransportSpec& spec, EventLoop& loop, TransportCallbacks callbacks)>;

/** @brief Factory producing real UDP transports. */
TransportFactory udp_transport_factory();

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_TRANSPORT_I_SSDP_TRANSPORT_H
