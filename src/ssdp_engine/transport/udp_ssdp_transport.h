/**
 * @file udp_ssdp_transport.h
 * @brief UDP multicast implementation of ISsdpTransport.
 */
#ifndef SSDPTRACK_TRANSPORT_UDP_SSDP_TRANSPORT_H
#define SSDPTRACK_TRANSPORT_UDP_SSDP_TRANSPORT_H

#include "i_ssdp_transport.h"
#include "../net/event_loop.h"
#include "../net/socket_platform.h"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace ssdptrack {
namespace ssdp {

/**
 * @brief Address the socket for `role` binds to.
 * @details Search sockets bind the source address (ephemeral port unless one is
 *          given). Advertisement sockets need the SSDP port: Windows binds the source
 *          address with the target port, POSIX binds the target (group) address itself
 *          so only traffic for that group is delivered.
 */
AddressTuple select_bind_address(TransportRole role, const AddressTuple& source, const AddressTuple& target);

class UdpSsdpTransport : public ISsdpTransport {
public:
    UdpSsdpTransport(const TransportSpec& spec, EventLoop& loop, TransportCallbacks callbacks);
    ~UdpSsdpTransport() override;

    /**
     * @brief Creates, configures and binds the socket, then registers it with the loop.
     * @details `on_connect` is posted to the loop once the socket is ready.
     * @throws SsdpSocketError on socket creation, bind or registration failure.
     */
    void open();

    void send(const std::string& packet, const AddressTuple& target) override;
    void close() override;
    bool is_closed() const override;

    /** @brief Address the socket is bound to, as reported by getsockname(). */
    const AddressTuple& local_address() const { return local_addr_; }

private:
    void configure_socket();
    void configure_ipv4_multicast();
    void configure_ipv6_multicast();
    void set_non_blocking();
    void handle_readable();
    void close_socket();

    std::string logger_prefix_;
    TransportSpec spec_;
    EventLoop& loop_;
    TransportCallbacks callbacks_;

    socket_t socket_fd_;
    AddressTuple local_addr_;
    std::vector<char> receive_buffer_;

    // Shared with tasks posted to the loop; false once closed.
    std::shared_ptr<std::atomic<bool>> open_state_;
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_TRANSPORT_UDP_SSDP_TRANSPORT_H
