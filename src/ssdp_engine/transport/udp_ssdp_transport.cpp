#include "udp_ssdp_transport.h"

#include "../protocol/ssdp_codec.h"
#include "../ssdp_errors.h"
#include "../utils/cpp_logger.h"

#include <cstring>

namespace ssdptrack {
namespace ssdp {

AddressTuple select_bind_address(TransportRole role, const AddressTuple& source, const AddressTuple& target) {
    if (role == TransportRole::SEARCH) {
        return source;
    }
#ifdef _WIN32
    AddressTuple bind_addr = source;
    bind_addr.port = target.port;
    return bind_addr;
#else
    return target;
#endif
}

UdpSsdpTransport::UdpSsdpTransport(const TransportSpec& spec, EventLoop& loop, TransportCallbacks callbacks)
    : logger_prefix_(spec.role == TransportRole::SEARCH ? "[SsdpTransport:search]" : "[SsdpTransport:advertisement]"),
      spec_(spec),
      loop_(loop),
      callbacks_(std::move(callbacks)),
      socket_fd_(SSDP_INVALID_SOCKET_VALUE),
      receive_buffer_(sanitize_receive_buffer_size(spec.settings.receive_buffer_size)),
      open_state_(std::make_shared<std::atomic<bool>>(false)) {}

UdpSsdpTransport::~UdpSsdpTransport() {
    close();
}

void UdpSsdpTransport::open() {
    const int family = spec_.target.is_ipv6() ? AF_INET6 : AF_INET;
    socket_fd_ = socket(family, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_fd_ == SSDP_INVALID_SOCKET_VALUE) {
        throw SsdpSocketError(logger_prefix_ + " Failed to create socket (errno: " +
                              std::to_string(SSDP_GET_LAST_SOCK_ERROR) + ")");
    }

    configure_socket();

    const AddressTuple bind_addr = select_bind_address(spec_.role, spec_.source, spec_.target);
    sockaddr_storage bind_storage;
    int bind_len = 0;
    if (!to_sockaddr(bind_addr, bind_storage, bind_len)) {
        close_socket();
        throw SsdpSocketError(logger_prefix_ + " Unusable bind address " + bind_addr.to_string());
    }
    if (bind(socket_fd_, reinterpret_cast<sockaddr*>(&bind_storage), static_cast<ssdp_socklen_t>(bind_len)) < 0) {
        const int error = SSDP_GET_LAST_SOCK_ERROR;
        close_socket();
        throw SsdpSocketError(logger_prefix_ + " Failed to bind to " + bind_addr.to_string() +
                              " (errno: " + std::to_string(error) + ")");
    }

    sockaddr_storage local_storage;
    ssdp_socklen_t local_len = sizeof(local_storage);
    std::memset(&local_storage, 0, sizeof(local_storage));
    if (getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&local_storage), &local_len) == 0) {
        local_addr_ = from_sockaddr(reinterpret_cast<sockaddr*>(&local_storage));
    } else {
        local_addr_ = bind_addr;
    }
    LOG_CPP_INFO("%s Bound to %s (target %s)", logger_prefix_.c_str(),
                 local_addr_.to_string().c_str(), spec_.target.to_string().c_str());

    open_state_->store(true);
    if (!loop_.add_reader(socket_fd_, [this]() { handle_readable(); })) {
        open_state_->store(false);
        close_socket();
        throw SsdpSocketError(logger_prefix_ + " Failed to register socket with the event loop");
    }

    auto state = open_state_;
    loop_.post([this, state]() {
        if (!state->load()) {
            return;
        }
        if (callbacks_.on_connect) {
            callbacks_.on_connect(*this);
        }
    });
}

void UdpSsdpTransport::configure_socket() {
    int reuse = 1;
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse)) < 0) {
        LOG_CPP_WARNING("%s Failed to set SO_REUSEADDR", logger_prefix_.c_str());
    }

    if (spec_.target.is_ipv6()) {
        int v6only = 1;
        if (setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_V6ONLY, reinterpret_cast<const char*>(&v6only), sizeof(v6only)) < 0) {
            LOG_CPP_WARNING("%s Failed to set IPV6_V6ONLY", logger_prefix_.c_str());
        }
        configure_ipv6_multicast();
    } else {
        int broadcast = 1;
        if (setsockopt(socket_fd_, SOL_SOCKET, SO_BROADCAST, reinterpret_cast<const char*>(&broadcast), sizeof(broadcast)) < 0) {
            LOG_CPP_WARNING("%s Failed to set SO_BROADCAST", logger_prefix_.c_str());
        }
        configure_ipv4_multicast();
    }

    set_non_blocking();
}

void UdpSsdpTransport::configure_ipv4_multicast() {
    in_addr source_addr;
    source_addr.s_addr = htonl(INADDR_ANY);
    if (!is_unspecified(spec_.source) && inet_pton(AF_INET, spec_.source.host.c_str(), &source_addr) != 1) {
        LOG_CPP_WARNING("%s Invalid source address %s, using INADDR_ANY", logger_prefix_.c_str(), spec_.source.host.c_str());
        source_addr.s_addr = htonl(INADDR_ANY);
    }

    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_IF, reinterpret_cast<const char*>(&source_addr), sizeof(source_addr)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IP_MULTICAST_IF", logger_prefix_.c_str());
    }

    int ttl = sanitize_multicast_ttl(spec_.settings.multicast_ttl);
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, reinterpret_cast<const char*>(&ttl), sizeof(ttl)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IP_MULTICAST_TTL", logger_prefix_.c_str());
    }

    int loop = 1;
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_LOOP, reinterpret_cast<const char*>(&loop), sizeof(loop)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IP_MULTICAST_LOOP", logger_prefix_.c_str());
    }

    if (!is_multicast(spec_.target)) {
        return;
    }
    struct ip_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    if (inet_pton(AF_INET, spec_.target.host.c_str(), &mreq.imr_multiaddr) != 1) {
        LOG_CPP_ERROR("%s Failed to parse multicast group address %s", logger_prefix_.c_str(), spec_.target.host.c_str());
        return;
    }
    mreq.imr_interface = source_addr;
    if (setsockopt(socket_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, reinterpret_cast<const char*>(&mreq), sizeof(mreq)) < 0) {
        LOG_CPP_ERROR("%s Failed to join multicast group %s", logger_prefix_.c_str(), spec_.target.host.c_str());
    } else {
        LOG_CPP_INFO("%s Successfully joined multicast group %s", logger_prefix_.c_str(), spec_.target.host.c_str());
    }
}

void UdpSsdpTransport::configure_ipv6_multicast() {
    const uint32_t scope_id = spec_.target.scope_id != 0 ? spec_.target.scope_id : spec_.source.scope_id;

    if (scope_id == 0) {
        LOG_CPP_WARNING("%s No IPv6 scope id, not setting IPV6_MULTICAST_IF", logger_prefix_.c_str());
    } else {
        unsigned int if_index = scope_id;
        if (setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_MULTICAST_IF, reinterpret_cast<const char*>(&if_index), sizeof(if_index)) < 0) {
            LOG_CPP_WARNING("%s Failed to set IPV6_MULTICAST_IF for interface %u", logger_prefix_.c_str(), if_index);
        }
    }

    int hops = sanitize_multicast_ttl(spec_.settings.multicast_ttl);
    if (setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, reinterpret_cast<const char*>(&hops), sizeof(hops)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IPV6_MULTICAST_HOPS", logger_prefix_.c_str());
    }

    unsigned int loop = 1;
    if (setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, reinterpret_cast<const char*>(&loop), sizeof(loop)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IPV6_MULTICAST_LOOP", logger_prefix_.c_str());
    }

    if (!is_multicast(spec_.target)) {
        return;
    }
    struct ipv6_mreq mreq;
    std::memset(&mreq, 0, sizeof(mreq));
    if (inet_pton(AF_INET6, spec_.target.host.c_str(), &mreq.ipv6mr_multiaddr) != 1) {
        LOG_CPP_ERROR("%s Failed to parse multicast group address %s", logger_prefix_.c_str(), spec_.target.host.c_str());
        return;
    }
    mreq.ipv6mr_interface = scope_id;
    if (setsockopt(socket_fd_, IPPROTO_IPV6, IPV6_JOIN_GROUP, reinterpret_cast<const char*>(&mreq), sizeof(mreq)) < 0) {
        LOG_CPP_ERROR("%s Failed to join multicast group %s on interface %u",
                      logger_prefix_.c_str(), spec_.target.host.c_str(), scope_id);
    } else {
        LOG_CPP_INFO("%s Successfully joined multicast group %s on interface %u",
                     logger_prefix_.c_str(), spec_.target.host.c_str(), scope_id);
    }
}

void UdpSsdpTransport::set_non_blocking() {
#ifdef _WIN32
    u_long mode = 1;
    if (ioctlsocket(socket_fd_, FIONBIO, &mode) != 0) {
        LOG_CPP_WARNING("%s Failed to make socket non-blocking: %d", logger_prefix_.c_str(), WSAGetLastError());
    }
#else
    const int flags = fcntl(socket_fd_, F_GETFL, 0);
    if (flags == -1 || fcntl(socket_fd_, F_SETFL, flags | O_NONBLOCK) == -1) {
        LOG_CPP_WARNING("%s Failed to make socket non-blocking: %s", logger_prefix_.c_str(), strerror(errno));
    }
#endif
}

void UdpSsdpTransport::send(const std::string& packet, const AddressTuple& target) {
    loop_.run_sync([this, &packet, &target]() {
        if (is_closed()) {
            LOG_CPP_DEBUG("%s Ignoring send on closed transport", logger_prefix_.c_str());
            return;
        }
        sockaddr_storage target_storage;
        int target_len = 0;
        if (!to_sockaddr(target, target_storage, target_len)) {
            LOG_CPP_ERROR("%s Cannot send to unparsable address %s", logger_prefix_.c_str(), target.host.c_str());
            return;
        }
        LOG_CPP_DEBUG("%s Sending %zu bytes to %s:\n%s", logger_prefix_.c_str(), packet.size(),
                      target.to_string().c_str(), packet.c_str());
        const auto sent = sendto(socket_fd_, packet.data(), static_cast<int>(packet.size()), 0,
                                 reinterpret_cast<sockaddr*>(&target_storage), static_cast<ssdp_socklen_t>(target_len));
        if (sent < 0) {
            LOG_CPP_ERROR("%s sendto %s failed (errno: %d)", logger_prefix_.c_str(),
                          target.to_string().c_str(), SSDP_GET_LAST_SOCK_ERROR);
        }
    });
}

void UdpSsdpTransport::handle_readable() {
    if (is_closed()) {
        return;
    }

    sockaddr_storage remote_storage;
    ssdp_socklen_t remote_len = sizeof(remote_storage);
    std::memset(&remote_storage, 0, sizeof(remote_storage));
    const auto received = recvfrom(socket_fd_, receive_buffer_.data(), static_cast<int>(receive_buffer_.size()), 0,
                                   reinterpret_cast<sockaddr*>(&remote_storage), &remote_len);
    if (received < 0) {
        const int error = SSDP_GET_LAST_SOCK_ERROR;
#ifdef _WIN32
        if (error == WSAEWOULDBLOCK || error == WSAECONNRESET) {
            return;
        }
#else
        if (error == EAGAIN || error == EWOULDBLOCK || error == EINTR) {
            return;
        }
#endif
        LOG_CPP_ERROR("%s recvfrom failed (errno: %d)", logger_prefix_.c_str(), error);
        return;
    }

    const std::string data(receive_buffer_.data(), static_cast<std::size_t>(received));
    const AddressTuple remote_addr = from_sockaddr(reinterpret_cast<sockaddr*>(&remote_storage));
    LOG_CPP_DEBUG("%s Received %zu bytes from %s:\n%s", logger_prefix_.c_str(), data.size(),
                  remote_addr.to_string().c_str(), data.c_str());

    if (!is_valid_ssdp_packet(data)) {
        LOG_CPP_DEBUG("%s Dropping non-SSDP datagram from %s", logger_prefix_.c_str(), remote_addr.to_string().c_str());
        return;
    }

    std::pair<std::string, SsdpHeaders> decoded;
    try {
        decoded = decode_ssdp_packet(data, local_addr_, remote_addr);
    } catch (const SsdpDecodeError& e) {
        LOG_CPP_WARNING("%s Dropping packet from %s with invalid headers: %s", logger_prefix_.c_str(),
                        remote_addr.to_string().c_str(), e.what());
        return;
    }

    if (callbacks_.on_data) {
        callbacks_.on_data(decoded.first, decoded.second);
    }
}

void UdpSsdpTransport::close() {
    if (!open_state_->exchange(false)) {
        close_socket();
        return;
    }
    loop_.run_sync([this]() {
        loop_.remove_reader(socket_fd_);
        close_socket();
    });
    LOG_CPP_INFO("%s Transport closed.", logger_prefix_.c_str());
}

bool UdpSsdpTransport::is_closed() const {
    return !open_state_->load();
}

void UdpSsdpTransport::close_socket() {
    if (socket_fd_ != SSDP_INVALID_SOCKET_VALUE) {
        SSDP_CLOSE_SOCKET(socket_fd_);
        socket_fd_ = SSDP_INVALID_SOCKET_VALUE;
    }
}

TransportFactory udp_transport_factory() {
    return [](const TransportSpec& spec, EventLoop& loop, TransportCallbacks callbacks) -> std::unique_ptr<ISsdpTransport> {
        auto transport = std::make_unique<UdpSsdpTransport>(spec, loop, std::move(callbacks));
        transport->open();
        return transport;
    };
}

} // namespace ssdp
} // namespace ssdptrack
