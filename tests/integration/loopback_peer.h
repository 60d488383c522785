#pragma once
/**
 * Raw UDP socket on the loopback interface standing in for a UPnP device.
 */

#include "net/address.h"
#include "net/socket_platform.h"

#include <gtest/gtest.h>
#include <cstring>
#include <string>

namespace ssdptrack {
namespace ssdp {
namespace testing {

/** Blocking socket with a 2 s receive timeout, bound to an ephemeral port. */
class RawPeer {
public:
    RawPeer() {
        fd_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ssdp_socklen_t len = sizeof(addr);
        if (fd_ != SSDP_INVALID_SOCKET_VALUE &&
            bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port_ = ntohs(addr.sin_port);
        }
#ifdef _WIN32
        DWORD timeout = 2000;
#else
        timeval timeout;
        timeout.tv_sec = 2;
        timeout.tv_usec = 0;
#endif
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout), sizeof(timeout));
    }

    ~RawPeer() {
        if (fd_ != SSDP_INVALID_SOCKET_VALUE) {
            SSDP_CLOSE_SOCKET(fd_);
        }
    }

    bool ok() const { return port_ != 0; }
    AddressTuple address() const { return make_ipv4_address("127.0.0.1", port_); }

    void send_to(const AddressTuple& target, const std::string& payload) {
        sockaddr_storage storage;
        int len = 0;
        ASSERT_TRUE(to_sockaddr(target, storage, len));
        sendto(fd_, payload.data(), static_cast<int>(payload.size()), 0, reinterpret_cast<sockaddr*>(&storage),
               static_cast<ssdp_socklen_t>(len));
    }

    std::string receive(AddressTuple* from = nullptr) {
        char buffer[2048];
        sockaddr_storage storage;
        ssdp_socklen_t len = sizeof(storage);
        const auto n = recvfrom(fd_, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&storage), &len);
        if (n <= 0) {
            return "";
        }
        if (from) {
            *from = from_sockaddr(reinterpret_cast<sockaddr*>(&storage));
        }
        return std::string(buffer, static_cast<size_t>(n));
    }

private:
    socket_t fd_ = SSDP_INVALID_SOCKET_VALUE;
    uint16_t port_ = 0;
};

} // namespace testing
} // namespace ssdp
} // namespace ssdptrack
