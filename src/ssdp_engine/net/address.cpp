#include "address.h"

#include "socket_platform.h"
#include "../utils/cpp_logger.h"

#include <cstdlib>
#include <cstring>

namespace ssdptrack {
namespace ssdp {

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;        // Without brackets, may still carry %zone.
    std::string port;
    std::string remainder;   // Path, query and fragment.
};

bool split_url(const std::string& url, UrlParts& parts) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }
    parts.scheme = url.substr(0, scheme_end);

    const auto netloc_start = scheme_end + 3;
    auto netloc_end = url.find_first_of("/?#", netloc_start);
    if (netloc_end == std::string::npos) {
        netloc_end = url.size();
    }
    std::string netloc = url.substr(netloc_start, netloc_end - netloc_start);
    parts.remainder = url.substr(netloc_end);

    const auto at = netloc.rfind('@');
    if (at != std::string::npos) {
        netloc = netloc.substr(at + 1);
    }
    if (netloc.empty()) {
        return false;
    }

    if (netloc[0] == '[') {
        const auto close = netloc.find(']');
        if (close == std::string::npos) {
            return false;
        }
        parts.host = netloc.substr(1, close - 1);
        if (close + 1 < netloc.size()) {
            if (netloc[close + 1] != ':') {
                return false;
            }
            parts.port = netloc.substr(close + 2);
        }
        return true;
    }

    const auto colon = netloc.rfind(':');
    if (colon != std::string::npos) {
        parts.host = netloc.substr(0, colon);
        parts.port = netloc.substr(colon + 1);
    } else {
        parts.host = netloc;
    }
    return true;
}

std::string strip_zone(const std::string& host) {
    const auto percent = host.find('%');
    return percent == std::string::npos ? host : host.substr(0, percent);
}

uint32_t parse_zone(const std::string& zone) {
    if (zone.empty()) {
        return 0;
    }
    char* end_ptr = nullptr;
    const unsigned long numeric = std::strtoul(zone.c_str(), &end_ptr, 10);
    if (end_ptr != zone.c_str() && *end_ptr == '\0') {
        return static_cast<uint32_t>(numeric);
    }
    return static_cast<uint32_t>(if_nametoindex(zone.c_str()));
}

bool ipv6_bytes(const std::string& host, unsigned char (&bytes)[16]) {
    in6_addr addr6;
    if (inet_pton(AF_INET6, strip_zone(host).c_str(), &addr6) != 1) {
        return false;
    }
    std::memcpy(bytes, &addr6, sizeof(bytes));
    return true;
}

bool ipv4_bytes(const std::string& host, unsigned char (&bytes)[4]) {
    in_addr addr4;
    if (inet_pton(AF_INET, host.c_str(), &addr4) != 1) {
        return false;
    }
    std::memcpy(bytes, &addr4, sizeof(bytes));
    return true;
}

} // namespace

std::string AddressTuple::to_string() const {
    if (is_ipv6()) {
        return "[" + get_host_string(*this) + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

bool AddressTuple::operator==(const AddressTuple& other) const {
    return family == other.family && host == other.host && port == other.port &&
           flowinfo == other.flowinfo && scope_id == other.scope_id;
}

AddressTuple make_ipv4_address(const std::string& host, uint16_t port) {
    AddressTuple addr;
    addr.family = AddressFamily::IPv4;
    addr.host = host;
    addr.port = port;
    return addr;
}

AddressTuple make_ipv6_address(const std::string& host, uint16_t port, uint32_t scope_id, uint32_t flowinfo) {
    AddressTuple addr;
    addr.family = AddressFamily::IPv6;
    addr.host = host;
    addr.port = port;
    addr.scope_id = scope_id;
    addr.flowinfo = flowinfo;
    return addr;
}

std::optional<AddressTuple> parse_ip_address(const std::string& host, uint16_t port) {
    char buffer[INET6_ADDRSTRLEN] = {0};

    in_addr addr4;
    if (inet_pton(AF_INET, host.c_str(), &addr4) == 1) {
        inet_ntop(AF_INET, &addr4, buffer, sizeof(buffer));
        return make_ipv4_address(buffer, port);
    }

    std::string literal = host;
    if (literal.size() > 2 && literal.front() == '[' && literal.back() == ']') {
        literal = literal.substr(1, literal.size() - 2);
    }
    const auto percent = literal.find('%');
    const std::string zone = percent == std::string::npos ? std::string() : literal.substr(percent + 1);
    literal = strip_zone(literal);

    in6_addr addr6;
    if (inet_pton(AF_INET6, literal.c_str(), &addr6) == 1) {
        inet_ntop(AF_INET6, &addr6, buffer, sizeof(buffer));
        return make_ipv6_address(buffer, port, parse_zone(zone));
    }
    return std::nullopt;
}

AddressTuple ssdp_target_v4() {
    return *parse_ip_address(kSsdpIpV4, kSsdpPort);
}

AddressTuple ssdp_target_v6(uint32_t scope_id) {
    AddressTuple target = *parse_ip_address(kSsdpIpV6LinkLocal, kSsdpPort);
    target.scope_id = scope_id;
    return target;
}

AddressTuple default_ssdp_target(const std::optional<AddressTuple>& source) {
    if (source && source->is_ipv6()) {
        return ssdp_target_v6(source->scope_id);
    }
    return ssdp_target_v4();
}

bool is_multicast(const AddressTuple& addr) {
    if (addr.is_ipv6()) {
        unsigned char bytes[16];
        return ipv6_bytes(addr.host, bytes) && bytes[0] == 0xff;
    }
    unsigned char bytes[4];
    return ipv4_bytes(addr.host, bytes) && bytes[0] >= 224 && bytes[0] <= 239;
}

bool is_unspecified(const AddressTuple& addr) {
    if (addr.host.empty()) {
        return true;
    }
    if (addr.is_ipv6()) {
        unsigned char bytes[16];
        if (!ipv6_bytes(addr.host, bytes)) {
            return false;
        }
        for (unsigned char byte : bytes) {
            if (byte != 0) {
                return false;
            }
        }
        return true;
    }
    unsigned char bytes[4];
    return ipv4_bytes(addr.host, bytes) && bytes[0] == 0 && bytes[1] == 0 && bytes[2] == 0 && bytes[3] == 0;
}

bool is_link_local(const AddressTuple& addr) {
    if (addr.is_ipv6()) {
        unsigned char bytes[16];
        return ipv6_bytes(addr.host, bytes) && bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80;
    }
    unsigned char bytes[4];
    return ipv4_bytes(addr.host, bytes) && bytes[0] == 169 && bytes[1] == 254;
}

bool to_sockaddr(const AddressTuple& addr, sockaddr_storage& out, int& out_len) {
    std::memset(&out, 0, sizeof(out));
    if (addr.is_ipv6()) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(addr.port);
        sin6->sin6_flowinfo = htonl(addr.flowinfo);
        sin6->sin6_scope_id = addr.scope_id;
        if (inet_pton(AF_INET6, strip_zone(addr.host).c_str(), &sin6->sin6_addr) != 1) {
            return false;
        }
        out_len = static_cast<int>(sizeof(sockaddr_in6));
        return true;
    }
    auto* sin = reinterpret_cast<sockaddr_in*>(&out);
    sin->sin_family = AF_INET;
    sin->sin_port = htons(addr.port);
    if (inet_pton(AF_INET, addr.host.c_str(), &sin->sin_addr) != 1) {
        return false;
    }
    out_len = static_cast<int>(sizeof(sockaddr_in));
    return true;
}

AddressTuple from_sockaddr(const sockaddr* addr) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (addr && addr->sa_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &sin6->sin6_addr, buffer, sizeof(buffer));
        return make_ipv6_address(buffer, ntohs(sin6->sin6_port), sin6->sin6_scope_id, ntohl(sin6->sin6_flowinfo));
    }
    if (addr && addr->sa_family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(addr);
        inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer));
        return make_ipv4_address(buffer, ntohs(sin->sin_port));
    }
    return AddressTuple{};
}

std::string get_host_string(const AddressTuple& addr) {
    if (addr.is_ipv6() && addr.scope_id != 0) {
        return addr.host + "%" + std::to_string(addr.scope_id);
    }
    return addr.host;
}

std::string get_host_port_string(const AddressTuple& addr) {
    if (addr.host.find(':') != std::string::npos) {
        return "[" + addr.host + "]:" + std::to_string(addr.port);
    }
    return addr.host + ":" + std::to_string(addr.port);
}

std::string get_adjusted_url(const std::string& url, const AddressTuple& addr) {
    if (!addr.is_ipv6() || addr.scope_id == 0) {
        return url;
    }

    UrlParts parts;
    if (!split_url(url, parts)) {
        return url;
    }

    const std::string hostname = strip_zone(parts.host);
    const auto host_addr = parse_ip_address(hostname);
    if (!host_addr || !host_addr->is_ipv6() || !is_link_local(*host_addr)) {
        return url;
    }

    std::string netloc = "[" + hostname + "%" + std::to_string(addr.scope_id) + "]";
    if (!parts.port.empty()) {
        netloc += ":" + parts.port;
    }
    return parts.scheme + "://" + netloc + parts.remainder;
}

std::string url_hostname(const std::string& url) {
    UrlParts parts;
    if (!split_url(url, parts)) {
        return "";
    }
    return strip_zone(parts.host);
}

std::optional<int> url_ip_version(const std::string& url) {
    const std::string hostname = url_hostname(url);
    if (hostname.empty()) {
        return std::nullopt;
    }
    const auto addr = parse_ip_address(hostname);
    if (!addr) {
        return std::nullopt;
    }
    return addr->is_ipv6() ? 6 : 4;
}

AddressTuple get_source_address_tuple(const AddressTuple& target, const std::optional<AddressTuple>& source) {
    if (source && !is_unspecified(*source)) {
        return *source;
    }

    AddressTuple fallback = target.is_ipv6() ? make_ipv6_address("::", 0, target.scope_id)
                                             : make_ipv4_address("0.0.0.0", 0);

    sockaddr_storage target_storage;
    int target_len = 0;
    if (!to_sockaddr(target, target_storage, target_len)) {
        LOG_CPP_WARNING("[Address] Cannot resolve source for unparsable target %s", target.host.c_str());
        return fallback;
    }

    socket_t probe = socket(target.is_ipv6() ? AF_INET6 : AF_INET, SOCK_DGRAM, 0);
    if (probe == SSDP_INVALID_SOCKET_VALUE) {
        LOG_CPP_WARNING("[Address] Failed to create probe socket (errno: %d)", SSDP_GET_LAST_SOCK_ERROR);
        return fallback;
    }

    // A connected UDP socket sends nothing; it only selects the route and local address.
    if (connect(probe, reinterpret_cast<sockaddr*>(&target_storage), static_cast<ssdp_socklen_t>(target_len)) != 0) {
        LOG_CPP_WARNING("[Address] No route to %s, using unspecified source (errno: %d)",
                        target.to_string().c_str(), SSDP_GET_LAST_SOCK_ERROR);
        SSDP_CLOSE_SOCKET(probe);
        return fallback;
    }

    sockaddr_storage local_storage;
    ssdp_socklen_t local_len = sizeof(local_storage);
    std::memset(&local_storage, 0, sizeof(local_storage));
    if (getsockname(probe, reinterpret_cast<sockaddr*>(&local_storage), &local_len) != 0) {
        LOG_CPP_WARNING("[Address] getsockname failed on probe socket (errno: %d)", SSDP_GET_LAST_SOCK_ERROR);
        SSDP_CLOSE_SOCKET(probe);
        return fallback;
    }
    SSDP_CLOSE_SOCKET(probe);

    AddressTuple local = from_sockaddr(reinterpret_cast<sockaddr*>(&local_storage));
    local.port = 0;
    if (local.is_ipv6()) {
        local.flowinfo = 0;
        local.scope_id = target.scope_id;
    }
    return local;
}

} // namespace ssdp
} // namespace ssdptrack
