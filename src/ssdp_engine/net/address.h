/**
 * @file address.h
 * @brief Address tuples, multicast constants and URL helpers for SSDP.
 * @details An `AddressTuple` mirrors a socket address: host, port and, for IPv6,
 *          flow info and scope (interface) id. Link-local IPv6 traffic is only usable
 *          with its scope id, so the helpers here carry it into host strings and
 *          LOCATION urls.
 */
#ifndef SSDPTRACK_NET_ADDRESS_H
#define SSDPTRACK_NET_ADDRESS_H

#include <cstdint>
#include <optional>
#include <string>

struct sockaddr;
struct sockaddr_storage;

namespace ssdptrack {
namespace ssdp {

inline constexpr const char* kSsdpIpV4 = "239.255.255.250";
inline constexpr const char* kSsdpIpV6LinkLocal = "FF02::C";
inline constexpr const char* kSsdpIpV6SiteLocal = "FF05::C";
inline constexpr const char* kSsdpIpV6OrganisationLocal = "FF08::C";
inline constexpr const char* kSsdpIpV6Global = "FF0E::C";
inline constexpr uint16_t kSsdpPort = 1900;

enum class AddressFamily {
    IPv4,
    IPv6
};

struct AddressTuple {
    std::string host;          // Literal address without any %zone suffix.
    uint16_t port = 0;
    uint32_t flowinfo = 0;     // IPv6 only.
    uint32_t scope_id = 0;     // IPv6 only, 0 when unscoped.
    AddressFamily family = AddressFamily::IPv4;

    bool is_ipv6() const { return family == AddressFamily::IPv6; }

    /** @brief `host:port`, or `[host%scope]:port` for IPv6. */
    std::string to_string() const;

    bool operator==(const AddressTuple& other) const;
    bool operator!=(const AddressTuple& other) const { return !(*this == other); }
};

AddressTuple make_ipv4_address(const std::string& host, uint16_t port);
AddressTuple make_ipv6_address(const std::string& host, uint16_t port, uint32_t scope_id = 0, uint32_t flowinfo = 0);

/**
 * @brief Parses a literal IPv4/IPv6 address, optionally carrying `%zone`.
 * @details The zone may be numeric or an interface name.
 * @return The address tuple, or std::nullopt if `host` is not an IP literal.
 */
std::optional<AddressTuple> parse_ip_address(const std::string& host, uint16_t port = 0);

/** @brief The default multicast target for IPv4. */
AddressTuple ssdp_target_v4();

/** @brief The default link-local multicast target for IPv6 on interface `scope_id`. */
AddressTuple ssdp_target_v6(uint32_t scope_id);

/** @brief Group a listener targets when none is given, matching the source's family. */
AddressTuple default_ssdp_target(const std::optional<AddressTuple>& source);

bool is_multicast(const AddressTuple& addr);
bool is_unspecified(const AddressTuple& addr);
bool is_link_local(const AddressTuple& addr);

/**
 * @brief Converts to a socket address.
 * @return false if `addr.host` is not a valid literal for its family.
 */
bool to_sockaddr(const AddressTuple& addr, sockaddr_storage& out, int& out_len);

/** @brief Converts a received socket address. Unknown families yield an empty host. */
AddressTuple from_sockaddr(const sockaddr* addr);

/** @brief Host part used for `_host`: `host%scope` for scoped IPv6, plain host otherwise. */
std::string get_host_string(const AddressTuple& addr);

/** @brief `host:port` with IPv6 hosts bracketed, as used in the HOST header. */
std::string get_host_port_string(const AddressTuple& addr);

/**
 * @brief Rewrites a url pointing at a link-local IPv6 host to carry the zone id.
 * @details Returns `url` unchanged unless `addr` is IPv6 with a non-zero scope id and
 *          the url host is a link-local IPv6 literal; then the host becomes
 *          `[host%scope]`.
 */
std::string get_adjusted_url(const std::string& url, const AddressTuple& addr);

/** @brief Host of a url with brackets and zone stripped, or empty if unparsable. */
std::string url_hostname(const std::string& url);

/** @brief 4 or 6 if the url host is an IP literal, std::nullopt otherwise. */
std::optional<int> url_ip_version(const std::string& url);

/**
 * @brief Determines the local address to send from when talking to `target`.
 * @details An explicit, specified `source` wins. Otherwise the routing table is
 *          consulted through a connected UDP probe; IPv6 results carry the target's
 *          scope id. When no route exists the unspecified address is used.
 */
AddressTuple get_source_address_tuple(const AddressTuple& target,
                                      const std::optional<AddressTuple>& source = std::nullopt);

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_NET_ADDRESS_H
