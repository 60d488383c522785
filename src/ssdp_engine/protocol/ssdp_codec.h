/**
 * @file ssdp_codec.h
 * @brief Encoding and decoding of SSDP datagrams.
 */
#ifndef SSDPTRACK_PROTOCOL_SSDP_CODEC_H
#define SSDPTRACK_PROTOCOL_SSDP_CODEC_H

#include "ssdp_headers.h"
#include "../net/address.h"

#include <optional>
#include <string>
#include <utility>

namespace ssdptrack {
namespace ssdp {

inline constexpr const char* kSearchRequestLine = "M-SEARCH * HTTP/1.1";
inline constexpr const char* kNotifyRequestLine = "NOTIFY * HTTP/1.1";
inline constexpr const char* kOkStatusLine = "HTTP/1.1 200 OK";

/**
 * @brief Serializes a request/status line and headers.
 * @details Lines are joined with CRLF as `key:value` and terminated by an empty line.
 *          Synthetic `_` fields are not put on the wire.
 */
std::string encode_ssdp_packet(const std::string& request_line, const SsdpHeaders& headers);

/** @brief Builds an M-SEARCH request for `target` with the given MX and ST. */
std::string build_ssdp_search_packet(const AddressTuple& target, int mx, const std::string& search_target);

/**
 * @brief Cheap shape check run on every datagram before decoding.
 * @return true if non-empty, contains a newline and starts with a known SSDP line.
 */
bool is_valid_ssdp_packet(const std::string& data);

/**
 * @brief Parses a datagram into its first line and headers.
 * @details Adds `_timestamp`, `_host`, `_port`, `_local_addr`, `_remote_addr` and,
 *          when the USN carries one, `_udn`. A `location` pointing at a link-local
 *          IPv6 host gets the sender's zone id; the received value is kept in
 *          `_location_original`.
 * @throws SsdpDecodeError if a header line is malformed.
 */
std::pair<std::string, SsdpHeaders> decode_ssdp_packet(const std::string& data,
                                                       const AddressTuple& local_addr,
                                                       const AddressTuple& remote_addr);

/** @brief `uuid:...` part of a USN, or std::nullopt if the USN is not a UPnP one. */
std::optional<std::string> udn_from_usn(const std::string& usn);

/** @brief UDN from the `usn` header of `headers`. */
std::optional<std::string> udn_from_headers(const SsdpHeaders& headers);

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_PROTOCOL_SSDP_CODEC_H
