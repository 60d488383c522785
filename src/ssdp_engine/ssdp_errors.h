/**
 * @file ssdp_errors.h
 * @brief Exception types raised by the SSDP engine.
 */
#ifndef SSDPTRACK_SSDP_ERRORS_H
#define SSDPTRACK_SSDP_ERRORS_H

#include <stdexcept>
#include <string>

namespace ssdptrack {
namespace ssdp {

/** @brief Socket creation, option or bind failure during listener startup. */
class SsdpSocketError : public std::runtime_error {
public:
    explicit SsdpSocketError(const std::string& what_arg) : std::runtime_error(what_arg) {}
};

/** @brief A datagram looked like SSDP but its header block could not be parsed. */
class SsdpDecodeError : public std::runtime_error {
public:
    explicit SsdpDecodeError(const std::string& what_arg) : std::runtime_error(what_arg) {}
};

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_SSDP_ERRORS_H
