#ifndef SSDPTRACK_SSDP_ENGINE_SETTINGS_H
#define SSDPTRACK_SSDP_ENGINE_SETTINGS_H

#include <cstddef>
#include <string>

namespace ssdptrack {
namespace ssdp {

inline constexpr int kDefaultSearchMx = 4;
inline constexpr int kDefaultMulticastTtl = 2;
inline constexpr int kDefaultMaxAgeSeconds = 900;
inline constexpr std::size_t kDefaultReceiveBufferSize = 8192;
inline constexpr int kDefaultLoopPollTimeoutMs = 1000;
inline constexpr const char* kDefaultSearchTarget = "ssdp:all";

struct SsdpEngineSettings {
    int search_mx = kDefaultSearchMx;              // MX header and default collection window (s)
    std::string search_target = kDefaultSearchTarget;
    int multicast_ttl = kDefaultMulticastTtl;      // IP_MULTICAST_TTL / IPV6_MULTICAST_HOPS
    int default_max_age_seconds = kDefaultMaxAgeSeconds;
    std::size_t receive_buffer_size = kDefaultReceiveBufferSize;
    int loop_poll_timeout_ms = kDefaultLoopPollTimeoutMs;
};

inline int sanitize_search_mx(int configured) {
    return configured > 0 ? configured : kDefaultSearchMx;
}

inline int sanitize_multicast_ttl(int configured) {
    return (configured > 0 && configured <= 255) ? configured : kDefaultMulticastTtl;
}

inline int sanitize_max_age_seconds(int configured) {
    return configured > 0 ? configured : kDefaultMaxAgeSeconds;
}

inline std::size_t sanitize_receive_buffer_size(std::size_t configured) {
    // Large enough for one full-size UDP datagram payload at minimum.
    return configured >= 1500 ? configured : kDefaultReceiveBufferSize;
}

inline SsdpEngineSettings sanitize_settings(SsdpEngineSettings settings) {
    settings.search_mx = sanitize_search_mx(settings.search_mx);
    settings.multicast_ttl = sanitize_multicast_ttl(settings.multicast_ttl);
    settings.default_max_age_seconds = sanitize_max_age_seconds(settings.default_max_age_seconds);
    settings.receive_buffer_size = sanitize_receive_buffer_size(settings.receive_buffer_size);
    if (settings.loop_poll_timeout_ms <= 0) {
        settings.loop_poll_timeout_ms = kDefaultLoopPollTimeoutMs;
    }
    if (settings.search_target.empty()) {
        settings.search_target = kDefaultSearchTarget;
    }
    return settings;
}

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_SSDP_ENGINE_SETTINGS_H
