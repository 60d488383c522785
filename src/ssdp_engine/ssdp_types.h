/**
 * @file ssdp_types.h
 * @brief Enumerations shared by the codec, listeners and tracker.
 */
#ifndef SSDPTRACK_SSDP_TYPES_H
#define SSDPTRACK_SSDP_TYPES_H

#include <optional>
#include <string>

namespace ssdptrack {
namespace ssdp {

inline constexpr const char* kSsdpAlive = "ssdp:alive";
inline constexpr const char* kSsdpByebye = "ssdp:byebye";
inline constexpr const char* kSsdpUpdate = "ssdp:update";
inline constexpr const char* kSsdpDiscover = "\"ssdp:discover\"";
inline constexpr const char* kSsdpStAll = "ssdp:all";
inline constexpr const char* kSsdpStRootDevice = "upnp:rootdevice";

/**
 * @enum SsdpSource
 * @brief Where a header set came from and, after tracking, what it meant.
 */
enum class SsdpSource {
    SEARCH,                 ///< Raw search response (set by the search listener).
    ADVERTISEMENT,          ///< Raw NOTIFY (set by the advertisement listener).
    SEARCH_ALIVE,           ///< Known device answered a search, nothing changed.
    SEARCH_CHANGED,         ///< New device/service or changed headers via search.
    ADVERTISEMENT_ALIVE,    ///< ssdp:alive that brought something new.
    ADVERTISEMENT_BYEBYE,   ///< ssdp:byebye for a tracked device.
    ADVERTISEMENT_UPDATE    ///< ssdp:update.
};

/**
 * @enum NotificationSubType
 * @brief Value of the NTS header.
 */
enum class NotificationSubType {
    ALIVE,
    BYEBYE,
    UPDATE
};

inline const char* to_string(SsdpSource source) {
    switch (source) {
        case SsdpSource::SEARCH: return "search";
        case SsdpSource::ADVERTISEMENT: return "advertisement";
        case SsdpSource::SEARCH_ALIVE: return "search_alive";
        case SsdpSource::SEARCH_CHANGED: return "search_changed";
        case SsdpSource::ADVERTISEMENT_ALIVE: return "advertisement_alive";
        case SsdpSource::ADVERTISEMENT_BYEBYE: return "advertisement_byebye";
        case SsdpSource::ADVERTISEMENT_UPDATE: return "advertisement_update";
    }
    return "unknown";
}

inline std::optional<SsdpSource> ssdp_source_from_string(const std::string& value) {
    if (value == "search") return SsdpSource::SEARCH;
    if (value == "advertisement") return SsdpSource::ADVERTISEMENT;
    if (value == "search_alive") return SsdpSource::SEARCH_ALIVE;
    if (value == "search_changed") return SsdpSource::SEARCH_CHANGED;
    if (value == "advertisement_alive") return SsdpSource::ADVERTISEMENT_ALIVE;
    if (value == "advertisement_byebye") return SsdpSource::ADVERTISEMENT_BYEBYE;
    if (value == "advertisement_update") return SsdpSource::ADVERTISEMENT_UPDATE;
    return std::nullopt;
}

inline const char* to_string(NotificationSubType nts) {
    switch (nts) {
        case NotificationSubType::ALIVE: return kSsdpAlive;
        case NotificationSubType::BYEBYE: return kSsdpByebye;
        case NotificationSubType::UPDATE: return kSsdpUpdate;
    }
    return "";
}

inline std::optional<NotificationSubType> notification_sub_type_from_string(const std::string& value) {
    if (value == kSsdpAlive) return NotificationSubType::ALIVE;
    if (value == kSsdpByebye) return NotificationSubType::BYEBYE;
    if (value == kSsdpUpdate) return NotificationSubType::UPDATE;
    return std::nullopt;
}

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_SSDP_TYPES_H
