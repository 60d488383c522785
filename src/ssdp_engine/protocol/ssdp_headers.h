/**
 * @file ssdp_headers.h
 * @brief Case-insensitive, insertion-ordered header map used for every SSDP message.
 * @details Keys are matched regardless of letter case; the casing used by the most
 *          recent write is kept as the canonical key. Besides the wire headers a map
 *          carries synthetic fields prefixed with `_` (`_timestamp`, `_host`, `_port`,
 *          `_local_addr`, `_remote_addr`, `_udn`, `_source`, `_location_original`).
 *          All values are strings; the helpers below convert the typed synthetic ones.
 */
#ifndef SSDPTRACK_PROTOCOL_SSDP_HEADERS_H
#define SSDPTRACK_PROTOCOL_SSDP_HEADERS_H

#include "../ssdp_types.h"

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ssdptrack {
namespace ssdp {

using TimePoint = std::chrono::system_clock::time_point;

class CaseInsensitiveDict {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    CaseInsensitiveDict() = default;
    CaseInsensitiveDict(std::initializer_list<value_type> items);

    /** @brief Sets `key`, replacing its canonical casing but keeping its position. */
    void set(const std::string& key, const std::string& value);

    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    bool contains(const std::string& key) const;
    bool erase(const std::string& key);

    /** @brief Merges `other` into this map; keys of `other` win. */
    void update(const CaseInsensitiveDict& other);

    void clear();
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    /** @brief Plain copy keyed by canonical casing. */
    std::map<std::string, std::string> as_map() const;

    bool operator==(const CaseInsensitiveDict& other) const;
    bool operator!=(const CaseInsensitiveDict& other) const { return !(*this == other); }
    bool operator==(const std::map<std::string, std::string>& other) const;
    bool operator!=(const std::map<std::string, std::string>& other) const { return !(*this == other); }

private:
    void reindex();

    std::vector<value_type> entries_;
    std::unordered_map<std::string, std::size_t> index_;   // lower-cased key -> entries_ position
};

using SsdpHeaders = CaseInsensitiveDict;

std::string lowercase_copy(const std::string& text);
std::string trim_copy(const std::string& input);

bool is_internal_header(const std::string& key);

void set_timestamp(SsdpHeaders& headers, TimePoint timestamp);
std::optional<TimePoint> get_timestamp(const SsdpHeaders& headers);

void set_source(SsdpHeaders& headers, SsdpSource source);
std::optional<SsdpSource> get_source(const SsdpHeaders& headers);

} // namespace ssdp
} // namespace ssdptrack

#endif // SSDPTRACK_PROTOCOL_SSDP_HEADERS_H
