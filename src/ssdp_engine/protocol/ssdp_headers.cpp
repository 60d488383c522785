#include "ssdp_headers.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ssdptrack {
namespace ssdp {

std::string lowercase_copy(const std::string& text) {
    std::string lowered = text;
    std::transform(
        lowered.begin(),
        lowered.end(),
        lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string trim_copy(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

bool is_internal_header(const std::string& key) {
    return !key.empty() && key[0] == '_';
}

CaseInsensitiveDict::CaseInsensitiveDict(std::initializer_list<value_type> items) {
    for (const auto& item : items) {
        set(item.first, item.second);
    }
}

void CaseInsensitiveDict::set(const std::string& key, const std::string& value) {
    const std::string lowered = lowercase_copy(key);
    auto it = index_.find(lowered);
    if (it != index_.end()) {
        entries_[it->second] = value_type(key, value);
        return;
    }
    index_.emplace(lowered, entries_.size());
    entries_.emplace_back(key, value);
}

std::optional<std::string> CaseInsensitiveDict::get(const std::string& key) const {
    auto it = index_.find(lowercase_copy(key));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].second;
}

std::string CaseInsensitiveDict::get_or(const std::string& key, const std::string& fallback) const {
    auto it = index_.find(lowercase_copy(key));
    return it == index_.end() ? fallback : entries_[it->second].second;
}

bool CaseInsensitiveDict::contains(const std::string& key) const {
    return index_.count(lowercase_copy(key)) != 0;
}

bool CaseInsensitiveDict::erase(const std::string& key) {
    auto it = index_.find(lowercase_copy(key));
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return true;
}

void CaseInsensitiveDict::update(const CaseInsensitiveDict& other) {
    for (const auto& entry : other.entries_) {
        set(entry.first, entry.second);
    }
}

void CaseInsensitiveDict::clear() {
    entries_.clear();
    index_.clear();
}

std::map<std::string, std::string> CaseInsensitiveDict::as_map() const {
    return std::map<std::string, std::string>(entries_.begin(), entries_.end());
}

bool CaseInsensitiveDict::operator==(const CaseInsensitiveDict& other) const {
    if (size() != other.size()) {
        return false;
    }
    for (const auto& entry : entries_) {
        auto value = other.get(entry.first);
        if (!value || *value != entry.second) {
            return false;
        }
    }
    return true;
}

bool CaseInsensitiveDict::operator==(const std::map<std::string, std::string>& other) const {
    CaseInsensitiveDict folded;
    for (const auto& item : other) {
        folded.set(item.first, item.second);
    }
    // Two keys of `other` differing only in case collapse into one entry.
    return folded.size() == other.size() && *this == folded;
}

void CaseInsensitiveDict::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(lowercase_copy(entries_[i].first), i);
    }
}

void set_timestamp(SsdpHeaders& headers, TimePoint timestamp) {
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch());
    headers.set("_timestamp", std::to_string(micros.count()));
}

std::optional<TimePoint> get_timestamp(const SsdpHeaders& headers) {
    auto value = headers.get("_timestamp");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    char* end_ptr = nullptr;
    const long long micros = std::strtoll(value->c_str(), &end_ptr, 10);
    if (end_ptr == value->c_str() || *end_ptr != '\0') {
        return std::nullopt;
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::microseconds(micros)));
}

void set_source(SsdpHeaders& headers, SsdpSource source) {
    headers.set("_source", to_string(source));
}

std::optional<SsdpSource> get_source(const SsdpHeaders& headers) {
    auto value = headers.get("_source");
    if (!value) {
        return std::nullopt;
    }
    return ssdp_source_from_string(*value);
}

} // namespace ssdp
} // namespace ssdptrack
