#include "ssdp_codec.h"

#include "../ssdp_errors.h"
#include "../ssdp_types.h"

#include <vector>

namespace ssdptrack {
namespace ssdp {

namespace {

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::vector<std::string> split_lines(const std::string& data) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= data.size()) {
        auto end = data.find('\n', start);
        if (end == std::string::npos) {
            end = data.size();
        }
        std::string line = data.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

} // namespace

std::string encode_ssdp_packet(const std::string& request_line, const SsdpHeaders& headers) {
    std::string packet = request_line + "\r\n";
    for (const auto& entry : headers) {
        if (is_internal_header(entry.first)) {
            continue;
        }
        packet += entry.first + ":" + entry.second + "\r\n";
    }
    packet += "\r\n";
    return packet;
}

std::string build_ssdp_search_packet(const AddressTuple& target, int mx, const std::string& search_target) {
    SsdpHeaders headers;
    headers.set("HOST", get_host_port_string(target));
    headers.set("MAN", kSsdpDiscover);
    headers.set("MX", std::to_string(mx));
    headers.set("ST", search_target);
    return encode_ssdp_packet(kSearchRequestLine, headers);
}

bool is_valid_ssdp_packet(const std::string& data) {
    return !data.empty() &&
           data.find('\n') != std::string::npos &&
           (starts_with(data, kNotifyRequestLine) ||
            starts_with(data, kSearchRequestLine) ||
            starts_with(data, kOkStatusLine));
}

std::pair<std::string, SsdpHeaders> decode_ssdp_packet(const std::string& data,
                                                       const AddressTuple& local_addr,
                                                       const AddressTuple& remote_addr) {
    const std::vector<std::string> lines = split_lines(data);
    const std::string request_line = trim_copy(lines.front());

    SsdpHeaders headers;
    std::string last_key;
    for (std::size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) {
            break;
        }
        if (line[0] == ' ' || line[0] == '\t') {
            if (last_key.empty()) {
                throw SsdpDecodeError("Continuation line without a header: " + line);
            }
            headers.set(last_key, headers.get_or(last_key, "") + " " + trim_copy(line));
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw SsdpDecodeError("Header line without separator: " + line);
        }
        const std::string key = trim_copy(line.substr(0, colon));
        if (key.empty()) {
            throw SsdpDecodeError("Header line without name: " + line);
        }
        headers.set(key, trim_copy(line.substr(colon + 1)));
        last_key = key;
    }

    auto location = headers.get("location");
    if (location) {
        headers.set("_location_original", *location);
        headers.set("location", get_adjusted_url(*location, remote_addr));
    }

    set_timestamp(headers, std::chrono::system_clock::now());
    headers.set("_host", get_host_string(remote_addr));
    headers.set("_port", std::to_string(remote_addr.port));
    headers.set("_local_addr", local_addr.to_string());
    headers.set("_remote_addr", remote_addr.to_string());

    auto udn = udn_from_headers(headers);
    if (udn) {
        headers.set("_udn", *udn);
    }

    return {request_line, headers};
}

std::optional<std::string> udn_from_usn(const std::string& usn) {
    if (!starts_with(usn, "uuid:")) {
        return std::nullopt;
    }
    return usn.substr(0, usn.find("::"));
}

std::optional<std::string> udn_from_headers(const SsdpHeaders& headers) {
    auto usn = headers.get("usn");
    if (!usn) {
        return std::nullopt;
    }
    return udn_from_usn(*usn);
}

} // namespace ssdp
} // namespace ssdptrack
