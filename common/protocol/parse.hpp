#pragma once

#include "../types/device.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace yeelight::parse {

// Parse an HTTP-style header block (CRLF or LF separated).
// Each line with a ':' is split on the first ':', key lower-cased and trimmed,
// value trimmed. Later duplicates overwrite earlier ones. Other lines are skipped.
std::map<std::string, std::string> parse_headers(std::string_view text);

// Parse one discovery reply into a record
DeviceRecord parse_device(std::string_view text);

// A record can be reconciled only when its id is non-empty after trimming
bool has_usable_id(const DeviceRecord& record);

// Parse "scheme://host:port[/...]" into host and port
std::optional<Endpoint> parse_location(std::string_view location);

// Decode one reply line. Returns nullopt unless it is a JSON object.
std::optional<nlohmann::json> decode_reply(std::string_view line);

// State of buffered reply bytes that have no line break yet
enum class Framing {
    Complete,   // a whole JSON object
    Partial,    // blank, or a prefix that more bytes could complete
    Invalid,    // can never become a JSON object
};

Framing classify_reply(std::string_view buffer);

// Unsolicited state notification: {"method":"props","params":{...}} without an id
bool is_notification(const nlohmann::json& reply);

// Request id echoed in a reply
std::optional<int64_t> reply_id(const nlohmann::json& reply);

// Message of an {"error":{"code":..,"message":".."}} reply
std::optional<std::string> reply_error(const nlohmann::json& reply);

// get_prop ["power"] reply: true only when result[0] == "on"
bool power_from_reply(const nlohmann::json& reply);

std::string_view trim(std::string_view s);
std::string to_lower(std::string_view s);

} // namespace yeelight::parse
