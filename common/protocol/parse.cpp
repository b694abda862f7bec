#include "parse.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace yeelight::parse {

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::map<std::string, std::string> parse_headers(std::string_view text) {
    std::map<std::string, std::string> result;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();

        // Trailing '\r' of a CRLF line is removed by trim()
        std::string_view line = text.substr(pos, end - pos);
        size_t separator = line.find(':');
        if (separator != std::string_view::npos) {
            std::string key = to_lower(trim(line.substr(0, separator)));
            result[key] = std::string(trim(line.substr(separator + 1)));
        }

        pos = end + 1;
    }

    return result;
}

DeviceRecord parse_device(std::string_view text) {
    return DeviceRecord{parse_headers(text)};
}

bool has_usable_id(const DeviceRecord& record) {
    return !trim(record.id()).empty();
}

std::optional<Endpoint> parse_location(std::string_view location) {
    location = trim(location);

    size_t scheme_end = location.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    std::string_view authority = location.substr(scheme_end + 3);
    size_t path = authority.find('/');
    if (path != std::string_view::npos) {
        authority = authority.substr(0, path);
    }

    size_t colon = authority.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= authority.size()) {
        return std::nullopt;
    }

    std::string_view host = authority.substr(0, colon);
    std::string_view port_str = authority.substr(colon + 1);

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
        return std::nullopt;
    }
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }

    return Endpoint{std::string(host), static_cast<uint16_t>(port)};
}

std::optional<nlohmann::json> decode_reply(std::string_view line) {
    line = trim(line);
    if (line.empty()) {
        return std::nullopt;
    }

    auto reply = nlohmann::json::parse(line, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return std::nullopt;
    }
    return reply;
}

namespace {

// Keeps only the offset of the first syntax error
struct ErrorOffset : nlohmann::json_sax<nlohmann::json> {
    std::optional<size_t> position;

    bool null() override { return true; }
    bool boolean(bool) override { return true; }
    bool number_integer(number_integer_t) override { return true; }
    bool number_unsigned(number_unsigned_t) override { return true; }
    bool number_float(number_float_t, const string_t&) override { return true; }
    bool string(string_t&) override { return true; }
    bool binary(binary_t&) override { return true; }
    bool start_object(std::size_t) override { return true; }
    bool key(string_t&) override { return true; }
    bool end_object() override { return true; }
    bool start_array(std::size_t) override { return true; }
    bool end_array() override { return true; }

    bool parse_error(std::size_t offset, const std::string&,
                     const nlohmann::detail::exception&) override {
        position = offset;
        return false;
    }
};

} // namespace

Framing classify_reply(std::string_view buffer) {
    if (trim(buffer).empty()) {
        return Framing::Partial;
    }
    if (decode_reply(buffer)) {
        return Framing::Complete;
    }

    ErrorOffset sax;
    if (nlohmann::json::sax_parse(buffer.begin(), buffer.end(), &sax)) {
        // Well-formed, but not an object
        return Framing::Invalid;
    }

    // Running out of input is reported one past the last byte
    if (sax.position && *sax.position > buffer.size()) {
        return Framing::Partial;
    }
    return Framing::Invalid;
}

bool is_notification(const nlohmann::json& reply) {
    return reply.is_object() && reply.contains("method") && !reply.contains("id");
}

std::optional<int64_t> reply_id(const nlohmann::json& reply) {
    if (!reply.is_object()) return std::nullopt;
    auto it = reply.find("id");
    if (it == reply.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int64_t>();
}

std::optional<std::string> reply_error(const nlohmann::json& reply) {
    if (!reply.is_object()) return std::nullopt;
    auto it = reply.find("error");
    if (it == reply.end()) {
        return std::nullopt;
    }
    if (it->is_object() && it->contains("message") && (*it)["message"].is_string()) {
        return (*it)["message"].get<std::string>();
    }
    return it->dump();
}

bool power_from_reply(const nlohmann::json& reply) {
    if (!reply.is_object()) return false;
    auto it = reply.find("result");
    if (it == reply.end() || !it->is_array() || it->empty()) {
        return false;
    }
    const auto& first = (*it)[0];
    return first.is_string() && first.get<std::string>() == "on";
}

} // namespace yeelight::parse
