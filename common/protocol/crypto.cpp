#include "crypto.hpp"
#include <openssl/evp.h>
#include <cctype>

namespace yeelight::crypto {

std::optional<std::array<uint8_t, 20>> sha1(std::string_view data) {
    std::array<uint8_t, 20> digest{};
    unsigned int length = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha1(), nullptr) != 1 ||
        length != digest.size()) {
        return std::nullopt;
    }

    return digest;
}

std::string to_hex(const uint8_t* data, size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string result;
    result.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        result.push_back(digits[data[i] >> 4]);
        result.push_back(digits[data[i] & 0x0f]);
    }
    return result;
}

std::optional<std::string> uuid_from_id(std::string_view id) {
    auto digest = sha1(id);
    if (!digest) {
        return std::nullopt;
    }

    std::string hex = to_hex(digest->data(), digest->size());

    // Template characters other than x/y are copied and do not consume a digit
    constexpr std::string_view pattern = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";
    std::string uuid;
    uuid.reserve(pattern.size());

    size_t i = 0;
    for (char c : pattern) {
        if (c == 'x') {
            uuid.push_back(hex[i++]);
        } else if (c == 'y') {
            int nibble = std::isdigit(static_cast<unsigned char>(hex[i]))
                ? hex[i] - '0' : hex[i] - 'a' + 10;
            ++i;
            uuid.push_back("0123456789abcdef"[(nibble & 0x3) | 0x8]);
        } else {
            uuid.push_back(c);
        }
    }

    return uuid;
}

bool is_uuid(std::string_view s) {
    if (s.size() != 36) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i])) ||
                   std::isupper(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace yeelight::crypto
