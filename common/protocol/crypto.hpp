#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace yeelight::crypto {

// SHA-1 digest of the input bytes
std::optional<std::array<uint8_t, 20>> sha1(std::string_view data);

// Lowercase hex encoding
std::string to_hex(const uint8_t* data, size_t size);

// Stable accessory UUID for a device id.
// SHA-1 hex digits laid into xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, where y = (d & 0x3) | 0x8.
// Returns nullopt if the digest could not be computed.
std::optional<std::string> uuid_from_id(std::string_view id);

// Check the 8-4-4-4-12 lowercase hex shape
bool is_uuid(std::string_view s);

} // namespace yeelight::crypto
