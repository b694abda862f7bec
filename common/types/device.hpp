#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace yeelight {

// Well-known header names in a discovery reply
namespace keys {
    constexpr const char* ID = "id";
    constexpr const char* MODEL = "model";
    constexpr const char* LOCATION = "location";
    constexpr const char* FW_VER = "fw_ver";
    constexpr const char* SUPPORT = "support";
}

// One parsed discovery reply. Keys are lower-cased header names.
struct DeviceRecord {
    std::map<std::string, std::string> fields;

    // Empty string when the header was absent
    const std::string& get(const std::string& key) const {
        static const std::string empty;
        auto it = fields.find(key);
        return it != fields.end() ? it->second : empty;
    }

    bool has(const std::string& key) const { return fields.count(key) != 0; }

    const std::string& id() const { return get(keys::ID); }
    const std::string& model() const { return get(keys::MODEL); }
    const std::string& location() const { return get(keys::LOCATION); }
};

// host:port taken from a location value
struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

// Stable key of a previously registered accessory plus the host's handle to it.
// The reconciler only compares uuid values.
struct KnownIdentity {
    std::string uuid;
    size_t handle = 0;
};

} // namespace yeelight
