#pragma once

#include <cstdint>
#include <string>

namespace yeelight::probe {

// SSDP-style search on the Yeelight multicast group
constexpr const char* MULTICAST_ADDRESS = "239.255.255.250";
constexpr uint16_t MULTICAST_PORT = 1982;

// Local port the discovery socket listens on
constexpr uint16_t LOCAL_PORT = 62142;

// Outbound multicast TTL
constexpr int MULTICAST_TTL = 128;

// Collection window, measured from socket bind
constexpr int DEFAULT_WINDOW_MS = 1000;

constexpr const char* SEARCH_TARGET = "wifi_bulb";

// M-SEARCH * HTTP/1.1
// HOST: 239.255.255.250:1982
// MAN: "ssdp:discover"
// ST: wifi_bulb
inline std::string search_request(const std::string& host = MULTICAST_ADDRESS,
                                  uint16_t port = MULTICAST_PORT,
                                  const std::string& search_target = SEARCH_TARGET) {
    std::string payload = "M-SEARCH * HTTP/1.1\r\n";
    payload += "HOST: " + host + ":" + std::to_string(port) + "\r\n";
    payload += "MAN: \"ssdp:discover\"\r\n";
    payload += "ST: " + search_target + "\r\n";
    return payload;
}

} // namespace yeelight::probe
