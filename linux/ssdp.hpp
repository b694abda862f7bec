#pragma once

#include "event_loop.hpp"

#include <protocol/probe.hpp>
#include <types/device.hpp>
#include <types/enums.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ssdp {

struct Options {
    // Probe destination. Group membership is only requested for a multicast address.
    std::string target_address = yeelight::probe::MULTICAST_ADDRESS;
    uint16_t target_port = yeelight::probe::MULTICAST_PORT;

    // Local receive endpoint, port 0 picks an ephemeral port
    std::string bind_address = "0.0.0.0";
    uint16_t bind_port = yeelight::probe::LOCAL_PORT;

    int ttl = yeelight::probe::MULTICAST_TTL;
    std::chrono::milliseconds window{yeelight::probe::DEFAULT_WINDOW_MS};
    std::string search_target = yeelight::probe::SEARCH_TARGET;
};

struct Result {
    yeelight::DiscoveryStatus status = yeelight::DiscoveryStatus::Ok;
    std::string message;                        // error text when status != Ok
    std::vector<yeelight::DeviceRecord> records;  // arrival order
};

using Completion = std::function<void(Result)>;

// Run one discovery cycle on the loop. The socket is bound before the probe is sent
// and the window starts at bind. on_complete is called exactly once: at window expiry,
// on a receive error (with the records collected so far), or immediately when the
// socket cannot be set up or the probe cannot be sent.
void discover(event_loop::Loop& loop, const Options& options, Completion on_complete);

} // namespace ssdp
