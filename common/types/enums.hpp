#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace yeelight {

// Outcome of one control channel round-trip
enum class CommandStatus : uint8_t {
    Succeeded,
    PreconditionError,  // missing or unparsable device address, no socket touched
    ConnectError,
    DecodeError,
    TimedOut,
};

inline std::string_view to_string(CommandStatus status) {
    switch (status) {
        case CommandStatus::Succeeded: return "succeeded";
        case CommandStatus::PreconditionError: return "precondition_error";
        case CommandStatus::ConnectError: return "connect_error";
        case CommandStatus::DecodeError: return "decode_error";
        case CommandStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

// Outcome of one discovery cycle
enum class DiscoveryStatus : uint8_t {
    Ok,
    SocketError,  // bind/join/send/receive failure, records collected so far are kept
};

inline std::string_view to_string(DiscoveryStatus status) {
    switch (status) {
        case DiscoveryStatus::Ok: return "ok";
        case DiscoveryStatus::SocketError: return "socket_error";
    }
    return "unknown";
}

enum class PowerState : uint8_t {
    Off = 0,
    On = 1,
};

inline std::string_view to_string(PowerState state) {
    switch (state) {
        case PowerState::Off: return "off";
        case PowerState::On: return "on";
    }
    return "unknown";
}

inline std::optional<PowerState> power_state_from_string(std::string_view s) {
    if (s == "on" || s == "1" || s == "true") return PowerState::On;
    if (s == "off" || s == "0" || s == "false") return PowerState::Off;
    return std::nullopt;
}

// Transition effect for set_* commands
enum class Effect : uint8_t {
    Sudden,
    Smooth,
};

inline std::string_view to_string(Effect effect) {
    switch (effect) {
        case Effect::Sudden: return "sudden";
        case Effect::Smooth: return "smooth";
    }
    return "smooth";
}

} // namespace yeelight
