#pragma once

#include "../types/enums.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace yeelight::commands {

// Request id used when the caller does not supply one
constexpr int64_t DEFAULT_REQUEST_ID = 1;

// Transition duration for smooth power changes
constexpr int DEFAULT_TRANSITION_MS = 500;

// Devices reject smooth transitions shorter than this
constexpr int MIN_TRANSITION_MS = 30;

struct Command {
    std::string method;
    nlohmann::json params = nlohmann::json::array();
};

// Method names
namespace methods {
    constexpr const char* SET_POWER = "set_power";
    constexpr const char* GET_PROP = "get_prop";
}

// Wire form: {"id":<id>,"method":"...","params":[...]}\r\n
inline std::string serialize(const Command& command, int64_t id = DEFAULT_REQUEST_ID) {
    nlohmann::json request = {
        {"id", id},
        {"method", command.method},
        {"params", command.params.is_array() ? command.params : nlohmann::json::array()},
    };
    return request.dump() + "\r\n";
}

// set_power ["on"|"off", "smooth"|"sudden", <ms>]
inline Command set_power(PowerState state, Effect effect = Effect::Smooth,
                         int transition_ms = DEFAULT_TRANSITION_MS) {
    if (effect == Effect::Smooth && transition_ms < MIN_TRANSITION_MS) {
        transition_ms = MIN_TRANSITION_MS;
    }
    return {methods::SET_POWER,
            nlohmann::json::array({std::string(to_string(state)),
                                   std::string(to_string(effect)), transition_ms})};
}

inline Command set_power(bool on, int transition_ms = DEFAULT_TRANSITION_MS) {
    return set_power(on ? PowerState::On : PowerState::Off, Effect::Smooth, transition_ms);
}

// get_prop ["power"]
inline Command get_power() {
    return {methods::GET_PROP, nlohmann::json::array({"power"})};
}

} // namespace yeelight::commands
