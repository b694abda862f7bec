#pragma once

#include "event_loop.hpp"

#include <protocol/commands.hpp>
#include <types/enums.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace control {

constexpr int DEFAULT_DEADLINE_MS = 5000;

struct Options {
    // Measured from the start of the connection attempt
    std::chrono::milliseconds deadline{DEFAULT_DEADLINE_MS};

    // Sent in the request and matched against the reply "id"
    int64_t request_id = yeelight::commands::DEFAULT_REQUEST_ID;
};

enum class State {
    Idle,
    Connecting,
    AwaitingReply,
    Succeeded,
    Failed,
    TimedOut,
};

struct Result {
    yeelight::CommandStatus status = yeelight::CommandStatus::Succeeded;
    std::string message;   // failure description
    nlohmann::json reply;  // decoded reply object when status == Succeeded

    bool ok() const { return status == yeelight::CommandStatus::Succeeded; }

    // Reply "result" array, empty array when absent
    nlohmann::json result() const;
};

using Completion = std::function<void(Result)>;

// Send one command to the device at `address` (scheme://host:port) and wait for its reply.
// on_complete is called exactly once. An unparsable address completes immediately with
// PreconditionError before any socket is created. Every other path closes the connection
// exactly once before on_complete runs.
void send(event_loop::Loop& loop, std::string_view address,
          const yeelight::commands::Command& command, Completion on_complete,
          const Options& options = {});

} // namespace control
