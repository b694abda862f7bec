#pragma once

#include <dbus/dbus.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dbus_service {

// Session bus names
constexpr const char* SERVICE_NAME = "com.yeelight.Bridge";
constexpr const char* OBJECT_PATH = "/com/yeelight/Bridge";
constexpr const char* INTERFACE_NAME = "com.yeelight.Bridge";

// Error names returned by SetPower / GetPower
namespace errors {
    constexpr const char* UNKNOWN_LIGHT = "com.yeelight.Bridge.Error.UnknownLight";
    constexpr const char* CONNECT = "com.yeelight.Bridge.Error.Connect";
    constexpr const char* DECODE = "com.yeelight.Bridge.Error.Decode";
    constexpr const char* TIMEOUT = "com.yeelight.Bridge.Error.Timeout";
}

struct LightInfo {
    std::string uuid;
    std::string id;
    std::string model;
    std::string location;
};

// Deferred method reply. error_name empty means success.
struct Reply {
    std::string error_name;
    std::string message;
    bool on = false;  // GetPower only
};

using ReplyCallback = std::function<void(const Reply&)>;

// Method handlers supplied by the daemon. SetPower/GetPower answer through `reply`,
// which may run before the handler returns.
struct Callbacks {
    std::function<void()> on_discover;
    std::function<std::vector<LightInfo>()> on_list;
    std::function<void(const std::string& light, bool on, ReplyCallback reply)> on_set_power;
    std::function<void(const std::string& light, ReplyCallback reply)> on_get_power;
};

// Values behind the read-only properties
struct State {
    uint32_t light_count = 0;
    bool discovering = false;
};

// Connect to the session bus and export OBJECT_PATH. nullptr on failure.
// callbacks and state must outlive the connection.
DBusConnection* init(Callbacks* callbacks, State* state);

// Claim SERVICE_NAME, false if another process holds it
bool request_name(DBusConnection* conn);

// PropertiesChanged for the named properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                             const char** property_names, int num_properties);

// Store new values, signal only those that differ
void update_state(DBusConnection* conn, State* state, uint32_t light_count, bool discovering);

// Read and dispatch whatever is queued, call when get_fd() is readable
void process_pending(DBusConnection* conn);

int get_fd(DBusConnection* conn);

// Unexport and drop the connection
void cleanup(DBusConnection* conn);

} // namespace dbus_service
