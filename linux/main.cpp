#include "bridge.hpp"
#include "control.hpp"
#include "dbus.hpp"
#include "event_loop.hpp"
#include "ssdp.hpp"

#include <protocol/commands.hpp>
#include <protocol/parse.hpp>
#include <types/device.hpp>
#include <types/enums.hpp>

#include <poll.h>
#include <signal.h>

#include <charconv>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Global state (for daemon mode)
static event_loop::Loop g_loop;
static DBusConnection* g_session_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;
static bridge::Platform* g_platform = nullptr;

// Slack on top of the window/deadline before a one-shot command gives up on the loop
constexpr std::chrono::milliseconds LOOP_GRACE{1000};

// Timeout for calls into a running daemon
constexpr int DAEMON_CALL_TIMEOUT_MS = 15000;

// Signal handler
static void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_loop.stop();
}

// ============================================================================
// Option parsing
// ============================================================================

static bool parse_ms(const char* text, int& out) {
    std::string_view s(text);
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value < 0) {
        return false;
    }
    out = value;
    return true;
}

// Consumes --window/--deadline/--transition, leaves positional arguments in `positional`
static bool parse_options(int argc, char* argv[], int first, bridge::Options& options,
                          std::vector<std::string>& positional) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--window" || arg == "--deadline" || arg == "--transition") {
            int value = 0;
            if (i + 1 >= argc || !parse_ms(argv[i + 1], value)) {
                std::cerr << "Option " << arg << " expects a duration in milliseconds" << std::endl;
                return false;
            }
            ++i;
            if (arg == "--window") {
                options.discovery.window = std::chrono::milliseconds(value);
            } else if (arg == "--deadline") {
                options.control.deadline = std::chrono::milliseconds(value);
            } else {
                options.transition_ms = value;
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            positional.push_back(std::move(arg));
        }
    }
    return true;
}

static const char* error_name_for(yeelight::CommandStatus status) {
    switch (status) {
        case yeelight::CommandStatus::PreconditionError: return dbus_service::errors::UNKNOWN_LIGHT;
        case yeelight::CommandStatus::ConnectError: return dbus_service::errors::CONNECT;
        case yeelight::CommandStatus::DecodeError: return dbus_service::errors::DECODE;
        case yeelight::CommandStatus::TimedOut: return dbus_service::errors::TIMEOUT;
        case yeelight::CommandStatus::Succeeded: break;
    }
    return "";
}

static dbus_service::Reply to_reply(const control::Result& result, bool on = false) {
    dbus_service::Reply reply;
    if (!result.ok()) {
        reply.error_name = error_name_for(result.status);
        reply.message = result.message;
    }
    reply.on = on;
    return reply;
}

static void print_record(const yeelight::DeviceRecord& record) {
    std::cout << (record.id().empty() ? "(no id)" : record.id()) << std::endl;
    for (const auto& [key, value] : record.fields) {
        std::cout << "  " << key << ": " << value << std::endl;
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static void run_discovery() {
    if (!g_platform) return;

    dbus_service::update_state(g_session_dbus, &g_dbus_state, g_dbus_state.light_count, true);
    g_platform->discover_devices([](const ssdp::Result& result) {
        std::cout << "Discovery finished: " << result.records.size() << " replies, "
                  << g_platform->accessories().size() << " lights known" << std::endl;
        dbus_service::update_state(g_session_dbus, &g_dbus_state,
                                   static_cast<uint32_t>(g_platform->accessories().size()),
                                   g_platform->discovering());
    });
}

static int cmd_daemon(const bridge::Options& options) {
    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "Yeelight bridge starting..." << std::endl;

    bridge::Callbacks platform_callbacks;
    platform_callbacks.on_accessory_added = [](const bridge::Accessory& accessory) {
        std::cout << "New light: " << accessory.display_name << " (" << accessory.uuid << ")"
                  << std::endl;
    };
    bridge::Platform platform(g_loop, options, platform_callbacks);
    g_platform = &platform;

    // Set up D-Bus service callbacks
    g_dbus_callbacks.on_discover = []() {
        run_discovery();
    };

    g_dbus_callbacks.on_list = []() {
        std::vector<dbus_service::LightInfo> lights;
        for (const auto& accessory : g_platform->accessories()) {
            lights.push_back({accessory.uuid, accessory.serial_number, accessory.model,
                              accessory.context.location()});
        }
        return lights;
    };

    g_dbus_callbacks.on_set_power = [](const std::string& light, bool on,
                                       dbus_service::ReplyCallback reply) {
        g_platform->set_on(light, on, [reply](const control::Result& result) {
            reply(to_reply(result));
        });
    };

    g_dbus_callbacks.on_get_power = [](const std::string& light,
                                       dbus_service::ReplyCallback reply) {
        g_platform->get_on(light, [reply](const control::Result& result, bool on) {
            reply(to_reply(result, on));
        });
    };

    // Initialize session D-Bus service
    g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        g_platform = nullptr;
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        dbus_service::cleanup(g_session_dbus);
        g_platform = nullptr;
        return 1;
    }

    int session_fd = dbus_service::get_fd(g_session_dbus);
    event_loop::WatchId dbus_watch = 0;
    if (session_fd >= 0) {
        dbus_watch = g_loop.watch(session_fd, POLLIN, [](short) {
            dbus_service::process_pending(g_session_dbus);
        });
    }

    // Initial discovery cycle
    run_discovery();

    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    g_loop.run();

    // Cleanup
    if (dbus_watch != 0) g_loop.unwatch(dbus_watch);
    dbus_service::cleanup(g_session_dbus);
    g_session_dbus = nullptr;
    g_platform = nullptr;

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

static int cmd_discover(const bridge::Options& options) {
    bool done = false;
    bool ok = false;

    ssdp::discover(g_loop, options.discovery, [&](ssdp::Result result) {
        done = true;
        ok = result.status == yeelight::DiscoveryStatus::Ok;
        if (!ok) {
            std::cerr << "Discovery failed: " << result.message << std::endl;
        }
        for (const auto& record : result.records) {
            print_record(record);
        }
        std::cout << result.records.size() << " replies" << std::endl;
    });

    if (!g_loop.run_until([&] { return done; }, options.discovery.window + LOOP_GRACE)) {
        std::cerr << "Discovery did not complete" << std::endl;
        return 1;
    }
    return ok ? 0 : 1;
}

// Send one command directly to a device and print the reply
static int run_command(const std::string& location, const yeelight::commands::Command& command,
                       const bridge::Options& options, bool print_power) {
    bool done = false;
    control::Result outcome;

    control::send(g_loop, location, command, [&](control::Result result) {
        done = true;
        outcome = std::move(result);
    }, options.control);

    if (!g_loop.run_until([&] { return done; }, options.control.deadline + LOOP_GRACE)) {
        std::cerr << "Command did not complete" << std::endl;
        return 1;
    }

    if (!outcome.ok()) {
        std::cerr << yeelight::to_string(outcome.status) << ": " << outcome.message << std::endl;
        return 1;
    }

    if (auto error = yeelight::parse::reply_error(outcome.reply)) {
        std::cerr << "Device error: " << *error << std::endl;
        return 1;
    }

    if (print_power) {
        std::cout << (yeelight::parse::power_from_reply(outcome.reply) ? "on" : "off") << std::endl;
    } else {
        std::cout << outcome.reply.dump() << std::endl;
    }
    return 0;
}

static int cmd_power(const std::string& location, const std::string& state_str,
                     const bridge::Options& options) {
    auto state = yeelight::power_state_from_string(state_str);
    if (!state) {
        std::cerr << "Invalid power state: " << state_str << " (expected on or off)" << std::endl;
        return 1;
    }
    return run_command(location,
                       yeelight::commands::set_power(*state, yeelight::Effect::Smooth,
                                                     options.transition_ms),
                       options, false);
}

static int cmd_state(const std::string& location, const bridge::Options& options) {
    return run_command(location, yeelight::commands::get_power(), options, true);
}

// Connect to the session bus for talking to a running daemon
static DBusConnection* connect_session() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// Blocking call into the daemon, returns the reply (caller unrefs) or nullptr
static DBusMessage* call_daemon(DBusConnection* conn, DBusMessage* msg, const char* what) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply =
        dbus_connection_send_with_reply_and_block(conn, msg, DAEMON_CALL_TIMEOUT_MS, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << what << " failed (is daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

static DBusMessage* new_bridge_call(const char* method) {
    return dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        dbus_service::INTERFACE_NAME,
        method
    );
}

static int cmd_list() {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* msg = new_bridge_call("ListLights");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    DBusMessage* reply = call_daemon(conn, msg, "ListLights");
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    DBusMessageIter iter, array;
    size_t count = 0;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

        dbus_message_iter_recurse(&iter, &array);

        while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
            DBusMessageIter entry;
            dbus_message_iter_recurse(&array, &entry);

            const char* fields[4] = {"", "", "", ""};
            for (auto& field : fields) {
                if (dbus_message_iter_get_arg_type(&entry) != DBUS_TYPE_STRING) break;
                dbus_message_iter_get_basic(&entry, &field);
                dbus_message_iter_next(&entry);
            }

            std::cout << fields[1] << "  " << fields[2] << "  " << fields[3]
                      << "  " << fields[0] << std::endl;
            ++count;
            dbus_message_iter_next(&array);
        }
    }
    dbus_message_unref(reply);
    dbus_connection_unref(conn);

    if (count == 0) {
        std::cout << "No lights known" << std::endl;
    }
    return 0;
}

static int cmd_set_light(const std::string& light, bool on) {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* msg = new_bridge_call("SetPower");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    const char* light_str = light.c_str();
    dbus_bool_t value = on;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &light_str,
                             DBUS_TYPE_BOOLEAN, &value, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "SetPower");
    dbus_connection_unref(conn);
    if (!reply) return 1;
    dbus_message_unref(reply);

    std::cout << light << " turned " << (on ? "on" : "off") << std::endl;
    return 0;
}

static int cmd_get_light(const std::string& light) {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* msg = new_bridge_call("GetPower");
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    const char* light_str = light.c_str();
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &light_str, DBUS_TYPE_INVALID);

    DBusMessage* reply = call_daemon(conn, msg, "GetPower");
    dbus_connection_unref(conn);
    if (!reply) return 1;

    DBusError err;
    dbus_error_init(&err);
    dbus_bool_t on = false;
    bool ok = dbus_message_get_args(reply, &err, DBUS_TYPE_BOOLEAN, &on, DBUS_TYPE_INVALID);
    dbus_message_unref(reply);

    if (!ok) {
        std::cerr << "Unexpected GetPower reply: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }

    std::cout << (on ? "on" : "off") << std::endl;
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon                      Run the bridge daemon (D-Bus service)\n"
              << "  discover                    Search the LAN for lights and print replies\n"
              << "  power <location> <on|off>   Switch a light directly (yeelight://ip:port)\n"
              << "  state <location>            Query a light's power directly\n"
              << "  list                        List lights known to the daemon\n"
              << "  on <light>                  Switch on via the daemon (uuid or id)\n"
              << "  off <light>                 Switch off via the daemon\n"
              << "  get <light>                 Query power via the daemon\n"
              << "  help                        Show this help\n"
              << "\n"
              << "Options:\n"
              << "  --window <ms>               Discovery window (default "
              << yeelight::probe::DEFAULT_WINDOW_MS << ")\n"
              << "  --deadline <ms>             Command deadline (default "
              << control::DEFAULT_DEADLINE_MS << ")\n"
              << "  --transition <ms>           Smooth transition (default "
              << yeelight::commands::DEFAULT_TRANSITION_MS << ")\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    bridge::Options options;
    std::vector<std::string> args;
    if (!parse_options(argc, argv, 2, options, args)) {
        return 1;
    }

    auto expect_args = [&](size_t count, const char* usage) {
        if (args.size() != count) {
            std::cerr << "Usage: " << argv[0] << " " << usage << std::endl;
            return false;
        }
        return true;
    };

    if (cmd == "daemon") {
        if (!expect_args(0, "daemon [--window ms] [--deadline ms] [--transition ms]")) return 1;
        return cmd_daemon(options);
    } else if (cmd == "discover") {
        if (!expect_args(0, "discover [--window ms]")) return 1;
        return cmd_discover(options);
    } else if (cmd == "power") {
        if (!expect_args(2, "power <location> <on|off> [--deadline ms] [--transition ms]")) return 1;
        return cmd_power(args[0], args[1], options);
    } else if (cmd == "state") {
        if (!expect_args(1, "state <location> [--deadline ms]")) return 1;
        return cmd_state(args[0], options);
    } else if (cmd == "list") {
        if (!expect_args(0, "list")) return 1;
        return cmd_list();
    } else if (cmd == "on" || cmd == "off") {
        if (!expect_args(1, (cmd + " <light>").c_str())) return 1;
        return cmd_set_light(args[0], cmd == "on");
    } else if (cmd == "get") {
        if (!expect_args(1, "get <light>")) return 1;
        return cmd_get_light(args[0]);
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
