#include "dbus.hpp"
#include <cstring>
#include <iostream>
#include <vector>

namespace dbus_service {

namespace {

// Handed to libdbus as the object path user data
struct Context {
    Callbacks* callbacks = nullptr;
    State* state = nullptr;
};

Context g_context;

const char* const INTROSPECT_XML =
    DBUS_INTROSPECT_1_0_XML_DOCTYPE_DECL_NODE
    "<node>\n"
    " <interface name=\"com.yeelight.Bridge\">\n"
    "  <method name=\"Discover\"/>\n"
    "  <method name=\"ListLights\"><arg name=\"lights\" type=\"a(ssss)\" direction=\"out\"/></method>\n"
    "  <method name=\"SetPower\">\n"
    "   <arg name=\"light\" type=\"s\" direction=\"in\"/>\n"
    "   <arg name=\"on\" type=\"b\" direction=\"in\"/>\n"
    "  </method>\n"
    "  <method name=\"GetPower\">\n"
    "   <arg name=\"light\" type=\"s\" direction=\"in\"/>\n"
    "   <arg name=\"on\" type=\"b\" direction=\"out\"/>\n"
    "  </method>\n"
    "  <property name=\"LightCount\" type=\"u\" access=\"read\"/>\n"
    "  <property name=\"Discovering\" type=\"b\" access=\"read\"/>\n"
    " </interface>\n"
    " <interface name=\"" DBUS_INTERFACE_PROPERTIES "\">\n"
    "  <method name=\"Get\">\n"
    "   <arg name=\"interface_name\" type=\"s\" direction=\"in\"/>\n"
    "   <arg name=\"property_name\" type=\"s\" direction=\"in\"/>\n"
    "   <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "  </method>\n"
    "  <method name=\"GetAll\">\n"
    "   <arg name=\"interface_name\" type=\"s\" direction=\"in\"/>\n"
    "   <arg name=\"props\" type=\"a{sv}\" direction=\"out\"/>\n"
    "  </method>\n"
    "  <signal name=\"PropertiesChanged\">\n"
    "   <arg type=\"s\"/><arg type=\"a{sv}\"/><arg type=\"as\"/>\n"
    "  </signal>\n"
    " </interface>\n"
    " <interface name=\"" DBUS_INTERFACE_INTROSPECTABLE "\">\n"
    "  <method name=\"Introspect\"><arg name=\"data\" type=\"s\" direction=\"out\"/></method>\n"
    " </interface>\n"
    "</node>\n";

// Wrap one basic value in a variant
template <typename T>
void append_variant(DBusMessageIter* iter, int type, const char* signature, T value) {
    DBusMessageIter inner;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, signature, &inner);
    dbus_message_iter_append_basic(&inner, type, &value);
    dbus_message_iter_close_container(iter, &inner);
}

struct Property {
    const char* name;
    void (*write)(DBusMessageIter* iter, const State& state);
};

const Property PROPERTIES[] = {
    {"LightCount", [](DBusMessageIter* iter, const State& state) {
        append_variant<dbus_uint32_t>(iter, DBUS_TYPE_UINT32, "u", state.light_count);
    }},
    {"Discovering", [](DBusMessageIter* iter, const State& state) {
        append_variant<dbus_bool_t>(iter, DBUS_TYPE_BOOLEAN, "b", state.discovering);
    }},
};

const Property* find_property(const char* name) {
    for (const auto& property : PROPERTIES) {
        if (strcmp(property.name, name) == 0) return &property;
    }
    return nullptr;
}

// a{sv} entry for one property
void append_entry(DBusMessageIter* dict, const Property& property, const State& state) {
    DBusMessageIter entry;
    const char* name = property.name;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
    property.write(&entry, state);
    dbus_message_iter_close_container(dict, &entry);
}

// Returns an error reply unless `iface` names our interface
DBusMessage* check_interface(DBusMessage* msg, const char* iface) {
    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error_printf(msg, DBUS_ERROR_UNKNOWN_INTERFACE,
                                             "No such interface: %s", iface);
    }
    return nullptr;
}

DBusMessage* properties_get(DBusMessage* msg, const State& state) {
    const char* iface = nullptr;
    const char* name = nullptr;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &iface,
                               DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (ss)");
    }
    if (DBusMessage* error = check_interface(msg, iface)) return error;

    const Property* property = find_property(name);
    if (!property) {
        return dbus_message_new_error_printf(msg, DBUS_ERROR_UNKNOWN_PROPERTY,
                                             "No such property: %s", name);
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    if (!reply) return nullptr;
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    property->write(&iter, state);
    return reply;
}

DBusMessage* properties_get_all(DBusMessage* msg, const State& state) {
    const char* iface = nullptr;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (s)");
    }
    if (DBusMessage* error = check_interface(msg, iface)) return error;

    DBusMessage* reply = dbus_message_new_method_return(msg);
    if (!reply) return nullptr;
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (const auto& property : PROPERTIES) {
        append_entry(&dict, property, state);
    }
    dbus_message_iter_close_container(&iter, &dict);
    return reply;
}

// Send the deferred answer to `call` and drop the reference taken when it was deferred
void finish_call(DBusConnection* conn, DBusMessage* call, const Reply& result, bool with_power) {
    DBusMessage* reply = result.error_name.empty()
        ? dbus_message_new_method_return(call)
        : dbus_message_new_error(call, result.error_name.c_str(), result.message.c_str());

    if (reply) {
        if (with_power && result.error_name.empty()) {
            dbus_bool_t on = result.on;
            dbus_message_append_args(reply, DBUS_TYPE_BOOLEAN, &on, DBUS_TYPE_INVALID);
        }
        dbus_connection_send(conn, reply, nullptr);
        dbus_connection_flush(conn);
        dbus_message_unref(reply);
    } else {
        std::cerr << "dbus: out of memory building deferred reply" << std::endl;
    }
    dbus_message_unref(call);
}

// Bridge methods return the reply to send now, or nullptr once they took over the call
using Method = DBusMessage* (*)(DBusConnection* conn, DBusMessage* msg, Context& ctx);

DBusMessage* method_discover(DBusConnection*, DBusMessage* msg, Context& ctx) {
    std::cout << "dbus: Discover()" << std::endl;
    if (ctx.callbacks->on_discover) ctx.callbacks->on_discover();
    return dbus_message_new_method_return(msg);
}

DBusMessage* method_list_lights(DBusConnection*, DBusMessage* msg, Context& ctx) {
    std::vector<LightInfo> lights;
    if (ctx.callbacks->on_list) lights = ctx.callbacks->on_list();

    DBusMessage* reply = dbus_message_new_method_return(msg);
    if (!reply) return nullptr;

    DBusMessageIter iter, array;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ssss)", &array);
    for (const auto& light : lights) {
        DBusMessageIter row;
        dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &row);
        for (const std::string* field : {&light.uuid, &light.id, &light.model, &light.location}) {
            const char* value = field->c_str();
            dbus_message_iter_append_basic(&row, DBUS_TYPE_STRING, &value);
        }
        dbus_message_iter_close_container(&array, &row);
    }
    dbus_message_iter_close_container(&iter, &array);
    return reply;
}

DBusMessage* method_set_power(DBusConnection* conn, DBusMessage* msg, Context& ctx) {
    const char* light = nullptr;
    dbus_bool_t on = false;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &light,
                               DBUS_TYPE_BOOLEAN, &on, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (sb)");
    }
    if (!ctx.callbacks->on_set_power) {
        return dbus_message_new_error(msg, DBUS_ERROR_NOT_SUPPORTED, "SetPower unavailable");
    }

    std::cout << "dbus: SetPower(" << light << ", " << (on ? "true" : "false") << ")" << std::endl;
    dbus_message_ref(msg);
    ctx.callbacks->on_set_power(light, on, [conn, msg](const Reply& result) {
        finish_call(conn, msg, result, false);
    });
    return nullptr;
}

DBusMessage* method_get_power(DBusConnection* conn, DBusMessage* msg, Context& ctx) {
    const char* light = nullptr;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &light, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected (s)");
    }
    if (!ctx.callbacks->on_get_power) {
        return dbus_message_new_error(msg, DBUS_ERROR_NOT_SUPPORTED, "GetPower unavailable");
    }

    std::cout << "dbus: GetPower(" << light << ")" << std::endl;
    dbus_message_ref(msg);
    ctx.callbacks->on_get_power(light, [conn, msg](const Reply& result) {
        finish_call(conn, msg, result, true);
    });
    return nullptr;
}

const struct {
    const char* name;
    Method handler;
} METHODS[] = {
    {"Discover", method_discover},
    {"ListLights", method_list_lights},
    {"SetPower", method_set_power},
    {"GetPower", method_get_power},
};

bool is_call(DBusMessage* msg, const char* iface, const char* member) {
    return dbus_message_is_method_call(msg, iface, member) != 0;
}

DBusHandlerResult on_message(DBusConnection* conn, DBusMessage* msg, void* user_data) {
    auto& ctx = *static_cast<Context*>(user_data);
    if (!ctx.callbacks || !ctx.state) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    if (is_call(msg, DBUS_INTERFACE_INTROSPECTABLE, "Introspect")) {
        reply = dbus_message_new_method_return(msg);
        if (reply) {
            dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
        }
    } else if (is_call(msg, DBUS_INTERFACE_PROPERTIES, "Get")) {
        reply = properties_get(msg, *ctx.state);
    } else if (is_call(msg, DBUS_INTERFACE_PROPERTIES, "GetAll")) {
        reply = properties_get_all(msg, *ctx.state);
    } else if (is_call(msg, DBUS_INTERFACE_PROPERTIES, "Set")) {
        reply = dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY,
                                       "All properties are read-only");
    } else {
        bool found = false;
        for (const auto& method : METHODS) {
            if (is_call(msg, INTERFACE_NAME, method.name)) {
                found = true;
                reply = method.handler(conn, msg, ctx);
                break;
            }
        }
        if (!found) {
            return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
        }
        if (!reply) {
            // Answered later through finish_call
            return DBUS_HANDLER_RESULT_HANDLED;
        }
    }

    if (!reply) {
        return DBUS_HANDLER_RESULT_NEED_MEMORY;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
    return DBUS_HANDLER_RESULT_HANDLED;
}

} // namespace

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_context.callbacks = callbacks;
    g_context.state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (!conn) {
        std::cerr << "dbus: cannot reach session bus: "
                  << (dbus_error_is_set(&err) ? err.message : "unknown error") << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    DBusObjectPathVTable vtable = {};
    vtable.message_function = on_message;

    if (!dbus_connection_try_register_object_path(conn, OBJECT_PATH, &vtable, &g_context, &err)) {
        std::cerr << "dbus: cannot register " << OBJECT_PATH << ": "
                  << (dbus_error_is_set(&err) ? err.message : "out of memory") << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int result = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (result == -1) {
        std::cerr << "dbus: request_name failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }
    if (result != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER &&
        result != DBUS_REQUEST_NAME_REPLY_ALREADY_OWNER) {
        std::cerr << "dbus: " << SERVICE_NAME << " is owned by another process" << std::endl;
        return false;
    }

    std::cout << "dbus: owning " << SERVICE_NAME << " at " << OBJECT_PATH << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                             const char** property_names, int num_properties) {
    DBusMessage* signal =
        dbus_message_new_signal(OBJECT_PATH, DBUS_INTERFACE_PROPERTIES, "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter, changed, invalidated;
    const char* iface = INTERFACE_NAME;
    dbus_message_iter_init_append(signal, &iter);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &changed);
    for (int i = 0; i < num_properties; ++i) {
        if (const Property* property = find_property(property_names[i])) {
            append_entry(&changed, *property, state);
        }
    }
    dbus_message_iter_close_container(&iter, &changed);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_connection_flush(conn);
    dbus_message_unref(signal);
}

void update_state(DBusConnection* conn, State* state, uint32_t light_count, bool discovering) {
    const char* changed[2];
    int count = 0;

    if (state->light_count != light_count) {
        state->light_count = light_count;
        changed[count++] = "LightCount";
    }
    if (state->discovering != discovering) {
        state->discovering = discovering;
        changed[count++] = "Discovering";
    }

    if (conn && count > 0) {
        emit_properties_changed(conn, *state, changed, count);
    }
}

void process_pending(DBusConnection* conn) {
    if (!dbus_connection_read_write(conn, 0)) {
        std::cerr << "dbus: connection closed" << std::endl;
        return;
    }
    while (dbus_connection_get_dispatch_status(conn) == DBUS_DISPATCH_DATA_REMAINS) {
        dbus_connection_dispatch(conn);
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    return dbus_connection_get_unix_fd(conn, &fd) ? fd : -1;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unregister_object_path(conn, OBJECT_PATH);
        dbus_connection_unref(conn);
    }
    g_context = Context{};
}

} // namespace dbus_service
