#pragma once

#include "control.hpp"
#include "event_loop.hpp"
#include "ssdp.hpp"

#include <discovery/reconcile.hpp>
#include <protocol/commands.hpp>
#include <types/device.hpp>
#include <types/enums.hpp>

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace bridge {

constexpr const char* MANUFACTURER = "Yeelight";

// A light registered with the host, keyed by its stable uuid
struct Accessory {
    std::string uuid;
    std::string display_name;
    std::string manufacturer = MANUFACTURER;
    std::string model;
    std::string serial_number;

    // Latest discovery record (location, firmware, ...)
    yeelight::DeviceRecord context;
};

struct Options {
    ssdp::Options discovery;
    control::Options control;
    int transition_ms = yeelight::commands::DEFAULT_TRANSITION_MS;
};

struct Callbacks {
    std::function<void(const Accessory&)> on_accessory_added;
    std::function<void(const Accessory&)> on_accessory_restored;
};

using CommandCallback = std::function<void(const control::Result&)>;
using PowerCallback = std::function<void(const control::Result&, bool on)>;
using DiscoveryCallback = std::function<void(const ssdp::Result&)>;

// Host runtime: owns the accessory cache, runs discovery cycles and reconciles
// them against the cache, and issues commands one at a time per accessory.
class Platform {
public:
    Platform(event_loop::Loop& loop, Options options, Callbacks callbacks = {});

    // Restore an accessory from a host cache before discovery. Entries whose uuid is not
    // in the derived 8-4-4-4-12 form, or already loaded, are skipped and false is returned.
    bool configure_accessory(Accessory accessory);

    // One discovery cycle. done (optional) runs after registration.
    void discover_devices(DiscoveryCallback done = {});

    bool discovering() const { return discovering_; }

    // Apply reconciler output: register new accessories, refresh restored ones
    void apply(const std::vector<yeelight::reconcile::Decision>& decisions);

    void set_on(const std::string& light, bool on, CommandCallback done);
    void get_on(const std::string& light, PowerCallback done);

    // Lookup by uuid or device id
    const Accessory* find(const std::string& light) const;

    const std::vector<Accessory>& accessories() const { return accessories_; }

    std::vector<yeelight::KnownIdentity> known_identities() const;

private:
    struct Pending {
        yeelight::commands::Command command;
        CommandCallback done;
    };

    struct Queue {
        bool busy = false;
        std::deque<Pending> pending;
    };

    void register_new(const yeelight::reconcile::Decision& decision);
    void restore_existing(size_t handle, const yeelight::DeviceRecord& record);

    void enqueue(const std::string& light, yeelight::commands::Command command,
                 CommandCallback done);
    void pump(const std::string& uuid);

    event_loop::Loop& loop_;
    Options options_;
    Callbacks callbacks_;
    std::vector<Accessory> accessories_;
    std::map<std::string, Queue> queues_;
    bool discovering_ = false;
};

} // namespace bridge
