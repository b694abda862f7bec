#include "bridge.hpp"

#include <protocol/crypto.hpp>
#include <protocol/parse.hpp>

#include <algorithm>
#include <iostream>

namespace bridge {

Platform::Platform(event_loop::Loop& loop, Options options, Callbacks callbacks)
    : loop_(loop), options_(std::move(options)), callbacks_(std::move(callbacks)) {}

bool Platform::configure_accessory(Accessory accessory) {
    if (!yeelight::crypto::is_uuid(accessory.uuid)) {
        std::cerr << "bridge: ignoring cached accessory with malformed uuid '"
                  << accessory.uuid << "'" << std::endl;
        return false;
    }
    if (find(accessory.uuid)) {
        std::cerr << "bridge: ignoring cached accessory already loaded: " << accessory.uuid
                  << std::endl;
        return false;
    }

    std::cout << "bridge: loading accessory from cache: " << accessory.display_name << std::endl;
    accessories_.push_back(std::move(accessory));
    return true;
}

std::vector<yeelight::KnownIdentity> Platform::known_identities() const {
    std::vector<yeelight::KnownIdentity> known;
    known.reserve(accessories_.size());
    for (size_t i = 0; i < accessories_.size(); ++i) {
        known.push_back({accessories_[i].uuid, i});
    }
    return known;
}

void Platform::discover_devices(DiscoveryCallback done) {
    if (discovering_) {
        std::cout << "bridge: discovery already running" << std::endl;
        if (done) {
            ssdp::Result busy;
            busy.status = yeelight::DiscoveryStatus::SocketError;
            busy.message = "discovery already running";
            done(busy);
        }
        return;
    }
    discovering_ = true;

    ssdp::discover(loop_, options_.discovery, [this, done](ssdp::Result result) {
        discovering_ = false;

        if (result.status != yeelight::DiscoveryStatus::Ok) {
            std::cerr << "bridge: discovery failed: " << result.message << std::endl;
        }

        for (const auto& record : result.records) {
            if (!yeelight::parse::has_usable_id(record)) {
                std::cout << "bridge: dropping reply without id"
                          << (record.location().empty() ? "" : " from " + record.location())
                          << std::endl;
            }
        }

        auto known = known_identities();
        apply(yeelight::reconcile::reconcile(result.records, known));

        if (done) done(result);
    });
}

void Platform::apply(const std::vector<yeelight::reconcile::Decision>& decisions) {
    for (const auto& decision : decisions) {
        std::cout << "bridge: discovered device: " << decision.record.id() << std::endl;

        if (decision.action == yeelight::reconcile::Action::Create) {
            register_new(decision);
            continue;
        }

        size_t handle = accessories_.size();
        if (decision.identity && decision.identity->handle < accessories_.size() &&
            accessories_[decision.identity->handle].uuid == decision.uuid) {
            handle = decision.identity->handle;
        } else {
            auto it = std::find_if(accessories_.begin(), accessories_.end(),
                [&](const Accessory& a) { return a.uuid == decision.uuid; });
            if (it != accessories_.end()) {
                handle = static_cast<size_t>(it - accessories_.begin());
            }
        }

        if (handle < accessories_.size()) {
            restore_existing(handle, decision.record);
        } else {
            register_new(decision);
        }
    }
}

void Platform::register_new(const yeelight::reconcile::Decision& decision) {
    Accessory accessory;
    accessory.uuid = decision.uuid;
    accessory.model = decision.record.model();
    accessory.display_name = accessory.model.empty() ? decision.record.id() : accessory.model;
    accessory.serial_number = std::string(yeelight::parse::trim(decision.record.id()));
    accessory.context = decision.record;

    std::cout << "bridge: adding new accessory: " << accessory.serial_number
              << " (" << accessory.display_name << ")" << std::endl;

    accessories_.push_back(std::move(accessory));
    if (callbacks_.on_accessory_added) {
        callbacks_.on_accessory_added(accessories_.back());
    }
}

void Platform::restore_existing(size_t handle, const yeelight::DeviceRecord& record) {
    Accessory& accessory = accessories_[handle];
    std::cout << "bridge: restoring existing accessory from cache: " << accessory.display_name
              << std::endl;

    if (!record.location().empty() && record.location() != accessory.context.location()) {
        std::cout << "bridge: " << accessory.serial_number << " moved to " << record.location()
                  << std::endl;
    }
    accessory.context = record;
    if (!record.model().empty()) {
        accessory.model = record.model();
    }

    if (callbacks_.on_accessory_restored) {
        callbacks_.on_accessory_restored(accessory);
    }
}

const Accessory* Platform::find(const std::string& light) const {
    for (const auto& accessory : accessories_) {
        if (accessory.uuid == light || accessory.serial_number == light) {
            return &accessory;
        }
    }
    return nullptr;
}

void Platform::set_on(const std::string& light, bool on, CommandCallback done) {
    std::cout << "bridge: set on -> " << (on ? "true" : "false") << " for " << light << std::endl;
    enqueue(light, yeelight::commands::set_power(on, options_.transition_ms),
            [light, done](const control::Result& result) {
        if (result.ok()) {
            if (auto error = yeelight::parse::reply_error(result.reply)) {
                std::cerr << "bridge: " << light << " rejected set_power: " << *error << std::endl;
            }
        }
        if (done) done(result);
    });
}

void Platform::get_on(const std::string& light, PowerCallback done) {
    enqueue(light, yeelight::commands::get_power(),
            [light, done](const control::Result& result) {
        bool on = false;
        if (result.ok()) {
            if (auto error = yeelight::parse::reply_error(result.reply)) {
                std::cerr << "bridge: " << light << " rejected get_prop: " << *error << std::endl;
            }
            on = yeelight::parse::power_from_reply(result.reply);
        }
        if (done) done(result, on);
    });
}

void Platform::enqueue(const std::string& light, yeelight::commands::Command command,
                       CommandCallback done) {
    const Accessory* accessory = find(light);
    if (!accessory) {
        control::Result result;
        result.status = yeelight::CommandStatus::PreconditionError;
        result.message = "unknown light: " + light;
        std::cerr << "bridge: " << result.message << std::endl;
        if (done) done(result);
        return;
    }

    std::string uuid = accessory->uuid;
    queues_[uuid].pending.push_back(Pending{std::move(command), std::move(done)});
    pump(uuid);
}

void Platform::pump(const std::string& uuid) {
    auto it = queues_.find(uuid);
    if (it == queues_.end() || it->second.busy || it->second.pending.empty()) {
        return;
    }

    Pending next = std::move(it->second.pending.front());
    it->second.pending.pop_front();
    it->second.busy = true;

    // Address is read at send time so a restore that moved the light is honoured
    std::string location;
    if (const Accessory* accessory = find(uuid)) {
        location = accessory->context.location();
    }

    control::send(loop_, location, next.command,
        [this, uuid, done = std::move(next.done)](control::Result result) {
            queues_[uuid].busy = false;
            if (done) done(result);
            pump(uuid);
        },
        options_.control);
}

} // namespace bridge
