#pragma once

#include "../types/device.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace yeelight::reconcile {

enum class Action {
    Create,   // host allocates a new accessory under `uuid`
    Restore,  // host reuses the accessory it already holds for `uuid`
};

inline const char* to_string(Action action) {
    return action == Action::Create ? "create" : "restore";
}

struct Decision {
    Action action = Action::Create;
    DeviceRecord record;
    std::string uuid;
    // Set when the uuid matched a known identity. A Restore without identity refers to
    // an accessory created by an earlier decision of the same batch.
    std::optional<KnownIdentity> identity;
};

// Decide create-vs-restore for each record, in input order.
// Records without a usable id are skipped, so the output may be shorter than the input.
std::vector<Decision> reconcile(std::span<const DeviceRecord> records,
                                std::span<const KnownIdentity> known);

} // namespace yeelight::reconcile
