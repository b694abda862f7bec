#include "reconcile.hpp"
#include "../protocol/crypto.hpp"
#include "../protocol/parse.hpp"
#include <algorithm>
#include <unordered_set>

namespace yeelight::reconcile {

std::vector<Decision> reconcile(std::span<const DeviceRecord> records,
                                std::span<const KnownIdentity> known) {
    std::vector<Decision> decisions;
    decisions.reserve(records.size());

    // uuids created earlier in this batch
    std::unordered_set<std::string> created;

    for (const auto& record : records) {
        if (!parse::has_usable_id(record)) {
            continue;
        }

        auto uuid = crypto::uuid_from_id(parse::trim(record.id()));
        if (!uuid) {
            continue;
        }

        Decision decision;
        decision.record = record;
        decision.uuid = *uuid;

        auto existing = std::find_if(known.begin(), known.end(),
            [&](const KnownIdentity& identity) { return identity.uuid == *uuid; });

        if (existing != known.end()) {
            decision.action = Action::Restore;
            decision.identity = *existing;
        } else if (created.count(*uuid)) {
            decision.action = Action::Restore;
        } else {
            decision.action = Action::Create;
            created.insert(*uuid);
        }

        decisions.push_back(std::move(decision));
    }

    return decisions;
}

} // namespace yeelight::reconcile
