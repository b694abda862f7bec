#include <discovery/reconcile.hpp>
#include <protocol/crypto.hpp>
#include <protocol/parse.hpp>

#include <gtest/gtest.h>

using namespace yeelight;

namespace {

DeviceRecord record(const std::string& id, const std::string& location = "yeelight://10.0.0.1:55443") {
    DeviceRecord r;
    if (!id.empty()) r.fields[keys::ID] = id;
    r.fields[keys::LOCATION] = location;
    r.fields[keys::MODEL] = "color";
    return r;
}

std::string uuid_of(const std::string& id) {
    return crypto::uuid_from_id(id).value();
}

} // namespace

TEST(Reconcile, NewDeviceIsCreated) {
    std::vector<DeviceRecord> records = {record("0x1"), record("")};
    auto decisions = reconcile::reconcile(records, {});

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].action, reconcile::Action::Create);
    EXPECT_EQ(decisions[0].uuid, uuid_of("0x1"));
    EXPECT_EQ(decisions[0].record.id(), "0x1");
    EXPECT_FALSE(decisions[0].identity);
}

TEST(Reconcile, KnownDeviceIsRestoredWithItsHandle) {
    std::vector<KnownIdentity> known = {{uuid_of("0x2"), 0}, {uuid_of("0x1"), 1}};
    std::vector<DeviceRecord> records = {record("0x1", "yeelight://10.0.0.9:55443")};

    auto decisions = reconcile::reconcile(records, known);

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].action, reconcile::Action::Restore);
    ASSERT_TRUE(decisions[0].identity);
    EXPECT_EQ(decisions[0].identity->handle, 1u);
    EXPECT_EQ(decisions[0].record.location(), "yeelight://10.0.0.9:55443");
}

TEST(Reconcile, RecordsWithoutUsableIdAreSkipped) {
    DeviceRecord blank = record("");
    blank.fields[keys::ID] = "   ";
    std::vector<DeviceRecord> records = {record(""), blank};

    EXPECT_TRUE(reconcile::reconcile(records, {}).empty());
}

TEST(Reconcile, PreservesInputOrder) {
    std::vector<KnownIdentity> known = {{uuid_of("0xb"), 0}};
    std::vector<DeviceRecord> records = {record("0xa"), record("0xb"), record("0xc")};

    auto decisions = reconcile::reconcile(records, known);

    ASSERT_EQ(decisions.size(), 3u);
    EXPECT_EQ(decisions[0].record.id(), "0xa");
    EXPECT_EQ(decisions[0].action, reconcile::Action::Create);
    EXPECT_EQ(decisions[1].record.id(), "0xb");
    EXPECT_EQ(decisions[1].action, reconcile::Action::Restore);
    EXPECT_EQ(decisions[2].record.id(), "0xc");
    EXPECT_EQ(decisions[2].action, reconcile::Action::Create);
}

TEST(Reconcile, DuplicateInOneBatchCreatesOnce) {
    std::vector<DeviceRecord> records = {
        record("0x1", "yeelight://10.0.0.1:55443"),
        record("0x1", "yeelight://10.0.0.2:55443"),
    };

    auto decisions = reconcile::reconcile(records, {});

    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_EQ(decisions[0].action, reconcile::Action::Create);
    EXPECT_EQ(decisions[1].action, reconcile::Action::Restore);
    EXPECT_FALSE(decisions[1].identity);
    EXPECT_EQ(decisions[0].uuid, decisions[1].uuid);
}

TEST(Reconcile, IdIsTrimmedBeforeHashing) {
    DeviceRecord padded = record("");
    padded.fields[keys::ID] = " 0x1 ";
    std::vector<DeviceRecord> records = {padded};

    auto decisions = reconcile::reconcile(records, {});

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].uuid, uuid_of("0x1"));
}

TEST(Reconcile, ParsedReplyFeedsReconciler) {
    std::vector<DeviceRecord> records = {
        parse::parse_device("HTTP/1.1 200 OK\r\nLocation: yeelight://10.0.0.3:55443\r\nid: 0x3\r\n"),
    };
    auto decisions = reconcile::reconcile(records, {});

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(reconcile::to_string(decisions[0].action), std::string("create"));
}
