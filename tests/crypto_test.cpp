#include <protocol/crypto.hpp>

#include <gtest/gtest.h>

using namespace yeelight;

TEST(Crypto, Sha1KnownVector) {
    auto digest = crypto::sha1("abc");
    ASSERT_TRUE(digest);
    EXPECT_EQ(crypto::to_hex(digest->data(), digest->size()),
              "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(Crypto, UuidFromId) {
    EXPECT_EQ(crypto::uuid_from_id("0x1"), "1cb7a2e9-afbe-4d1e-8186-0f3dd4e4e3b7");
    EXPECT_EQ(crypto::uuid_from_id("0x0000000012345678"), "4271d547-1db1-451e-845a-47c9302b5929");
}

TEST(Crypto, UuidVariantNibble) {
    // sha1("") = da39a3ee5e6b4b0d3255..., the 16th digit 'd' becomes (0xd & 3) | 8 = '9'
    EXPECT_EQ(crypto::uuid_from_id(""), "da39a3ee-5e6b-44b0-9325-5bfef9560189");
}

TEST(Crypto, UuidIsStableAndDistinct) {
    auto a = crypto::uuid_from_id("0x000000000015243f");
    auto b = crypto::uuid_from_id("0x000000000015243f");
    auto c = crypto::uuid_from_id("0x0000000000152440");
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
    EXPECT_TRUE(crypto::is_uuid(*a));
    EXPECT_EQ((*a)[14], '4');
}

TEST(Crypto, IsUuid) {
    EXPECT_TRUE(crypto::is_uuid("1cb7a2e9-afbe-4d1e-8186-0f3dd4e4e3b7"));
    EXPECT_FALSE(crypto::is_uuid("1CB7A2E9-AFBE-4D1E-8186-0F3DD4E4E3B7"));
    EXPECT_FALSE(crypto::is_uuid("1cb7a2e9afbe4d1e81860f3dd4e4e3b7"));
    EXPECT_FALSE(crypto::is_uuid(""));
}
