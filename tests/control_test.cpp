#include "loopback.hpp"

#include <control.hpp>
#include <protocol/parse.hpp>

#include <gtest/gtest.h>

#include <optional>

using namespace std::chrono_literals;

namespace {

struct ControlTest : ::testing::Test {
    event_loop::Loop loop;
    std::optional<control::Result> result;
    int calls = 0;

    control::Completion capture() {
        return [this](control::Result r) {
            ++calls;
            result = std::move(r);
        };
    }

    bool wait(std::chrono::milliseconds limit = 2s) {
        return loop.run_until([this] { return result.has_value(); }, limit);
    }

    static control::Options deadline(std::chrono::milliseconds ms) {
        control::Options options;
        options.deadline = ms;
        return options;
    }
};

} // namespace

TEST_F(ControlTest, ReplyBeforeDeadlineSucceeds) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"result\":[\"ok\"]}\r\n";
    light.delay = 200ms;

    control::send(loop, light.location(), yeelight::commands::set_power(true), capture(),
                  deadline(500ms));
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::Succeeded);
    EXPECT_EQ(result->result(), nlohmann::json::array({"ok"}));
    EXPECT_EQ(light.received(),
              "{\"id\":1,\"method\":\"set_power\",\"params\":[\"on\",\"smooth\",500]}\r\n");
}

TEST_F(ControlTest, ReplyAfterDeadlineTimesOut) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"result\":[\"ok\"]}\r\n";
    light.delay = 800ms;

    auto start = event_loop::Clock::now();
    control::send(loop, light.location(), yeelight::commands::set_power(true), capture(),
                  deadline(500ms));
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::TimedOut);
    EXPECT_GE(event_loop::Clock::now() - start, 500ms);
    EXPECT_LT(event_loop::Clock::now() - start, 800ms);

    // Connection is closed and the late reply is ignored
    EXPECT_TRUE(loop.run_until([&] { return light.peer_closed(); }, 1s));
    loop.run_until([] { return false; }, 400ms);
    EXPECT_EQ(calls, 1);
}

TEST_F(ControlTest, InvalidJsonIsDecodeErrorAndCloses) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "this is not json\r\n";

    control::send(loop, light.location(), yeelight::commands::get_power(), capture());
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::DecodeError);
    EXPECT_TRUE(loop.run_until([&] { return light.peer_closed(); }, 1s));
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST_F(ControlTest, UnparsableAddressFailsWithoutSockets) {
    for (const char* address : {"", "192.168.1.5:55443", "yeelight://192.168.1.5",
                                "yeelight://light.local:55443"}) {
        result.reset();
        control::send(loop, address, yeelight::commands::get_power(), capture());

        ASSERT_TRUE(result) << address;
        EXPECT_EQ(result->status, yeelight::CommandStatus::PreconditionError) << address;
        EXPECT_EQ(loop.watch_count(), 0u);
        EXPECT_EQ(loop.timer_count(), 0u);
    }
    EXPECT_EQ(calls, 4);
}

TEST_F(ControlTest, GetPowerReplyDecodesOn) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"result\":[\"on\"]}\r\n";
    light.delay = 100ms;

    control::send(loop, light.location(), yeelight::commands::get_power(), capture(),
                  deadline(500ms));
    ASSERT_TRUE(wait());

    ASSERT_TRUE(result->ok());
    EXPECT_TRUE(yeelight::parse::power_from_reply(result->reply));
    EXPECT_EQ(light.received(), "{\"id\":1,\"method\":\"get_prop\",\"params\":[\"power\"]}\r\n");
}

TEST_F(ControlTest, RefusedConnectionIsConnectError) {
    // Bound but never listening
    net::Socket holder = net::tcp_socket();
    sockaddr_in addr = loopback::localhost(0);
    ASSERT_EQ(bind(holder.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    uint16_t port = loopback::local_port(holder.fd);

    control::send(loop, "yeelight://127.0.0.1:" + std::to_string(port),
                  yeelight::commands::get_power(), capture());
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::ConnectError);
    EXPECT_EQ(loop.watch_count(), 0u);
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST_F(ControlTest, NotificationBeforeReplyIsSkipped) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"method\":\"props\",\"params\":{\"power\":\"off\"}}\r\n"
                  "{\"id\":1,\"result\":[\"on\"]}\r\n";

    control::send(loop, light.location(), yeelight::commands::get_power(), capture());
    ASSERT_TRUE(wait());

    ASSERT_TRUE(result->ok());
    EXPECT_TRUE(yeelight::parse::power_from_reply(result->reply));
}

TEST_F(ControlTest, ReplyWithOtherIdIsIgnored) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":9,\"result\":[\"off\"]}\r\n{\"id\":1,\"result\":[\"on\"]}\r\n";

    control::send(loop, light.location(), yeelight::commands::get_power(), capture());
    ASSERT_TRUE(wait());

    ASSERT_TRUE(result->ok());
    EXPECT_EQ(yeelight::parse::reply_id(result->reply), 1);
}

TEST_F(ControlTest, CustomRequestIdIsSentAndMatched) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"result\":[\"off\"]}\r\n{\"id\":17,\"result\":[\"on\"]}\r\n";

    control::Options options;
    options.request_id = 17;
    control::send(loop, light.location(), yeelight::commands::get_power(), capture(), options);
    ASSERT_TRUE(wait());

    ASSERT_TRUE(result->ok());
    EXPECT_TRUE(yeelight::parse::power_from_reply(result->reply));
    EXPECT_EQ(light.received().rfind("{\"id\":17,", 0), 0u);
}

TEST_F(ControlTest, UnterminatedReplyIsDecodedAtClose) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"result\":[\"ok\"]}";
    light.close_after_reply = true;

    control::send(loop, light.location(), yeelight::commands::set_power(false), capture());
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::Succeeded);
}

TEST_F(ControlTest, ReplyWithoutLineBreakSucceedsWhileOpen) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"result\":[\"on\"]}";
    light.delay = 100ms;

    auto start = event_loop::Clock::now();
    control::send(loop, light.location(), yeelight::commands::get_power(), capture(),
                  deadline(1000ms));
    ASSERT_TRUE(wait());

    ASSERT_EQ(result->status, yeelight::CommandStatus::Succeeded);
    EXPECT_TRUE(yeelight::parse::power_from_reply(result->reply));
    EXPECT_LT(event_loop::Clock::now() - start, 1000ms);
}

TEST_F(ControlTest, GarbageWithoutLineBreakIsDecodeErrorWhileOpen) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "this is not json";
    light.delay = 100ms;

    auto start = event_loop::Clock::now();
    control::send(loop, light.location(), yeelight::commands::get_power(), capture(),
                  deadline(1000ms));
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::DecodeError);
    EXPECT_LT(event_loop::Clock::now() - start, 1000ms);
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST_F(ControlTest, ReplySplitAcrossWritesWaitsForTheRest) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"res";
    light.trailer = "ult\":[\"on\"]}";
    light.trailer_delay = 150ms;

    auto start = event_loop::Clock::now();
    control::send(loop, light.location(), yeelight::commands::get_power(), capture(),
                  deadline(1000ms));
    ASSERT_TRUE(wait());

    ASSERT_EQ(result->status, yeelight::CommandStatus::Succeeded);
    EXPECT_TRUE(yeelight::parse::power_from_reply(result->reply));
    EXPECT_GE(event_loop::Clock::now() - start, 150ms);
}

TEST_F(ControlTest, CloseWithoutReplyIsDecodeError) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.close_after_reply = true;

    control::send(loop, light.location(), yeelight::commands::set_power(false), capture());
    ASSERT_TRUE(wait());

    EXPECT_EQ(result->status, yeelight::CommandStatus::DecodeError);
}

TEST_F(ControlTest, ErrorReplyStillSucceeds) {
    loopback::StubLight light(loop);
    ASSERT_TRUE(light.ok());
    light.reply = "{\"id\":1,\"error\":{\"code\":-1,\"message\":\"client quota exceeded\"}}\r\n";

    control::send(loop, light.location(), yeelight::commands::set_power(true), capture());
    ASSERT_TRUE(wait());

    ASSERT_TRUE(result->ok());
    EXPECT_EQ(yeelight::parse::reply_error(result->reply), "client quota exceeded");
    EXPECT_TRUE(result->result().empty());
}
