#include <event_loop.hpp>

#include <gtest/gtest.h>

#include <poll.h>
#include <unistd.h>

#include <vector>

using namespace std::chrono_literals;

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    Pipe() { EXPECT_EQ(pipe(fds), 0); }
    ~Pipe() {
        ::close(fds[0]);
        ::close(fds[1]);
    }
};

} // namespace

TEST(EventLoop, TimersFireInDeadlineOrder) {
    event_loop::Loop loop;
    std::vector<int> fired;

    loop.add_timer(30ms, [&] { fired.push_back(2); });
    loop.add_timer(10ms, [&] { fired.push_back(1); });

    EXPECT_TRUE(loop.run_until([&] { return fired.size() == 2; }, 1s));
    EXPECT_EQ(fired, (std::vector<int>{1, 2}));
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(EventLoop, CancelledTimerDoesNotFire) {
    event_loop::Loop loop;
    bool fired = false;

    auto id = loop.add_timer(10ms, [&] { fired = true; });
    EXPECT_TRUE(loop.cancel_timer(id));
    EXPECT_FALSE(loop.cancel_timer(id));

    loop.run_until([] { return false; }, 50ms);
    EXPECT_FALSE(fired);
}

TEST(EventLoop, TimerCanCancelAnotherDueTimer) {
    event_loop::Loop loop;
    bool second = false;

    event_loop::TimerId other = 0;
    loop.add_timer(0ms, [&] { loop.cancel_timer(other); });
    other = loop.add_timer(5ms, [&] { second = true; });

    loop.run_until([] { return false; }, 50ms);
    EXPECT_FALSE(second);
}

TEST(EventLoop, WatchReportsReadable) {
    event_loop::Loop loop;
    Pipe p;
    short seen = 0;

    loop.watch(p.fds[0], POLLIN, [&](short revents) { seen = revents; });
    ASSERT_EQ(write(p.fds[1], "x", 1), 1);

    EXPECT_TRUE(loop.run_until([&] { return seen != 0; }, 1s));
    EXPECT_TRUE(seen & POLLIN);
}

TEST(EventLoop, CallbackMayUnwatchItself) {
    event_loop::Loop loop;
    Pipe p;
    int calls = 0;

    event_loop::WatchId id = 0;
    id = loop.watch(p.fds[0], POLLIN, [&](short) {
        ++calls;
        loop.unwatch(id);
    });
    ASSERT_EQ(write(p.fds[1], "x", 1), 1);

    loop.run_until([] { return false; }, 50ms);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(loop.watch_count(), 0u);
}

TEST(EventLoop, ModifyChangesEvents) {
    event_loop::Loop loop;
    Pipe p;
    short seen = 0;

    auto id = loop.watch(p.fds[1], 0, [&](short revents) { seen = revents; });
    loop.run_once(10ms);
    EXPECT_EQ(seen, 0);

    EXPECT_TRUE(loop.modify(id, POLLOUT));
    EXPECT_TRUE(loop.run_until([&] { return seen != 0; }, 1s));
    EXPECT_TRUE(seen & POLLOUT);

    loop.unwatch(id);
    EXPECT_FALSE(loop.modify(id, POLLIN));
}

TEST(EventLoop, RunStopsFromCallback) {
    event_loop::Loop loop;
    loop.add_timer(10ms, [&] { loop.stop(); });
    loop.run();
    EXPECT_EQ(loop.timer_count(), 0u);
}

TEST(EventLoop, RunUntilGivesUpAtLimit) {
    event_loop::Loop loop;
    auto start = event_loop::Clock::now();
    EXPECT_FALSE(loop.run_until([] { return false; }, 50ms));
    EXPECT_GE(event_loop::Clock::now() - start, 50ms);
}
