#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace event_loop {

using Clock = std::chrono::steady_clock;
using WatchId = uint64_t;
using TimerId = uint64_t;

// Called with poll() revents
using FdCallback = std::function<void(short revents)>;
using TimerCallback = std::function<void()>;

// Single-threaded poll() loop with fd readiness watches and one-shot timers.
// Callbacks may add or remove watches and timers, including their own.
class Loop {
public:
    WatchId watch(int fd, short events, FdCallback callback);

    // Change the events of an existing watch
    bool modify(WatchId id, short events);

    void unwatch(WatchId id);

    TimerId add_timer(std::chrono::milliseconds delay, TimerCallback callback);

    // Returns false if the timer already fired or was cancelled
    bool cancel_timer(TimerId id);

    // One poll() round, waits at most max_wait (less if a timer is due sooner).
    // Returns false on a poll error other than EINTR.
    bool run_once(std::chrono::milliseconds max_wait);

    // Run until stop()
    void run();

    // Run until done() holds or limit elapses, returns done()
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds limit);

    // Safe to call from a signal handler
    void stop() { running_ = false; }

    size_t watch_count() const { return watches_.size(); }
    size_t timer_count() const { return timers_.size(); }

private:
    struct Watch {
        int fd = -1;
        short events = 0;
        FdCallback callback;
    };

    struct Timer {
        Clock::time_point due;
        TimerCallback callback;
    };

    void fire_due_timers();

    std::map<WatchId, Watch> watches_;
    std::map<TimerId, Timer> timers_;
    uint64_t next_id_ = 1;
    std::atomic<bool> running_{false};
};

} // namespace event_loop
