#include "event_loop.hpp"

#include <poll.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

namespace event_loop {

WatchId Loop::watch(int fd, short events, FdCallback callback) {
    WatchId id = next_id_++;
    watches_[id] = Watch{fd, events, std::move(callback)};
    return id;
}

bool Loop::modify(WatchId id, short events) {
    auto it = watches_.find(id);
    if (it == watches_.end()) return false;
    it->second.events = events;
    return true;
}

void Loop::unwatch(WatchId id) {
    watches_.erase(id);
}

TimerId Loop::add_timer(std::chrono::milliseconds delay, TimerCallback callback) {
    TimerId id = next_id_++;
    timers_[id] = Timer{Clock::now() + delay, std::move(callback)};
    return id;
}

bool Loop::cancel_timer(TimerId id) {
    return timers_.erase(id) != 0;
}

bool Loop::run_once(std::chrono::milliseconds max_wait) {
    auto timeout = max_wait;

    auto now = Clock::now();
    for (const auto& [id, timer] : timers_) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(timer.due - now);
        timeout = std::min(timeout, std::max(remaining, std::chrono::milliseconds(0)));
    }

    // Snapshot, callbacks may change watches_ while dispatching
    std::vector<pollfd> fds;
    std::vector<WatchId> ids;
    fds.reserve(watches_.size());
    ids.reserve(watches_.size());
    for (const auto& [id, w] : watches_) {
        pollfd pfd = {};
        pfd.fd = w.fd;
        pfd.events = w.events;
        fds.push_back(pfd);
        ids.push_back(id);
    }

    int ret = poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
    if (ret < 0) {
        if (errno == EINTR) return true;
        std::cerr << "event_loop: poll error: " << strerror(errno) << std::endl;
        return false;
    }

    for (size_t i = 0; i < fds.size() && ret > 0; ++i) {
        if (fds[i].revents == 0) continue;

        auto it = watches_.find(ids[i]);
        if (it == watches_.end()) continue;

        // Copy, the callback may unwatch itself
        FdCallback callback = it->second.callback;
        callback(fds[i].revents);
    }

    fire_due_timers();
    return true;
}

void Loop::fire_due_timers() {
    auto now = Clock::now();

    std::vector<TimerId> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.due <= now) due.push_back(id);
    }

    // Earliest deadline first
    std::sort(due.begin(), due.end(), [this](TimerId a, TimerId b) {
        return timers_[a].due < timers_[b].due;
    });

    for (TimerId id : due) {
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;  // cancelled by an earlier callback

        TimerCallback callback = std::move(it->second.callback);
        timers_.erase(it);
        callback();
    }
}

void Loop::run() {
    running_ = true;
    while (running_) {
        if (!run_once(std::chrono::milliseconds(100))) {
            break;
        }
    }
}

bool Loop::run_until(const std::function<bool()>& done, std::chrono::milliseconds limit) {
    auto deadline = Clock::now() + limit;
    while (!done()) {
        auto now = Clock::now();
        if (now >= deadline) break;

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        if (!run_once(std::min(remaining, std::chrono::milliseconds(100)))) {
            break;
        }
    }
    return done();
}

} // namespace event_loop
