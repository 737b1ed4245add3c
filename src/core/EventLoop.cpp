#include "core/EventLoop.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <vector>
#include <poll.h>

EventLoop::TimerId EventLoop::runAfter(std::chrono::milliseconds delay, Callback callback) {
    TimerId id = ++nextTimerId;
    timers[id] = Timer{Clock::now() + delay, std::move(callback)};
    return id;
}

bool EventLoop::cancelTimer(TimerId id) {
    return timers.erase(id) > 0;
}

void EventLoop::watchFd(int fd, short events, FdCallback callback) {
    if (fd < 0) return;
    watchers[fd] = Watcher{events, std::move(callback)};
}

void EventLoop::unwatchFd(int fd) {
    watchers.erase(fd);
}

std::chrono::milliseconds EventLoop::untilNextTimer(std::chrono::milliseconds cap) const {
    auto wait = cap;
    auto now = Clock::now();
    for (const auto& [id, timer] : timers) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(timer.deadline - now);
        if (remaining < std::chrono::milliseconds(0)) {
            return std::chrono::milliseconds(0);
        }
        // round up so a due timer is not polled for with a zero timeout repeatedly
        if (timer.deadline - now > remaining) {
            remaining += std::chrono::milliseconds(1);
        }
        wait = std::min(wait, remaining);
    }
    return wait;
}

void EventLoop::fireExpiredTimers() {
    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& [id, timer] : timers) {
        if (timer.deadline <= now) {
            due.emplace_back(timer.deadline, id);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        // an earlier callback may have cancelled this one
        auto it = timers.find(entry.second);
        if (it == timers.end()) continue;
        Callback callback = std::move(it->second.callback);
        timers.erase(it);
        callback();
    }
}

bool EventLoop::runOnce(std::chrono::milliseconds maxWait) {
    if (watchers.empty() && timers.empty()) {
        return false;
    }

    auto wait = untilNextTimer(maxWait);

    std::vector<pollfd> fds;
    fds.reserve(watchers.size());
    for (const auto& [fd, watcher] : watchers) {
        pollfd p{};
        p.fd = fd;
        p.events = watcher.events;
        fds.push_back(p);
    }

    int timeoutMs = static_cast<int>(std::min<long long>(wait.count(), INT_MAX));
    int ready = poll(fds.empty() ? nullptr : fds.data(), static_cast<nfds_t>(fds.size()), timeoutMs);
    if (ready < 0 && errno != EINTR) {
        return false;
    }

    if (ready > 0) {
        for (const auto& p : fds) {
            if (p.revents == 0) continue;
            // callbacks may unwatch or close other fds
            auto it = watchers.find(p.fd);
            if (it == watchers.end()) continue;
            FdCallback callback = it->second.callback;
            callback(p.revents);
        }
    }

    fireExpiredTimers();
    return true;
}

bool EventLoop::runUntil(const std::function<bool()>& done, std::chrono::milliseconds limit) {
    auto start = Clock::now();
    while (!done()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        if (limit != std::chrono::milliseconds::max() && elapsed >= limit) {
            return false;
        }
        auto remaining = limit == std::chrono::milliseconds::max()
            ? std::chrono::milliseconds(1000)
            : std::min(limit - elapsed, std::chrono::milliseconds(1000));
        if (!runOnce(remaining)) {
            return done();
        }
    }
    return true;
}

void EventLoop::sleepFor(std::chrono::milliseconds duration) {
    bool elapsed = false;
    TimerId id = runAfter(duration, [&elapsed] { elapsed = true; });
    runUntil([&elapsed] { return elapsed; });
    cancelTimer(id);
}
