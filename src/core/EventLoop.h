#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>

/**
 * @brief 单线程事件循环 (poll 反应器)
 *
 * 管理 fd 监听与定时器。所有回调都在调用 runOnce/runUntil 的线程上执行,
 * Bridge 的同步接口通过泵循环等待自己的结果,其它请求的 I/O 与超时照常推进。
 */
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;
    using FdCallback = std::function<void(short revents)>;

    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    TimerId runAfter(std::chrono::milliseconds delay, Callback callback);
    bool cancelTimer(TimerId id);

    // Registers or replaces the watcher for fd.
    void watchFd(int fd, short events, FdCallback callback);
    void unwatchFd(int fd);
    bool isWatching(int fd) const { return watchers.count(fd) > 0; }

    /**
     * One poll iteration, waiting at most maxWait (or less when a timer is due).
     * @return false when there was nothing to wait for
     */
    bool runOnce(std::chrono::milliseconds maxWait);

    /**
     * Pumps until done() holds or limit elapses.
     * Returns early with false if nothing is left that could change done().
     */
    bool runUntil(const std::function<bool()>& done,
                  std::chrono::milliseconds limit = std::chrono::milliseconds::max());

    // Sleeps while keeping I/O and timers serviced.
    void sleepFor(std::chrono::milliseconds duration);

    size_t timerCount() const { return timers.size(); }
    size_t watcherCount() const { return watchers.size(); }

private:
    struct Timer {
        Clock::time_point deadline;
        Callback callback;
    };

    struct Watcher {
        short events;
        FdCallback callback;
    };

    TimerId nextTimerId = 0;
    std::map<TimerId, Timer> timers;
    std::unordered_map<int, Watcher> watchers;

    void fireExpiredTimers();
    std::chrono::milliseconds untilNextTimer(std::chrono::milliseconds cap) const;
};
