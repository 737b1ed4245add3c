#include <gtest/gtest.h>
#include "../src/core/EventLoop.h"
#include <poll.h>
#include <unistd.h>
#include <string>
#include <vector>

TEST(EventLoopTest, TimersFireInDeadlineOrder) {
    EventLoop loop;
    std::vector<int> fired;
    loop.runAfter(std::chrono::milliseconds(30), [&] { fired.push_back(3); });
    loop.runAfter(std::chrono::milliseconds(10), [&] { fired.push_back(1); });
    loop.runAfter(std::chrono::milliseconds(20), [&] { fired.push_back(2); });

    loop.runUntil([&] { return fired.size() == 3; }, std::chrono::seconds(2));
    EXPECT_EQ(fired, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.timerCount(), 0u);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    auto id = loop.runAfter(std::chrono::milliseconds(10), [&] { fired = true; });
    EXPECT_TRUE(loop.cancelTimer(id));
    EXPECT_FALSE(loop.cancelTimer(id));

    loop.sleepFor(std::chrono::milliseconds(30));
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, RunUntilReturnsFalseWhenIdle) {
    EventLoop loop;
    EXPECT_FALSE(loop.runOnce(std::chrono::milliseconds(10)));
    EXPECT_FALSE(loop.runUntil([] { return false; }));
}

TEST(EventLoopTest, FdWatcherSeesReadableData) {
    EventLoop loop;
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    std::string received;
    loop.watchFd(fds[0], POLLIN, [&](short) {
        char buf[64];
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) received.append(buf, static_cast<size_t>(n));
    });
    loop.runAfter(std::chrono::milliseconds(5), [&] {
        ASSERT_EQ(write(fds[1], "ping", 4), 4);
    });

    EXPECT_TRUE(loop.runUntil([&] { return received == "ping"; }, std::chrono::seconds(2)));
    EXPECT_EQ(loop.watcherCount(), 1u);
    loop.unwatchFd(fds[0]);
    EXPECT_FALSE(loop.isWatching(fds[0]));
    EXPECT_EQ(loop.watcherCount(), 0u);
    close(fds[0]);
    close(fds[1]);
}
