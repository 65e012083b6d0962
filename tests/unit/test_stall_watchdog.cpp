/**
 * @file test_stall_watchdog.cpp
 * @brief Stall detection timing
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "StallWatchdog.h"

using namespace CipherLink;
using std::chrono::milliseconds;

class StallWatchdogTest : public ::testing::Test {
protected:
    static bool waitFor(const std::atomic<int>& counter, int value, milliseconds limit) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (counter.load() < value && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(milliseconds(2));
        }
        return counter.load() >= value;
    }

    std::atomic<int> stalls_{0};
};

TEST_F(StallWatchdogTest, FiresOnceWithoutProgress) {
    StallWatchdog watchdog(milliseconds(30), [this] { ++stalls_; });
    watchdog.start();
    ASSERT_TRUE(waitFor(stalls_, 1, milliseconds(2000)));
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(stalls_.load(), 1);
    EXPECT_TRUE(watchdog.fired());
}

TEST_F(StallWatchdogTest, ProgressDefersTheDeadline) {
    StallWatchdog watchdog(milliseconds(150), [this] { ++stalls_; });
    watchdog.start();
    for (int i = 0; i < 10; ++i) {
        std::this_thread::sleep_for(milliseconds(30));
        watchdog.progress();
    }
    EXPECT_EQ(stalls_.load(), 0);
    EXPECT_TRUE(waitFor(stalls_, 1, milliseconds(2000)));
}

TEST_F(StallWatchdogTest, StopPreventsFiring) {
    StallWatchdog watchdog(milliseconds(50), [this] { ++stalls_; });
    watchdog.start();
    watchdog.stop();
    std::this_thread::sleep_for(milliseconds(120));
    EXPECT_EQ(stalls_.load(), 0);
    EXPECT_FALSE(watchdog.fired());
}

TEST_F(StallWatchdogTest, NonPositiveTimeoutDisables) {
    StallWatchdog watchdog(milliseconds(0), [this] { ++stalls_; });
    watchdog.start();
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(stalls_.load(), 0);
}
