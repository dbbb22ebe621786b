/**
 * @file test_reconnect_policy.cpp
 * @brief Unit tests for the automatic reconnection window
 */

#include "orchestrator/reconnect_policy.h"

#include <gtest/gtest.h>

using namespace spotty::orchestrator;
using std::chrono::seconds;

namespace {

ReconnectWindow::TimePoint at(int secondsFromStart) {
    return ReconnectWindow::TimePoint{} + seconds(secondsFromStart);
}

}  // namespace

TEST(ReconnectWindow, Defaults) {
    ReconnectWindow window;
    EXPECT_EQ(window.horizon(), seconds(600));
    EXPECT_EQ(window.maxAttempts(), 5u);
    EXPECT_EQ(window.size(), 0u);
}

TEST(ReconnectWindow, AllowsUpToMaxAttempts) {
    ReconnectWindow window;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(window.shouldRetry(at(i * 10))) << "attempt " << i;
        window.record(at(i * 10));
    }
    EXPECT_FALSE(window.shouldRetry(at(50)));
    EXPECT_EQ(window.size(), 5u);
}

TEST(ReconnectWindow, OldEntriesExpire) {
    ReconnectWindow window;
    for (int t : {0, 100, 200, 300, 400}) {
        ASSERT_TRUE(window.shouldRetry(at(t)));
        window.record(at(t));
    }
    EXPECT_FALSE(window.shouldRetry(at(450)));

    // t=0 is older than the horizon at t=700, t=100 is exactly on it and stays
    EXPECT_TRUE(window.shouldRetry(at(700)));
    EXPECT_EQ(window.size(), 4u);
}

TEST(ReconnectWindow, RefusalDoesNotRecord) {
    ReconnectWindow window(seconds(60), 1);
    ASSERT_TRUE(window.shouldRetry(at(0)));
    window.record(at(0));
    EXPECT_FALSE(window.shouldRetry(at(30)));
    EXPECT_FALSE(window.shouldRetry(at(40)));
    EXPECT_EQ(window.size(), 1u);
    EXPECT_TRUE(window.shouldRetry(at(61)));
}

TEST(ReconnectWindow, ClearResets) {
    ReconnectWindow window(seconds(600), 2);
    window.record(at(0));
    window.record(at(1));
    EXPECT_FALSE(window.shouldRetry(at(2)));
    window.clear();
    EXPECT_TRUE(window.shouldRetry(at(3)));
}
