/**
 * @file test_event_channel.cpp
 * @brief Unit tests for the per-session playback event channel
 */

#include "playback/event_channel.h"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace spotty::playback;

TEST(PlaybackEventChannel, PushAndPopInOrder) {
    PlaybackEventChannel channel;
    EXPECT_TRUE(channel.push(PlayerEvent::started("a")));
    EXPECT_TRUE(channel.push(PlayerEvent::stopped("a")));
    EXPECT_EQ(channel.size(), 2u);

    auto first = channel.tryPop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, PlayerEvent::Kind::Started);
    auto second = channel.tryPop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->kind, PlayerEvent::Kind::Stopped);
    EXPECT_FALSE(channel.tryPop().has_value());
}

TEST(PlaybackEventChannel, OneNotificationPerPushAndClose) {
    PlaybackEventChannel channel;
    int notifications = 0;
    channel.setReadyCallback([&notifications]() { ++notifications; });

    channel.push(PlayerEvent::started("a"));
    channel.push(PlayerEvent::paused("a", 10, 100));
    channel.close();
    EXPECT_EQ(notifications, 3);

    // close is idempotent
    channel.close();
    EXPECT_EQ(notifications, 3);
}

TEST(PlaybackEventChannel, PushAfterCloseIsRejected) {
    PlaybackEventChannel channel;
    channel.close();
    EXPECT_FALSE(channel.push(PlayerEvent::started("a")));
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_TRUE(channel.isDrained());
}

TEST(PlaybackEventChannel, LateCallbackReplaysOwedNotifications) {
    PlaybackEventChannel channel;
    channel.push(PlayerEvent::started("a"));
    channel.push(PlayerEvent::stopped("a"));
    channel.close();

    int notifications = 0;
    channel.setReadyCallback([&notifications]() { ++notifications; });
    EXPECT_EQ(notifications, 3);
}

TEST(PlaybackEventChannel, ClearedCallbackStopsNotifications) {
    PlaybackEventChannel channel;
    int notifications = 0;
    channel.setReadyCallback([&notifications]() { ++notifications; });
    channel.setReadyCallback(nullptr);
    channel.push(PlayerEvent::started("a"));
    EXPECT_EQ(notifications, 0);
    EXPECT_EQ(channel.size(), 1u);
}

TEST(PlaybackEventChannel, DrainedOnlyWhenClosedAndEmpty) {
    PlaybackEventChannel channel;
    channel.push(PlayerEvent::started("a"));
    channel.close();
    EXPECT_TRUE(channel.isClosed());
    EXPECT_FALSE(channel.isDrained());
    channel.tryPop();
    EXPECT_TRUE(channel.isDrained());
}

TEST(PlaybackEventChannel, ProducerOnAnotherThread) {
    PlaybackEventChannel channel;
    std::atomic<int> notifications{0};
    channel.setReadyCallback([&notifications]() { notifications.fetch_add(1); });

    std::thread producer([&channel]() {
        for (int i = 0; i < 100; ++i) {
            channel.push(PlayerEvent::volumeSet(static_cast<uint16_t>(i)));
        }
        channel.close();
    });
    producer.join();

    EXPECT_EQ(notifications.load(), 101);
    int popped = 0;
    while (auto event = channel.tryPop()) {
        EXPECT_EQ(event->volume, popped);
        ++popped;
    }
    EXPECT_EQ(popped, 100);
}
