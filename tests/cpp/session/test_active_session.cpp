/**
 * @file test_active_session.cpp
 * @brief Unit tests for assembling mixer, player and control surface for a session
 */

#include "fakes/fake_backend.h"
#include "session/active_session.h"

#include <gtest/gtest.h>

using namespace spotty;
using namespace spotty::testing;

class ActiveSessionTest : public ::testing::Test {
   protected:
    session::SessionComponents components() {
        return session::SessionComponents{&players_, &controls_};
    }

    std::shared_ptr<FakeSession> session_ = std::make_shared<FakeSession>("alice");
    FakePlayerFactory players_;
    FakeControlSurfaceFactory controls_;
    session::SpawnConfig config_;
};

TEST_F(ActiveSessionTest, SpawnWiresEverything) {
    config_.connectConfig.initialVolume = 1234;

    session::SpawnedSession spawned;
    std::string error;
    ASSERT_TRUE(session::spawnActiveSession(session_, config_, components(), spawned, error))
        << error;

    ASSERT_NE(spawned.handle, nullptr);
    ASSERT_NE(spawned.task, nullptr);
    ASSERT_NE(spawned.events, nullptr);
    ASSERT_NE(spawned.player, nullptr);
    ASSERT_NE(spawned.mixer, nullptr);

    // Mixer starts at the configured volume and feeds the player's filter
    EXPECT_EQ(spawned.mixer->volume(), 1234);
    auto player = players_.last();
    ASSERT_NE(player, nullptr);
    EXPECT_EQ(player->context.audioFilter, spawned.mixer->audioFilter());
    EXPECT_EQ(player->context.events, spawned.events);
    EXPECT_EQ(player->context.session, session_);

    // The task is handed back unstarted
    EXPECT_FALSE(controls_.last()->started);
    EXPECT_EQ(controls_.last()->initialVolume, 1234);
}

TEST_F(ActiveSessionTest, SinkFactoryTargetsConfiguredDevice) {
    session::SpawnedSession spawned;
    std::string error;
    ASSERT_TRUE(session::spawnActiveSession(session_, config_, components(), spawned, error));

    auto sink = players_.last()->context.sinkFactory();
    ASSERT_NE(sink, nullptr);
    auto* pipe = dynamic_cast<playback::PipeSink*>(sink.get());
    ASSERT_NE(pipe, nullptr);
    EXPECT_EQ(pipe->device(), playback::kNullDevice);
    EXPECT_EQ(pipe->format(), playback::AudioFormat::S16);
}

TEST_F(ActiveSessionTest, EachSpawnGetsFreshChannelAndMixer) {
    session::SpawnedSession first;
    session::SpawnedSession second;
    std::string error;
    ASSERT_TRUE(session::spawnActiveSession(session_, config_, components(), first, error));
    first.mixer->setVolume(10);
    ASSERT_TRUE(session::spawnActiveSession(session_, config_, components(), second, error));

    EXPECT_NE(first.events, second.events);
    EXPECT_NE(first.mixer, second.mixer);
    EXPECT_EQ(second.mixer->volume(), config_.connectConfig.initialVolume);
}

TEST_F(ActiveSessionTest, UnknownMixerFails) {
    config_.mixerName = "alsa";
    session::SpawnedSession spawned;
    std::string error;
    EXPECT_FALSE(session::spawnActiveSession(session_, config_, components(), spawned, error));
    EXPECT_NE(error.find("alsa"), std::string::npos);
    EXPECT_TRUE(players_.players.empty());
}

TEST_F(ActiveSessionTest, UnknownSinkFails) {
    config_.sinkName = "rodio";
    session::SpawnedSession spawned;
    std::string error;
    EXPECT_FALSE(session::spawnActiveSession(session_, config_, components(), spawned, error));
    EXPECT_NE(error.find("rodio"), std::string::npos);
}

TEST_F(ActiveSessionTest, PlayerFailure) {
    players_.failNext = true;
    session::SpawnedSession spawned;
    std::string error;
    EXPECT_FALSE(session::spawnActiveSession(session_, config_, components(), spawned, error));
    EXPECT_TRUE(controls_.states.empty());
}

TEST_F(ActiveSessionTest, ControlSurfaceFailureStopsPlayer) {
    controls_.failNext = true;
    session::SpawnedSession spawned;
    std::string error;
    EXPECT_FALSE(session::spawnActiveSession(session_, config_, components(), spawned, error));
    ASSERT_NE(players_.last(), nullptr);
    EXPECT_TRUE(players_.last()->stopped);
    EXPECT_EQ(spawned.task, nullptr);
}

TEST_F(ActiveSessionTest, MissingInputs) {
    session::SpawnedSession spawned;
    std::string error;
    EXPECT_FALSE(session::spawnActiveSession(nullptr, config_, components(), spawned, error));
    EXPECT_FALSE(session::spawnActiveSession(session_, config_, session::SessionComponents{},
                                             spawned, error));
}
