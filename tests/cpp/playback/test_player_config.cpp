#include "playback/player_config.h"
#include "playback/player_event.h"

#include <gtest/gtest.h>

using namespace spotty::playback;

TEST(PlayerConfig, Defaults) {
    PlayerConfig config;
    EXPECT_EQ(config.bitrate, Bitrate::Bitrate160);
    EXPECT_TRUE(config.gapless);
    EXPECT_FALSE(config.passthrough);
    EXPECT_FALSE(config.normalisation);
    EXPECT_EQ(config.normalisationType, NormalisationType::Auto);
    EXPECT_EQ(config.normalisationMethod, NormalisationMethod::Basic);
    EXPECT_DOUBLE_EQ(config.normalisationThresholdDbfs, -2.0);
    EXPECT_TRUE(config.lmsConnectMode);
}

TEST(PlayerConfig, ParseBitrate) {
    EXPECT_EQ(parseBitrate("96"), Bitrate::Bitrate96);
    EXPECT_EQ(parseBitrate("160"), Bitrate::Bitrate160);
    EXPECT_EQ(parseBitrate("320"), Bitrate::Bitrate320);
    EXPECT_FALSE(parseBitrate("128").has_value());
    EXPECT_FALSE(parseBitrate("").has_value());
    EXPECT_STREQ(bitrateToString(Bitrate::Bitrate320), "320");
}

TEST(PlayerConfig, ParseNormalisationTypeIsCaseInsensitive) {
    EXPECT_EQ(parseNormalisationType("album"), NormalisationType::Album);
    EXPECT_EQ(parseNormalisationType("Track"), NormalisationType::Track);
    EXPECT_EQ(parseNormalisationType("AUTO"), NormalisationType::Auto);
    EXPECT_FALSE(parseNormalisationType("loud").has_value());
    EXPECT_STREQ(normalisationTypeToString(NormalisationType::Track), "track");
}

TEST(PlayerConfig, AudioFormats) {
    EXPECT_EQ(parseAudioFormat("s16"), AudioFormat::S16);
    EXPECT_EQ(parseAudioFormat("F32"), AudioFormat::F32);
    EXPECT_FALSE(parseAudioFormat("s24").has_value());
    EXPECT_EQ(bytesPerSample(AudioFormat::S16), 2u);
    EXPECT_EQ(bytesPerSample(AudioFormat::S32), 4u);
    EXPECT_EQ(bytesPerSample(AudioFormat::F32), 4u);
}

TEST(PlayerEvent, Factories) {
    auto changed = PlayerEvent::changed("old", "new");
    EXPECT_EQ(changed.kind, PlayerEvent::Kind::Changed);
    EXPECT_EQ(changed.oldTrackId, "old");
    EXPECT_EQ(changed.trackId, "new");

    auto playing = PlayerEvent::playing("t1", 1000, 180000);
    EXPECT_EQ(playing.kind, PlayerEvent::Kind::Playing);
    EXPECT_EQ(playing.positionMs, 1000u);
    EXPECT_EQ(playing.durationMs, 180000u);

    EXPECT_EQ(PlayerEvent::volumeSet(42).volume, 42);
    EXPECT_STREQ(playerEventKindToString(PlayerEvent::Kind::EndOfTrack), "end_of_track");
}
