#pragma once

#include "playback/audio_backend.h"
#include "playback/event_channel.h"
#include "playback/mixer.h"
#include "playback/player_config.h"
#include "session/session_config.h"
#include "session/streaming.h"

#include <memory>
#include <optional>
#include <string>

namespace spotty::session {

/**
 * @brief Everything needed to turn an authenticated session into a controllable device.
 *
 * Copied per spawn; the mixer starts from connectConfig.initialVolume every time.
 */
struct SpawnConfig {
    playback::PlayerConfig playerConfig;
    ConnectConfig connectConfig;
    playback::MixerConfig mixerConfig;
    std::string mixerName = playback::SoftMixer::kName;
    std::string sinkName = playback::PipeSink::kName;
    std::optional<std::string> sinkDevice = std::string(playback::kNullDevice);
    playback::AudioFormat format = playback::AudioFormat::S16;
};

struct SessionComponents {
    PlayerFactory* players = nullptr;
    ControlSurfaceFactory* controls = nullptr;
};

struct SpawnedSession {
    std::shared_ptr<ControlHandle> handle;
    std::unique_ptr<ControlTask> task;
    std::shared_ptr<playback::PlaybackEventChannel> events;
    std::shared_ptr<Player> player;
    std::shared_ptr<playback::Mixer> mixer;
};

/**
 * @brief Build mixer, audio filter, sink, player and control surface for a session.
 *
 * The control task is returned unstarted; the caller decides how completion is reported.
 *
 * @return false with error set when a component cannot be created
 */
bool spawnActiveSession(SessionPtr session, const SpawnConfig& config,
                        const SessionComponents& components, SpawnedSession& out,
                        std::string& error);

}  // namespace spotty::session
