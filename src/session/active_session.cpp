#include "session/active_session.h"

#include "logging/logger.h"

namespace spotty::session {

bool spawnActiveSession(SessionPtr session, const SpawnConfig& config,
                        const SessionComponents& components, SpawnedSession& out,
                        std::string& error) {
    if (!session) {
        error = "No session to spawn from";
        return false;
    }
    if (!components.players || !components.controls) {
        error = "Player or control surface factory missing";
        return false;
    }

    auto mixerFactory = playback::findMixer(config.mixerName);
    if (!mixerFactory) {
        error = "Invalid mixer: " + config.mixerName;
        return false;
    }
    auto sinkBuilder = playback::findSink(config.sinkName);
    if (!sinkBuilder) {
        error = "Invalid audio backend: " + config.sinkName;
        return false;
    }

    std::shared_ptr<playback::Mixer> mixer = (*mixerFactory)(config.mixerConfig);
    if (!mixer) {
        error = "Mixer " + config.mixerName + " could not be created";
        return false;
    }
    mixer->setVolume(config.connectConfig.initialVolume);

    PlayerContext context;
    context.session = session;
    context.config = config.playerConfig;
    context.audioFilter = mixer->audioFilter();
    context.sinkFactory = [builder = *sinkBuilder, device = config.sinkDevice,
                           format = config.format]() { return builder(device, format); };
    context.events = std::make_shared<playback::PlaybackEventChannel>();

    std::shared_ptr<Player> player = components.players->create(context);
    if (!player) {
        error = "Player could not be created";
        return false;
    }

    ControlSurface surface =
        components.controls->create(config.connectConfig, session, player, mixer);
    if (!surface.handle || !surface.task) {
        error = "Control surface could not be created";
        player->stop();
        return false;
    }

    LOG_DEBUG("Spawned session for {} (device '{}', volume {})", session->username(),
              config.connectConfig.name, config.connectConfig.initialVolume);

    out.handle = std::move(surface.handle);
    out.task = std::move(surface.task);
    out.events = std::move(context.events);
    out.player = std::move(player);
    out.mixer = std::move(mixer);
    return true;
}

}  // namespace spotty::session
