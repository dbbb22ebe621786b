#include "playback/player_event.h"

#include <utility>

namespace spotty::playback {

PlayerEvent PlayerEvent::started(std::string trackId, uint32_t positionMs) {
    PlayerEvent event;
    event.kind = Kind::Started;
    event.trackId = std::move(trackId);
    event.positionMs = positionMs;
    return event;
}

PlayerEvent PlayerEvent::changed(std::string oldTrackId, std::string newTrackId) {
    PlayerEvent event;
    event.kind = Kind::Changed;
    event.oldTrackId = std::move(oldTrackId);
    event.trackId = std::move(newTrackId);
    return event;
}

PlayerEvent PlayerEvent::playing(std::string trackId, uint32_t positionMs, uint32_t durationMs) {
    PlayerEvent event;
    event.kind = Kind::Playing;
    event.trackId = std::move(trackId);
    event.positionMs = positionMs;
    event.durationMs = durationMs;
    return event;
}

PlayerEvent PlayerEvent::paused(std::string trackId, uint32_t positionMs, uint32_t durationMs) {
    PlayerEvent event;
    event.kind = Kind::Paused;
    event.trackId = std::move(trackId);
    event.positionMs = positionMs;
    event.durationMs = durationMs;
    return event;
}

PlayerEvent PlayerEvent::stopped(std::string trackId) {
    PlayerEvent event;
    event.kind = Kind::Stopped;
    event.trackId = std::move(trackId);
    return event;
}

PlayerEvent PlayerEvent::volumeSet(uint16_t volume) {
    PlayerEvent event;
    event.kind = Kind::VolumeSet;
    event.volume = volume;
    return event;
}

const char* playerEventKindToString(PlayerEvent::Kind kind) {
    switch (kind) {
    case PlayerEvent::Kind::Started:
        return "started";
    case PlayerEvent::Kind::Changed:
        return "changed";
    case PlayerEvent::Kind::Playing:
        return "playing";
    case PlayerEvent::Kind::Paused:
        return "paused";
    case PlayerEvent::Kind::Stopped:
        return "stopped";
    case PlayerEvent::Kind::Loading:
        return "loading";
    case PlayerEvent::Kind::Preloading:
        return "preloading";
    case PlayerEvent::Kind::TimeToPreloadNextTrack:
        return "time_to_preload_next_track";
    case PlayerEvent::Kind::EndOfTrack:
        return "end_of_track";
    case PlayerEvent::Kind::Unavailable:
        return "unavailable";
    case PlayerEvent::Kind::VolumeSet:
        return "volume_set";
    }
    return "unknown";
}

}  // namespace spotty::playback
