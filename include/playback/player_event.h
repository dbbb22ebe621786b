#pragma once

#include <cstdint>
#include <string>

namespace spotty::playback {

/**
 * @brief Playback state transition reported by the player.
 *
 * Only the fields relevant to the given kind are populated.
 */
struct PlayerEvent {
    enum class Kind {
        Started,
        Changed,
        Playing,
        Paused,
        Stopped,
        Loading,
        Preloading,
        TimeToPreloadNextTrack,
        EndOfTrack,
        Unavailable,
        VolumeSet,
    };

    Kind kind = Kind::Stopped;
    std::string trackId;
    std::string oldTrackId;
    uint32_t positionMs = 0;
    uint32_t durationMs = 0;
    uint16_t volume = 0;

    static PlayerEvent started(std::string trackId, uint32_t positionMs = 0);
    static PlayerEvent changed(std::string oldTrackId, std::string newTrackId);
    static PlayerEvent playing(std::string trackId, uint32_t positionMs, uint32_t durationMs);
    static PlayerEvent paused(std::string trackId, uint32_t positionMs, uint32_t durationMs);
    static PlayerEvent stopped(std::string trackId);
    static PlayerEvent volumeSet(uint16_t volume);
};

const char* playerEventKindToString(PlayerEvent::Kind kind);

}  // namespace spotty::playback
