#pragma once

#include "playback/player_event.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace spotty::playback {

/**
 * @brief Single-producer / single-consumer queue of playback events bound to one session.
 *
 * The producer (player) pushes events and eventually closes the channel. The consumer is
 * woken through the ready callback: exactly one callback per pushed event plus one for
 * close, so a consumer that pops one event per notification never misses the end.
 * Callbacks run on the producer's thread, outside the internal lock.
 */
class PlaybackEventChannel {
   public:
    using ReadyCallback = std::function<void()>;

    PlaybackEventChannel() = default;
    PlaybackEventChannel(const PlaybackEventChannel&) = delete;
    PlaybackEventChannel& operator=(const PlaybackEventChannel&) = delete;

    /**
     * @brief Install (or clear with nullptr) the consumer wake-up hook.
     *
     * Notifications already owed for queued events and a prior close are replayed
     * immediately on the caller's thread.
     */
    void setReadyCallback(ReadyCallback callback);

    // Producer side
    bool push(PlayerEvent event);
    void close();

    // Consumer side
    std::optional<PlayerEvent> tryPop();

    bool isClosed() const;
    // Closed and fully consumed; the consumer can drop the channel.
    bool isDrained() const;
    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::deque<PlayerEvent> queue_;
    bool closed_ = false;
    ReadyCallback callback_;
};

}  // namespace spotty::playback
