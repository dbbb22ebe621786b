#pragma once

#include "lms/device_notifier.h"
#include "playback/event_channel.h"

#include <cstddef>
#include <memory>

namespace spotty::lms {

/**
 * @brief Forwards the events of one session's channel to the device notifier.
 *
 * The owner calls forwardNext() once per channel notification. Events are delivered
 * one at a time in arrival order; once the channel is closed and drained the bridge
 * reports finished and never forwards again.
 */
class PlaybackEventBridge {
   public:
    enum class Step {
        Forwarded,
        Idle,      // nothing queued yet
        Finished,  // channel closed and drained
    };

    PlaybackEventBridge(std::shared_ptr<playback::PlaybackEventChannel> channel,
                        DeviceNotifier& notifier);

    Step forwardNext();

    bool isFinished() const {
        return finished_;
    }
    size_t forwardedCount() const {
        return forwarded_;
    }

   private:
    std::shared_ptr<playback::PlaybackEventChannel> channel_;
    DeviceNotifier& notifier_;
    bool finished_ = false;
    size_t forwarded_ = 0;
};

}  // namespace spotty::lms
