#include "lms/playback_event_bridge.h"

#include "logging/logger.h"

#include <exception>
#include <utility>

namespace spotty::lms {

PlaybackEventBridge::PlaybackEventBridge(std::shared_ptr<playback::PlaybackEventChannel> channel,
                                         DeviceNotifier& notifier)
    : channel_(std::move(channel)), notifier_(notifier) {}

PlaybackEventBridge::Step PlaybackEventBridge::forwardNext() {
    if (finished_ || !channel_) {
        finished_ = true;
        return Step::Finished;
    }

    auto event = channel_->tryPop();
    if (!event) {
        if (channel_->isClosed()) {
            finished_ = true;
            channel_.reset();
            return Step::Finished;
        }
        return Step::Idle;
    }

    try {
        if (!notifier_.signalEvent(*event)) {
            LOG_DEBUG("Playback event {} not delivered",
                      playback::playerEventKindToString(event->kind));
        }
    } catch (const std::exception& ex) {
        LOG_DEBUG("Playback event {} dropped: {}", playback::playerEventKindToString(event->kind),
                  ex.what());
    }
    ++forwarded_;
    return Step::Forwarded;
}

}  // namespace spotty::lms
