#include "playback/event_channel.h"

#include <utility>

namespace spotty::playback {

void PlaybackEventChannel::setReadyCallback(ReadyCallback callback) {
    size_t owed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = callback;
        owed = queue_.size() + (closed_ ? 1 : 0);
    }
    if (!callback) {
        return;
    }
    for (size_t i = 0; i < owed; ++i) {
        callback();
    }
}

bool PlaybackEventChannel::push(PlayerEvent event) {
    ReadyCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(event));
        callback = callback_;
    }
    if (callback) {
        callback();
    }
    return true;
}

void PlaybackEventChannel::close() {
    ReadyCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        callback = callback_;
    }
    if (callback) {
        callback();
    }
}

std::optional<PlayerEvent> PlaybackEventChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    PlayerEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

bool PlaybackEventChannel::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool PlaybackEventChannel::isDrained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

size_t PlaybackEventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}  // namespace spotty::playback
