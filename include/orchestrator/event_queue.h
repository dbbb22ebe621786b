#ifndef SPOTTY_ORCHESTRATOR_EVENT_QUEUE_H
#define SPOTTY_ORCHESTRATOR_EVENT_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace spotty::orchestrator {

/**
 * @brief Multi-producer / single-consumer FIFO with a bounded wait.
 *
 * Producers may be any thread (discovery, connection completions, control tasks,
 * players). Items pushed after stop() are discarded.
 */
template <typename T>
class EventQueue {
   public:
    EventQueue() = default;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            queue_.push_back(std::move(item));
        }
        cond_.notify_one();
    }

    /**
     * @brief Wait up to @p timeout for the next item.
     *
     * @return std::nullopt on timeout, or when stopped and empty
     */
    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait_for(lock, timeout, [this] { return !queue_.empty() || stopped_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cond_.notify_all();
    }

    bool isStopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    bool stopped_ = false;
};

}  // namespace spotty::orchestrator

#endif  // SPOTTY_ORCHESTRATOR_EVENT_QUEUE_H
