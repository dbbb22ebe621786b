#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace spotty::orchestrator {

/**
 * @brief Time-bounded history of unexpected session terminations.
 *
 * shouldRetry() prunes entries older than the horizon and refuses once maxAttempts
 * remain. The caller records a timestamp only when it actually reconnects.
 */
class ReconnectWindow {
   public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr std::chrono::seconds kDefaultHorizon{600};
    static constexpr size_t kDefaultMaxAttempts = 5;

    explicit ReconnectWindow(std::chrono::seconds horizon = kDefaultHorizon,
                             size_t maxAttempts = kDefaultMaxAttempts);

    bool shouldRetry(TimePoint now);
    void record(TimePoint now);
    void clear();

    size_t size() const {
        return attempts_.size();
    }
    std::chrono::seconds horizon() const {
        return horizon_;
    }
    size_t maxAttempts() const {
        return maxAttempts_;
    }

   private:
    void prune(TimePoint now);

    std::chrono::seconds horizon_;
    size_t maxAttempts_;
    std::deque<TimePoint> attempts_;
};

}  // namespace spotty::orchestrator
