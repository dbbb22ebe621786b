#include "orchestrator/reconnect_policy.h"

#include "logging/logger.h"

namespace spotty::orchestrator {

ReconnectWindow::ReconnectWindow(std::chrono::seconds horizon, size_t maxAttempts)
    : horizon_(horizon), maxAttempts_(maxAttempts) {}

void ReconnectWindow::prune(TimePoint now) {
    while (!attempts_.empty() && now - attempts_.front() > horizon_) {
        attempts_.pop_front();
    }
}

bool ReconnectWindow::shouldRetry(TimePoint now) {
    prune(now);
    if (attempts_.size() >= maxAttempts_) {
        LOG_WARN(
            "Control task shut down {} times within {} seconds. Not reconnecting automatically.",
            attempts_.size(), horizon_.count());
        return false;
    }
    return true;
}

void ReconnectWindow::record(TimePoint now) {
    attempts_.push_back(now);
}

void ReconnectWindow::clear() {
    attempts_.clear();
}

}  // namespace spotty::orchestrator
