#pragma once

#include "session/streaming.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace spotty::orchestrator {

/**
 * @brief Keeps detached control tasks alive until they finish on their own.
 *
 * Owned and reaped by the orchestrator thread only.
 */
class BackgroundTasks {
   public:
    void detach(std::unique_ptr<session::ControlTask> task);

    // Drops finished tasks, returns how many were released.
    size_t reap();

    size_t size() const {
        return tasks_.size();
    }
    bool empty() const {
        return tasks_.empty();
    }

   private:
    std::vector<std::unique_ptr<session::ControlTask>> tasks_;
};

}  // namespace spotty::orchestrator
