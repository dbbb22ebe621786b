#include "orchestrator/background_tasks.h"

#include "logging/logger.h"

#include <algorithm>

namespace spotty::orchestrator {

void BackgroundTasks::detach(std::unique_ptr<session::ControlTask> task) {
    if (!task || task->isFinished()) {
        return;
    }
    tasks_.push_back(std::move(task));
    LOG_DEBUG("Control task detached ({} in background)", tasks_.size());
}

size_t BackgroundTasks::reap() {
    const size_t before = tasks_.size();
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const std::unique_ptr<session::ControlTask>& task) {
                                    return task->isFinished();
                                }),
                 tasks_.end());
    const size_t reaped = before - tasks_.size();
    if (reaped > 0) {
        LOG_DEBUG("Reaped {} finished background control task(s)", reaped);
    }
    return reaped;
}

}  // namespace spotty::orchestrator
