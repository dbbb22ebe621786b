#pragma once

#include "daemon/graceful_shutdown.h"
#include "orchestrator/orchestrator.h"

namespace spotty::daemon {

/**
 * @brief Process lifecycle glue: signal handlers, interrupt polling and systemd notify.
 */
class ShutdownManager : public orchestrator::InterruptSource {
   public:
    // Uses the process-wide signal state unless another one is given (tests).
    explicit ShutdownManager(SignalState* state = nullptr);

    void installSignalHandlers();

    bool consumeInterrupt() override;

    // Notifications
    void notifyReady();
    void notifyStopping();

    // Periodic processing (called from the control loop)
    void tick();

    int interruptCount() const {
        return controller_.interruptCount();
    }

   private:
    void sendWatchdog();
    void sendReadyNotify();
    void sendStoppingNotify();

    Controller controller_;

    bool readyNotified_{false};
    bool stoppingNotified_{false};
};

}  // namespace spotty::daemon
