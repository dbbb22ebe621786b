#include "daemon/graceful_shutdown.h"

namespace spotty::daemon {

// Global signal state (used by signalHandler)
static SignalState g_signalState;

SignalState& getGlobalSignalState() {
    return g_signalState;
}

// Async-signal-safe signal handler - ONLY sets flags
void signalHandler(int sig) {
    g_signalState.received = sig;
    g_signalState.interrupt = 1;
}

bool Controller::processPendingSignals() {
    if (!signalState_ || !signalState_->interrupt) {
        return false;
    }

    signalState_->interrupt = 0;
    lastSignal_ = signalState_->received;
    const int count = ++interruptCount_;

    if (logCallback_) {
        logCallback_(lastSignal_, count);
    }
    return true;
}

}  // namespace spotty::daemon
