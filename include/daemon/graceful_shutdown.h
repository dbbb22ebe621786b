#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <utility>

namespace spotty::daemon {

// ========== Signal State ==========
// Flags set by the signal handler and polled by the control loop.
// volatile sig_atomic_t keeps access async-signal-safe.

struct SignalState {
    volatile sig_atomic_t interrupt = 0;  // SIGINT, SIGTERM
    volatile sig_atomic_t received = 0;   // Last signal number (for logging)

    void reset() {
        interrupt = 0;
        received = 0;
    }
};

// ========== Interrupt Controller ==========
// Turns raw signal flags into counted interrupts.
// Testable without actual signal delivery.

class Controller {
   public:
    using LogCallback = std::function<void(int signal, int count)>;

    Controller() = default;

    void setSignalState(SignalState* state) {
        signalState_ = state;
    }
    void setLogCallback(LogCallback cb) {
        logCallback_ = std::move(cb);
    }

    // Consume a pending interrupt. Returns true if one was pending.
    bool processPendingSignals();

    // Number of interrupts consumed so far (1 = leave loop, 2 = abandon drain)
    int interruptCount() const {
        return interruptCount_.load();
    }
    bool isRunning() const {
        return interruptCount_.load() == 0;
    }
    int getLastSignal() const {
        return lastSignal_;
    }

    void reset() {
        interruptCount_ = 0;
        lastSignal_ = 0;
    }

   private:
    SignalState* signalState_ = nullptr;
    std::atomic<int> interruptCount_{0};
    int lastSignal_ = 0;
    LogCallback logCallback_;
};

// ========== Signal Handler ==========
// Async-signal-safe, only sets flags.
void signalHandler(int sig);

SignalState& getGlobalSignalState();

}  // namespace spotty::daemon
