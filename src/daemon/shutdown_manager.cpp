#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <csignal>

#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace spotty::daemon {

ShutdownManager::ShutdownManager(SignalState* state) {
    controller_.setSignalState(state ? state : &getGlobalSignalState());
    controller_.setLogCallback([](int signal, int count) {
        if (count == 1) {
            LOG_INFO("Received signal {}, shutting down", signal);
        } else {
            LOG_WARN("Received signal {} again, exiting", signal);
        }
    });
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool ShutdownManager::consumeInterrupt() {
    return controller_.processPendingSignals();
}

void ShutdownManager::notifyReady() {
    if (!readyNotified_) {
        sendReadyNotify();
    }
}

void ShutdownManager::notifyStopping() {
    sendStoppingNotify();
}

void ShutdownManager::tick() {
    if (readyNotified_ && controller_.isRunning()) {
        sendWatchdog();
    }
}

void ShutdownManager::sendWatchdog() {
#ifdef HAVE_SYSTEMD
    sd_notify(0, "WATCHDOG=1");
#endif
}

void ShutdownManager::sendReadyNotify() {
#ifdef HAVE_SYSTEMD
    sd_notify(0, "READY=1\nSTATUS=Waiting for a controller...\n");
    readyNotified_ = true;
    LOG_DEBUG("systemd: Notified READY=1");
#endif
}

void ShutdownManager::sendStoppingNotify() {
#ifdef HAVE_SYSTEMD
    if (!stoppingNotified_) {
        sd_notify(0, "STOPPING=1\nSTATUS=Shutting down...\n");
        stoppingNotified_ = true;
        LOG_DEBUG("systemd: Notified STOPPING=1");
    }
#endif
}

}  // namespace spotty::daemon
