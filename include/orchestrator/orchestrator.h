#pragma once

#include "core/credential_cache.h"
#include "core/credentials.h"
#include "discovery/discovery_service.h"
#include "lms/device_notifier.h"
#include "lms/playback_event_bridge.h"
#include "orchestrator/background_tasks.h"
#include "orchestrator/event_queue.h"
#include "orchestrator/loop_events.h"
#include "orchestrator/reconnect_policy.h"
#include "session/active_session.h"
#include "session/session_config.h"
#include "session/streaming.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace spotty::orchestrator {

enum class OrchestratorState {
    NoSession,
    Connecting,
    Active,
    Draining,
    Terminated,
};

enum class LoopOutcome {
    Interrupted,
    Authenticated,
    FirstConnectFailed,
};

const char* orchestratorStateToString(OrchestratorState state);
const char* loopOutcomeToString(LoopOutcome outcome);

// Process exit status for a loop outcome: 1 only for an unrecoverable first connection.
int exitCodeFor(LoopOutcome outcome);

// Polled between waits; returns true once per delivered interrupt.
class InterruptSource {
   public:
    virtual ~InterruptSource() = default;
    virtual bool consumeInterrupt() = 0;
};

struct OrchestratorConfig {
    session::SessionConfig sessionConfig;
    session::SpawnConfig spawnConfig;
    // nullopt: discovery disabled for the whole run
    std::optional<discovery::DiscoveryConfig> discovery;
    // Leave the loop after the first successful connection
    bool authenticateOnly = false;
    std::chrono::milliseconds pollInterval{100};
};

struct LifecycleHooks {
    std::function<void()> onReady;
    std::function<void()> onTick;
    std::function<void()> onStopping;
};

struct OrchestratorDependencies {
    session::StreamingService* streaming = nullptr;
    session::PlayerFactory* players = nullptr;
    session::ControlSurfaceFactory* controls = nullptr;
    discovery::DiscoveryFactory discoveryFactory;
    lms::DeviceNotifier* notifier = nullptr;
    const core::CredentialCache* cache = nullptr;
    InterruptSource* interrupts = nullptr;
    std::function<ReconnectWindow::TimePoint()> clock;
    LifecycleHooks hooks;
};

/**
 * @brief The session lifecycle control loop.
 *
 * Single-threaded: every external source posts a LoopEvent and step() services at most
 * one per call. Events tagged with a superseded attempt or session id are dropped, so
 * at most one session is ever active.
 *
 * Usage: start(), then run() (or step() repeatedly followed by shutdown()).
 */
class Orchestrator {
   public:
    Orchestrator(OrchestratorConfig config, OrchestratorDependencies deps);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Launch discovery (if enabled) and the first connection (if credentials given).
     *
     * @return false with error set when discovery cannot be launched
     */
    bool start(std::optional<core::Credentials> initialCredentials, std::string& error);

    /**
     * @brief Service at most one event, waiting up to @p wait for it.
     *
     * @return false once the loop must be left; outcome() then holds the reason
     */
    bool step(std::chrono::milliseconds wait);

    // step() until the loop ends, then shutdown().
    LoopOutcome run();

    /**
     * @brief Stop the active control task and wait for it to finish.
     *
     * A further interrupt during the wait abandons it.
     */
    void shutdown();

    OrchestratorState state() const;
    std::optional<LoopOutcome> outcome() const {
        return outcome_;
    }

    bool hasActiveSession() const {
        return active_ != nullptr;
    }
    bool hasPendingConnection() const {
        return pendingAttemptId_.has_value();
    }
    bool hasEventChannel() const {
        return events_ != nullptr;
    }
    bool discoveryEnabled() const {
        return discoveryEnabled_;
    }
    uint64_t activeSessionId() const;
    size_t backgroundTaskCount() const {
        return background_.size();
    }
    size_t reconnectWindowSize() const {
        return reconnectWindow_.size();
    }
    const std::optional<core::Credentials>& lastCredentials() const {
        return lastCredentials_;
    }

   private:
    struct ActiveSlot {
        uint64_t sessionId = 0;
        session::SessionPtr session;
        std::shared_ptr<session::ControlHandle> handle;
        std::unique_ptr<session::ControlTask> task;
        std::shared_ptr<session::Player> player;
        std::shared_ptr<playback::Mixer> mixer;
    };

    struct EventSlot {
        uint64_t sessionId = 0;
        std::shared_ptr<playback::PlaybackEventChannel> channel;
        std::unique_ptr<lms::PlaybackEventBridge> bridge;
    };

    void dispatch(LoopEvent& event);
    void onDiscoveryCredentials(DiscoveryCredentials& event);
    void onDiscoveryEnded();
    void onConnectionResolved(ConnectionResolved& event);
    void onControlTaskFinished(const ControlTaskFinished& event);
    void onPlaybackEventsReady(const PlaybackEventsReady& event);

    void startConnection(const core::Credentials& credentials);
    void failConnection(const std::string& reason);
    void installSession(session::SessionPtr session);
    void detachActive();
    void clearEventSlot();
    ReconnectWindow::TimePoint now() const;

    OrchestratorConfig config_;
    OrchestratorDependencies deps_;
    std::shared_ptr<EventQueue<LoopEvent>> queue_;
    std::unique_ptr<lms::DeviceNotifier> fallbackNotifier_;

    std::unique_ptr<discovery::DiscoveryService> discovery_;
    bool discoveryEnabled_ = false;

    std::unique_ptr<session::ConnectionAttempt> pending_;
    std::optional<uint64_t> pendingAttemptId_;
    std::optional<core::Credentials> pendingCredentials_;
    uint64_t nextAttemptId_ = 0;

    std::unique_ptr<ActiveSlot> active_;
    std::unique_ptr<EventSlot> events_;
    uint64_t nextSessionId_ = 0;

    BackgroundTasks background_;
    ReconnectWindow reconnectWindow_;
    std::optional<core::Credentials> lastCredentials_;
    bool everConnected_ = false;

    std::optional<LoopOutcome> outcome_;
    bool draining_ = false;
    bool terminated_ = false;
};

}  // namespace spotty::orchestrator
