#include "orchestrator/orchestrator.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <type_traits>
#include <utility>
#include <variant>

namespace spotty::orchestrator {

namespace {

class DiscardingNotifier : public lms::DeviceNotifier {
   public:
    bool signalEvent(const playback::PlayerEvent&) override {
        return true;
    }
};

}  // namespace

const char* orchestratorStateToString(OrchestratorState state) {
    switch (state) {
    case OrchestratorState::NoSession:
        return "no_session";
    case OrchestratorState::Connecting:
        return "connecting";
    case OrchestratorState::Active:
        return "active";
    case OrchestratorState::Draining:
        return "draining";
    case OrchestratorState::Terminated:
        return "terminated";
    }
    return "unknown";
}

const char* loopOutcomeToString(LoopOutcome outcome) {
    switch (outcome) {
    case LoopOutcome::Interrupted:
        return "interrupted";
    case LoopOutcome::Authenticated:
        return "authenticated";
    case LoopOutcome::FirstConnectFailed:
        return "first_connect_failed";
    }
    return "unknown";
}

int exitCodeFor(LoopOutcome outcome) {
    return outcome == LoopOutcome::FirstConnectFailed ? 1 : 0;
}

Orchestrator::Orchestrator(OrchestratorConfig config, OrchestratorDependencies deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      queue_(std::make_shared<EventQueue<LoopEvent>>()) {
    if (!deps_.notifier) {
        fallbackNotifier_ = std::make_unique<DiscardingNotifier>();
        deps_.notifier = fallbackNotifier_.get();
    }
}

Orchestrator::~Orchestrator() {
    queue_->stop();
    if (discovery_) {
        discovery_->stop();
    }
    clearEventSlot();
    pending_.reset();
}

ReconnectWindow::TimePoint Orchestrator::now() const {
    return deps_.clock ? deps_.clock() : ReconnectWindow::Clock::now();
}

OrchestratorState Orchestrator::state() const {
    if (terminated_) {
        return OrchestratorState::Terminated;
    }
    if (draining_) {
        return OrchestratorState::Draining;
    }
    if (pendingAttemptId_) {
        return OrchestratorState::Connecting;
    }
    if (active_) {
        return OrchestratorState::Active;
    }
    return OrchestratorState::NoSession;
}

uint64_t Orchestrator::activeSessionId() const {
    return active_ ? active_->sessionId : 0;
}

bool Orchestrator::start(std::optional<core::Credentials> initialCredentials, std::string& error) {
    std::weak_ptr<EventQueue<LoopEvent>> queue = queue_;

    if (config_.discovery) {
        if (!deps_.discoveryFactory) {
            error = "Discovery enabled but no discovery service is available";
            return false;
        }
        discovery_ = deps_.discoveryFactory(*config_.discovery);
        if (!discovery_) {
            error = "Discovery service could not be created";
            return false;
        }

        auto onCredentials = [queue](core::Credentials credentials) {
            if (auto q = queue.lock()) {
                q->push(DiscoveryCredentials{std::move(credentials)});
            }
        };
        auto onEnded = [queue]() {
            if (auto q = queue.lock()) {
                q->push(DiscoveryEnded{});
            }
        };
        if (!discovery_->launch(onCredentials, onEnded, error)) {
            discovery_.reset();
            return false;
        }
        discoveryEnabled_ = true;
        LOG_INFO("Discovery announced '{}' (device id {}, port {})", config_.discovery->name,
                 config_.discovery->deviceId,
                 config_.discovery->port == 0 ? std::string("ephemeral")
                                              : std::to_string(config_.discovery->port));
    }

    if (initialCredentials) {
        startConnection(*initialCredentials);
    }

    if (deps_.hooks.onReady) {
        deps_.hooks.onReady();
    }
    return true;
}

bool Orchestrator::step(std::chrono::milliseconds wait) {
    if (outcome_) {
        return false;
    }

    background_.reap();
    if (deps_.hooks.onTick) {
        deps_.hooks.onTick();
    }

    if (deps_.interrupts && deps_.interrupts->consumeInterrupt()) {
        LOG_INFO("Interrupt received, leaving the control loop");
        outcome_ = LoopOutcome::Interrupted;
        return false;
    }

    auto event = queue_->popFor(wait);
    if (!event) {
        return true;
    }
    dispatch(*event);
    return !outcome_.has_value();
}

LoopOutcome Orchestrator::run() {
    while (step(config_.pollInterval)) {
    }
    shutdown();
    return outcome_.value_or(LoopOutcome::Interrupted);
}

void Orchestrator::dispatch(LoopEvent& event) {
    std::visit(
        [this](auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, DiscoveryCredentials>) {
                onDiscoveryCredentials(e);
            } else if constexpr (std::is_same_v<T, DiscoveryEnded>) {
                onDiscoveryEnded();
            } else if constexpr (std::is_same_v<T, ConnectionResolved>) {
                onConnectionResolved(e);
            } else if constexpr (std::is_same_v<T, ControlTaskFinished>) {
                onControlTaskFinished(e);
            } else if constexpr (std::is_same_v<T, PlaybackEventsReady>) {
                onPlaybackEventsReady(e);
            }
        },
        event);
}

void Orchestrator::onDiscoveryCredentials(DiscoveryCredentials& event) {
    if (!discoveryEnabled_) {
        return;
    }
    LOG_INFO("Discovery: credentials received for {}", event.credentials.username());

    reconnectWindow_.clear();
    detachActive();
    startConnection(event.credentials);
}

void Orchestrator::onDiscoveryEnded() {
    if (!discoveryEnabled_) {
        return;
    }
    LOG_WARN("Discovery stopped!");
    discoveryEnabled_ = false;
    discovery_.reset();
}

void Orchestrator::onConnectionResolved(ConnectionResolved& event) {
    if (!pendingAttemptId_ || *pendingAttemptId_ != event.attemptId) {
        LOG_DEBUG("Dropping result of superseded connection attempt {}", event.attemptId);
        return;
    }

    pending_.reset();
    pendingAttemptId_.reset();
    std::optional<core::Credentials> credentials = std::move(pendingCredentials_);
    pendingCredentials_.reset();

    if (!event.result.ok()) {
        std::string reason = "no session";
        if (event.result.error) {
            reason = std::string(core::errorCodeToString(event.result.error->code)) + ": " +
                     event.result.error->message;
        }
        failConnection(reason);
        return;
    }

    LOG_INFO("Authenticated as {}", event.result.session->username());
    lastCredentials_ = std::move(credentials);

    if (config_.authenticateOnly) {
        outcome_ = LoopOutcome::Authenticated;
        return;
    }
    installSession(std::move(event.result.session));
}

void Orchestrator::onControlTaskFinished(const ControlTaskFinished& event) {
    if (!active_ || active_->sessionId != event.sessionId) {
        LOG_DEBUG("Detached control task of session {} finished", event.sessionId);
        return;
    }

    LOG_WARN("Control task shut down unexpectedly");
    active_.reset();

    if (!lastCredentials_) {
        LOG_INFO("No credentials to reconnect with, waiting for discovery");
        return;
    }
    const auto terminatedAt = now();
    if (!reconnectWindow_.shouldRetry(terminatedAt)) {
        return;
    }
    reconnectWindow_.record(terminatedAt);
    LOG_INFO("Reconnecting ({} of {} within {} seconds)", reconnectWindow_.size(),
             reconnectWindow_.maxAttempts(), reconnectWindow_.horizon().count());
    startConnection(*lastCredentials_);
}

void Orchestrator::onPlaybackEventsReady(const PlaybackEventsReady& event) {
    if (!events_ || events_->sessionId != event.sessionId) {
        return;
    }
    if (events_->bridge->forwardNext() == lms::PlaybackEventBridge::Step::Finished) {
        LOG_DEBUG("Playback events of session {} ended", event.sessionId);
        clearEventSlot();
    }
}

void Orchestrator::startConnection(const core::Credentials& credentials) {
    const uint64_t attemptId = ++nextAttemptId_;

    // Dropping the previous attempt cancels it
    pending_.reset();
    pendingAttemptId_ = attemptId;
    pendingCredentials_ = credentials;

    if (!deps_.streaming) {
        queue_->push(ConnectionResolved{
            attemptId, session::ConnectResult::failure(core::ErrorCode::SESSION_CONNECT_FAILED,
                                                       "no streaming service")});
        return;
    }

    LOG_INFO("Connecting as {} (attempt {})", credentials.username(), attemptId);
    std::weak_ptr<EventQueue<LoopEvent>> queue = queue_;
    pending_ = deps_.streaming->connect(config_.sessionConfig, credentials, deps_.cache,
                                        [queue, attemptId](session::ConnectResult result) {
                                            if (auto q = queue.lock()) {
                                                q->push(ConnectionResolved{attemptId,
                                                                           std::move(result)});
                                            }
                                        });
    if (!pending_) {
        queue_->push(ConnectionResolved{
            attemptId, session::ConnectResult::failure(core::ErrorCode::SESSION_CONNECT_FAILED,
                                                       "connection attempt not started")});
    }
}

void Orchestrator::failConnection(const std::string& reason) {
    if (!everConnected_) {
        LOG_ERROR("Connection failed: {}", reason);
        outcome_ = LoopOutcome::FirstConnectFailed;
        return;
    }
    LOG_WARN("Reconnection failed: {}. Waiting for the next discovery event.", reason);
}

void Orchestrator::installSession(session::SessionPtr session) {
    if (active_) {
        detachActive();
    }

    session::SpawnedSession spawned;
    std::string error;
    session::SessionComponents components{deps_.players, deps_.controls};
    if (!session::spawnActiveSession(session, config_.spawnConfig, components, spawned, error)) {
        session->shutdown();
        failConnection(error);
        return;
    }
    everConnected_ = true;

    const uint64_t sessionId = ++nextSessionId_;
    std::weak_ptr<EventQueue<LoopEvent>> queue = queue_;

    // The previous session's channel is no longer consumed from here on
    clearEventSlot();
    events_ = std::make_unique<EventSlot>();
    events_->sessionId = sessionId;
    events_->channel = spawned.events;
    events_->bridge = std::make_unique<lms::PlaybackEventBridge>(spawned.events, *deps_.notifier);

    active_ = std::make_unique<ActiveSlot>();
    active_->sessionId = sessionId;
    active_->session = std::move(session);
    active_->handle = std::move(spawned.handle);
    active_->task = std::move(spawned.task);
    active_->player = std::move(spawned.player);
    active_->mixer = std::move(spawned.mixer);

    events_->channel->setReadyCallback([queue, sessionId]() {
        if (auto q = queue.lock()) {
            q->push(PlaybackEventsReady{sessionId});
        }
    });
    active_->task->start([queue, sessionId]() {
        if (auto q = queue.lock()) {
            q->push(ControlTaskFinished{sessionId});
        }
    });

    LOG_INFO("Device '{}' active (session {})", config_.spawnConfig.connectConfig.name, sessionId);
}

void Orchestrator::detachActive() {
    if (!active_) {
        return;
    }
    LOG_DEBUG("Detaching control task of session {}", active_->sessionId);
    active_->handle->shutdown();
    background_.detach(std::move(active_->task));
    active_.reset();
}

void Orchestrator::clearEventSlot() {
    if (!events_) {
        return;
    }
    events_->channel->setReadyCallback(nullptr);
    events_.reset();
}

void Orchestrator::shutdown() {
    if (terminated_) {
        return;
    }
    draining_ = true;
    LOG_INFO("Gracefully shutting down");
    if (deps_.hooks.onStopping) {
        deps_.hooks.onStopping();
    }

    if (discovery_) {
        discovery_->stop();
        discovery_.reset();
    }
    discoveryEnabled_ = false;
    pending_.reset();
    pendingAttemptId_.reset();
    pendingCredentials_.reset();

    if (active_) {
        const uint64_t sessionId = active_->sessionId;
        active_->handle->shutdown();

        if (!active_->task->isFinished()) {
            LOG_INFO("Waiting for the control task to finish (interrupt again to exit now)");
        }
        while (!active_->task->isFinished()) {
            if (deps_.interrupts && deps_.interrupts->consumeInterrupt()) {
                LOG_WARN("Second interrupt, not waiting for the control task");
                break;
            }
            auto event = queue_->popFor(config_.pollInterval);
            if (!event) {
                continue;
            }
            auto* finished = std::get_if<ControlTaskFinished>(&*event);
            if (finished && finished->sessionId == sessionId) {
                break;
            }
        }
        active_.reset();
    }

    clearEventSlot();
    draining_ = false;
    terminated_ = true;
}

}  // namespace spotty::orchestrator
