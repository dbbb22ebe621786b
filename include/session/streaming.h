#pragma once

#include "core/credentials.h"
#include "core/error_codes.h"
#include "playback/audio_backend.h"
#include "playback/event_channel.h"
#include "playback/mixer.h"
#include "playback/player_config.h"
#include "session/session_config.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace spotty::core {
class CredentialCache;
}

namespace spotty::session {

/**
 * @brief One authenticated connection to the streaming service.
 *
 * Shared by the player and the control surface; copying the pointer is the cheap clone.
 */
class Session {
   public:
    virtual ~Session() = default;

    virtual std::string username() const = 0;
    virtual void shutdown() = 0;
};

using SessionPtr = std::shared_ptr<Session>;

struct ConnectError {
    core::ErrorCode code = core::ErrorCode::SESSION_CONNECT_FAILED;
    std::string message;
};

struct ConnectResult {
    SessionPtr session;
    std::optional<ConnectError> error;

    bool ok() const {
        return session != nullptr && !error;
    }

    static ConnectResult success(SessionPtr session) {
        return ConnectResult{std::move(session), std::nullopt};
    }
    static ConnectResult failure(core::ErrorCode code, std::string message) {
        return ConnectResult{nullptr, ConnectError{code, std::move(message)}};
    }
};

using ConnectCallback = std::function<void(ConnectResult)>;

/**
 * @brief An outstanding connect handshake.
 *
 * Destroying the attempt cancels it and releases its resources; the completion
 * callback is never invoked after destruction returns.
 */
class ConnectionAttempt {
   public:
    virtual ~ConnectionAttempt() = default;
};

class StreamingService {
   public:
    virtual ~StreamingService() = default;

    /**
     * @brief Start connecting and authenticating.
     *
     * @param onComplete Invoked exactly once, possibly from another thread
     */
    virtual std::unique_ptr<ConnectionAttempt> connect(const SessionConfig& config,
                                                       const core::Credentials& credentials,
                                                       const core::CredentialCache* cache,
                                                       ConnectCallback onComplete) = 0;
};

class Player {
   public:
    virtual ~Player() = default;
    virtual void stop() = 0;
};

struct PlayerContext {
    SessionPtr session;
    playback::PlayerConfig config;
    std::shared_ptr<playback::AudioFilter> audioFilter;
    // Invoked by the player whenever it (re)opens its output
    std::function<std::unique_ptr<playback::Sink>()> sinkFactory;
    std::shared_ptr<playback::PlaybackEventChannel> events;
};

class PlayerFactory {
   public:
    virtual ~PlayerFactory() = default;
    virtual std::shared_ptr<Player> create(const PlayerContext& context) = 0;
};

// Lightweight remote to ask a running control task to stop.
class ControlHandle {
   public:
    virtual ~ControlHandle() = default;
    virtual void shutdown() = 0;
};

/**
 * @brief The device's presence in the remote-control protocol.
 *
 * Runs on its own after start() until the session ends or it is asked to shut down.
 * Destruction must not block on the remote close handshake.
 */
class ControlTask {
   public:
    virtual ~ControlTask() = default;

    virtual void start(std::function<void()> onFinished) = 0;
    virtual bool isFinished() const = 0;
};

struct ControlSurface {
    std::shared_ptr<ControlHandle> handle;
    std::unique_ptr<ControlTask> task;
};

class ControlSurfaceFactory {
   public:
    virtual ~ControlSurfaceFactory() = default;
    virtual ControlSurface create(const ConnectConfig& config, SessionPtr session,
                                  std::shared_ptr<Player> player,
                                  std::shared_ptr<playback::Mixer> mixer) = 0;
};

}  // namespace spotty::session
