#pragma once

#include "core/credentials.h"
#include "session/streaming.h"

#include <cstdint>
#include <variant>

namespace spotty::orchestrator {

// Posted by the discovery service; the sequence has ended.
struct DiscoveryEnded {};

// Posted by the discovery service when a controller claimed the device.
struct DiscoveryCredentials {
    core::Credentials credentials;
};

// Completion of connection attempt attemptId.
struct ConnectionResolved {
    uint64_t attemptId = 0;
    session::ConnectResult result;
};

// The control task of session sessionId ran to completion.
struct ControlTaskFinished {
    uint64_t sessionId = 0;
};

// The event channel of session sessionId has something to consume (an event or its close).
struct PlaybackEventsReady {
    uint64_t sessionId = 0;
};

using LoopEvent = std::variant<DiscoveryEnded, DiscoveryCredentials, ConnectionResolved,
                               ControlTaskFinished, PlaybackEventsReady>;

}  // namespace spotty::orchestrator
