#pragma once

#include "core/credentials.h"
#include "playback/player_config.h"
#include "session/session_config.h"

#include <cstdint>
#include <optional>
#include <string>

namespace spotty::session {

struct AccessToken {
    std::string accessToken;
    uint32_t expiresIn = 0;
};

/**
 * @brief Bounded operations that bypass the control loop.
 *
 * Both calls block until the operation has finished.
 */
class OneShotService {
   public:
    virtual ~OneShotService() = default;

    virtual bool playTrack(const std::string& trackId, uint32_t startPositionMs,
                           const core::Credentials& credentials,
                           const playback::PlayerConfig& playerConfig,
                           const SessionConfig& sessionConfig, std::string& error) = 0;

    virtual std::optional<AccessToken> fetchToken(const std::string& clientId,
                                                  const std::string& scopes,
                                                  const core::Credentials& credentials,
                                                  const SessionConfig& sessionConfig,
                                                  std::string& error) = 0;
};

}  // namespace spotty::session
