#pragma once

#include "app/options.h"
#include "core/credential_cache.h"
#include "core/credentials.h"
#include "core/error_codes.h"
#include "lms/lms_notifier.h"
#include "playback/mixer.h"
#include "playback/player_config.h"
#include "session/session_config.h"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace spotty::app {

constexpr const char* kDefaultScopes =
    "user-read-private,user-read-playback-state,user-modify-playback-state,playlist-read-private";

// Everything the process needs after option validation.
struct Setup {
    std::optional<core::CredentialCache> cache;
    std::optional<core::Credentials> credentials;

    bool enableDiscovery = true;
    uint16_t zeroconfPort = 0;
    bool authenticate = false;

    session::ConnectConfig connectConfig;
    session::SessionConfig sessionConfig;
    playback::PlayerConfig playerConfig;
    playback::MixerConfig mixerConfig;
    playback::AudioFormat format = playback::AudioFormat::S16;

    std::optional<std::string> singleTrack;
    uint32_t startPositionMs = 0;

    bool getToken = false;
    std::optional<std::string> saveToken;
    std::string clientId;
    std::string scopes = kDefaultScopes;

    lms::LmsConfig lms;
};

struct SetupError {
    core::ErrorCode code = core::ErrorCode::OK;
    std::string message;
};

struct SetupContext {
    EnvLookup env;
    core::PasswordPrompt prompt;
    // Valid values for a rejected option are printed here
    std::ostream* hints = nullptr;
};

/**
 * @brief Validate options and derive the runtime configuration.
 *
 * Opens (and creates) the cache directories and resolves credentials, which may
 * prompt for a password through ctx.prompt.
 *
 * @return false with error set on an invalid value or missing credentials
 */
bool buildSetup(const OptionSet& options, const SetupContext& ctx, Setup& out, SetupError& error);

}  // namespace spotty::app
