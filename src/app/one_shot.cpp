#include "app/one_shot.h"

#include "core/version.h"
#include "logging/logger.h"

#include <fstream>
#include <nlohmann/json.hpp>

namespace spotty::app {

void printCheck(std::ostream& out) {
    nlohmann::json capabilities = {
        {"autoplay", true},
        {"lms-auth", true},
        {"volume-normalisation", true},
        {"passthrough", true},
        {"save-token", true},
        {"podcasts", true},
#ifdef SPOTTY_DEBUG_BUILD
        {"debug", true},
#else
        {"debug", false},
#endif
    };

    out << "ok " << core::getVersionString() << "\n";
    out << capabilities.dump() << std::endl;
}

std::string tokenToJson(const session::AccessToken& token) {
    nlohmann::json j = {
        {"accessToken", token.accessToken},
        {"expiresIn", token.expiresIn},
    };
    return j.dump();
}

bool writeToken(const session::AccessToken& token, const std::optional<std::string>& path,
                std::ostream& out, std::string& error) {
    std::string json = tokenToJson(token);
    if (!path) {
        out << json << std::endl;
        return true;
    }

    std::ofstream file(*path, std::ios::trunc);
    if (!file) {
        error = "Cannot open " + *path + " for writing";
        return false;
    }
    file << json;
    if (!file) {
        error = "Failed to write token to " + *path;
        return false;
    }
    LOG_DEBUG("Token written to {}", *path);
    return true;
}

int runGetToken(const Setup& setup, session::OneShotService& service, std::ostream& out) {
    if (!setup.credentials) {
        LOG_ERROR("Cannot fetch a token without credentials");
        return 0;
    }
    if (setup.clientId.empty()) {
        LOG_WARN("No client id given, using the backend default");
    }

    std::string error;
    auto token = service.fetchToken(setup.clientId, setup.scopes, *setup.credentials,
                                    setup.sessionConfig, error);
    if (!token) {
        LOG_ERROR("Failed to fetch token: {}", error);
        return 0;
    }

    if (!writeToken(*token, setup.saveToken, out, error)) {
        LOG_ERROR("{}", error);
    }
    return 0;
}

int runSingleTrack(const Setup& setup, session::OneShotService& service) {
    if (!setup.credentials || !setup.singleTrack) {
        LOG_ERROR("Cannot play a track without credentials");
        return 0;
    }

    LOG_INFO("Playing track {} from {} ms", *setup.singleTrack, setup.startPositionMs);
    std::string error;
    if (!service.playTrack(*setup.singleTrack, setup.startPositionMs, *setup.credentials,
                           setup.playerConfig, setup.sessionConfig, error)) {
        LOG_ERROR("Playback of {} failed: {}", *setup.singleTrack, error);
    }
    return 0;
}

}  // namespace spotty::app
