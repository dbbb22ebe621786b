#include "core/credential_cache.h"

#include "core/base64.h"
#include "logging/logger.h"

#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace spotty::core {

namespace fs = std::filesystem;

namespace {

bool ensureDirectory(const std::optional<fs::path>& dir, std::string& error) {
    if (!dir) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(*dir, ec);
    if (ec) {
        error = "Cannot create directory " + dir->string() + ": " + ec.message();
        return false;
    }
    return true;
}

}  // namespace

std::optional<CredentialCache> CredentialCache::open(std::optional<fs::path> credentialsDir,
                                                     std::optional<fs::path> volumeDir,
                                                     std::optional<fs::path> audioDir,
                                                     std::string& error) {
    if (!credentialsDir && !volumeDir && !audioDir) {
        return std::nullopt;
    }
    if (!ensureDirectory(credentialsDir, error) || !ensureDirectory(volumeDir, error) ||
        !ensureDirectory(audioDir, error)) {
        return std::nullopt;
    }

    CredentialCache cache;
    cache.credentialsDir_ = std::move(credentialsDir);
    cache.volumeDir_ = std::move(volumeDir);
    cache.audioDir_ = std::move(audioDir);
    return cache;
}

std::optional<Credentials> CredentialCache::credentials() const {
    if (!credentialsDir_) {
        return std::nullopt;
    }

    const fs::path path = *credentialsDir_ / kCredentialsFile;
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json json;
        file >> json;

        auto username = json.at("username").get<std::string>();
        auto authType = json.at("auth_type").get<int>();
        auto blob = base64::decode(json.at("auth_data").get<std::string>());
        if (!blob) {
            LOG_WARN("Cached credentials in {} have an invalid auth_data field", path.string());
            return std::nullopt;
        }
        if (authType < static_cast<int>(AuthType::UserPass) ||
            authType > static_cast<int>(AuthType::AccessToken)) {
            LOG_WARN("Cached credentials in {} use unknown auth_type {}", path.string(), authType);
            return std::nullopt;
        }
        return Credentials(std::move(username), static_cast<AuthType>(authType), std::move(*blob));
    } catch (const nlohmann::json::exception& ex) {
        LOG_WARN("Cannot read cached credentials from {}: {}", path.string(), ex.what());
        return std::nullopt;
    }
}

std::optional<uint16_t> CredentialCache::volume() const {
    if (!volumeDir_) {
        return std::nullopt;
    }

    std::ifstream file(*volumeDir_ / kVolumeFile);
    if (!file.is_open()) {
        return std::nullopt;
    }

    long value = -1;
    if (!(file >> value) || value < 0 || value > 0xFFFF) {
        LOG_WARN("Ignoring invalid cached volume in {}", (*volumeDir_ / kVolumeFile).string());
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

}  // namespace spotty::core
