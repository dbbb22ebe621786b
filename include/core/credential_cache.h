#pragma once

#include "core/credentials.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace spotty::core {

/**
 * @brief Read-only view of the session library's persistent cache.
 *
 * Layout (shared with the session layer, which is the only writer):
 *   <credentials dir>/credentials.json  {"username", "auth_type", "auth_data" (base64)}
 *   <volume dir>/volume                 decimal 0..65535
 *   <audio dir>/                        audio file cache
 *
 * Read once at startup and treated as immutable configuration afterwards.
 */
class CredentialCache {
   public:
    static constexpr const char* kCredentialsFile = "credentials.json";
    static constexpr const char* kVolumeFile = "volume";

    /**
     * @brief Open the cache, creating missing directories.
     *
     * @return std::nullopt when no directory is configured or a directory cannot be created
     *         (error describes why in the latter case)
     */
    static std::optional<CredentialCache> open(std::optional<std::filesystem::path> credentialsDir,
                                               std::optional<std::filesystem::path> volumeDir,
                                               std::optional<std::filesystem::path> audioDir,
                                               std::string& error);

    std::optional<Credentials> credentials() const;
    std::optional<uint16_t> volume() const;

    const std::optional<std::filesystem::path>& credentialsLocation() const {
        return credentialsDir_;
    }
    const std::optional<std::filesystem::path>& volumeLocation() const {
        return volumeDir_;
    }
    const std::optional<std::filesystem::path>& audioLocation() const {
        return audioDir_;
    }

   private:
    CredentialCache() = default;

    std::optional<std::filesystem::path> credentialsDir_;
    std::optional<std::filesystem::path> volumeDir_;
    std::optional<std::filesystem::path> audioDir_;
};

}  // namespace spotty::core
