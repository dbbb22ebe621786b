#pragma once

#include "core/credentials.h"
#include "session/session_config.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace spotty::discovery {

struct DiscoveryConfig {
    std::string deviceId;
    std::string name;
    session::DeviceType deviceType = session::DeviceType::Speaker;
    // 0 = ephemeral
    uint16_t port = 0;
};

/**
 * @brief Zeroconf announcement through which another controller claims this device.
 *
 * Each claim yields a fresh credential set. The sequence ends when onEnded fires;
 * no further credentials are delivered afterwards.
 */
class DiscoveryService {
   public:
    using CredentialsCallback = std::function<void(core::Credentials)>;
    using EndedCallback = std::function<void()>;

    virtual ~DiscoveryService() = default;

    /**
     * @return false with error set when the announcement could not be started
     */
    virtual bool launch(CredentialsCallback onCredentials, EndedCallback onEnded,
                        std::string& error) = 0;
    virtual void stop() = 0;
};

using DiscoveryFactory =
    std::function<std::unique_ptr<DiscoveryService>(const DiscoveryConfig& config)>;

}  // namespace spotty::discovery
