#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace spotty::session {

struct ProxyUrl {
    std::string host;
    uint16_t port = 80;

    std::string toString() const;
};

/**
 * @brief Parse an HTTP proxy URL of the form "http://host[:port]".
 *
 * Only the http scheme is accepted; a path, if present, is ignored.
 *
 * @return true on success, false with error set otherwise
 */
bool parseProxyUrl(std::string_view url, ProxyUrl& out, std::string& error);

struct SessionConfig {
    std::string userAgent;
    std::string deviceId;
    std::optional<ProxyUrl> proxy;
    std::optional<uint16_t> apPort;
};

enum class DeviceType {
    Unknown,
    Computer,
    Tablet,
    Smartphone,
    Speaker,
    Tv,
    Avr,
    Stb,
    AudioDongle,
};

const char* deviceTypeToString(DeviceType type);

// Protocol volume (0..65535) used when neither the command line nor the cache provide one.
constexpr uint16_t kDefaultInitialVolume = 0x8000;

struct ConnectConfig {
    std::string name = "Spotty";
    DeviceType deviceType = DeviceType::Speaker;
    uint16_t initialVolume = kDefaultInitialVolume;
    bool hasVolumeCtrl = true;
    bool autoplay = false;
};

}  // namespace spotty::session
