#pragma once

#include "lms/device_notifier.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spotty::lms {

constexpr const char* kDefaultLmsPort = "9000";
constexpr const char* kJsonRpcTarget = "/jsonrpc.js";
constexpr std::chrono::milliseconds kDefaultRequestTimeout{2000};

struct LmsConfig {
    std::optional<std::string> server;  // host[:port]
    std::optional<std::string> playerMac;
    std::optional<std::string> auth;  // pre-encoded Basic credentials
    std::chrono::milliseconds timeout = kDefaultRequestTimeout;
};

struct LmsRequest {
    std::string host;
    std::string port;
    std::string target;
    std::string body;
    std::optional<std::string> authorization;
};

/**
 * @brief Notifies a Logitech Media Server player through its JSON-RPC endpoint.
 *
 * Each forwarded event becomes one "spottyconnect" command for the configured player.
 * Without a server or player MAC every event is skipped.
 */
class LmsNotifier : public DeviceNotifier {
   public:
    // Sends one request; returns false with error set on transport or HTTP failure.
    using Transport = std::function<bool(const LmsRequest& request,
                                         std::chrono::milliseconds timeout, std::string& error)>;

    explicit LmsNotifier(LmsConfig config, Transport transport = {});

    bool isConfigured() const;

    bool signalEvent(const playback::PlayerEvent& event) override;

    /**
     * @brief spottyconnect command arguments for an event, std::nullopt if not forwarded
     */
    static std::optional<std::vector<std::string>> commandFor(const playback::PlayerEvent& event);

    static std::string buildRequestBody(const std::string& playerMac,
                                        const std::vector<std::string>& command);

    // host[:port] -> (host, port), default port 9000
    static std::pair<std::string, std::string> splitServer(const std::string& server);

   private:
    LmsConfig config_;
    Transport transport_;
};

/**
 * @brief Blocking HTTP POST over Boost.Beast with socket send/receive timeouts.
 */
bool postJsonRpc(const LmsRequest& request, std::chrono::milliseconds timeout,
                 std::string& error);

}  // namespace spotty::lms
