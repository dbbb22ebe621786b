#include "lms/lms_notifier.h"

#include "logging/logger.h"
#include "playback/mixer.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/time.h>

namespace spotty::lms {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

void applySocketTimeouts(tcp::socket& socket, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    int fd = socket.native_handle();
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        LOG_DEBUG("[LMS] setsockopt timeout failed");
    }
}

}  // namespace

bool postJsonRpc(const LmsRequest& request, std::chrono::milliseconds timeout,
                 std::string& error) {
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::error_code ec;
        auto endpoints = resolver.resolve(request.host, request.port, ec);
        if (ec) {
            error = "resolve " + request.host + ": " + ec.message();
            return false;
        }

        tcp::socket socket(ioc);
        bool connected = false;
        for (const auto& entry : endpoints) {
            socket.close(ec);
            socket.open(entry.endpoint().protocol(), ec);
            if (ec) {
                continue;
            }
            // Linux honors SO_SNDTIMEO for blocking connect()
            applySocketTimeouts(socket, timeout);
            socket.connect(entry.endpoint(), ec);
            if (!ec) {
                connected = true;
                break;
            }
        }
        if (!connected) {
            error = "connect " + request.host + ":" + request.port + ": " + ec.message();
            return false;
        }

        http::request<http::string_body> req{http::verb::post, request.target, 11};
        req.set(http::field::host, request.host + ":" + request.port);
        req.set(http::field::user_agent, "spotty");
        req.set(http::field::content_type, "application/json");
        if (request.authorization) {
            req.set(http::field::authorization, "Basic " + *request.authorization);
        }
        req.body() = request.body;
        req.prepare_payload();

        http::write(socket, req, ec);
        if (ec) {
            error = "write: " + ec.message();
            return false;
        }

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res, ec);
        if (ec) {
            error = "read: " + ec.message();
            return false;
        }

        socket.shutdown(tcp::socket::shutdown_both, ec);

        if (res.result() != http::status::ok) {
            error = "HTTP " + std::to_string(res.result_int());
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
}

LmsNotifier::LmsNotifier(LmsConfig config, Transport transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = postJsonRpc;
    }
    if (isConfigured()) {
        LOG_INFO("Forwarding playback events to LMS {} for player {}", *config_.server,
                 *config_.playerMac);
    }
}

bool LmsNotifier::isConfigured() const {
    return config_.server && !config_.server->empty() && config_.playerMac &&
           !config_.playerMac->empty();
}

std::optional<std::vector<std::string>> LmsNotifier::commandFor(
    const playback::PlayerEvent& event) {
    using Kind = playback::PlayerEvent::Kind;
    switch (event.kind) {
    case Kind::Started:
        return std::vector<std::string>{"start", event.trackId};
    case Kind::Changed:
        return std::vector<std::string>{"change", event.trackId, event.oldTrackId};
    case Kind::Playing:
        return std::vector<std::string>{"change", event.trackId};
    case Kind::Paused:
    case Kind::Stopped:
        return std::vector<std::string>{"stop"};
    case Kind::VolumeSet:
        return std::vector<std::string>{"volume",
                                        std::to_string(playback::volumeToPercent(event.volume))};
    default:
        return std::nullopt;
    }
}

std::string LmsNotifier::buildRequestBody(const std::string& playerMac,
                                          const std::vector<std::string>& command) {
    nlohmann::json args = nlohmann::json::array();
    args.push_back("spottyconnect");
    for (const auto& part : command) {
        args.push_back(part);
    }

    nlohmann::json body;
    body["id"] = 1;
    body["method"] = "slim.request";
    body["params"] = nlohmann::json::array({playerMac, args});
    return body.dump();
}

std::pair<std::string, std::string> LmsNotifier::splitServer(const std::string& server) {
    const size_t colon = server.rfind(':');
    if (colon == std::string::npos || colon + 1 == server.size()) {
        return {server.substr(0, colon), kDefaultLmsPort};
    }
    return {server.substr(0, colon), server.substr(colon + 1)};
}

bool LmsNotifier::signalEvent(const playback::PlayerEvent& event) {
    if (!isConfigured()) {
        LOG_ONCE(DEBUG, "[LMS] Server or player MAC not configured, not forwarding events");
        return false;
    }

    auto command = commandFor(event);
    if (!command) {
        LOG_TRACE("[LMS] Ignoring {} event", playback::playerEventKindToString(event.kind));
        return true;
    }

    auto [host, port] = splitServer(*config_.server);
    LmsRequest request;
    request.host = std::move(host);
    request.port = std::move(port);
    request.target = kJsonRpcTarget;
    request.body = buildRequestBody(*config_.playerMac, *command);
    if (config_.auth && !config_.auth->empty()) {
        request.authorization = config_.auth;
    }

    LOG_DEBUG("[LMS] {} -> {}", playback::playerEventKindToString(event.kind), request.body);

    std::string error;
    if (!transport_(request, config_.timeout, error)) {
        LOG_DEBUG("[LMS] Failed to notify {}: {}", *config_.server, error);
        return false;
    }
    return true;
}

}  // namespace spotty::lms
