#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace spotty::core {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Configuration
    {ErrorCode::CONFIG_INVALID_OPTION, "CONFIG_INVALID_OPTION"},
    {ErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE"},
    {ErrorCode::CONFIG_MISSING_CREDENTIALS, "CONFIG_MISSING_CREDENTIALS"},
    {ErrorCode::CONFIG_INVALID_PROXY, "CONFIG_INVALID_PROXY"},
    {ErrorCode::CONFIG_CACHE_UNAVAILABLE, "CONFIG_CACHE_UNAVAILABLE"},
    {ErrorCode::CONFIG_NO_BACKEND, "CONFIG_NO_BACKEND"},

    // Session / connection
    {ErrorCode::SESSION_CONNECT_FAILED, "SESSION_CONNECT_FAILED"},
    {ErrorCode::SESSION_AUTH_FAILED, "SESSION_AUTH_FAILED"},
    {ErrorCode::SESSION_TIMEOUT, "SESSION_TIMEOUT"},
    {ErrorCode::SESSION_CANCELLED, "SESSION_CANCELLED"},
    {ErrorCode::SESSION_TERMINATED, "SESSION_TERMINATED"},

    // Discovery
    {ErrorCode::DISCOVERY_LAUNCH_FAILED, "DISCOVERY_LAUNCH_FAILED"},
    {ErrorCode::DISCOVERY_STOPPED, "DISCOVERY_STOPPED"},

    // Device notifier
    {ErrorCode::NOTIFIER_NOT_CONFIGURED, "NOTIFIER_NOT_CONFIGURED"},
    {ErrorCode::NOTIFIER_UNREACHABLE, "NOTIFIER_UNREACHABLE"},
    {ErrorCode::NOTIFIER_HTTP_ERROR, "NOTIFIER_HTTP_ERROR"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = []() {
    std::unordered_map<std::string, ErrorCode> map;
    for (const auto& [code, name] : kErrorCodeStrings) {
        map.emplace(name, code);
    }
    return map;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isConfigError(code)) {
        return "config";
    }
    if (isSessionError(code)) {
        return "session";
    }
    if (isDiscoveryError(code)) {
        return "discovery";
    }
    if (isNotifierError(code)) {
        return "notifier";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(4) << std::setfill('0')
        << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

bool isRetryable(ErrorCode code) {
    switch (code) {
    case ErrorCode::SESSION_CONNECT_FAILED:
    case ErrorCode::SESSION_TIMEOUT:
    case ErrorCode::SESSION_TERMINATED:
    case ErrorCode::NOTIFIER_UNREACHABLE:
        return true;
    default:
        return false;
    }
}

}  // namespace spotty::core
