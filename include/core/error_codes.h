#ifndef SPOTTY_CORE_ERROR_CODES_H
#define SPOTTY_CORE_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace spotty::core {

/**
 * @brief Error codes for the connect daemon.
 *
 * Categories use upper 4 bits of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Configuration
 * - 0x2xxx: Session / connection
 * - 0x3xxx: Discovery
 * - 0x4xxx: Device notifier (LMS)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Configuration (0x1000)
    CONFIG_INVALID_OPTION = 0x1001,
    CONFIG_INVALID_VALUE = 0x1002,
    CONFIG_MISSING_CREDENTIALS = 0x1003,
    CONFIG_INVALID_PROXY = 0x1004,
    CONFIG_CACHE_UNAVAILABLE = 0x1005,
    CONFIG_NO_BACKEND = 0x1006,

    // Session / connection (0x2000)
    SESSION_CONNECT_FAILED = 0x2001,
    SESSION_AUTH_FAILED = 0x2002,
    SESSION_TIMEOUT = 0x2003,
    SESSION_CANCELLED = 0x2004,
    SESSION_TERMINATED = 0x2005,

    // Discovery (0x3000)
    DISCOVERY_LAUNCH_FAILED = 0x3001,
    DISCOVERY_STOPPED = 0x3002,

    // Device notifier (0x4000)
    NOTIFIER_NOT_CONFIGURED = 0x4001,
    NOTIFIER_UNREACHABLE = 0x4002,
    NOTIFIER_HTTP_ERROR = 0x4003,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "SESSION_AUTH_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "session"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x2002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isConfigError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isSessionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isDiscoveryError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isNotifierError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if a failure is transient.
 *
 * Transient failures are worth another attempt with the same credentials;
 * authentication and configuration failures are not.
 */
bool isRetryable(ErrorCode code);

}  // namespace spotty::core

#endif  // SPOTTY_CORE_ERROR_CODES_H
