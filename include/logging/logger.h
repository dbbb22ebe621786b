/**
 * @file logger.h
 * @brief Logging for the spotty connect daemon
 *
 * spdlog logger writing to stderr (stdout carries --check and token output) and,
 * optionally, to a rotating file. The level comes from --quiet / --verbose, the
 * "logging" section of the config file and the SPOTTY_LOG environment variable.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace spotty {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,  // includes masked command line / environment dump
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * @brief Logger settings
 *
 * Config file keys (all optional, inside "logging"):
 *   level, file, max-file-size, max-backups, console, color, pattern
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty: stderr only
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);
    size_t maxBackups = 2;
    bool console = true;
    bool colored = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

constexpr const char* kLogLevelEnvVar = "SPOTTY_LOG";

/**
 * @brief Create the process logger
 *
 * A second call only applies level and pattern; sinks stay as they are.
 *
 * @return false if a sink could not be created (message on stderr)
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief initialize() with the "logging" section of a JSON config file applied on top of @p base
 *
 * An unreadable file or a malformed section leaves @p base untouched.
 */
bool initializeFromConfig(const std::string& configPath, LogConfig base = LogConfig{});

// --verbose => trace, --quiet => warn; verbose wins when both are set
LogLevel levelFromFlags(bool quiet, bool verbose);

// SPOTTY_LOG, if set to a known level name
std::optional<LogLevel> levelFromEnvironment();

void shutdown();
void setLevel(LogLevel level);
LogLevel getLevel();
void flush();

// Creates a default stderr logger on first use
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);
std::optional<LogLevel> parseLevel(std::string_view name);

// parseLevel() falling back to Info
LogLevel stringToLevel(std::string_view name);

}  // namespace logging
}  // namespace spotty

#include <spdlog/spdlog.h>

#define SPOTTY_LOG_WITH(spdlogMacro, ...)                                     \
    do {                                                                      \
        if (auto spotty_logger_ = ::spotty::logging::getLogger()) {           \
            spdlogMacro(spotty_logger_, __VA_ARGS__);                         \
        }                                                                     \
    } while (0)

#define LOG_TRACE(...) SPOTTY_LOG_WITH(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) SPOTTY_LOG_WITH(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) SPOTTY_LOG_WITH(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) SPOTTY_LOG_WITH(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) SPOTTY_LOG_WITH(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) SPOTTY_LOG_WITH(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// First call per call site only, e.g. LOG_ONCE(WARN, "...")
#define LOG_ONCE(level, ...)                                         \
    do {                                                             \
        static std::atomic<bool> spotty_logged_once_{false};         \
        if (!spotty_logged_once_.exchange(true)) {                   \
            LOG_##level(__VA_ARGS__);                                \
        }                                                            \
    } while (0)
