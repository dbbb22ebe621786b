#include "logging/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace spotty {
namespace logging {

namespace {

struct LevelInfo {
    LogLevel level;
    spdlog::level::level_enum spdlogLevel;
    std::string_view name;
    std::string_view alias;  // accepted when parsing only
};

constexpr std::array<LevelInfo, 7> kLevels = {{
    {LogLevel::Trace, spdlog::level::trace, "trace", ""},
    {LogLevel::Debug, spdlog::level::debug, "debug", ""},
    {LogLevel::Info, spdlog::level::info, "info", ""},
    {LogLevel::Warn, spdlog::level::warn, "warn", "warning"},
    {LogLevel::Error, spdlog::level::err, "error", "err"},
    {LogLevel::Critical, spdlog::level::critical, "critical", "fatal"},
    {LogLevel::Off, spdlog::level::off, "off", "none"},
}};

const LevelInfo& infoFor(LogLevel level) {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return info;
        }
    }
    return kLevels[2];
}

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
std::atomic<bool> g_ready{false};

std::shared_ptr<spdlog::logger> buildLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (!config.colored) {
            sink->set_color_mode(spdlog::color_mode::never);
        }
        sinks.push_back(std::move(sink));
    }
    if (!config.filePath.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxBackups));
    }

    auto logger = std::make_shared<spdlog::logger>("spotty", sinks.begin(), sinks.end());
    logger->flush_on(spdlog::level::warn);
    return logger;
}

// Copies the recognised keys of a "logging" object; nothing is changed on a type error.
bool applyLoggingSection(const nlohmann::json& section, LogConfig& config, std::string& error) {
    if (!section.is_object()) {
        error = "\"logging\" must be an object";
        return false;
    }

    LogConfig updated = config;
    try {
        if (auto it = section.find("level"); it != section.end()) {
            auto level = parseLevel(it->get<std::string>());
            if (!level) {
                error = "unknown level \"" + it->get<std::string>() + "\"";
                return false;
            }
            updated.level = *level;
        }
        if (auto it = section.find("file"); it != section.end()) {
            updated.filePath = it->get<std::string>();
        }
        if (auto it = section.find("max-file-size"); it != section.end()) {
            updated.maxFileSize = it->get<size_t>();
        }
        if (auto it = section.find("max-backups"); it != section.end()) {
            updated.maxBackups = it->get<size_t>();
        }
        if (auto it = section.find("console"); it != section.end()) {
            updated.console = it->get<bool>();
        }
        if (auto it = section.find("color"); it != section.end()) {
            updated.colored = it->get<bool>();
        }
        if (auto it = section.find("pattern"); it != section.end()) {
            updated.pattern = it->get<std::string>();
        }
    } catch (const nlohmann::json::exception& ex) {
        error = ex.what();
        return false;
    }

    config = std::move(updated);
    return true;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    if (!g_ready.load(std::memory_order_acquire)) {
        try {
            g_logger = buildLogger(config);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Cannot set up logging: " << ex.what() << std::endl;
            return false;
        }
        spdlog::set_default_logger(g_logger);
        g_ready.store(true, std::memory_order_release);
    }

    g_logger->set_level(infoFor(config.level).spdlogLevel);
    g_logger->set_pattern(config.pattern);
    return true;
}

bool initializeFromConfig(const std::string& configPath, LogConfig base) {
    std::ifstream file(configPath);
    if (file.is_open()) {
        nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
        std::string error;
        if (json.is_discarded()) {
            std::cerr << "Ignoring logging settings, " << configPath << " is not valid JSON"
                      << std::endl;
        } else if (json.is_object() && json.contains("logging") &&
                   !applyLoggingSection(json["logging"], base, error)) {
            std::cerr << "Ignoring logging settings in " << configPath << ": " << error
                      << std::endl;
        }
    }
    return initialize(base);
}

LogLevel levelFromFlags(bool quiet, bool verbose) {
    if (verbose) {
        return LogLevel::Trace;
    }
    return quiet ? LogLevel::Warn : LogLevel::Info;
}

std::optional<LogLevel> levelFromEnvironment() {
    const char* value = std::getenv(kLogLevelEnvVar);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return parseLevel(value);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_ready.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (auto logger = getLogger()) {
        logger->set_level(infoFor(level).spdlogLevel);
    }
}

LogLevel getLevel() {
    auto logger = getLogger();
    if (!logger) {
        return LogLevel::Info;
    }
    const auto current = logger->level();
    auto it = std::find_if(kLevels.begin(), kLevels.end(),
                           [current](const LevelInfo& info) { return info.spdlogLevel == current; });
    return it != kLevels.end() ? it->level : LogLevel::Info;
}

void flush() {
    if (g_ready.load(std::memory_order_acquire) && g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (!g_ready.load(std::memory_order_acquire)) {
        initialize();
    }
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return infoFor(level).name;
}

std::optional<LogLevel> parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& info : kLevels) {
        if (lower == info.name || (!info.alias.empty() && lower == info.alias)) {
            return info.level;
        }
    }
    return std::nullopt;
}

LogLevel stringToLevel(std::string_view name) {
    return parseLevel(name).value_or(LogLevel::Info);
}

}  // namespace logging
}  // namespace spotty
