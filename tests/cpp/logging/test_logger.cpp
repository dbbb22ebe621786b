/**
 * @file test_logger.cpp
 * @brief Unit tests for log level selection and config-file initialization
 */

#include "logging/logger.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace spotty::logging;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const char* previous = std::getenv(kLogLevelEnvVar);
        if (previous) {
            savedEnv_ = previous;
        }
        ::unsetenv(kLogLevelEnvVar);
        configPath_ = fs::temp_directory_path() /
                      ("spotty_logger_test_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        if (savedEnv_) {
            ::setenv(kLogLevelEnvVar, savedEnv_->c_str(), 1);
        } else {
            ::unsetenv(kLogLevelEnvVar);
        }
        std::error_code ec;
        fs::remove(configPath_, ec);
        shutdown();
    }

    std::optional<std::string> savedEnv_;
    fs::path configPath_;
};

TEST_F(LoggerTest, LevelFromFlags) {
    EXPECT_EQ(levelFromFlags(false, false), LogLevel::Info);
    EXPECT_EQ(levelFromFlags(true, false), LogLevel::Warn);
    EXPECT_EQ(levelFromFlags(false, true), LogLevel::Trace);
    // verbose wins
    EXPECT_EQ(levelFromFlags(true, true), LogLevel::Trace);
}

TEST_F(LoggerTest, LevelFromEnvironment) {
    EXPECT_FALSE(levelFromEnvironment().has_value());

    ::setenv(kLogLevelEnvVar, "debug", 1);
    ASSERT_TRUE(levelFromEnvironment().has_value());
    EXPECT_EQ(*levelFromEnvironment(), LogLevel::Debug);

    ::setenv(kLogLevelEnvVar, "", 1);
    EXPECT_FALSE(levelFromEnvironment().has_value());
}

TEST_F(LoggerTest, StringToLevel) {
    EXPECT_EQ(stringToLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(stringToLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("err"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("none"), LogLevel::Off);
    EXPECT_EQ(stringToLevel("bogus"), LogLevel::Info);
    EXPECT_EQ(levelToString(LogLevel::Critical), "critical");
}

TEST_F(LoggerTest, ParseLevelRejectsUnknownNames) {
    EXPECT_EQ(parseLevel("Debug"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("fatal"), LogLevel::Critical);
    EXPECT_FALSE(parseLevel("loud").has_value());
    EXPECT_FALSE(parseLevel("").has_value());
}

TEST_F(LoggerTest, UnknownEnvironmentLevelIgnored) {
    ::setenv(kLogLevelEnvVar, "chatty", 1);
    EXPECT_FALSE(levelFromEnvironment().has_value());
}

TEST_F(LoggerTest, InitializeAppliesLevel) {
    LogConfig config;
    config.level = LogLevel::Warn;
    ASSERT_TRUE(initialize(config));
    EXPECT_EQ(getLevel(), LogLevel::Warn);

    setLevel(LogLevel::Trace);
    EXPECT_EQ(getLevel(), LogLevel::Trace);
}

TEST_F(LoggerTest, ConfigFileOverridesBase) {
    {
        std::ofstream file(configPath_);
        file << R"({"name": "ignored", "logging": {"level": "error", "color": false}})";
    }

    LogConfig base;
    base.level = LogLevel::Trace;
    ASSERT_TRUE(initializeFromConfig(configPath_.string(), base));
    EXPECT_EQ(getLevel(), LogLevel::Error);
}

TEST_F(LoggerTest, InvalidLoggingSectionKeepsBase) {
    {
        std::ofstream file(configPath_);
        file << R"({"logging": {"level": "error", "max-backups": "many"}})";
    }

    LogConfig base;
    base.level = LogLevel::Debug;
    ASSERT_TRUE(initializeFromConfig(configPath_.string(), base));
    EXPECT_EQ(getLevel(), LogLevel::Debug);
}

TEST_F(LoggerTest, MalformedConfigFileKeepsBase) {
    {
        std::ofstream file(configPath_);
        file << "{ logging";
    }

    LogConfig base;
    base.level = LogLevel::Warn;
    ASSERT_TRUE(initializeFromConfig(configPath_.string(), base));
    EXPECT_EQ(getLevel(), LogLevel::Warn);
}

TEST_F(LoggerTest, MissingConfigFileKeepsBase) {
    LogConfig base;
    base.level = LogLevel::Debug;
    ASSERT_TRUE(initializeFromConfig("/nonexistent/spotty.json", base));
    EXPECT_EQ(getLevel(), LogLevel::Debug);
}

TEST_F(LoggerTest, LogOnceMacroCompilesAndLogs) {
    ASSERT_TRUE(initialize());
    for (int i = 0; i < 3; ++i) {
        LOG_ONCE(DEBUG, "logged once {}", i);
    }
    LOG_INFO("info {}", 1);
    SUCCEED();
}
