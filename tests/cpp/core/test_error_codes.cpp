/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error code names, categories and retry classification
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace spotty::core;

TEST(ErrorCodes, ToStringKnownCodes) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::CONFIG_NO_BACKEND), "CONFIG_NO_BACKEND");
    EXPECT_STREQ(errorCodeToString(ErrorCode::SESSION_AUTH_FAILED), "SESSION_AUTH_FAILED");
    EXPECT_STREQ(errorCodeToString(ErrorCode::NOTIFIER_HTTP_ERROR), "NOTIFIER_HTTP_ERROR");
}

TEST(ErrorCodes, ToStringUnknownCode) {
    EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(0x9999)), "UNKNOWN_ERROR");
}

TEST(ErrorCodes, StringRoundTrip) {
    EXPECT_EQ(stringToErrorCode("DISCOVERY_STOPPED"), ErrorCode::DISCOVERY_STOPPED);
    EXPECT_EQ(stringToErrorCode("CONFIG_INVALID_PROXY"), ErrorCode::CONFIG_INVALID_PROXY);
    EXPECT_EQ(stringToErrorCode("NOT_A_CODE"), ErrorCode::INTERNAL_UNKNOWN);
}

TEST(ErrorCodes, Hex) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::SESSION_AUTH_FAILED), "0x2002");
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
}

TEST(ErrorCodes, Categories) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::CONFIG_INVALID_VALUE), "config");
    EXPECT_STREQ(getErrorCategory(ErrorCode::SESSION_TIMEOUT), "session");
    EXPECT_STREQ(getErrorCategory(ErrorCode::DISCOVERY_LAUNCH_FAILED), "discovery");
    EXPECT_STREQ(getErrorCategory(ErrorCode::NOTIFIER_UNREACHABLE), "notifier");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_UNKNOWN), "internal");

    EXPECT_TRUE(isConfigError(ErrorCode::CONFIG_MISSING_CREDENTIALS));
    EXPECT_FALSE(isConfigError(ErrorCode::SESSION_CONNECT_FAILED));
}

TEST(ErrorCodes, Retryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::SESSION_CONNECT_FAILED));
    EXPECT_TRUE(isRetryable(ErrorCode::SESSION_TIMEOUT));
    EXPECT_FALSE(isRetryable(ErrorCode::SESSION_AUTH_FAILED));
    EXPECT_FALSE(isRetryable(ErrorCode::CONFIG_INVALID_VALUE));
}
