/**
 * @file test_base64.cpp
 * @brief Unit tests for Base64 encoding/decoding (RFC 4648).
 */

#include "core/base64.h"

#include <gtest/gtest.h>
#include <vector>

using namespace spotty::core;

// ============================================================
// Encode Tests
// ============================================================

TEST(Base64, EncodeEmpty) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(base64::encode(empty), "");
}

TEST(Base64, EncodePadding) {
    EXPECT_EQ(base64::encode(std::vector<uint8_t>{0x4D}), "TQ==");
    EXPECT_EQ(base64::encode(std::vector<uint8_t>{0x4D, 0x61}), "TWE=");
    EXPECT_EQ(base64::encode(std::vector<uint8_t>{0x4D, 0x61, 0x6E}), "TWFu");
}

TEST(Base64, EncodeText) {
    EXPECT_EQ(base64::encode(std::string_view("Hello, World!")), "SGVsbG8sIFdvcmxkIQ==");
}

TEST(Base64, EncodeBinaryData) {
    std::vector<uint8_t> data = {0x00, 0xFF, 0x7F, 0x80, 0x01};
    EXPECT_EQ(base64::encode(data), "AP9/gAE=");
}

// ============================================================
// Decode Tests
// ============================================================

TEST(Base64, DecodeEmpty) {
    auto result = base64::decode("");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(Base64, DecodeBinaryData) {
    auto result = base64::decode("AP9/gAE=");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (std::vector<uint8_t>{0x00, 0xFF, 0x7F, 0x80, 0x01}));
}

TEST(Base64, DecodeSkipsLineBreaks) {
    auto result = base64::decode("SGVs\nbG8s\r\nIFdv cmxkIQ==");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::string(result->begin(), result->end()), "Hello, World!");
}

TEST(Base64, DecodeRejectsInvalidCharacters) {
    EXPECT_FALSE(base64::decode("SGVs*G8=").has_value());
}

TEST(Base64, DecodeRejectsBadPadding) {
    EXPECT_FALSE(base64::decode("TQ=").has_value());
    EXPECT_FALSE(base64::decode("T===").has_value());
}
