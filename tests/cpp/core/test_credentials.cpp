/**
 * @file test_credentials.cpp
 * @brief Unit tests for first-connection credential resolution
 */

#include "core/credentials.h"

#include <gtest/gtest.h>

using namespace spotty::core;

namespace {

Credentials storedFor(const std::string& user) {
    return Credentials(user, AuthType::StoredCredentials, {0x01, 0x02, 0x03});
}

PasswordPrompt failingPrompt() {
    return [](const std::string&) -> std::optional<std::string> {
        ADD_FAILURE() << "prompt must not be used";
        return std::nullopt;
    };
}

}  // namespace

TEST(Credentials, WithPasswordStoresUtf8Bytes) {
    auto creds = Credentials::withPassword("alice", "s3cret");
    EXPECT_EQ(creds.username(), "alice");
    EXPECT_EQ(creds.authType(), AuthType::UserPass);
    EXPECT_EQ(std::string(creds.authData().begin(), creds.authData().end()), "s3cret");
}

TEST(Credentials, Equality) {
    EXPECT_EQ(storedFor("alice"), storedFor("alice"));
    EXPECT_NE(storedFor("alice"), storedFor("bob"));
    EXPECT_NE(storedFor("alice"), Credentials::withPassword("alice", "\x01\x02\x03"));
}

TEST(ResolveCredentials, NoUsernameUsesCache) {
    auto result = resolveCredentials(std::nullopt, std::nullopt, storedFor("alice"), failingPrompt());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, storedFor("alice"));
}

TEST(ResolveCredentials, NothingAvailable) {
    EXPECT_FALSE(resolveCredentials(std::nullopt, std::nullopt, std::nullopt, failingPrompt())
                     .has_value());
}

TEST(ResolveCredentials, ExplicitPasswordBeatsCache) {
    auto result = resolveCredentials(std::string("bob"), std::string("pw"), storedFor("alice"),
                                     failingPrompt());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Credentials::withPassword("bob", "pw"));
}

TEST(ResolveCredentials, ExplicitPasswordBeatsMatchingCache) {
    auto result = resolveCredentials(std::string("alice"), std::string("pw"), storedFor("alice"),
                                     failingPrompt());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->authType(), AuthType::UserPass);
}

TEST(ResolveCredentials, MatchingCacheIsReused) {
    auto result = resolveCredentials(std::string("alice"), std::nullopt, storedFor("alice"),
                                     failingPrompt());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, storedFor("alice"));
}

TEST(ResolveCredentials, MismatchedCachePrompts) {
    std::string promptedFor;
    auto prompt = [&promptedFor](const std::string& user) -> std::optional<std::string> {
        promptedFor = user;
        return std::string("typed");
    };

    auto result = resolveCredentials(std::string("bob"), std::nullopt, storedFor("alice"), prompt);
    EXPECT_EQ(promptedFor, "bob");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, Credentials::withPassword("bob", "typed"));
}

TEST(ResolveCredentials, EmptyPromptInputMeansNoCredentials) {
    auto prompt = [](const std::string&) -> std::optional<std::string> { return std::string(); };
    EXPECT_FALSE(
        resolveCredentials(std::string("bob"), std::nullopt, std::nullopt, prompt).has_value());
}

TEST(ResolveCredentials, MissingPromptMeansNoCredentials) {
    EXPECT_FALSE(
        resolveCredentials(std::string("bob"), std::nullopt, std::nullopt, PasswordPrompt{})
            .has_value());
}
