/**
 * @file test_one_shot.cpp
 * @brief Unit tests for --check, --get-token / --save-token and --single-track
 */

#include "app/one_shot.h"
#include "core/version.h"
#include "fakes/fake_backend.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <nlohmann/json.hpp>
#include <sstream>
#include <unistd.h>

using namespace spotty;
using namespace spotty::app;
namespace fs = std::filesystem;

class OneShotTest : public ::testing::Test {
   protected:
    void SetUp() override {
        tokenPath_ = fs::temp_directory_path() /
                     ("spotty_token_test_" + std::to_string(::getpid()) + "_" +
                      ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        fs::remove(tokenPath_);

        setup_.credentials = core::Credentials::withPassword("alice", "secret");
        setup_.clientId = "client-123";
        token_.accessToken = "BQDx-token";
        token_.expiresIn = 3600;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(tokenPath_, ec);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path tokenPath_;
    app::Setup setup_;
    session::AccessToken token_;
    spotty::testing::FakeOneShotService service_;
};

// ========== --check ==========

TEST_F(OneShotTest, CheckPrintsVersionAndCapabilities) {
    std::ostringstream out;
    printCheck(out);

    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);

    EXPECT_EQ(first, "ok " + core::getVersionString());

    auto caps = nlohmann::json::parse(second);
    for (const char* key :
         {"autoplay", "lms-auth", "volume-normalisation", "passthrough", "save-token", "podcasts"}) {
        ASSERT_TRUE(caps.contains(key)) << key;
        EXPECT_TRUE(caps[key].get<bool>()) << key;
    }
    EXPECT_TRUE(caps["debug"].is_boolean());
}

// ========== Token output ==========

TEST_F(OneShotTest, TokenJson) {
    auto json = nlohmann::json::parse(tokenToJson(token_));
    EXPECT_EQ(json["accessToken"], "BQDx-token");
    EXPECT_EQ(json["expiresIn"], 3600);
}

TEST_F(OneShotTest, WriteTokenToStream) {
    std::ostringstream out;
    std::string error;
    ASSERT_TRUE(writeToken(token_, std::nullopt, out, error));
    EXPECT_EQ(out.str(), tokenToJson(token_) + "\n");
}

TEST_F(OneShotTest, WriteTokenToFile) {
    std::ostringstream out;
    std::string error;
    ASSERT_TRUE(writeToken(token_, tokenPath_.string(), out, error)) << error;
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(readFile(tokenPath_), tokenToJson(token_));
}

TEST_F(OneShotTest, WriteTokenToUnwritablePath) {
    std::ostringstream out;
    std::string error;
    std::string path = (tokenPath_ / "nested" / "token.json").string();
    EXPECT_FALSE(writeToken(token_, path, out, error));
    EXPECT_EQ(error, "Cannot open " + path + " for writing");
}

// ========== --get-token ==========

TEST_F(OneShotTest, GetTokenPrintsToken) {
    service_.token = token_;
    setup_.scopes = "streaming";

    std::ostringstream out;
    EXPECT_EQ(runGetToken(setup_, service_, out), 0);
    EXPECT_EQ(service_.requestedClientId, "client-123");
    EXPECT_EQ(service_.requestedScopes, "streaming");
    EXPECT_EQ(out.str(), tokenToJson(token_) + "\n");
}

TEST_F(OneShotTest, SaveTokenWritesFile) {
    service_.token = token_;
    setup_.saveToken = tokenPath_.string();

    std::ostringstream out;
    EXPECT_EQ(runGetToken(setup_, service_, out), 0);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(readFile(tokenPath_), tokenToJson(token_));
}

TEST_F(OneShotTest, GetTokenFailureStillExitsZero) {
    std::ostringstream out;
    EXPECT_EQ(runGetToken(setup_, service_, out), 0);
    EXPECT_TRUE(service_.requestedClientId.has_value());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(OneShotTest, GetTokenWithoutCredentialsSkipsRequest) {
    setup_.credentials.reset();
    std::ostringstream out;
    EXPECT_EQ(runGetToken(setup_, service_, out), 0);
    EXPECT_FALSE(service_.requestedClientId.has_value());
}

// ========== --single-track ==========

TEST_F(OneShotTest, SingleTrackPlaysFromPosition) {
    setup_.singleTrack = "6rqhFgbbKwnb9MLmUQDhG6";
    setup_.startPositionMs = 30000;
    setup_.playerConfig.bitrate = playback::Bitrate::Bitrate96;
    setup_.playerConfig.lmsConnectMode = false;

    EXPECT_EQ(runSingleTrack(setup_, service_), 0);
    EXPECT_EQ(service_.playedTrack, "6rqhFgbbKwnb9MLmUQDhG6");
    EXPECT_EQ(service_.playedFromMs, 30000u);
    ASSERT_TRUE(service_.playedWith.has_value());
    EXPECT_EQ(service_.playedWith->bitrate, playback::Bitrate::Bitrate96);
    EXPECT_FALSE(service_.playedWith->lmsConnectMode);
}

TEST_F(OneShotTest, SingleTrackFailureStillExitsZero) {
    setup_.singleTrack = "missing";
    service_.playSucceeds = false;
    EXPECT_EQ(runSingleTrack(setup_, service_), 0);
    EXPECT_EQ(service_.playedTrack, "missing");
}
