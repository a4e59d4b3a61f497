/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "debridarr/logger.hpp"
#include "debridarr/real_debrid.hpp"
#include "mock_http.hpp"
#include "test_support.hpp"

using namespace debridarr;
using namespace debridarr::test;
using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Pair;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

constexpr const char* kApi = "https://api.example/rest/1.0";

class RealDebridTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::ERROR);
        http_ = std::make_shared<StrictMock<MockHttpClient>>();
        client_ = std::make_unique<RealDebridClient>(http_, std::string(kApi) + "/", "secret");
    }

    Descriptor link(const std::string& payload) {
        Descriptor d;
        d.path = "inbox/x.magnet";
        d.kind = DescriptorKind::Link;
        d.payload = payload;
        return d;
    }

    std::shared_ptr<StrictMock<MockHttpClient>> http_;
    std::unique_ptr<RealDebridClient> client_;
};

TEST(RealDebridParseTest, ClassifiesResponses) {
    EXPECT_EQ(RealDebridClient::classify(reply(201)), RemoteError::None);
    EXPECT_EQ(RealDebridClient::classify(reply(429)), RemoteError::RateLimited);
    EXPECT_EQ(RealDebridClient::classify(reply(404)), RemoteError::PermanentReject);
    EXPECT_EQ(RealDebridClient::classify(reply(502)), RemoteError::NetworkError);
    EXPECT_EQ(RealDebridClient::classify(transportFailure("timeout")), RemoteError::NetworkError);
}

TEST(RealDebridParseTest, MapsRemoteStates) {
    EXPECT_EQ(RealDebridClient::mapState("downloaded"), CacheState::Cached);
    EXPECT_EQ(RealDebridClient::mapState("downloading"), CacheState::Downloading);
    EXPECT_EQ(RealDebridClient::mapState("magnet_error"), CacheState::Failed);
    EXPECT_EQ(RealDebridClient::mapState("dead"), CacheState::Failed);
    EXPECT_EQ(RealDebridClient::mapState("waiting_files_selection"), CacheState::Pending);
    EXPECT_EQ(RealDebridClient::mapState("queued"), CacheState::Pending);
}

TEST(RealDebridParseTest, ParsesTorrentInfo) {
    auto status = RealDebridClient::parseStatus(
        R"({"id":"AB","status":"downloading","progress":37.5,"links":[]})");
    EXPECT_EQ(status.error, RemoteError::None);
    EXPECT_EQ(status.state, CacheState::Downloading);
    EXPECT_EQ(status.progress, 37);

    auto done = RealDebridClient::parseStatus(
        R"({"status":"downloaded","progress":99,"links":["https://rd/d/1","","https://rd/d/2"]})");
    EXPECT_EQ(done.state, CacheState::Cached);
    EXPECT_EQ(done.progress, 100);
    EXPECT_THAT(done.links, ElementsAre("https://rd/d/1", "https://rd/d/2"));

    EXPECT_EQ(RealDebridClient::parseStatus("<html>").error, RemoteError::NetworkError);
}

TEST(RealDebridParseTest, ParsesUnrestrictResponses) {
    auto ok = RealDebridClient::parseResolved(
        200, R"({"download":"https://cdn/f.mkv","filename":"f.mkv","filesize":1234})");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.url, "https://cdn/f.mkv");
    EXPECT_EQ(ok.filename, "f.mkv");
    EXPECT_EQ(ok.size, 1234u);

    EXPECT_EQ(RealDebridClient::parseResolved(503, "").error, RemoteError::HosterUnavailable);
    EXPECT_EQ(RealDebridClient::parseResolved(400, R"({"error":"hoster_unavailable","error_code":19})").error,
              RemoteError::HosterUnavailable);
    EXPECT_EQ(RealDebridClient::parseResolved(429, "{}").error, RemoteError::RateLimited);
    EXPECT_EQ(RealDebridClient::parseResolved(404, R"({"error":"unknown_ressource"})").error,
              RemoteError::PermanentReject);
    EXPECT_EQ(RealDebridClient::parseResolved(500, "").error, RemoteError::NetworkError);
    EXPECT_EQ(RealDebridClient::parseResolved(200, R"({"filename":"x"})").error, RemoteError::PermanentReject);
}

TEST_F(RealDebridTest, SubmitsMagnetAsForm) {
    const std::string magnet = magnetFor("show");
    EXPECT_CALL(*http_, postForm(std::string(kApi) + "/torrents/addMagnet",
                                 ElementsAre(Pair("magnet", magnet)),
                                 Contains("Authorization: Bearer secret")))
        .WillOnce(Return(reply(201, R"({"id":"TORRENT1","uri":"x"})")));

    auto outcome = client_->submit(link(magnet));
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.handle, "TORRENT1");
}

TEST_F(RealDebridTest, SubmitsContainerAsUpload) {
    Descriptor container;
    container.path = "inbox/x.torrent";
    container.kind = DescriptorKind::ContainerFile;
    container.payload = "d8:announce0:e";

    EXPECT_CALL(*http_, put(std::string(kApi) + "/torrents/addTorrent", "d8:announce0:e", _))
        .WillOnce(Return(reply(400, R"({"error":"invalid_file"})")));

    auto outcome = client_->submit(container);
    EXPECT_EQ(outcome.error, RemoteError::PermanentReject);
    EXPECT_EQ(outcome.message, "HTTP 400: invalid_file");
}

TEST_F(RealDebridTest, FindsExistingEntryByHash) {
    EXPECT_CALL(*http_, get(std::string(kApi) + "/torrents?limit=100", _))
        .WillOnce(Return(reply(200, std::string(R"([
            {"id":"OLD","hash":")") + kHash + R"(","status":"magnet_error"},
            {"id":"OTHER","hash":"ffff","status":"downloaded"},
            {"id":"MATCH","hash":")" + std::string(kHash) + R"(","status":"downloading"}
        ])")));

    auto existing = client_->findExisting(link(magnetFor("show")));
    ASSERT_TRUE(existing.has_value());
    EXPECT_EQ(*existing, "MATCH");
}

TEST_F(RealDebridTest, ContainersAreNeverMatched) {
    Descriptor container;
    container.kind = DescriptorKind::ContainerFile;
    container.payload = "d8:announce0:e";
    EXPECT_FALSE(client_->findExisting(container).has_value());
}

TEST_F(RealDebridTest, SelectsAllFilesAndPollsInfo) {
    EXPECT_CALL(*http_, postForm(std::string(kApi) + "/torrents/selectFiles/T1",
                                 ElementsAre(Pair("files", "all")), _))
        .WillOnce(Return(reply(204)));
    EXPECT_CALL(*http_, get(std::string(kApi) + "/torrents/info/T1", _))
        .WillOnce(Return(reply(200, R"({"status":"queued","progress":0})")))
        .WillOnce(Return(reply(404, R"({"error":"unknown_ressource"})")));

    EXPECT_EQ(client_->selectAll("T1"), RemoteError::None);
    EXPECT_EQ(client_->pollStatus("T1").state, CacheState::Pending);
    EXPECT_EQ(client_->pollStatus("T1").error, RemoteError::PermanentReject);
}

TEST_F(RealDebridTest, ResolveMapsTransportFailure) {
    EXPECT_CALL(*http_, postForm(std::string(kApi) + "/unrestrict/link",
                                 ElementsAre(Pair("link", "https://rd/d/1")), _))
        .WillOnce(Return(transportFailure("connection reset")));

    auto resolved = client_->resolve("https://rd/d/1");
    EXPECT_EQ(resolved.error, RemoteError::NetworkError);
    EXPECT_EQ(resolved.message, "connection reset");
}

TEST_F(RealDebridTest, ReleaseDeletesHandleOnly) {
    EXPECT_CALL(*http_, del(std::string(kApi) + "/torrents/delete/T9", _))
        .WillOnce(Return(reply(204)));
    client_->release("T9");
    client_->release("");
}

TEST_F(RealDebridTest, VerifiesToken) {
    EXPECT_CALL(*http_, get(std::string(kApi) + "/user", _))
        .WillOnce(Return(reply(200, R"({"username":"me"})")))
        .WillOnce(Return(reply(401, R"({"error":"bad_token"})")))
        .WillOnce(Return(transportFailure("no route to host")))
        .WillOnce(Return(reply(503)));

    EXPECT_EQ(client_->verifyToken(), TokenCheck::Valid);
    EXPECT_EQ(client_->verifyToken(), TokenCheck::Invalid);
    EXPECT_EQ(client_->verifyToken(), TokenCheck::Unreachable);
    EXPECT_EQ(client_->verifyToken(), TokenCheck::Unreachable);
}

}
