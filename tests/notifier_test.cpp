/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <json/json.h>
#include <memory>

#include "debridarr/logger.hpp"
#include "debridarr/notifier.hpp"
#include "mock_http.hpp"

using namespace debridarr;
using namespace debridarr::test;
using ::testing::_;
using ::testing::Return;

namespace {

TEST(WebhookNotifierTest, RendersJsonReport) {
    FailureReport report{"radarr", "Movie.magnet", FailureClass::DeadJob, "no progress after 60 polls"};
    std::string body = WebhookNotifier::renderBody(report);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    ASSERT_TRUE(reader->parse(body.data(), body.data() + body.size(), &root, &errors)) << errors;
    EXPECT_EQ(root["client"].asString(), "radarr");
    EXPECT_EQ(root["descriptor"].asString(), "Movie.magnet");
    EXPECT_EQ(root["reason"].asString(), "DeadJob");
    EXPECT_EQ(root["message"].asString(), "no progress after 60 polls");
    EXPECT_EQ(body.find('\n'), std::string::npos);
}

TEST(WebhookNotifierTest, PostsToConfiguredUrl) {
    Logger::setLevel(LogLevel::ERROR);
    auto http = std::make_shared<MockHttpClient>();
    FailureReport report{"sonarr", "Show.magnet", FailureClass::HosterUnavailable, "503"};
    EXPECT_CALL(*http, post("https://hooks.example/debrid", WebhookNotifier::renderBody(report),
                            "application/json", _))
        .WillOnce(Return(reply(200)))
        .WillOnce(Return(reply(500)));

    WebhookNotifier notifier(http, "https://hooks.example/debrid");
    EXPECT_TRUE(notifier.notify(report));
    EXPECT_FALSE(notifier.notify(report));

    WebhookNotifier unset(http, "");
    EXPECT_FALSE(unset.notify(report));
}

}
