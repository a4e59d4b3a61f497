/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "debridarr/flow.hpp"
#include "debridarr/logger.hpp"
#include "test_support.hpp"

using namespace debridarr;
using namespace debridarr::test;

namespace {

class FlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::ERROR);
        layout_ = ClientLayout::under(dir_.path(), "radarr");
        ASSERT_TRUE(layout_.create());
    }

    TempDir dir_;
    ClientLayout layout_;
};

TEST_F(FlowTest, StatusFollowsDirectoryMembership) {
    writeFile(layout_.inbox / "q.magnet", magnetFor("q"));
    writeFile(layout_.completed / "d.magnet", magnetFor("d"));
    writeFile(layout_.failed / "f.magnet", magnetFor("f"));

    Flow flow(layout_);
    EXPECT_EQ(flow.status("q.magnet"), Status::Queued);
    EXPECT_EQ(flow.status("d.magnet"), Status::Done);
    EXPECT_EQ(flow.status("f.magnet"), Status::Failed);
    EXPECT_EQ(flow.status("nope.magnet"), Status::Missing);
    EXPECT_EQ(flow.status("../radarr/inbox/q.magnet"), Status::Missing);
}

TEST_F(FlowTest, CountsSeparateDescriptorsFromFiles) {
    writeFile(layout_.inbox / "q.magnet", magnetFor("q"));
    writeFile(layout_.completed / "d.magnet", magnetFor("d"));
    writeFile(layout_.completed / "movie.mkv", "video");
    writeFile(layout_.completed / "movie.srt", "subs");
    writeFile(layout_.failed / "f.torrent", "d1:ae");
    writeFile(layout_.failed / "f.torrent.error.txt", "reason: DeadJob\n");
    writeFile(layout_.staging / "movie.mkv.part", "vi");

    Flow flow(layout_);
    auto c = flow.counts();
    EXPECT_EQ(c.queued, 1u);
    EXPECT_EQ(c.done, 1u);
    EXPECT_EQ(c.failed, 1u);
    EXPECT_EQ(c.files, 2u);
    EXPECT_EQ(c.staging, 1u);

    auto files = flow.completedFiles();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "movie.mkv");
    EXPECT_EQ(files[0].size, 5u);

    auto entries = flow.list();
    EXPECT_EQ(entries.size(), 3u);
    EXPECT_EQ(flow.list(1).size(), 1u);
}

TEST_F(FlowTest, RetryMovesDescriptorBackAndDropsNote) {
    writeFile(layout_.failed / "f.magnet", magnetFor("f"));
    writeFile(layout_.failed / "f.magnet.error.txt", "reason: HosterUnavailable\n");

    Flow flow(layout_);
    auto note = flow.error("f.magnet");
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ(*note, "reason: HosterUnavailable\n");

    std::string message;
    ASSERT_TRUE(flow.retry("f.magnet", &message)) << message;
    EXPECT_EQ(flow.status("f.magnet"), Status::Queued);
    EXPECT_FALSE(std::filesystem::exists(layout_.failed / "f.magnet.error.txt"));
    EXPECT_FALSE(flow.error("f.magnet").has_value());

    EXPECT_FALSE(flow.retry("f.magnet", &message));
    EXPECT_EQ(message, "Already queued: f.magnet");
    EXPECT_FALSE(flow.retry("ghost.magnet", &message));
    EXPECT_EQ(message, "Not found: ghost.magnet");
}

TEST_F(FlowTest, RemoveFileRefusesDescriptors) {
    writeFile(layout_.completed / "d.magnet", magnetFor("d"));
    writeFile(layout_.completed / "movie.mkv", "video");

    Flow flow(layout_);
    std::string message;
    EXPECT_FALSE(flow.removeFile("d.magnet", &message));
    EXPECT_TRUE(std::filesystem::exists(layout_.completed / "d.magnet"));
    EXPECT_TRUE(flow.removeFile("movie.mkv", &message)) << message;
    EXPECT_FALSE(std::filesystem::exists(layout_.completed / "movie.mkv"));
    EXPECT_FALSE(flow.removeFile("movie.mkv", &message));
    EXPECT_FALSE(flow.removeFile("../radarr/completed/d.magnet", &message));
}

TEST_F(FlowTest, CleanupRemovesPartialsAndStrays) {
    writeFile(layout_.staging / "a.mkv.part", "aa");
    writeFile(layout_.staging / "b.mkv.part", "bb");
    writeFile(layout_.inbox / "stray.txt", "?");
    writeFile(layout_.inbox / "keep.magnet", magnetFor("keep"));
    writeFile(layout_.completed / "movie.mkv", "video");

    Flow flow(layout_);
    EXPECT_EQ(flow.cleanup(), 3);
    EXPECT_EQ(countFiles(layout_.staging), 0u);
    EXPECT_TRUE(std::filesystem::exists(layout_.inbox / "keep.magnet"));
    EXPECT_FALSE(std::filesystem::exists(layout_.inbox / "stray.txt"));
    EXPECT_TRUE(std::filesystem::exists(layout_.completed / "movie.mkv"));
}

TEST_F(FlowTest, AbortDeletesOnlyQueuedDescriptors) {
    writeFile(layout_.inbox / "q.magnet", magnetFor("q"));
    writeFile(layout_.inbox / "notes.txt", "keep");
    writeFile(layout_.completed / "d.magnet", magnetFor("d"));

    Flow flow(layout_);
    std::string message;
    ASSERT_TRUE(flow.abort("q.magnet", &message)) << message;
    EXPECT_EQ(flow.status("q.magnet"), Status::Missing);

    EXPECT_FALSE(flow.abort("q.magnet", &message));
    EXPECT_NE(message.find("Not queued"), std::string::npos);
    EXPECT_FALSE(flow.abort("d.magnet", &message));
    EXPECT_TRUE(std::filesystem::exists(layout_.completed / "d.magnet"));
    EXPECT_FALSE(flow.abort("notes.txt", &message));
    EXPECT_TRUE(std::filesystem::exists(layout_.inbox / "notes.txt"));
    EXPECT_FALSE(flow.abort("../inbox/q.magnet", &message));
}

}
