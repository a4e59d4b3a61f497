/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "debridarr/downloader.hpp"
#include "debridarr/logger.hpp"
#include "test_support.hpp"

using namespace debridarr;
using namespace debridarr::test;

namespace {

class DownloaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::ERROR);
        layout_ = ClientLayout::under(dir_.path(), "radarr");
        ASSERT_TRUE(layout_.create());
        fetcher_ = std::make_shared<FakeFetcher>();

        JobSnapshot snapshot;
        snapshot.id = "job";
        progress_.track(snapshot);
    }

    FileEntry entry(const std::string& filename, const std::string& url) {
        FileEntry e;
        e.filename = filename;
        e.resolvedUrl = url;
        return e;
    }

    void publish(const std::vector<FileEntry>& entries) {
        std::vector<FileProgress> files;
        for (const auto& e : entries) {
            files.push_back(FileProgress{e.filename, e.bytesExpected, 0, e.status});
        }
        progress_.setFiles("job", files);
    }

    TempDir dir_;
    ClientLayout layout_;
    ProgressStore progress_;
    std::shared_ptr<FakeFetcher> fetcher_;
    std::atomic<bool> stop_{false};
};

TEST_F(DownloaderTest, PlacesEveryFileInCompleted) {
    fetcher_->serve("u1", "first file");
    fetcher_->serve("u2", "second");
    fetcher_->serve("u3", "third!");
    std::vector<FileEntry> entries{entry("one.mkv", "u1"), entry("two.mkv", "u2"), entry("three.srt", "u3")};
    publish(entries);

    Downloader downloader(fetcher_, progress_, 2);
    CancelToken cancel(&stop_);
    EXPECT_EQ(downloader.fetchAll("job", entries, layout_, cancel), DownloadOutcome::Completed);

    EXPECT_EQ(readFile(layout_.completed / "one.mkv"), "first file");
    EXPECT_EQ(readFile(layout_.completed / "two.mkv"), "second");
    EXPECT_EQ(readFile(layout_.completed / "three.srt"), "third!");
    EXPECT_EQ(countFiles(layout_.staging), 0u);
    for (const auto& e : entries) {
        EXPECT_EQ(e.status, FileStatus::Completed) << e.filename;
    }
    EXPECT_EQ(entries[0].bytesTransferred, 10u);
    auto snapshot = progress_.get("job");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->files[0].bytesTransferred, 10u);
}

TEST_F(DownloaderTest, OneFailureDoesNotStopSiblings) {
    fetcher_->serve("good", "payload");
    std::vector<FileEntry> entries{entry("bad.mkv", "missing"), entry("good.mkv", "good")};

    Downloader downloader(fetcher_, progress_, 1);
    CancelToken cancel(&stop_);
    EXPECT_EQ(downloader.fetchAll("job", entries, layout_, cancel), DownloadOutcome::Failed);

    EXPECT_EQ(entries[0].status, FileStatus::Failed);
    EXPECT_EQ(entries[1].status, FileStatus::Completed);
    EXPECT_TRUE(std::filesystem::exists(layout_.completed / "good.mkv"));
    EXPECT_FALSE(std::filesystem::exists(layout_.staging / "bad.mkv.part"));
}

TEST_F(DownloaderTest, UnresolvedEntryCountsAsFailure) {
    auto unresolved = entry("nolink.mkv", "");
    unresolved.status = FileStatus::Failed;
    std::vector<FileEntry> entries{unresolved};

    Downloader downloader(fetcher_, progress_, 4);
    CancelToken cancel(&stop_);
    EXPECT_EQ(downloader.fetchAll("job", entries, layout_, cancel), DownloadOutcome::Failed);
    EXPECT_EQ(fetcher_->fetches.load(), 0);
}

TEST_F(DownloaderTest, ExistingFinalFileIsNotFetchedAgain) {
    writeFile(layout_.completed / "have.mkv", "already here");
    fetcher_->serve("u", "new content");
    std::vector<FileEntry> entries{entry("have.mkv", "u")};

    Downloader downloader(fetcher_, progress_, 1);
    CancelToken cancel(&stop_);
    EXPECT_EQ(downloader.fetchAll("job", entries, layout_, cancel), DownloadOutcome::Completed);
    EXPECT_EQ(readFile(layout_.completed / "have.mkv"), "already here");
    EXPECT_EQ(fetcher_->fetches.load(), 0);
}

TEST_F(DownloaderTest, CancellationDiscardsPartialFile) {
    fetcher_->serve("u", std::string(64, 'x'));
    std::vector<FileEntry> entries{entry("big.mkv", "u")};

    Downloader downloader(fetcher_, progress_, 1);
    CancelToken cancel(&stop_);
    cancel.cancel();
    EXPECT_EQ(downloader.fetchAll("job", entries, layout_, cancel), DownloadOutcome::Cancelled);

    EXPECT_FALSE(std::filesystem::exists(layout_.completed / "big.mkv"));
    EXPECT_EQ(countFiles(layout_.staging), 0u);
}

TEST_F(DownloaderTest, EmptyJobCompletesImmediately) {
    std::vector<FileEntry> entries;
    Downloader downloader(fetcher_, progress_, 2);
    CancelToken cancel(&stop_);
    EXPECT_EQ(downloader.fetchAll("job", entries, layout_, cancel), DownloadOutcome::Completed);
    EXPECT_EQ(downloader.workers(), 2);
}

TEST_F(DownloaderTest, SingleStreamKeepsCallerThreadName) {
    fetcher_->serve("u1", "only");
    std::vector<FileEntry> entries{entry("solo.mkv", "u1")};
    publish(entries);

    Downloader downloader(fetcher_, progress_, 4);
    DownloadOutcome outcome = DownloadOutcome::Failed;
    std::string nameAfter;
    std::thread worker([&] {
        setThreadName("Download-0");
        CancelToken cancel(&stop_);
        outcome = downloader.fetchAll("job", entries, layout_, cancel);
        nameAfter = threadName();
    });
    worker.join();

    EXPECT_EQ(outcome, DownloadOutcome::Completed);
    EXPECT_EQ(nameAfter, "Download-0");
    EXPECT_EQ(readFile(layout_.completed / "solo.mkv"), "only");
}

}
