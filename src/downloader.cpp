/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/downloader.hpp"
#include "debridarr/files.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <thread>

namespace debridarr {

Downloader::Downloader(std::shared_ptr<Fetcher> fetcher, ProgressStore& progress, int workers)
    : fetcher_(std::move(fetcher)), progress_(progress), workers_(workers < 1 ? 1 : workers) {
}

DownloadOutcome Downloader::fetchAll(const JobId& jobId, std::vector<FileEntry>& entries,
                                     const ClientLayout& layout, const CancelToken& cancel) {
    if (entries.empty()) {
        return DownloadOutcome::Completed;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<int> failed{0};
    std::atomic<int> cancelled{0};

    auto drain = [&]() {
        while (true) {
            std::size_t index = next.fetch_add(1);
            if (index >= entries.size()) {
                break;
            }
            EntryResult result = EntryResult::Failed;
            try {
                result = fetchEntry(jobId, index, entries[index], layout, cancel);
            } catch (const std::exception& e) {
                LOG_ERROR("Transfer of " + entries[index].filename + " failed: " + std::string(e.what()));
                entries[index].status = FileStatus::Failed;
            }
            if (result == EntryResult::Failed) {
                ++failed;
            } else if (result == EntryResult::Cancelled) {
                ++cancelled;
            }
        }
    };

    const int threads = std::min<int>(workers_, static_cast<int>(entries.size()));
    LOG_DEBUG("Fetching " + std::to_string(entries.size()) + " file(s) for " + jobId +
              " on " + std::to_string(threads) + " stream(s)");

    // A single stream runs on the caller, which keeps its own name
    if (threads == 1) {
        drain();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (int i = 0; i < threads; ++i) {
            pool.emplace_back([&drain, i] {
                setThreadName("File-" + std::to_string(i));
                drain();
            });
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    if (cancelled.load() > 0 || cancel.cancelled()) {
        return DownloadOutcome::Cancelled;
    }
    return failed.load() > 0 ? DownloadOutcome::Failed : DownloadOutcome::Completed;
}

Downloader::EntryResult Downloader::fetchEntry(const JobId& jobId, std::size_t index, FileEntry& entry,
                                               const ClientLayout& layout, const CancelToken& cancel) {
    if (entry.status == FileStatus::Failed) {
        // Never resolved to a URL
        return EntryResult::Failed;
    }
    if (cancel.cancelled()) {
        return EntryResult::Cancelled;
    }

    const auto finalPath = layout.completed / entry.filename;
    const auto stagingPath = layout.staging / (entry.filename + ".part");

    std::error_code ec;
    if (std::filesystem::exists(finalPath, ec)) {
        LOG_INFO("Already present, skipping: " + entry.filename);
        entry.status = FileStatus::Completed;
        entry.bytesTransferred = entry.bytesExpected;
        progress_.setFileBytes(jobId, index, entry.bytesTransferred);
        progress_.setFileStatus(jobId, index, entry.status);
        return EntryResult::Done;
    }

    std::ofstream out(stagingPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        LOG_ERROR("Cannot open staging file: " + stagingPath.string());
        entry.status = FileStatus::Failed;
        progress_.setFileStatus(jobId, index, entry.status);
        return EntryResult::Failed;
    }

    entry.status = FileStatus::Downloading;
    entry.bytesTransferred = 0;
    progress_.setFileStatus(jobId, index, entry.status);

    bool writeFailed = false;
    FetchResult result = fetcher_->fetch(entry.resolvedUrl, [&](const char* data, std::size_t size) {
        if (cancel.cancelled()) {
            return false;
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) {
            writeFailed = true;
            return false;
        }
        entry.bytesTransferred += size;
        progress_.setFileBytes(jobId, index, entry.bytesTransferred);
        return true;
    });
    out.close();

    auto discardStaging = [&] {
        std::error_code removeEc;
        std::filesystem::remove(stagingPath, removeEc);
    };

    if (writeFailed || (!out && result.ok())) {
        LOG_ERROR("Write to staging failed: " + stagingPath.string());
        discardStaging();
        entry.status = FileStatus::Failed;
        progress_.setFileStatus(jobId, index, entry.status);
        return EntryResult::Failed;
    }

    if (result.status == FetchStatus::Cancelled || cancel.cancelled()) {
        LOG_DEBUG("Transfer cancelled: " + entry.filename);
        discardStaging();
        entry.status = FileStatus::Queued;
        progress_.setFileStatus(jobId, index, entry.status);
        return EntryResult::Cancelled;
    }

    if (!result.ok()) {
        LOG_ERROR("Transfer of " + entry.filename + " failed: " + result.error);
        discardStaging();
        entry.status = FileStatus::Failed;
        progress_.setFileStatus(jobId, index, entry.status);
        return EntryResult::Failed;
    }

    if (std::filesystem::exists(finalPath, ec)) {
        // A sibling job finished the same file first
        LOG_INFO("Final file appeared during transfer, discarding staging copy: " + entry.filename);
        discardStaging();
    } else {
        std::string error;
        if (!moveFile(stagingPath, finalPath, &error)) {
            LOG_ERROR("Cannot place " + entry.filename + ": " + error);
            discardStaging();
            entry.status = FileStatus::Failed;
            progress_.setFileStatus(jobId, index, entry.status);
            return EntryResult::Failed;
        }
    }

    if (entry.bytesExpected == 0) {
        entry.bytesExpected = entry.bytesTransferred;
    }
    entry.status = FileStatus::Completed;
    progress_.setFileStatus(jobId, index, entry.status);
    LOG_INFO("Downloaded " + entry.filename + " (" + std::to_string(entry.bytesTransferred) + " bytes)");
    return EntryResult::Done;
}

}
