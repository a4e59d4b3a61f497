/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "debridarr/descriptor.hpp"
#include "debridarr/types.hpp"

namespace debridarr {

// Cooperative cancellation flag, optionally chained to a parent flag
// (the controller's stop flag) so shutdown reaches every job.
class CancelToken final {
public:
    explicit CancelToken(const std::atomic<bool>* parent = nullptr) noexcept : parent_(parent) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load() || (parent_ != nullptr && parent_->load());
    }

private:
    std::atomic<bool> cancelled_{false};
    const std::atomic<bool>* parent_;
};

struct FileEntry {
    std::string link;
    std::string filename;
    std::string resolvedUrl;
    std::uint64_t bytesExpected = 0;
    std::uint64_t bytesTransferred = 0;
    FileStatus status = FileStatus::Queued;
};

// Live orchestration record for one descriptor. Owned by the Controller;
// fields other than the token are guarded by the controller's registry lock
// or touched only by the thread currently running the job body.
struct Job {
    Job(JobId jobId, Descriptor source, const std::atomic<bool>* stopFlag)
        : id(std::move(jobId)), descriptor(std::move(source)), cancel(stopFlag) {}

    JobId id;
    Descriptor descriptor;
    std::string cacheHandle;
    Phase phase = Phase::Detected;
    int retryCount = 0;
    std::optional<std::chrono::steady_clock::time_point> cooldownUntil;
    std::vector<std::string> links;
    std::vector<FileEntry> fileEntries;
    CancelToken cancel;
    bool aborted = false;
};

[[nodiscard]] JobId makeJobId(const std::filesystem::path& source,
                              std::chrono::system_clock::time_point detectedAt);

}
