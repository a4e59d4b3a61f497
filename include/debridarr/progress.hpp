/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "debridarr/types.hpp"

namespace debridarr {

struct FileProgress {
    std::string filename;
    std::uint64_t bytesExpected = 0;
    std::uint64_t bytesTransferred = 0;
    FileStatus status = FileStatus::Queued;

    [[nodiscard]] int percent() const noexcept;
};

// Read-mostly projection of a Job. Never the authoritative copy.
struct JobSnapshot {
    JobId id;
    std::string descriptor;
    Phase phase = Phase::Detected;
    int retryCount = 0;
    int cacheProgress = 0;
    std::vector<FileProgress> files;
    std::chrono::system_clock::time_point detectedAt;

    [[nodiscard]] int filesProgress() const noexcept;
    // Caching and transfer each account for half of the total.
    [[nodiscard]] int progress() const noexcept;
    [[nodiscard]] std::string label() const;
};

// Shared between job bodies (writers) and status readers. One mutex per
// store; updates are small and frequent, never long-held.
class ProgressStore final {
public:
    ProgressStore() = default;

    ProgressStore(const ProgressStore&) = delete;
    ProgressStore& operator=(const ProgressStore&) = delete;

    void track(JobSnapshot snapshot);
    bool remove(const JobId& id) noexcept;
    void clear() noexcept;

    void setPhase(const JobId& id, Phase phase, int retryCount);
    void setCacheProgress(const JobId& id, int percent);
    void setFiles(const JobId& id, std::vector<FileProgress> files);
    void setFileBytes(const JobId& id, std::size_t index, std::uint64_t transferred);
    void setFileStatus(const JobId& id, std::size_t index, FileStatus status);

    [[nodiscard]] std::optional<JobSnapshot> get(const JobId& id) const;
    // Oldest detection first.
    [[nodiscard]] std::vector<JobSnapshot> list() const;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobId, JobSnapshot> jobs_;
};

}
