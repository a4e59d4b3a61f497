/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/progress.hpp"
#include <algorithm>

namespace debridarr {

int FileProgress::percent() const noexcept {
    if (status == FileStatus::Completed || status == FileStatus::Extracted ||
        status == FileStatus::FailedExtraction) {
        return 100;
    }
    if (bytesExpected == 0) {
        return 0;
    }
    auto pct = (bytesTransferred * 100) / bytesExpected;
    return static_cast<int>(std::min<std::uint64_t>(pct, 100));
}

int JobSnapshot::filesProgress() const noexcept {
    if (files.empty()) {
        return phase == Phase::PostProcess || phase == Phase::Completed ? 100 : 0;
    }
    std::uint64_t expected = 0;
    std::uint64_t transferred = 0;
    bool sized = true;
    for (const auto& f : files) {
        if (f.bytesExpected == 0) sized = false;
        expected += f.bytesExpected;
        transferred += std::min(f.bytesTransferred, f.bytesExpected);
    }
    if (sized && expected > 0) {
        return static_cast<int>((transferred * 100) / expected);
    }
    int sum = 0;
    for (const auto& f : files) {
        sum += f.percent();
    }
    return sum / static_cast<int>(files.size());
}

int JobSnapshot::progress() const noexcept {
    if (phase == Phase::Completed) {
        return 100;
    }
    return std::clamp(cacheProgress, 0, 100) / 2 + filesProgress() / 2;
}

std::string JobSnapshot::label() const {
    switch (phase) {
        case Phase::CachingPoll:
            return "Caching " + std::to_string(cacheProgress) + "%";
        case Phase::Downloading:
            return "Downloading " + std::to_string(files.size()) + " file(s) " +
                   std::to_string(filesProgress()) + "%";
        case Phase::RetryCooldown:
            return "Hoster unavailable, retry " + std::to_string(retryCount) + " cooling down";
        case Phase::EnqueuedForDownload:
            return "Waiting for download slot";
        case Phase::PostProcess:
            return "Extracting";
        default:
            return toString(phase);
    }
}

void ProgressStore::track(JobSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = snapshot.id;
    jobs_[id] = std::move(snapshot);
}

bool ProgressStore::remove(const JobId& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.erase(id) > 0;
}

void ProgressStore::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
}

void ProgressStore::setPhase(const JobId& id, Phase phase, int retryCount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    it->second.phase = phase;
    it->second.retryCount = retryCount;
}

void ProgressStore::setCacheProgress(const JobId& id, int percent) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    it->second.cacheProgress = std::clamp(percent, 0, 100);
}

void ProgressStore::setFiles(const JobId& id, std::vector<FileProgress> files) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    it->second.files = std::move(files);
}

void ProgressStore::setFileBytes(const JobId& id, std::size_t index, std::uint64_t transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || index >= it->second.files.size()) return;
    it->second.files[index].bytesTransferred = transferred;
}

void ProgressStore::setFileStatus(const JobId& id, std::size_t index, FileStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || index >= it->second.files.size()) return;
    it->second.files[index].status = status;
}

std::optional<JobSnapshot> ProgressStore::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<JobSnapshot> ProgressStore::list() const {
    std::vector<JobSnapshot> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(jobs_.size());
        for (const auto& [id, snapshot] : jobs_) {
            result.push_back(snapshot);
        }
    }
    std::sort(result.begin(), result.end(), [](const JobSnapshot& a, const JobSnapshot& b) {
        return a.detectedAt != b.detectedAt ? a.detectedAt < b.detectedAt : a.id < b.id;
    });
    return result;
}

std::size_t ProgressStore::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

}
