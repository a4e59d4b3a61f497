/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <vector>

#include "debridarr/config.hpp"
#include "debridarr/fetcher.hpp"
#include "debridarr/job.hpp"
#include "debridarr/progress.hpp"

namespace debridarr {

enum class DownloadOutcome : uint8_t { Completed, Cancelled, Failed };

// Fetches one job's resolved entries concurrently. Each call runs its own
// sub-pool of min(workers, entries) threads.
class Downloader final {
public:
    Downloader(std::shared_ptr<Fetcher> fetcher, ProgressStore& progress, int workers);

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    // Entries are updated in place. A failing entry never stops its siblings.
    [[nodiscard]] DownloadOutcome fetchAll(const JobId& jobId, std::vector<FileEntry>& entries,
                                           const ClientLayout& layout, const CancelToken& cancel);

    [[nodiscard]] int workers() const noexcept { return workers_; }

private:
    enum class EntryResult : uint8_t { Done, Cancelled, Failed };

    [[nodiscard]] EntryResult fetchEntry(const JobId& jobId, std::size_t index, FileEntry& entry,
                                         const ClientLayout& layout, const CancelToken& cancel);

    std::shared_ptr<Fetcher> fetcher_;
    ProgressStore& progress_;
    int workers_;
};

}
