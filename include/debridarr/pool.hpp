/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "debridarr/types.hpp"

namespace debridarr {

using JobProcessor = std::function<void(const JobId&, int workerId)>;

// Fixed-size worker pool. Queued jobs are admitted oldest-detection first,
// independent of submission order; equal timestamps fall back to FIFO.
class Pool {
public:
    explicit Pool(int workers, std::string name = "Worker") noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    void stop() noexcept;
    void submit(const JobId& jobId, std::chrono::system_clock::time_point detectedAt) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    struct Ticket {
        JobId id;
        std::chrono::system_clock::time_point detectedAt;
        std::uint64_t sequence;
    };

    struct AdmitLater {
        bool operator()(const Ticket& a, const Ticket& b) const noexcept {
            if (a.detectedAt != b.detectedAt) {
                return a.detectedAt > b.detectedAt;
            }
            return a.sequence > b.sequence;
        }
    };

    void workerLoop(int workerId);

    int workers_;
    std::string name_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::priority_queue<Ticket, std::vector<Ticket>, AdmitLater> jobQueue_;
    std::uint64_t nextSequence_ = 0;

    std::vector<std::thread> workerThreads_;
};

}
