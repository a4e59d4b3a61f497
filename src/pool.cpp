/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/pool.hpp"
#include "debridarr/logger.hpp"
#include <system_error>

namespace debridarr {

Pool::Pool(int workers, std::string name) noexcept
    : workers_(workers < 1 ? 1 : workers), name_(std::move(name)) {
    LOG_DEBUG("Pool " + name_ + " created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool " + name_ + " already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_DEBUG("Pool " + name_ + " started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool " + name_ + ": " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool " + name_ + "...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!jobQueue_.empty()) {
            LOG_DEBUG("Dropping " + std::to_string(jobQueue_.size()) + " queued job(s) from pool " + name_);
        }
        while (!jobQueue_.empty()) {
            jobQueue_.pop();
        }
    }

    LOG_DEBUG("Pool " + name_ + " stopped");
}

void Pool::submit(const JobId& jobId, std::chrono::system_clock::time_point detectedAt) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
        return;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push(Ticket{jobId, detectedAt, nextSequence_++});
        }

        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued for " + name_ + ": " + jobId);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + e.what());
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return jobQueue_.size();
    } catch (const std::system_error&) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    const std::string workerName = name_ + "-" + std::to_string(workerId);
    setThreadName(workerName);
    LOG_DEBUG(workerName + " thread started");

    try {
        while (!shutdown_.load()) {
            JobId jobId;

            {
                std::unique_lock<std::mutex> lock(queueMutex_);

                jobAvailable_.wait(lock, [this] {
                    return !jobQueue_.empty() || shutdown_.load();
                });

                if (shutdown_.load()) {
                    break;
                }

                if (jobQueue_.empty()) {
                    continue;
                }

                jobId = jobQueue_.top().id;
                jobQueue_.pop();
            }

            if (!jobId.empty()) {
                LOG_DEBUG(workerName + " claimed job: " + jobId);

                try {
                    processor_(jobId, workerId);
                } catch (const std::exception& e) {
                    LOG_ERROR(workerName + " job processing error: " +
                              std::string(e.what()) + " (job: " + jobId + ")");
                } catch (...) {
                    LOG_ERROR(workerName + " unknown job processing error (job: " + jobId + ")");
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(workerName + " fatal error: " + std::string(e.what()));
    }

    LOG_DEBUG(workerName + " stopped");
}

}
