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
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "debridarr/config.hpp"
#include "debridarr/downloader.hpp"
#include "debridarr/extractor.hpp"
#include "debridarr/fetcher.hpp"
#include "debridarr/job.hpp"
#include "debridarr/notifier.hpp"
#include "debridarr/pool.hpp"
#include "debridarr/progress.hpp"
#include "debridarr/remote_cache.hpp"
#include "debridarr/scanner.hpp"

namespace debridarr {

enum class SubmitDecision : uint8_t {
    Accepted,
    AlreadyTracked,  // a live job exists for this path
    Duplicate,       // already completed; inbox copy deleted
    Stopped
};

using PhaseListener = std::function<void(const JobId&, Phase)>;

// Job lifecycle orchestrator for one client directory set.
//
// Caching runs on one thread per job; cached jobs are handed to a bounded
// download pool admitted oldest-detection first. Directory placement under
// completed/ or failed/ is the only durable record of a finished job.
class Controller final {
public:
    Controller(ClientLayout layout, const Settings& settings,
               std::shared_ptr<RemoteCache> remote,
               std::shared_ptr<Fetcher> fetcher,
               std::shared_ptr<Extractor> extractor);
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = delete;
    Controller& operator=(Controller&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    SubmitDecision submit(const Descriptor& descriptor);

    // Inbox catch-up plus cooldown re-checks. Jobs whose descriptor was deleted
    // from the inbox are aborted. Called periodically by the Server.
    void rescan();

    // Cancels a live job, deletes its descriptor and releases its handle.
    // Unknown or finished jobs return false.
    bool abort(const JobId& id) noexcept;

    [[nodiscard]] std::optional<JobId> findByDescriptor(const std::filesystem::path& path) const;
    [[nodiscard]] std::size_t activeCount() const noexcept;
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] const ProgressStore& progress() const noexcept { return progress_; }
    [[nodiscard]] const ClientLayout& layout() const noexcept { return layout_; }

    void setFailureNotifier(FailureNotifier notifier);
    void setPhaseListener(PhaseListener listener);

private:
    enum class Disposition : uint8_t {
        Continue,
        Completed,
        Failed,
        Abandoned,
        Cancelled,
        Cooldown
    };

    struct Outcome {
        Disposition disposition = Disposition::Continue;
        FailureClass failure = FailureClass::None;
        std::string message;
    };

    class TrackingScope;

    void launchCaching(const std::shared_ptr<Job>& job);
    void cachingBody(std::shared_ptr<Job> job, std::uint64_t threadId);
    void runDownload(const JobId& id);
    void reapFinished();

    [[nodiscard]] Outcome cachingPhase(Job& job);
    [[nodiscard]] Outcome acquireHandle(Job& job);
    [[nodiscard]] Outcome selectEntries(Job& job);
    [[nodiscard]] Outcome pollUntilCached(Job& job);
    [[nodiscard]] Outcome downloadPhase(Job& job);
    [[nodiscard]] Outcome enterCooldown(Job& job, const std::string& reason);
    void postProcess(Job& job);

    void dispose(const std::shared_ptr<Job>& job, const Outcome& outcome, TrackingScope& scope);
    void conclude(Job& job, const Outcome& outcome) noexcept;
    void discardAborted(Job& job) noexcept;
    [[nodiscard]] bool moveDescriptor(const Job& job, const std::filesystem::path& dir) noexcept;
    void writeFailureNote(const Job& job, const Outcome& outcome) noexcept;
    void notifyFailure(const Job& job, const Outcome& outcome) noexcept;

    void setPhase(Job& job, Phase phase);
    // Parks a job for the pool or a cooldown. False if it was aborted first.
    [[nodiscard]] bool handOff(Job& job, Phase phase);
    void publishPhase(const JobId& id, Phase phase, int retryCount);
    void untrack(const Job& job) noexcept;
    [[nodiscard]] bool sleepFor(std::chrono::milliseconds duration, const CancelToken& cancel) const;

    template <typename Call>
    [[nodiscard]] auto withRateLimit(Job& job, Call call) -> decltype(call());

    ClientLayout layout_;
    Settings settings_;
    std::shared_ptr<RemoteCache> remote_;

    ProgressStore progress_;
    Downloader downloader_;
    PostProcessor postProcessor_;
    Scanner scanner_;
    Pool pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_{false};

    mutable std::mutex registryMutex_;
    std::condition_variable idle_;
    std::unordered_map<JobId, std::shared_ptr<Job>> jobs_;
    std::unordered_map<std::string, JobId> byPath_;

    std::mutex threadsMutex_;
    std::map<std::uint64_t, std::thread> cachingThreads_;
    std::vector<std::uint64_t> finishedThreads_;
    std::uint64_t nextThreadId_ = 0;

    std::mutex hooksMutex_;
    FailureNotifier failureNotifier_;
    PhaseListener phaseListener_;
};

}
