/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/controller.hpp"
#include "debridarr/files.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace {
std::string pathKey(const std::filesystem::path& path) {
    return path.lexically_normal().string();
}

debridarr::RemoteError& errorOf(debridarr::SubmitOutcome& outcome) { return outcome.error; }
debridarr::RemoteError& errorOf(debridarr::ResolvedLink& link) { return link.error; }
debridarr::RemoteError& errorOf(debridarr::RemoteError& error) { return error; }

std::string filenameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Two entries of one job must not share a staging or final path
std::string uniqueName(const std::string& name, std::unordered_set<std::string>& used) {
    if (used.insert(name).second) {
        return name;
    }
    std::filesystem::path p(name);
    for (int n = 2;; ++n) {
        std::string candidate = p.stem().string() + " (" + std::to_string(n) + ")" + p.extension().string();
        if (used.insert(candidate).second) {
            return candidate;
        }
    }
}
}

namespace debridarr {

// Removes a job from every tracking structure when the owning body exits,
// unless ownership was handed on (download pool or cooldown).
class Controller::TrackingScope {
public:
    TrackingScope(Controller& owner, std::shared_ptr<Job> job) : owner_(owner), job_(std::move(job)) {}
    ~TrackingScope() {
        if (!retained_) {
            owner_.untrack(*job_);
        }
    }

    TrackingScope(const TrackingScope&) = delete;
    TrackingScope& operator=(const TrackingScope&) = delete;

    void retain() noexcept { retained_ = true; }

private:
    Controller& owner_;
    std::shared_ptr<Job> job_;
    bool retained_ = false;
};

Controller::Controller(ClientLayout layout, const Settings& settings,
                       std::shared_ptr<RemoteCache> remote,
                       std::shared_ptr<Fetcher> fetcher,
                       std::shared_ptr<Extractor> extractor)
    : layout_(std::move(layout)),
      settings_(settings),
      remote_(std::move(remote)),
      downloader_(std::move(fetcher), progress_, settings.performance().workers),
      postProcessor_(std::move(extractor), settings.autoExtract, settings.minArchiveSize),
      scanner_(layout_.inbox, settings.scanInterval),
      pool_(settings.performance().workers, "Download") {
    LOG_DEBUG("Controller created for client " + layout_.name + " (" +
              std::to_string(settings.performance().workers) + " download workers)");
}

Controller::~Controller() {
    stop();
}

bool Controller::start() {
    if (running_.load()) {
        LOG_WARN("Controller for " + layout_.name + " already running");
        return false;
    }

    if (!layout_.create()) {
        return false;
    }

    stop_.store(false);
    if (!pool_.start([this](const JobId& id, int) { runDownload(id); })) {
        LOG_ERROR("Failed to start download pool for " + layout_.name);
        return false;
    }

    running_.store(true);
    LOG_INFO("Client " + layout_.name + " watching " + layout_.inbox.string());
    return true;
}

void Controller::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping controller for " + layout_.name + "...");
    stop_.store(true);

    pool_.stop();

    std::map<std::uint64_t, std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        threads.swap(cachingThreads_);
    }
    for (auto& [id, thread] : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        finishedThreads_.clear();
    }

    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        if (!jobs_.empty()) {
            LOG_INFO(std::to_string(jobs_.size()) + " unfinished job(s) in " + layout_.name +
                     " will resume from the inbox on next start");
        }
        jobs_.clear();
        byPath_.clear();
        progress_.clear();
    }
    idle_.notify_all();

    LOG_DEBUG("Controller for " + layout_.name + " stopped");
}

SubmitDecision Controller::submit(const Descriptor& descriptor) {
    if (!running_.load() || stop_.load()) {
        LOG_DEBUG("Submit ignored, controller stopped: " + descriptor.name());
        return SubmitDecision::Stopped;
    }

    std::shared_ptr<Job> job;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        const std::string key = pathKey(descriptor.path);
        if (byPath_.count(key) > 0) {
            return SubmitDecision::AlreadyTracked;
        }

        std::error_code ec;
        if (std::filesystem::exists(layout_.completed / descriptor.name(), ec)) {
            std::filesystem::remove(descriptor.path, ec);
            if (ec) {
                LOG_WARN("Could not remove duplicate descriptor " + descriptor.name() + ": " + ec.message());
            }
            LOG_INFO("Already completed, dropping duplicate: " + descriptor.name());
            return SubmitDecision::Duplicate;
        }

        JobId id = makeJobId(descriptor.path, descriptor.detectedAt);
        job = std::make_shared<Job>(id, descriptor, &stop_);
        jobs_[id] = job;
        byPath_[key] = id;

        JobSnapshot snapshot;
        snapshot.id = id;
        snapshot.descriptor = descriptor.name();
        snapshot.detectedAt = descriptor.detectedAt;
        progress_.track(std::move(snapshot));
    }

    LOG_INFO("Job " + job->id + " accepted: " + descriptor.name());

    try {
        launchCaching(job);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot start caching for " + descriptor.name() + ": " + std::string(e.what()));
        untrack(*job);
        return SubmitDecision::Stopped;
    }
    return SubmitDecision::Accepted;
}

void Controller::rescan() {
    if (!running_.load() || stop_.load()) {
        return;
    }

    reapFinished();

    // Deleting a live descriptor from the inbox aborts its job
    std::vector<JobId> orphaned;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        for (const auto& [id, job] : jobs_) {
            if (isTerminal(job->phase) || job->aborted) {
                continue;
            }
            std::error_code ec;
            if (!std::filesystem::exists(job->descriptor.path, ec) && !ec) {
                orphaned.push_back(id);
            }
        }
    }
    for (const auto& id : orphaned) {
        LOG_INFO("Descriptor for job " + id + " left the inbox, aborting");
        (void)abort(id);
    }

    for (const auto& descriptor : scanner_.scan()) {
        if (stop_.load()) {
            return;
        }
        (void)submit(descriptor);
    }

    std::vector<std::shared_ptr<Job>> due;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto& [id, job] : jobs_) {
            if (job->phase == Phase::RetryCooldown && job->cooldownUntil &&
                *job->cooldownUntil <= now && !job->aborted) {
                job->cooldownUntil.reset();
                due.push_back(job);
            }
        }
    }

    for (auto& job : due) {
        LOG_INFO("Cooldown elapsed for " + job->descriptor.name() + ", re-checking cache (attempt " +
                 std::to_string(job->retryCount + 1) + ")");
        try {
            launchCaching(job);
        } catch (const std::exception& e) {
            LOG_ERROR("Cannot resume " + job->descriptor.name() + ": " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(registryMutex_);
            job->cooldownUntil = std::chrono::steady_clock::now();
        }
    }
}

bool Controller::abort(const JobId& id) noexcept {
    try {
        std::shared_ptr<Job> idleJob;
        {
            std::lock_guard<std::mutex> lock(registryMutex_);
            auto it = jobs_.find(id);
            if (it == jobs_.end()) {
                LOG_DEBUG("Abort ignored, no live job " + id);
                return false;
            }
            auto& job = it->second;
            if (isTerminal(job->phase) || job->aborted) {
                return false;
            }
            job->aborted = true;
            job->cancel.cancel();

            // No thread owns a job that waits for a pool slot or a cooldown
            if ((job->phase == Phase::RetryCooldown && job->cooldownUntil) ||
                job->phase == Phase::EnqueuedForDownload) {
                idleJob = job;
            }
        }

        LOG_INFO("Abort requested for job " + id);
        if (idleJob) {
            discardAborted(*idleJob);
            untrack(*idleJob);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Abort of " + id + " failed: " + std::string(e.what()));
        return false;
    }
}

std::optional<JobId> Controller::findByDescriptor(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = byPath_.find(pathKey(path));
    if (it == byPath_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t Controller::activeCount() const noexcept {
    std::lock_guard<std::mutex> lock(registryMutex_);
    return jobs_.size();
}

bool Controller::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(registryMutex_);
    return idle_.wait_for(lock, timeout, [this] { return jobs_.empty(); });
}

void Controller::setFailureNotifier(FailureNotifier notifier) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    failureNotifier_ = std::move(notifier);
}

void Controller::setPhaseListener(PhaseListener listener) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    phaseListener_ = std::move(listener);
}

void Controller::launchCaching(const std::shared_ptr<Job>& job) {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    std::uint64_t threadId = nextThreadId_++;
    cachingThreads_.emplace(threadId, std::thread(&Controller::cachingBody, this, job, threadId));
}

void Controller::reapFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        for (auto threadId : finishedThreads_) {
            auto it = cachingThreads_.find(threadId);
            if (it != cachingThreads_.end()) {
                done.push_back(std::move(it->second));
                cachingThreads_.erase(it);
            }
        }
        finishedThreads_.clear();
    }
    for (auto& thread : done) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void Controller::cachingBody(std::shared_ptr<Job> job, std::uint64_t threadId) {
    setThreadName("Cache-" + job->id.substr(0, 8));

    {
        TrackingScope scope(*this, job);
        Outcome outcome;
        try {
            outcome = cachingPhase(*job);
        } catch (const std::exception& e) {
            LOG_ERROR("Exception caching job " + job->id + ": " + std::string(e.what()));
            outcome = {Disposition::Failed, FailureClass::PermanentReject, e.what()};
        }
        dispose(job, outcome, scope);
    }

    std::lock_guard<std::mutex> lock(threadsMutex_);
    finishedThreads_.push_back(threadId);
}

void Controller::runDownload(const JobId& id) {
    std::shared_ptr<Job> job;
    int retries = 0;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            LOG_DEBUG("Job left the queue before download: " + id);
            return;
        }
        job = it->second;
        if (job->phase != Phase::EnqueuedForDownload) {
            return;
        }
        job->phase = Phase::Downloading;
        retries = job->retryCount;
    }
    publishPhase(job->id, Phase::Downloading, retries);

    TrackingScope scope(*this, job);
    Outcome outcome;
    try {
        outcome = downloadPhase(*job);
    } catch (const std::exception& e) {
        LOG_ERROR("Exception downloading job " + job->id + ": " + std::string(e.what()));
        outcome = {Disposition::Failed, FailureClass::PermanentReject, e.what()};
    }
    dispose(job, outcome, scope);
}

Controller::Outcome Controller::cachingPhase(Job& job) {
    if (!job.cacheHandle.empty()) {
        // Cooldown re-entry keeps the existing remote handle
        return pollUntilCached(job);
    }

    switch (loadPayload(job.descriptor)) {
        case PayloadStatus::Ok:
            break;
        case PayloadStatus::Missing:
            return {Disposition::Abandoned, FailureClass::None, "descriptor disappeared from inbox"};
        case PayloadStatus::Empty:
            return {Disposition::Failed, FailureClass::PermanentReject, "descriptor payload is empty"};
        case PayloadStatus::IoError:
            return {Disposition::Abandoned, FailureClass::None, "descriptor could not be read"};
    }


    Outcome outcome = acquireHandle(job);
    if (outcome.disposition != Disposition::Continue) {
        return outcome;
    }

    outcome = selectEntries(job);
    if (outcome.disposition != Disposition::Continue) {
        return outcome;
    }

    return pollUntilCached(job);
}

Controller::Outcome Controller::acquireHandle(Job& job) {
    setPhase(job, Phase::CheckingExisting);

    auto existing = remote_->findExisting(job.descriptor);
    if (job.cancel.cancelled()) {
        return {Disposition::Cancelled};
    }
    if (existing) {
        job.cacheHandle = *existing;
        setPhase(job, Phase::UsingExisting);
        LOG_INFO("Reusing remote entry " + job.cacheHandle + " for " + job.descriptor.name());
        return {};
    }

    setPhase(job, Phase::Submitting);
    SubmitOutcome submitted = withRateLimit(job, [&] { return remote_->submit(job.descriptor); });
    if (job.cancel.cancelled()) {
        if (submitted.ok()) {
            job.cacheHandle = submitted.handle;
        }
        return {Disposition::Cancelled};
    }

    switch (submitted.error) {
        case RemoteError::None:
            job.cacheHandle = submitted.handle;
            LOG_INFO("Submitted " + job.descriptor.name() + " as remote entry " + job.cacheHandle);
            return {};
        case RemoteError::PermanentReject:
        case RemoteError::HosterUnavailable:
            return {Disposition::Failed, FailureClass::PermanentReject, "submission rejected: " + submitted.message};
        case RemoteError::RateLimited:
        case RemoteError::NetworkError:
            break;
    }
    return {Disposition::Abandoned, FailureClass::NetworkError, "submission failed: " + submitted.message};
}

Controller::Outcome Controller::selectEntries(Job& job) {
    setPhase(job, Phase::SelectingEntries);

    RemoteError error = withRateLimit(job, [&] { return remote_->selectAll(job.cacheHandle); });
    if (job.cancel.cancelled()) {
        return {Disposition::Cancelled};
    }

    switch (error) {
        case RemoteError::None:
            return {};
        case RemoteError::PermanentReject:
        case RemoteError::HosterUnavailable:
            return {Disposition::Failed, FailureClass::PermanentReject, "file selection rejected"};
        case RemoteError::RateLimited:
        case RemoteError::NetworkError:
            break;
    }
    return {Disposition::Abandoned, FailureClass::NetworkError, "file selection failed"};
}

Controller::Outcome Controller::pollUntilCached(Job& job) {
    setPhase(job, Phase::CachingPoll);

    const int threshold = std::max(1, settings_.deadThreshold);
    int zeroSamples = 0;

    while (true) {
        if (job.cancel.cancelled()) {
            return {Disposition::Cancelled};
        }

        CacheStatus status = remote_->pollStatus(job.cacheHandle);

        if (status.error == RemoteError::None) {
            progress_.setCacheProgress(job.id, status.progress);

            if (status.state == CacheState::Cached) {
                if (status.links.empty()) {
                    return {Disposition::Failed, FailureClass::PermanentReject, "cached entry has no links"};
                }
                job.links = std::move(status.links);
                LOG_INFO("Cached " + job.descriptor.name() + " (" + std::to_string(job.links.size()) + " link(s))");
                return {};
            }
            if (status.state == CacheState::Failed) {
                return {Disposition::Failed, FailureClass::PermanentReject, "remote reported " + status.message};
            }

            zeroSamples = status.progress > 0 ? 0 : zeroSamples + 1;
            LOG_TRACE("Poll " + job.id + ": " + status.message + " " + std::to_string(status.progress) + "%");
        } else if (status.error == RemoteError::PermanentReject) {
            return {Disposition::Failed, FailureClass::PermanentReject, "status unavailable: " + status.message};
        } else {
            // Unanswered polls count against liveness
            ++zeroSamples;
            LOG_DEBUG("Poll " + job.id + " failed: " + status.message);
        }

        if (zeroSamples >= threshold) {
            return {Disposition::Failed, FailureClass::DeadJob,
                    "no progress after " + std::to_string(zeroSamples) + " polls"};
        }

        if (!sleepFor(settings_.pollInterval, job.cancel)) {
            return {Disposition::Cancelled};
        }
    }
}

Controller::Outcome Controller::downloadPhase(Job& job) {
    std::vector<FileEntry> entries;
    std::unordered_set<std::string> names;

    for (const auto& link : job.links) {
        if (job.cancel.cancelled()) {
            return {Disposition::Cancelled};
        }

        ResolvedLink resolved = withRateLimit(job, [&] { return remote_->resolve(link); });
        if (job.cancel.cancelled()) {
            return {Disposition::Cancelled};
        }

        FileEntry entry;
        entry.link = link;
        switch (resolved.error) {
            case RemoteError::None: {
                std::string name = resolved.filename.empty() ? filenameFromUrl(resolved.url) : resolved.filename;
                entry.filename = uniqueName(sanitizeFilename(name), names);
                entry.resolvedUrl = resolved.url;
                entry.bytesExpected = resolved.size;
                break;
            }
            case RemoteError::HosterUnavailable:
                return enterCooldown(job, resolved.message);
            case RemoteError::PermanentReject:
                LOG_ERROR("Cannot resolve " + link + ": " + resolved.message);
                entry.filename = uniqueName(sanitizeFilename(filenameFromUrl(link)), names);
                entry.status = FileStatus::Failed;
                break;
            case RemoteError::RateLimited:
            case RemoteError::NetworkError:
                return {Disposition::Abandoned, FailureClass::NetworkError, "link resolution failed: " + resolved.message};
        }
        entries.push_back(std::move(entry));
    }

    job.fileEntries = std::move(entries);

    std::vector<FileProgress> files;
    files.reserve(job.fileEntries.size());
    for (const auto& entry : job.fileEntries) {
        files.push_back(FileProgress{entry.filename, entry.bytesExpected, 0, entry.status});
    }
    progress_.setFiles(job.id, std::move(files));

    switch (downloader_.fetchAll(job.id, job.fileEntries, layout_, job.cancel)) {
        case DownloadOutcome::Completed:
            break;
        case DownloadOutcome::Cancelled:
            return {Disposition::Cancelled};
        case DownloadOutcome::Failed: {
            auto failed = std::count_if(job.fileEntries.begin(), job.fileEntries.end(),
                                        [](const FileEntry& e) { return e.status == FileStatus::Failed; });
            return {Disposition::Failed, FailureClass::TransferFailed,
                    std::to_string(failed) + " of " + std::to_string(job.fileEntries.size()) +
                        " file(s) did not complete"};
        }
    }

    postProcess(job);
    return {Disposition::Completed};
}

Controller::Outcome Controller::enterCooldown(Job& job, const std::string& reason) {
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        attempt = ++job.retryCount;
        if (attempt < std::max(1, settings_.maxRetries)) {
            job.cooldownUntil = std::chrono::steady_clock::now() + settings_.cooldown;
        }
    }

    if (attempt >= std::max(1, settings_.maxRetries)) {
        return {Disposition::Failed, FailureClass::HosterUnavailable,
                "hoster unavailable after " + std::to_string(attempt) + " attempt(s): " + reason};
    }

    LOG_WARN("Hoster unavailable for " + job.descriptor.name() + ", cooling down (attempt " +
             std::to_string(attempt) + " of " + std::to_string(settings_.maxRetries) + ")");
    return {Disposition::Cooldown, FailureClass::HosterUnavailable, reason};
}

void Controller::postProcess(Job& job) {
    setPhase(job, Phase::PostProcess);

    for (std::size_t i = 0; i < job.fileEntries.size(); ++i) {
        auto& entry = job.fileEntries[i];
        if (entry.status != FileStatus::Completed) {
            continue;
        }
        switch (postProcessor_.process(layout_.completed / entry.filename)) {
            case PostProcessResult::Extracted:
                entry.status = FileStatus::Extracted;
                break;
            case PostProcessResult::ExtractionFailed:
                LOG_WARN("Post-processing failed for " + entry.filename + " (" +
                         toString(FailureClass::PostProcessFailure) + "), kept as " +
                         PostProcessor::failedName(entry.filename));
                entry.status = FileStatus::FailedExtraction;
                break;
            case PostProcessResult::Skipped:
            case PostProcessResult::Invalid:
                break;
        }
        progress_.setFileStatus(job.id, i, entry.status);
    }
}

void Controller::dispose(const std::shared_ptr<Job>& job, const Outcome& outcome, TrackingScope& scope) {
    try {
        bool aborted = false;
        {
            std::lock_guard<std::mutex> lock(registryMutex_);
            aborted = job->aborted;
        }
        if (aborted && outcome.disposition != Disposition::Completed) {
            discardAborted(*job);
            return;
        }

        switch (outcome.disposition) {
            case Disposition::Continue:
                if (!handOff(*job, Phase::EnqueuedForDownload)) {
                    discardAborted(*job);
                    return;
                }
                scope.retain();
                pool_.submit(job->id, job->descriptor.detectedAt);
                return;

            case Disposition::Cooldown:
                if (!handOff(*job, Phase::RetryCooldown)) {
                    discardAborted(*job);
                    return;
                }
                scope.retain();
                return;

            case Disposition::Completed:
            case Disposition::Failed:
                conclude(*job, outcome);
                return;

            case Disposition::Abandoned:
                LOG_WARN("Abandoned " + job->descriptor.name() + ": " + outcome.message +
                         " (descriptor stays in inbox)");
                remote_->release(job->cacheHandle);
                return;

            case Disposition::Cancelled:
                LOG_DEBUG("Job " + job->id + " interrupted by shutdown");
                return;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to settle job " + job->id + ": " + std::string(e.what()));
    }
}

void Controller::conclude(Job& job, const Outcome& outcome) noexcept {
    try {
        const bool completed = outcome.disposition == Disposition::Completed;
        setPhase(job, completed ? Phase::Completed : Phase::Failed);

        remote_->release(job.cacheHandle);

        if (completed) {
            if (!moveDescriptor(job, layout_.completed)) {
                LOG_ERROR("Completed job " + job.id + " left its descriptor in the inbox");
            }
            LOG_INFO("JOB COMPLETED: " + job.descriptor.name() + " -> " +
                     std::to_string(job.fileEntries.size()) + " file(s)");
            return;
        }

        writeFailureNote(job, outcome);
        if (!moveDescriptor(job, layout_.failed)) {
            LOG_ERROR("Failed job " + job.id + " left its descriptor in the inbox");
        }
        LOG_WARN("JOB FAILED: " + job.descriptor.name() + " [" + toString(outcome.failure) + "] " + outcome.message);
        notifyFailure(job, outcome);

    } catch (const std::exception& e) {
        LOG_ERROR("Error finalizing job " + job.id + ": " + std::string(e.what()));
    }
}

void Controller::discardAborted(Job& job) noexcept {
    try {
        remote_->release(job.cacheHandle);

        std::error_code ec;
        std::filesystem::remove(job.descriptor.path, ec);
        if (ec) {
            LOG_WARN("Could not delete aborted descriptor " + job.descriptor.name() + ": " + ec.message());
        }

        LOG_INFO("Job " + job.id + " aborted: " + job.descriptor.name());
    } catch (const std::exception& e) {
        LOG_ERROR("Error discarding aborted job " + job.id + ": " + std::string(e.what()));
    }
}

bool Controller::moveDescriptor(const Job& job, const std::filesystem::path& dir) noexcept {
    try {
        const auto target = dir / job.descriptor.name();
        const int attempts = std::max(1, settings_.moveAttempts);
        std::string error;

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            std::error_code ec;
            if (!std::filesystem::exists(job.descriptor.path, ec)) {
                error = "descriptor no longer in inbox";
                break;
            }
            if (moveFile(job.descriptor.path, target, &error)) {
                LOG_DEBUG("Moved " + job.descriptor.name() + " to " + dir.string());
                return true;
            }
            if (attempt < attempts) {
                LOG_DEBUG("Move of " + job.descriptor.name() + " failed (" + error + "), attempt " +
                          std::to_string(attempt) + " of " + std::to_string(attempts));
                std::this_thread::sleep_for(settings_.moveBackoff * attempt);
            }
        }

        LOG_ERROR("Could not move " + job.descriptor.name() + " to " + dir.string() + ": " + error);
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Could not move " + job.descriptor.name() + ": " + std::string(e.what()));
        return false;
    }
}

void Controller::writeFailureNote(const Job& job, const Outcome& outcome) noexcept {
    try {
        auto notePath = layout_.failed / (job.descriptor.name() + ".error.txt");
        std::ofstream note(notePath, std::ios::trunc);
        if (!note) {
            LOG_WARN("Cannot write failure note " + notePath.string());
            return;
        }
        note << "reason: " << toString(outcome.failure) << "\n"
             << "message: " << outcome.message << "\n"
             << "retries: " << job.retryCount << "\n"
             << "job: " << job.id << "\n";
    } catch (const std::exception& e) {
        LOG_WARN("Cannot write failure note for " + job.descriptor.name() + ": " + std::string(e.what()));
    }
}

void Controller::notifyFailure(const Job& job, const Outcome& outcome) noexcept {
    try {
        FailureNotifier notifier;
        {
            std::lock_guard<std::mutex> lock(hooksMutex_);
            notifier = failureNotifier_;
        }
        if (!notifier) {
            return;
        }
        notifier(FailureReport{layout_.name, job.descriptor.name(), outcome.failure, outcome.message});
    } catch (const std::exception& e) {
        LOG_ERROR("Failure notifier threw for " + job.descriptor.name() + ": " + std::string(e.what()));
    }
}

void Controller::setPhase(Job& job, Phase phase) {
    int retries = 0;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        job.phase = phase;
        retries = job.retryCount;
    }
    publishPhase(job.id, phase, retries);
}

bool Controller::handOff(Job& job, Phase phase) {
    int retries = 0;
    {
        // Checked together with the phase change so abort() either sees an
        // idle job it can discard itself, or leaves the discard to the caller.
        std::lock_guard<std::mutex> lock(registryMutex_);
        if (job.aborted) {
            return false;
        }
        job.phase = phase;
        retries = job.retryCount;
    }
    publishPhase(job.id, phase, retries);
    return true;
}

void Controller::publishPhase(const JobId& id, Phase phase, int retryCount) {
    progress_.setPhase(id, phase, retryCount);
    LOG_DEBUG("Job " + id + " -> " + toString(phase));

    PhaseListener listener;
    {
        std::lock_guard<std::mutex> lock(hooksMutex_);
        listener = phaseListener_;
    }
    if (listener) {
        try {
            listener(id, phase);
        } catch (const std::exception& e) {
            LOG_WARN("Phase listener threw: " + std::string(e.what()));
        }
    }
}

void Controller::untrack(const Job& job) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(registryMutex_);
            if (jobs_.erase(job.id) > 0) {
                byPath_.erase(pathKey(job.descriptor.path));
                progress_.remove(job.id);
            }
        }
        idle_.notify_all();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to untrack job " + job.id + ": " + std::string(e.what()));
    }
}

bool Controller::sleepFor(std::chrono::milliseconds duration, const CancelToken& cancel) const {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    const auto slice = std::chrono::milliseconds(50);

    while (!cancel.cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), slice));
    }
    return false;
}

template <typename Call>
auto Controller::withRateLimit(Job& job, Call call) -> decltype(call()) {
    auto result = call();
    if (errorOf(result) != RemoteError::RateLimited) {
        return result;
    }

    LOG_WARN("Rate limited on " + job.descriptor.name() + ", retrying in " +
             std::to_string(settings_.rateLimitBackoff.count()) + "ms");
    if (!sleepFor(settings_.rateLimitBackoff, job.cancel)) {
        return result;
    }

    result = call();
    if (errorOf(result) == RemoteError::RateLimited) {
        errorOf(result) = RemoteError::NetworkError;
    }
    return result;
}

}
