/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "debridarr/config.hpp"
#include "debridarr/types.hpp"

namespace debridarr {

class Controller;
class RemoteCache;
class RealDebridClient;
class Fetcher;
class Extractor;
class HttpClient;
class WebhookNotifier;

// Phase change of a job, reported with its client and descriptor file name.
using TransitionListener = std::function<void(const std::string& client, const std::string& descriptor, Phase)>;

// Owns one Controller per configured client and the shared rescan loop.
class Server final {
public:
    explicit Server(Settings settings);
    Server(Settings settings, std::shared_ptr<RemoteCache> remote,
           std::shared_ptr<Fetcher> fetcher, std::shared_ptr<Extractor> extractor);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    // Token check against the remote service and a write probe per inbox.
    [[nodiscard]] bool healthCheck();

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] const Settings& settings() const noexcept { return settings_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Controller>>& controllers() const noexcept { return controllers_; }

    // Applied to every controller created by start().
    void setTransitionListener(TransitionListener listener) { transitionListener_ = std::move(listener); }

    // Removes *.part leftovers from a previous run. Returns the count removed.
    static int recoverStaging(const std::filesystem::path& staging) noexcept;

private:
    [[nodiscard]] bool createWorkspace() noexcept;
    void scanLoop();

    Settings settings_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<RealDebridClient> realDebrid_;
    std::shared_ptr<RemoteCache> remote_;
    std::shared_ptr<Fetcher> fetcher_;
    std::shared_ptr<Extractor> extractor_;
    std::shared_ptr<WebhookNotifier> notifier_;
    TransitionListener transitionListener_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::vector<std::unique_ptr<Controller>> controllers_;
    std::thread scannerThread_;
};

}
