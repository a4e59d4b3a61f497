/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/server.hpp"
#include "debridarr/controller.hpp"
#include "debridarr/extractor.hpp"
#include "debridarr/fetcher.hpp"
#include "debridarr/http.hpp"
#include "debridarr/logger.hpp"
#include "debridarr/notifier.hpp"
#include "debridarr/real_debrid.hpp"
#include <chrono>
#include <fstream>
#include <thread>

namespace debridarr {

// Note: Signal handling is done by the CLI (debridarrd.cpp), not by Server class

Server::Server(Settings settings)
    : settings_(std::move(settings)),
      http_(std::make_shared<HttpClient>()) {
    realDebrid_ = std::make_shared<RealDebridClient>(http_, settings_.apiUrl, settings_.apiToken);
    remote_ = realDebrid_;
    fetcher_ = std::make_shared<CurlFetcher>(http_, settings_.performance().chunkSize);
    extractor_ = std::make_shared<CommandExtractor>();
    if (!settings_.notifyUrl.empty()) {
        notifier_ = std::make_shared<WebhookNotifier>(http_, settings_.notifyUrl);
    }
    LOG_DEBUG("Server created - root: " + settings_.root.string() + ", profile: " + profileName(settings_.profile));
}

Server::Server(Settings settings, std::shared_ptr<RemoteCache> remote,
               std::shared_ptr<Fetcher> fetcher, std::shared_ptr<Extractor> extractor)
    : settings_(std::move(settings)),
      remote_(std::move(remote)),
      fetcher_(std::move(fetcher)),
      extractor_(std::move(extractor)) {
    LOG_DEBUG("Server created with injected services - root: " + settings_.root.string());
}

Server::~Server() {
    shutdown();
}

bool Server::healthCheck() {
    bool healthy = true;

    if (realDebrid_) {
        if (settings_.apiToken.empty()) {
            LOG_ERROR("No API token configured (set DEBRIDARR_API_TOKEN or --token)");
            return false;
        }
        switch (realDebrid_->verifyToken()) {
            case TokenCheck::Valid:
                LOG_INFO("API token verified");
                break;
            case TokenCheck::Invalid:
                LOG_ERROR("API token rejected by " + settings_.apiUrl);
                return false;
            case TokenCheck::Unreachable:
                LOG_WARN("Could not reach " + settings_.apiUrl + " to verify the token, continuing");
                break;
        }
    }

    if (!createWorkspace()) {
        return false;
    }

    for (const auto& layout : settings_.layouts()) {
        auto probe = layout.inbox / ".write-probe";
        {
            std::ofstream out(probe);
            if (!out || !(out << "ok")) {
                LOG_ERROR("Inbox is not writable: " + layout.inbox.string());
                healthy = false;
                continue;
            }
        }
        std::error_code ec;
        std::filesystem::remove(probe, ec);
    }

    return healthy;
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting debridarr server...");

    if (!createWorkspace()) {
        LOG_ERROR("Failed to create workspace");
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("debridarr Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Root: " + settings_.root.string());
    LOG_DEBUG("Profile: " + std::string(profileName(settings_.profile)) + " (" +
              std::to_string(settings_.performance().workers) + " workers, " +
              std::to_string(settings_.performance().chunkSize) + " byte chunks)");
    LOG_DEBUG("Auto extract: " + std::string(settings_.autoExtract ? "on" : "off"));
    LOG_DEBUG("Poll interval: " + std::to_string(settings_.pollInterval.count()) + "ms, dead after " +
              std::to_string(settings_.deadThreshold) + " idle polls");
    LOG_DEBUG("========================================");

    try {
        for (const auto& layout : settings_.layouts()) {
            int removed = recoverStaging(layout.staging);
            if (removed > 0) {
                LOG_INFO("Removed " + std::to_string(removed) + " partial download(s) from " + layout.staging.string());
            }

            auto controller = std::make_unique<Controller>(layout, settings_, remote_, fetcher_, extractor_);
            if (notifier_) {
                auto notifier = notifier_;
                controller->setFailureNotifier([notifier](const FailureReport& report) {
                    (void)notifier->notify(report);
                });
            }
            if (transitionListener_) {
                auto listener = transitionListener_;
                const Controller* owner = controller.get();
                controller->setPhaseListener([listener, owner](const JobId& id, Phase phase) {
                    auto snapshot = owner->progress().get(id);
                    listener(owner->layout().name, snapshot ? snapshot->descriptor : id, phase);
                });
            }
            if (!controller->start()) {
                LOG_ERROR("Failed to start client " + layout.name);
                controllers_.clear();
                return false;
            }
            controllers_.push_back(std::move(controller));
        }

        running_.store(true);
        shutdown_.store(false);

        scannerThread_ = std::thread(&Server::scanLoop, this);

        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        controllers_.clear();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    running_.store(false);

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }

    for (auto& controller : controllers_) {
        controller->stop();
    }
    controllers_.clear();

    LOG_INFO("Server shutdown complete");
}

bool Server::createWorkspace() noexcept {
    try {
        for (const auto& layout : settings_.layouts()) {
            if (!layout.create()) {
                return false;
            }
        }
        LOG_DEBUG("Workspace ready: " + settings_.root.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace: " + std::string(e.what()));
        return false;
    }
}

int Server::recoverStaging(const std::filesystem::path& staging) noexcept {
    int removed = 0;
    try {
        if (!std::filesystem::exists(staging)) {
            return 0;
        }
        for (const auto& entry : std::filesystem::directory_iterator(staging)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".part") {
                continue;
            }
            std::error_code ec;
            if (std::filesystem::remove(entry.path(), ec)) {
                LOG_DEBUG("Removed orphaned partial: " + entry.path().filename().string());
                ++removed;
            } else if (ec) {
                LOG_WARN("Cannot remove orphaned partial " + entry.path().string() + ": " + ec.message());
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering staging " + staging.string() + ": " + std::string(e.what()));
    }
    return removed;
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    const auto scanInterval = settings_.scanInterval;

    while (!shutdown_.load()) {
        try {
            for (auto& controller : controllers_) {
                if (shutdown_.load()) break;
                controller->rescan();
            }

            auto sleepEnd = std::chrono::steady_clock::now() + scanInterval;
            while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }

        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
            std::this_thread::sleep_for(scanInterval);
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
