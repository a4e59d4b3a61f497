/*
 * debridarr - Daemon (debridarrd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/controller.hpp"
#include "debridarr/logger.hpp"
#include "debridarr/server.hpp"
#include <chrono>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unistd.h>

using namespace debridarr;

constexpr const char* VERSION = "0.1.0";

static std::mutex g_output_mutex;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

void printUsage(const char* progName) {
    std::cout << "debridarr daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --root <dir>           Content root (default: ./content)\n";
    std::cout << "  --token <token>        Real-Debrid API token\n";
    std::cout << "  --client <name>        Download client directory set (repeatable)\n";
    std::cout << "  --profile <tier>       low | balanced | high\n";
    std::cout << "  --no-extract           Leave archives as downloaded\n";
    std::cout << "  --notify-url <url>     POST a JSON report for every failed job\n";
    std::cout << "  --log-file <path>      Also append log lines to a file\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  DEBRIDARR_API_TOKEN, DEBRIDARR_ROOT, DEBRIDARR_CLIENTS, DEBRIDARR_PROFILE,\n";
    std::cout << "  DEBRIDARR_AUTO_EXTRACT, DEBRIDARR_POLL_INTERVAL_MS, DEBRIDARR_DEAD_THRESHOLD,\n";
    std::cout << "  DEBRIDARR_MAX_RETRIES, DEBRIDARR_COOLDOWN_MS, DEBRIDARR_SCAN_INTERVAL_MS,\n";
    std::cout << "  DEBRIDARR_NOTIFY_URL, DEBRIDARR_LOG_FILE, DEBRIDARR_LOG_LEVEL\n\n";
    std::cout << "Layout per client:\n";
    std::cout << "  <root>/<client>/inbox       drop .magnet / .torrent files here\n";
    std::cout << "  <root>/<client>/completed   downloaded files and finished descriptors\n";
    std::cout << "  <root>/<client>/failed      failed descriptors with .error.txt notes\n";
}

// One console line per job transition worth showing.
void announce(const std::string& client, const std::string& descriptor, Phase phase) {
    const char* color = nullptr;
    const char* word = nullptr;
    switch (phase) {
        case Phase::CachingPoll: color = "\033[33m"; word = "caching"; break;
        case Phase::Downloading: color = "\033[36m"; word = "downloading"; break;
        case Phase::RetryCooldown: color = "\033[33m"; word = "cooldown"; break;
        case Phase::Completed: color = "\033[32m"; word = "done"; break;
        case Phase::Failed: color = "\033[31m"; word = "failed"; break;
        default: return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "  " << color << std::left << std::setw(12) << word << "\033[0m"
              << "\033[90m" << std::setw(10) << client << "\033[0m " << descriptor << std::endl;
}

void logProgress(const Server& server) {
    for (const auto& controller : server.controllers()) {
        for (const auto& snapshot : controller->progress().list()) {
            LOG_INFO("[" + controller->layout().name + "] " + snapshot.descriptor + ": " +
                     snapshot.label() + " (" + std::to_string(snapshot.progress()) + "% overall)");
        }
    }
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();

    Settings settings;
    try {
        settings = Settings::fromEnv();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    bool clientsFromFlags = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--root") {
            auto v = value("--root");
            if (!v) return 1;
            settings.root = *v;
        } else if (arg == "--token") {
            auto v = value("--token");
            if (!v) return 1;
            settings.apiToken = *v;
        } else if (arg == "--client") {
            auto v = value("--client");
            if (!v) return 1;
            if (!clientsFromFlags) {
                settings.clients.clear();
                clientsFromFlags = true;
            }
            settings.clients.push_back(*v);
        } else if (arg == "--profile") {
            auto v = value("--profile");
            if (!v) return 1;
            auto profile = parseProfile(*v);
            if (!profile) {
                std::cerr << "Error: Unknown profile '" << *v << "' (low, balanced, high)\n";
                return 1;
            }
            settings.profile = *profile;
        } else if (arg == "--no-extract") {
            settings.autoExtract = false;
        } else if (arg == "--notify-url") {
            auto v = value("--notify-url");
            if (!v) return 1;
            settings.notifyUrl = *v;
        } else if (arg == "--log-file") {
            auto v = value("--log-file");
            if (!v) return 1;
            settings.logFile = *v;
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    if (!settings.logFile.empty() && !Logger::setLogFile(settings.logFile)) {
        std::cerr << "Error: Cannot open log file " << settings.logFile << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::filesystem::path pidPath = settings.root / ".debridarrd.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid) && *pid != getpid()) {
        std::cerr << "Error: debridarrd already running (pid " << *pid << ")\n";
        return 1;
    }

    std::cout << "\n";
    std::cout << "  \033[1mdebridarr\033[0m " << VERSION << "                     \033[90mcache · fetch · extract\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";

    try {
        auto server = std::make_unique<Server>(settings);
        server->setTransitionListener(announce);

        if (!server->healthCheck()) {
            std::cout << "  \033[31mHealth check failed\033[0m\n";
            return 1;
        }

        if (!server->start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        std::unique_lock<std::mutex> output(g_output_mutex);
        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Root       " << settings.root.string() << "\n";
        std::cout << "    Profile    " << profileName(settings.profile) << " ("
                  << settings.performance().workers << " workers)\n";
        std::cout << "    Clients    ";
        for (std::size_t i = 0; i < settings.clients.size(); ++i) {
            std::cout << (i ? ", " : "") << settings.clients[i];
        }
        std::cout << "\n";
        std::cout << "    Extract    " << (settings.autoExtract ? "on" : "off") << "\n";
        std::cout << "\n";
        std::cout << "  Submit:  ./dbr-add <client> \"magnet:?xt=...\"\n";
        std::cout << "  Status:  ./dbr-flow <client> counts\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n";
        output.unlock();

        const auto progressInterval = std::chrono::seconds(30);
        auto nextProgress = std::chrono::steady_clock::now() + progressInterval;

        while (!g_shutdown_requested && server->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (std::chrono::steady_clock::now() >= nextProgress) {
                logProgress(*server);
                nextProgress = std::chrono::steady_clock::now() + progressInterval;
            }
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server->shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("debridarr daemon stopped");
    return 0;
}
