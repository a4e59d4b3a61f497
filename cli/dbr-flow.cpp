/*
 * debridarr - Ledger inspection tool (dbr-flow)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/flow.hpp"
#include "debridarr/logger.hpp"
#include <cerrno>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

using namespace debridarr;

void printUsage(const char* progName) {
    std::cout << "debridarr Ledger Tool\n\n";
    std::cout << "Usage: " << progName << " [--root <dir>] <client> [command] [name]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  list            Descriptors in inbox, completed and failed (default)\n";
    std::cout << "  counts          Per-directory counts\n";
    std::cout << "  files           Downloaded files in completed/\n";
    std::cout << "  error <name>    Failure note of a failed descriptor\n";
    std::cout << "  retry <name>    Move a failed or completed descriptor back to the inbox\n";
    std::cout << "  abort <name>    Drop a queued descriptor; the daemon cancels its job\n";
    std::cout << "  delete <name>   Delete a downloaded file\n";
    std::cout << "  cleanup         Remove partial downloads and stray inbox files\n";
    std::cout << "                  (refused while debridarrd is running)\n\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0 success, 1 error, 2 not found\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " sonarr\n";
    std::cout << "  " << progName << " radarr retry Movie.2024.magnet\n";
}

bool daemonRunning(const std::filesystem::path& root) {
    std::ifstream file(root / ".debridarrd.pid");
    long pid = 0;
    if (!file || !(file >> pid) || pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::string humanSize(std::uintmax_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return ss.str();
}

const char* statusColor(Status status) {
    switch (status) {
        case Status::Queued: return "\033[33m";
        case Status::Done: return "\033[32m";
        case Status::Failed: return "\033[31m";
        default: return "\033[90m";
    }
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    std::filesystem::path root = Settings::fromEnv().root;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--root") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --root requires a directory\n";
                return 1;
            }
            root = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = positional.size() >= 2 ? positional[1] : "list";
    const std::string name = positional.size() >= 3 ? positional[2] : "";

    auto requireName = [&]() {
        if (name.empty()) {
            std::cerr << "Error: " << command << " requires a descriptor or file name\n";
            return false;
        }
        return true;
    };

    try {
        Flow flow(ClientLayout::under(root, positional[0]));

        if (command == "list") {
            auto entries = flow.list();
            if (entries.empty()) {
                std::cerr << "No descriptors found" << std::endl;
                return 2;
            }
            for (const auto& entry : entries) {
                std::cout << statusColor(entry.status) << std::left << std::setw(8) << toString(entry.status)
                          << "\033[0m " << entry.name << "\n";
            }
            return 0;
        }

        if (command == "counts") {
            auto c = flow.counts();
            std::cout << "queued   " << c.queued << "\n"
                      << "done     " << c.done << "\n"
                      << "failed   " << c.failed << "\n"
                      << "files    " << c.files << "\n"
                      << "partial  " << c.staging << "\n";
            return 0;
        }

        if (command == "files") {
            for (const auto& file : flow.completedFiles()) {
                std::cout << std::right << std::setw(10) << humanSize(file.size) << "  " << file.name << "\n";
            }
            return 0;
        }

        if (command == "error") {
            if (!requireName()) return 1;
            auto note = flow.error(name);
            if (!note) {
                std::cerr << "No failure note for " << name << " (status: " << toString(flow.status(name)) << ")\n";
                return 2;
            }
            std::cout << *note;
            return 0;
        }

        if (command == "retry") {
            if (!requireName()) return 1;
            std::string message;
            if (!flow.retry(name, &message)) {
                std::cerr << "Error: " << message << std::endl;
                return flow.status(name) == Status::Missing ? 2 : 1;
            }
            std::cout << name << std::endl;
            return 0;
        }

        if (command == "abort") {
            if (!requireName()) return 1;
            std::string message;
            if (!flow.abort(name, &message)) {
                std::cerr << "Error: " << message << std::endl;
                return flow.status(name) == Status::Missing ? 2 : 1;
            }
            std::cout << name << std::endl;
            return 0;
        }

        if (command == "delete") {
            if (!requireName()) return 1;
            std::string message;
            if (!flow.removeFile(name, &message)) {
                std::cerr << "Error: " << message << std::endl;
                return 1;
            }
            return 0;
        }

        if (command == "cleanup") {
            if (daemonRunning(root)) {
                std::cerr << "Error: debridarrd is running; stop it before cleanup\n";
                return 1;
            }
            std::cout << "Removed " << flow.cleanup() << " file(s)" << std::endl;
            return 0;
        }

        std::cerr << "Error: Unknown command: " << command << "\n";
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
