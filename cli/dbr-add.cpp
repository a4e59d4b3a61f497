/*
 * debridarr - Descriptor submission tool (dbr-add)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/logger.hpp"
#include "debridarr/work.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <unistd.h>

using namespace debridarr;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "debridarr Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--root <dir>] <client> <magnet-link | file.torrent>\n";
    std::cout << "       " << progName << " [--root <dir>] <client> -     (read magnet link from stdin)\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  client        Download client name (e.g. sonarr, radarr)\n";
    std::cout << "  magnet-link   magnet:?xt=urn:btih:... link\n";
    std::cout << "  file.torrent  Torrent file, copied into the inbox\n\n";
    std::cout << "Options:\n";
    std::cout << "  --root <dir>    Content root (default: $DEBRIDARR_ROOT or ./content)\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " sonarr \"magnet:?xt=urn:btih:...&dn=Show.S01E01\"\n";
    std::cout << "  " << progName << " radarr ./Movie.2024.torrent\n";
    std::cout << "  pbpaste | " << progName << " radarr -\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; DEBRIDARR_LOG_LEVEL overrides
    if (!std::getenv("DEBRIDARR_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    std::filesystem::path root = Settings::fromEnv().root;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
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

    std::string client = positional[0];
    std::string target;
    if (positional.size() >= 2 && positional[1] != "-") {
        target = positional[1];
    } else if (!isatty(fileno(stdin))) {
        target.assign((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }

    if (target.empty()) {
        std::cerr << "Error: No magnet link or torrent file provided\n";
        return 1;
    }

    try {
        Work work(ClientLayout::under(root, client), true);

        SubmitResult result;
        if (target.rfind("magnet:", 0) == 0 || target.find("magnet:?") != std::string::npos) {
            result = work.submitLink(target);
        } else {
            result = work.submitContainer(target);
        }

        if (result.ok) {
            // Just the descriptor name - clean for piping
            std::cout << result.name << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
