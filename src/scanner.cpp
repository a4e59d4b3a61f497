/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/scanner.hpp"
#include "debridarr/files.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>

namespace debridarr {

Scanner::Scanner(const std::filesystem::path& inbox, std::chrono::milliseconds emptyGrace) noexcept
    : inbox_(inbox), emptyGrace_(emptyGrace) {
}

std::vector<Descriptor> Scanner::scan() const noexcept {
    std::vector<Descriptor> found;

    try {
        if (!std::filesystem::exists(inbox_)) {
            LOG_DEBUG("Inbox does not exist: " + inbox_.string());
            return found;
        }

        for (const auto& entry : std::filesystem::directory_iterator(inbox_)) {
            if (!ready(entry)) {
                continue;
            }
            auto kind = descriptorKind(entry.path());
            if (!kind) {
                continue;
            }

            Descriptor d;
            d.path = entry.path();
            d.kind = *kind;
            d.detectedAt = toSystemTime(entry.last_write_time());
            found.push_back(std::move(d));
            LOG_TRACE("Found descriptor: " + entry.path().filename().string());
        }

        std::sort(found.begin(), found.end(), [](const Descriptor& a, const Descriptor& b) {
            return a.detectedAt != b.detectedAt ? a.detectedAt < b.detectedAt : a.path < b.path;
        });

        if (!found.empty()) {
            LOG_TRACE("Scanner found " + std::to_string(found.size()) + " descriptor(s) in " + inbox_.string());
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }

    return found;
}

std::size_t Scanner::pendingCount() const noexcept {
    std::size_t count = 0;

    try {
        if (!std::filesystem::exists(inbox_)) {
            return 0;
        }

        for (const auto& entry : std::filesystem::directory_iterator(inbox_)) {
            if (ready(entry)) {
                ++count;
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Inbox count interrupted: " + std::string(e.what()));
    }

    return count;
}

bool Scanner::isDescriptorFile(const std::filesystem::directory_entry& entry) noexcept {
    try {
        if (!entry.is_regular_file()) {
            return false;
        }

        // Hidden files are in-flight writes from the submission tool
        auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            return false;
        }

        return descriptorKind(entry.path()).has_value();
    } catch (const std::exception&) {
        return false;
    }
}

bool Scanner::ready(const std::filesystem::directory_entry& entry) const noexcept {
    try {
        if (!isDescriptorFile(entry)) {
            return false;
        }
        if (entry.file_size() > 0) {
            return true;
        }

        // Writers that create then fill get picked up on the next pass
        auto age = std::filesystem::file_time_type::clock::now() - entry.last_write_time();
        if (age < emptyGrace_) {
            LOG_DEBUG("Skipping empty descriptor: " + entry.path().filename().string());
            return false;
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}
