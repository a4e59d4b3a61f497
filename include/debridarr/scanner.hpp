/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <vector>

#include "debridarr/descriptor.hpp"

namespace debridarr {

// Periodic-rescan watch layer over one inbox directory.
class Scanner {
public:
    // Zero-byte descriptors are held back until they are older than emptyGrace,
    // then reported so the job fails on its empty payload.
    explicit Scanner(const std::filesystem::path& inbox,
                     std::chrono::milliseconds emptyGrace = std::chrono::seconds(5)) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Descriptors ordered by detection time, oldest first. Payloads are not loaded.
    [[nodiscard]] std::vector<Descriptor> scan() const noexcept;
    [[nodiscard]] std::size_t pendingCount() const noexcept;

    [[nodiscard]] static bool isDescriptorFile(const std::filesystem::directory_entry& entry) noexcept;

private:
    [[nodiscard]] bool ready(const std::filesystem::directory_entry& entry) const noexcept;

    std::filesystem::path inbox_;
    std::chrono::milliseconds emptyGrace_;
};

}
