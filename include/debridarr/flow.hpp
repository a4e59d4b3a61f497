/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "debridarr/config.hpp"
#include "debridarr/types.hpp"

namespace debridarr {

struct LedgerEntry {
    std::string name;
    Status status;
    std::uintmax_t size = 0;
    std::chrono::system_clock::time_point timestamp;
};

struct LedgerCounts {
    std::size_t queued = 0;
    std::size_t staging = 0;
    std::size_t done = 0;
    std::size_t failed = 0;
    std::size_t files = 0;
};

// Read and repair view over a client's directory ledger. Works without the
// daemon; everything it reports comes from directory membership.
class Flow {
public:
    explicit Flow(ClientLayout layout) noexcept;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;
    Flow(Flow&&) noexcept = default;
    Flow& operator=(Flow&&) noexcept = default;

    [[nodiscard]] Status status(const std::string& name) const noexcept;
    // Descriptors across inbox, completed and failed, newest first.
    [[nodiscard]] std::vector<LedgerEntry> list(std::size_t max = 50) const noexcept;
    [[nodiscard]] std::vector<LedgerEntry> completedFiles() const noexcept;
    [[nodiscard]] LedgerCounts counts() const noexcept;

    [[nodiscard]] std::optional<std::string> error(const std::string& name) const;

    // Moves a failed or completed descriptor back into the inbox.
    [[nodiscard]] bool retry(const std::string& name, std::string* message = nullptr) const noexcept;
    // Deletes a queued descriptor. A running daemon aborts its job on the next
    // rescan and releases the remote entry.
    [[nodiscard]] bool abort(const std::string& name, std::string* message = nullptr) const noexcept;
    // Deletes a payload file from completed/. Descriptors are refused.
    [[nodiscard]] bool removeFile(const std::string& name, std::string* message = nullptr) const noexcept;
    // Removes staging partials and inbox files that are not descriptors.
    [[nodiscard]] int cleanup() const noexcept;

    [[nodiscard]] const ClientLayout& layout() const noexcept { return layout_; }

private:
    ClientLayout layout_;

    [[nodiscard]] std::filesystem::path notePath(const std::string& name) const;
    [[nodiscard]] static bool isSafeName(const std::string& name) noexcept;
};

}
