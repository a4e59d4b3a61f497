/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

namespace debridarr {

// Rename, falling back to copy + remove when source and destination
// live on different filesystems. An existing destination is replaced.
[[nodiscard]] bool moveFile(const std::filesystem::path& from, const std::filesystem::path& to,
                            std::string* error = nullptr) noexcept;

// Reduce a remote-supplied name to a single safe path component.
[[nodiscard]] std::string sanitizeFilename(const std::string& name);

[[nodiscard]] std::string trim(const std::string& value);

[[nodiscard]] std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time);

}
