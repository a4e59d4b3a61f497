/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "debridarr/config.hpp"

namespace debridarr {

enum class SubmissionError : uint8_t {
    None = 0,
    IoError,
    InvalidSize,
    InvalidContent,
    AlreadyQueued,
    WorkspaceError
};

struct SubmitResult {
    bool ok = false;
    std::string name;  // descriptor file name placed in the inbox
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Drops descriptors into a client inbox. Files are written under a hidden
// name and renamed into place so the scanner never sees a partial write.
class Work final {
public:
    explicit Work(ClientLayout layout, bool createIfMissing = true);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;
    Work(Work&&) noexcept = default;
    Work& operator=(Work&&) noexcept = default;

    [[nodiscard]] SubmitResult submitLink(const std::string& link);
    [[nodiscard]] SubmitResult submitContainer(const std::filesystem::path& source);

    void setMaxSize(std::size_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::size_t maxSize() const noexcept { return maxBytes_; }

    // Inbox file name for a link: display name, else info-hash, else generated.
    [[nodiscard]] static std::string nameForLink(const std::string& link);

private:
    ClientLayout layout_;
    std::size_t maxBytes_ = 10'000'000; // 10MB

    [[nodiscard]] static std::string generateId();
    [[nodiscard]] SubmitResult publish(const std::string& name, const std::string& content) const;
};

}
