/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/work.hpp"
#include "debridarr/descriptor.hpp"
#include "debridarr/files.hpp"
#include "debridarr/logger.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

namespace debridarr {

Work::Work(ClientLayout layout, bool createIfMissing)
    : layout_(std::move(layout)) {
    if (createIfMissing && !layout_.create()) {
        LOG_ERROR("Failed to initialize inbox: " + layout_.inbox.string());
    }
}

SubmitResult Work::submitLink(const std::string& link) {
    std::string value = trim(link);
    if (value.empty()) {
        LOG_DEBUG("Invalid link: empty");
        return {false, "", SubmissionError::InvalidContent, "Link is empty"};
    }
    if (value.rfind("magnet:?", 0) != 0) {
        return {false, "", SubmissionError::InvalidContent, "Not a magnet link"};
    }
    if (value.size() > maxBytes_) {
        return {false, "", SubmissionError::InvalidSize,
                "Link exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    return publish(nameForLink(value) + ".magnet", value);
}

SubmitResult Work::submitContainer(const std::filesystem::path& source) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return {false, "", SubmissionError::InvalidContent, "File not found: " + source.string()};
    }
    if (descriptorKind(source) != DescriptorKind::ContainerFile) {
        return {false, "", SubmissionError::InvalidContent, "Not a .torrent file: " + source.string()};
    }

    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        return {false, "", SubmissionError::IoError, "Failed to read file size: " + source.string()};
    }
    if (size == 0) {
        return {false, "", SubmissionError::InvalidContent, "File is empty: " + source.string()};
    }
    if (size > maxBytes_) {
        return {false, "", SubmissionError::InvalidSize,
                "File exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)"};
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return {false, "", SubmissionError::IoError, "Failed to open " + source.string()};
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    return publish(sanitizeFilename(source.filename().string()), content);
}

std::string Work::nameForLink(const std::string& link) {
    if (auto display = magnetDisplayName(link)) {
        std::string name = sanitizeFilename(*display);
        if (name != "download") {
            return name;
        }
    }
    if (auto hash = magnetInfoHash(link)) {
        return *hash;
    }
    return generateId();
}

std::string Work::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

SubmitResult Work::publish(const std::string& name, const std::string& content) const {
    const auto finalPath = layout_.inbox / name;
    const auto tempPath = layout_.inbox / ("." + name + ".tmp");

    std::error_code ec;
    if (!std::filesystem::is_directory(layout_.inbox, ec)) {
        return {false, "", SubmissionError::WorkspaceError, "Inbox does not exist: " + layout_.inbox.string()};
    }
    if (std::filesystem::exists(finalPath, ec)) {
        return {false, name, SubmissionError::AlreadyQueued, "Already queued: " + name};
    }

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return {false, "", SubmissionError::IoError, "Failed to write " + tempPath.string()};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tempPath, ec);
            return {false, "", SubmissionError::IoError, "Failed to write " + tempPath.string()};
        }
    }

    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        LOG_ERROR("Failed to publish " + name + ": " + ec.message());
        std::error_code cleanupEc;
        std::filesystem::remove(tempPath, cleanupEc);
        return {false, "", SubmissionError::IoError, "Failed to publish " + name};
    }

    LOG_INFO("Descriptor queued: " + finalPath.string());
    return {true, name, SubmissionError::None, ""};
}

}
