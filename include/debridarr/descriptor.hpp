/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "debridarr/types.hpp"

namespace debridarr {

// A magnet link or .torrent file found in an inbox. The source path is its
// identity and the dedup key; the payload is loaded lazily by the job body.
struct Descriptor {
    std::filesystem::path path;
    DescriptorKind kind = DescriptorKind::Link;
    std::string payload;
    std::chrono::system_clock::time_point detectedAt;

    [[nodiscard]] std::string name() const { return path.filename().string(); }
};

enum class PayloadStatus : uint8_t { Ok, Missing, Empty, IoError };

// Kind by extension (.magnet / .torrent, case-insensitive), nullopt otherwise.
[[nodiscard]] std::optional<DescriptorKind> descriptorKind(const std::filesystem::path& path) noexcept;

// Reads the payload into descriptor.payload. Link payloads are trimmed;
// container payloads are kept byte-for-byte.
[[nodiscard]] PayloadStatus loadPayload(Descriptor& descriptor) noexcept;

// Lowercase hex info-hash from a magnet's xt=urn:btih: parameter. Base32
// hashes are converted to hex.
[[nodiscard]] std::optional<std::string> magnetInfoHash(const std::string& magnet);

// Decoded dn= parameter of a magnet, if any.
[[nodiscard]] std::optional<std::string> magnetDisplayName(const std::string& magnet);

}
