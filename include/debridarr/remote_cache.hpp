/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "debridarr/descriptor.hpp"

namespace debridarr {

enum class RemoteError : uint8_t {
    None,
    PermanentReject,
    RateLimited,
    NetworkError,
    HosterUnavailable
};

enum class CacheState : uint8_t { Pending, Downloading, Cached, Failed };

struct SubmitOutcome {
    RemoteError error = RemoteError::None;
    std::string handle;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return error == RemoteError::None; }
};

struct CacheStatus {
    RemoteError error = RemoteError::None;
    CacheState state = CacheState::Pending;
    int progress = 0;
    std::vector<std::string> links;
    std::string message;
};

struct ResolvedLink {
    RemoteError error = RemoteError::None;
    std::string url;
    std::string filename;
    std::uint64_t size = 0;
    std::string message;

    [[nodiscard]] bool ok() const noexcept { return error == RemoteError::None; }
};

// Remote caching service. Implementations must be safe to call from
// several job threads at once.
class RemoteCache {
public:
    virtual ~RemoteCache() = default;

    // Handle of an entry already known to the service for this payload.
    [[nodiscard]] virtual std::optional<std::string> findExisting(const Descriptor& descriptor) = 0;
    [[nodiscard]] virtual SubmitOutcome submit(const Descriptor& descriptor) = 0;
    [[nodiscard]] virtual RemoteError selectAll(const std::string& handle) = 0;
    [[nodiscard]] virtual CacheStatus pollStatus(const std::string& handle) = 0;
    [[nodiscard]] virtual ResolvedLink resolve(const std::string& link) = 0;
    // Best effort; failures are logged by the implementation.
    virtual void release(const std::string& handle) noexcept = 0;
};

[[nodiscard]] const char* toString(RemoteError error) noexcept;

}
