/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "debridarr/http.hpp"

namespace debridarr {

enum class FetchStatus : uint8_t { Ok, Cancelled, Failed };

struct FetchResult {
    FetchStatus status = FetchStatus::Failed;
    long httpStatus = 0;
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return status == FetchStatus::Ok; }
};

// Streams one resolved URL into a sink. The sink returning false is a
// cancellation, reported as FetchStatus::Cancelled.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    [[nodiscard]] virtual FetchResult fetch(const std::string& url, const ChunkSink& sink) = 0;
};

class CurlFetcher final : public Fetcher {
public:
    CurlFetcher(std::shared_ptr<HttpClient> http, std::size_t chunkSize);

    [[nodiscard]] FetchResult fetch(const std::string& url, const ChunkSink& sink) override;
    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

private:
    std::shared_ptr<HttpClient> http_;
    std::size_t chunkSize_;
};

}
