/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/fetcher.hpp"
#include "debridarr/logger.hpp"

namespace debridarr {

CurlFetcher::CurlFetcher(std::shared_ptr<HttpClient> http, std::size_t chunkSize)
    : http_(std::move(http)), chunkSize_(chunkSize) {
}

FetchResult CurlFetcher::fetch(const std::string& url, const ChunkSink& sink) {
    FetchResult result;
    HttpResponse response = http_->stream(url, sink, chunkSize_);
    result.httpStatus = response.status;

    if (response.cancelled) {
        result.status = FetchStatus::Cancelled;
        return result;
    }
    if (!response.transportOk()) {
        result.error = response.error;
        return result;
    }
    if (response.status < 200 || response.status >= 300) {
        result.error = "HTTP " + std::to_string(response.status);
        return result;
    }

    result.status = FetchStatus::Ok;
    return result;
}

}
