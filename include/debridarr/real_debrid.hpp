/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>

#include "debridarr/http.hpp"
#include "debridarr/remote_cache.hpp"

namespace debridarr {

enum class TokenCheck : uint8_t { Valid, Invalid, Unreachable };

// Real-Debrid REST client (https://api.real-debrid.com/rest/1.0).
class RealDebridClient final : public RemoteCache {
public:
    RealDebridClient(std::shared_ptr<HttpClient> http, std::string apiUrl, std::string token);

    RealDebridClient(const RealDebridClient&) = delete;
    RealDebridClient& operator=(const RealDebridClient&) = delete;

    [[nodiscard]] std::optional<std::string> findExisting(const Descriptor& descriptor) override;
    [[nodiscard]] SubmitOutcome submit(const Descriptor& descriptor) override;
    [[nodiscard]] RemoteError selectAll(const std::string& handle) override;
    [[nodiscard]] CacheStatus pollStatus(const std::string& handle) override;
    [[nodiscard]] ResolvedLink resolve(const std::string& link) override;
    void release(const std::string& handle) noexcept override;

    // GET /user; 401 means the token is wrong.
    [[nodiscard]] TokenCheck verifyToken();

    // Response parsing, exposed for tests.
    [[nodiscard]] static RemoteError classify(const HttpResponse& response) noexcept;
    [[nodiscard]] static CacheState mapState(const std::string& status) noexcept;
    [[nodiscard]] static CacheStatus parseStatus(const std::string& body);
    [[nodiscard]] static ResolvedLink parseResolved(long httpStatus, const std::string& body);
    [[nodiscard]] static std::string parseHandle(const std::string& body);

private:
    [[nodiscard]] HttpHeaders authHeaders() const;
    [[nodiscard]] std::string endpoint(const std::string& path) const;

    std::shared_ptr<HttpClient> http_;
    std::string apiUrl_;
    std::string token_;
};

}
