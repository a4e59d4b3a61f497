/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <memory>
#include <string>

#include "debridarr/http.hpp"
#include "debridarr/types.hpp"

namespace debridarr {

struct FailureReport {
    std::string client;
    std::string descriptor;
    FailureClass failure = FailureClass::None;
    std::string message;
};

// Invoked once per permanently failed job. Exceptions are caught by the caller.
using FailureNotifier = std::function<void(const FailureReport&)>;

// POSTs {client, descriptor, reason, message} as JSON to a fixed URL.
class WebhookNotifier final {
public:
    WebhookNotifier(std::shared_ptr<HttpClient> http, std::string url);

    bool notify(const FailureReport& report);

    [[nodiscard]] static std::string renderBody(const FailureReport& report);

private:
    std::shared_ptr<HttpClient> http_;
    std::string url_;
};

}
