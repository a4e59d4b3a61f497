/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/notifier.hpp"
#include "debridarr/logger.hpp"
#include <json/json.h>

namespace debridarr {

WebhookNotifier::WebhookNotifier(std::shared_ptr<HttpClient> http, std::string url)
    : http_(std::move(http)), url_(std::move(url)) {
}

std::string WebhookNotifier::renderBody(const FailureReport& report) {
    Json::Value body(Json::objectValue);
    body["client"] = report.client;
    body["descriptor"] = report.descriptor;
    body["reason"] = toString(report.failure);
    body["message"] = report.message;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

bool WebhookNotifier::notify(const FailureReport& report) {
    if (url_.empty()) {
        return false;
    }

    HttpResponse response = http_->post(url_, renderBody(report), "application/json");
    if (!response.success()) {
        LOG_WARN("Failure notification for " + report.descriptor + " not delivered: " +
                 (response.error.empty() ? "HTTP " + std::to_string(response.status) : response.error));
        return false;
    }

    LOG_DEBUG("Failure notification sent for " + report.descriptor);
    return true;
}

}
