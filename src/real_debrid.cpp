/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/real_debrid.hpp"
#include "debridarr/logger.hpp"
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace {

bool parseJson(const std::string& body, Json::Value& root, std::string* errors = nullptr) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    bool ok = reader->parse(body.data(), body.data() + body.size(), &root, &errs);
    if (!ok && errors != nullptr) {
        *errors = errs;
    }
    return ok;
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string describe(const debridarr::HttpResponse& response) {
    if (!response.error.empty()) {
        return response.error;
    }
    Json::Value root;
    if (parseJson(response.body, root) && root.isObject() && root.isMember("error")) {
        return "HTTP " + std::to_string(response.status) + ": " + root["error"].asString();
    }
    return "HTTP " + std::to_string(response.status);
}

}

namespace debridarr {

RealDebridClient::RealDebridClient(std::shared_ptr<HttpClient> http, std::string apiUrl, std::string token)
    : http_(std::move(http)), apiUrl_(std::move(apiUrl)), token_(std::move(token)) {
    while (!apiUrl_.empty() && apiUrl_.back() == '/') {
        apiUrl_.pop_back();
    }
}

HttpHeaders RealDebridClient::authHeaders() const {
    return {"Authorization: Bearer " + token_};
}

std::string RealDebridClient::endpoint(const std::string& path) const {
    return apiUrl_ + path;
}

std::optional<std::string> RealDebridClient::findExisting(const Descriptor& descriptor) {
    // Container payloads are opaque, so only links can be matched by hash
    if (descriptor.kind != DescriptorKind::Link) {
        return std::nullopt;
    }
    auto hash = magnetInfoHash(descriptor.payload);
    if (!hash) {
        return std::nullopt;
    }

    HttpResponse response = http_->get(endpoint("/torrents?limit=100"), authHeaders());
    if (!response.success()) {
        LOG_DEBUG("Torrent list unavailable: " + describe(response));
        return std::nullopt;
    }

    Json::Value root;
    if (!parseJson(response.body, root) || !root.isArray()) {
        return std::nullopt;
    }

    for (const auto& item : root) {
        if (lower(item.get("hash", "").asString()) != *hash) {
            continue;
        }
        if (mapState(item.get("status", "").asString()) == CacheState::Failed) {
            continue;
        }
        std::string id = item.get("id", "").asString();
        if (!id.empty()) {
            LOG_DEBUG("Existing torrent " + id + " matches " + descriptor.name());
            return id;
        }
    }
    return std::nullopt;
}

SubmitOutcome RealDebridClient::submit(const Descriptor& descriptor) {
    SubmitOutcome outcome;
    HttpResponse response;

    if (descriptor.kind == DescriptorKind::Link) {
        response = http_->postForm(endpoint("/torrents/addMagnet"), {{"magnet", descriptor.payload}}, authHeaders());
    } else {
        response = http_->put(endpoint("/torrents/addTorrent"), descriptor.payload, authHeaders());
    }

    outcome.error = classify(response);
    if (outcome.error != RemoteError::None) {
        outcome.message = describe(response);
        return outcome;
    }

    outcome.handle = parseHandle(response.body);
    if (outcome.handle.empty()) {
        outcome.error = RemoteError::PermanentReject;
        outcome.message = "response carried no torrent id";
    }
    return outcome;
}

RemoteError RealDebridClient::selectAll(const std::string& handle) {
    HttpResponse response = http_->postForm(endpoint("/torrents/selectFiles/" + handle),
                                            {{"files", "all"}}, authHeaders());
    RemoteError error = classify(response);
    if (error != RemoteError::None) {
        LOG_DEBUG("selectFiles " + handle + " failed: " + describe(response));
    }
    return error;
}

CacheStatus RealDebridClient::pollStatus(const std::string& handle) {
    HttpResponse response = http_->get(endpoint("/torrents/info/" + handle), authHeaders());
    RemoteError error = classify(response);
    if (error != RemoteError::None) {
        CacheStatus status;
        status.error = error;
        status.message = describe(response);
        return status;
    }
    return parseStatus(response.body);
}

ResolvedLink RealDebridClient::resolve(const std::string& link) {
    HttpResponse response = http_->postForm(endpoint("/unrestrict/link"), {{"link", link}}, authHeaders());
    if (!response.transportOk()) {
        ResolvedLink resolved;
        resolved.error = RemoteError::NetworkError;
        resolved.message = response.error;
        return resolved;
    }
    return parseResolved(response.status, response.body);
}

void RealDebridClient::release(const std::string& handle) noexcept {
    if (handle.empty()) {
        return;
    }
    try {
        HttpResponse response = http_->del(endpoint("/torrents/delete/" + handle), authHeaders());
        if (!response.success()) {
            LOG_WARN("Failed to release torrent " + handle + ": " + describe(response));
        } else {
            LOG_DEBUG("Released torrent " + handle);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to release torrent " + handle + ": " + std::string(e.what()));
    }
}

TokenCheck RealDebridClient::verifyToken() {
    HttpResponse response = http_->get(endpoint("/user"), authHeaders());
    if (!response.transportOk() || response.status >= 500) {
        return TokenCheck::Unreachable;
    }
    if (response.status == 401 || response.status == 403) {
        return TokenCheck::Invalid;
    }
    return response.success() ? TokenCheck::Valid : TokenCheck::Unreachable;
}

RemoteError RealDebridClient::classify(const HttpResponse& response) noexcept {
    if (!response.transportOk()) {
        return RemoteError::NetworkError;
    }
    if (response.status >= 200 && response.status < 300) {
        return RemoteError::None;
    }
    if (response.status == 429) {
        return RemoteError::RateLimited;
    }
    if (response.status >= 400 && response.status < 500) {
        return RemoteError::PermanentReject;
    }
    return RemoteError::NetworkError;
}

CacheState RealDebridClient::mapState(const std::string& status) noexcept {
    if (status == "downloaded") {
        return CacheState::Cached;
    }
    if (status == "magnet_error" || status == "error" || status == "virus" || status == "dead") {
        return CacheState::Failed;
    }
    if (status == "downloading" || status == "compressing" || status == "uploading") {
        return CacheState::Downloading;
    }
    return CacheState::Pending;
}

CacheStatus RealDebridClient::parseStatus(const std::string& body) {
    CacheStatus status;
    Json::Value root;
    std::string errors;
    if (!parseJson(body, root, &errors) || !root.isObject()) {
        status.error = RemoteError::NetworkError;
        status.message = "malformed torrent info: " + errors;
        return status;
    }

    std::string state = root.get("status", "").asString();
    status.state = mapState(state);
    status.message = state;

    const Json::Value& progress = root["progress"];
    if (progress.isNumeric()) {
        status.progress = std::clamp(static_cast<int>(progress.asDouble()), 0, 100);
    }
    if (status.state == CacheState::Cached) {
        status.progress = 100;
    }

    const Json::Value& links = root["links"];
    if (links.isArray()) {
        for (const auto& link : links) {
            if (link.isString() && !link.asString().empty()) {
                status.links.push_back(link.asString());
            }
        }
    }
    return status;
}

ResolvedLink RealDebridClient::parseResolved(long httpStatus, const std::string& body) {
    ResolvedLink resolved;
    Json::Value root;
    bool parsed = parseJson(body, root) && root.isObject();

    if (httpStatus < 200 || httpStatus >= 300) {
        std::string error = parsed ? root.get("error", "").asString() : "";
        int code = parsed ? root.get("error_code", Json::Value(0)).asInt() : 0;

        if (httpStatus == 503 || error == "hoster_unavailable" || code == 19) {
            resolved.error = RemoteError::HosterUnavailable;
        } else if (httpStatus == 429) {
            resolved.error = RemoteError::RateLimited;
        } else if (httpStatus >= 400 && httpStatus < 500) {
            resolved.error = RemoteError::PermanentReject;
        } else {
            resolved.error = RemoteError::NetworkError;
        }
        resolved.message = "HTTP " + std::to_string(httpStatus) + (error.empty() ? "" : ": " + error);
        return resolved;
    }

    if (!parsed) {
        resolved.error = RemoteError::NetworkError;
        resolved.message = "malformed unrestrict response";
        return resolved;
    }

    resolved.url = root.get("download", "").asString();
    resolved.filename = root.get("filename", "").asString();
    const Json::Value& size = root["filesize"];
    if (size.isNumeric()) {
        resolved.size = size.asUInt64();
    }
    if (resolved.url.empty()) {
        resolved.error = RemoteError::PermanentReject;
        resolved.message = "unrestrict response carried no download url";
    }
    return resolved;
}

std::string RealDebridClient::parseHandle(const std::string& body) {
    Json::Value root;
    if (!parseJson(body, root) || !root.isObject()) {
        return {};
    }
    return root.get("id", "").asString();
}

const char* toString(RemoteError error) noexcept {
    switch (error) {
        case RemoteError::None: return "none";
        case RemoteError::PermanentReject: return "permanent reject";
        case RemoteError::RateLimited: return "rate limited";
        case RemoteError::NetworkError: return "network error";
        case RemoteError::HosterUnavailable: return "hoster unavailable";
    }
    return "unknown";
}

}
