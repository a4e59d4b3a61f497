/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/config.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace debridarr {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> env_string(const char* name) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return std::nullopt;
    }
    return std::string(val);
}

long long env_number(const char* name, long long defv) {
    auto val = env_string(name);
    if (!val) {
        return defv;
    }
    try {
        long long parsed = std::stoll(*val);
        return parsed < 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + *val);
        return defv;
    }
}

std::chrono::milliseconds env_millis(const char* name, std::chrono::milliseconds defv) {
    return std::chrono::milliseconds(env_number(name, defv.count()));
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            items.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return items;
}
}

ProfileSpec profileSpec(Profile profile) noexcept {
    switch (profile) {
        case Profile::Low: return {2, 8 * 1024};
        case Profile::High: return {8, 1024 * 1024};
        case Profile::Balanced:
        default: return {4, 64 * 1024};
    }
}

std::optional<Profile> parseProfile(const std::string& name) noexcept {
    try {
        std::string key = toLowerCopy(name);
        if (key == "low") return Profile::Low;
        if (key == "balanced") return Profile::Balanced;
        if (key == "high") return Profile::High;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

const char* profileName(Profile profile) noexcept {
    switch (profile) {
        case Profile::Low: return "low";
        case Profile::High: return "high";
        case Profile::Balanced:
        default: return "balanced";
    }
}

ClientLayout ClientLayout::under(const std::filesystem::path& root, const std::string& name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        throw std::invalid_argument("Invalid client name: '" + name + "'");
    }
    auto base = root / name;
    return ClientLayout{name, base / "inbox", base / "staging", base / "completed", base / "failed"};
}

bool ClientLayout::create() const noexcept {
    try {
        std::filesystem::create_directories(inbox);
        std::filesystem::create_directories(staging);
        std::filesystem::create_directories(completed);
        std::filesystem::create_directories(failed);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create directories for client " + name + ": " + e.what());
        return false;
    }
}

Settings Settings::fromEnv() {
    Settings s;

    if (auto token = env_string("DEBRIDARR_API_TOKEN")) s.apiToken = *token;
    if (auto url = env_string("DEBRIDARR_API_URL")) s.apiUrl = *url;
    if (auto root = env_string("DEBRIDARR_ROOT")) s.root = *root;
    if (auto clients = env_string("DEBRIDARR_CLIENTS")) s.clients = splitList(*clients);
    if (auto profile = env_string("DEBRIDARR_PROFILE")) {
        if (auto parsed = parseProfile(*profile)) {
            s.profile = *parsed;
        } else {
            LOG_WARN("Unknown DEBRIDARR_PROFILE '" + *profile + "', using " + profileName(s.profile));
        }
    }
    if (auto extract = env_string("DEBRIDARR_AUTO_EXTRACT")) {
        auto v = toLowerCopy(*extract);
        s.autoExtract = !(v == "0" || v == "false" || v == "no" || v == "off");
    }
    if (auto url = env_string("DEBRIDARR_NOTIFY_URL")) s.notifyUrl = *url;
    if (auto file = env_string("DEBRIDARR_LOG_FILE")) s.logFile = *file;

    s.minArchiveSize = static_cast<std::uintmax_t>(
        env_number("DEBRIDARR_MIN_ARCHIVE_SIZE", static_cast<long long>(s.minArchiveSize)));
    s.pollInterval = env_millis("DEBRIDARR_POLL_INTERVAL_MS", s.pollInterval);
    s.deadThreshold = static_cast<int>(env_number("DEBRIDARR_DEAD_THRESHOLD", s.deadThreshold));
    s.maxRetries = static_cast<int>(env_number("DEBRIDARR_MAX_RETRIES", s.maxRetries));
    s.cooldown = env_millis("DEBRIDARR_COOLDOWN_MS", s.cooldown);
    s.scanInterval = env_millis("DEBRIDARR_SCAN_INTERVAL_MS", s.scanInterval);

    return s;
}

std::vector<ClientLayout> Settings::layouts() const {
    std::vector<ClientLayout> result;
    result.reserve(clients.size());
    for (const auto& client : clients) {
        result.push_back(ClientLayout::under(root, client));
    }
    return result;
}

}
