/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace debridarr {

enum class Profile : uint8_t { Low, Balanced, High };

// A performance tier fixes both the download worker count and the
// network read-chunk size.
struct ProfileSpec {
    int workers;
    std::size_t chunkSize;
};

[[nodiscard]] ProfileSpec profileSpec(Profile profile) noexcept;
[[nodiscard]] std::optional<Profile> parseProfile(const std::string& name) noexcept;
[[nodiscard]] const char* profileName(Profile profile) noexcept;

// Directory set of one download client. Directory membership is the job ledger.
struct ClientLayout {
    std::string name;
    std::filesystem::path inbox;
    std::filesystem::path staging;
    std::filesystem::path completed;
    std::filesystem::path failed;

    // <root>/<name>/{inbox,staging,completed,failed}
    // Throws std::invalid_argument for names that are empty or contain a path separator.
    [[nodiscard]] static ClientLayout under(const std::filesystem::path& root, const std::string& name);

    [[nodiscard]] bool create() const noexcept;
};

struct Settings {
    std::string apiToken;
    std::string apiUrl = "https://api.real-debrid.com/rest/1.0";
    std::filesystem::path root = "content";
    std::vector<std::string> clients{"sonarr", "radarr"};

    Profile profile = Profile::Balanced;
    bool autoExtract = true;
    std::uintmax_t minArchiveSize = 1024;

    std::chrono::milliseconds pollInterval{10'000};
    int deadThreshold = 60;
    int maxRetries = 3;
    std::chrono::milliseconds cooldown{300'000};
    std::chrono::milliseconds rateLimitBackoff{5'000};
    std::chrono::milliseconds scanInterval{5'000};
    int moveAttempts = 5;
    std::chrono::milliseconds moveBackoff{500};

    std::string notifyUrl;
    std::filesystem::path logFile;

    // Defaults overridden by DEBRIDARR_* environment variables.
    [[nodiscard]] static Settings fromEnv();

    [[nodiscard]] ProfileSpec performance() const noexcept { return profileSpec(profile); }
    [[nodiscard]] std::vector<ClientLayout> layouts() const;
};

}
