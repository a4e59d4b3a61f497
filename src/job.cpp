/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/job.hpp"
#include <iomanip>
#include <sstream>

namespace debridarr {

JobId makeJobId(const std::filesystem::path& source, std::chrono::system_clock::time_point detectedAt) {
    // FNV-1a 64 over the normalized path followed by the detection tick count
    std::uint64_t hash = 14695981039346656037ull;
    auto mix = [&hash](const std::string& bytes) {
        for (unsigned char c : bytes) {
            hash ^= c;
            hash *= 1099511628211ull;
        }
    };

    mix(source.lexically_normal().string());
    mix("@" + std::to_string(detectedAt.time_since_epoch().count()));

    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

}
