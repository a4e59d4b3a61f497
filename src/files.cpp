/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/files.hpp"
#include <system_error>

namespace debridarr {

bool moveFile(const std::filesystem::path& from, const std::filesystem::path& to,
              std::string* error) noexcept {
    try {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (!ec) {
            return true;
        }
        if (ec != std::errc::cross_device_link) {
            if (error) *error = ec.message();
            return false;
        }

        std::error_code copyEc;
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, copyEc);
        if (copyEc) {
            if (error) *error = copyEc.message();
            std::filesystem::remove(to, copyEc);
            return false;
        }
        std::filesystem::remove(from, copyEc);
        if (copyEc) {
            if (error) *error = "copied but could not remove source: " + copyEc.message();
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

std::string sanitizeFilename(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == ':' || uc < 0x20) {
            result.push_back('_');
        } else {
            result.push_back(c);
        }
    }
    result = trim(result);
    while (!result.empty() && result.front() == '.') {
        result.erase(result.begin());
    }
    if (result.empty()) {
        result = "download";
    }
    return result;
}

std::string trim(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    auto begin = value.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(ws);
    return value.substr(begin, end - begin + 1);
}

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type time) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

}
