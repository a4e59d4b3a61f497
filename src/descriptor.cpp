/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/descriptor.hpp"
#include "debridarr/files.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace debridarr {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> magnetParam(const std::string& magnet, const std::string& key) {
    auto query = magnet.find('?');
    if (query == std::string::npos) {
        return std::nullopt;
    }
    std::size_t pos = query + 1;
    while (pos < magnet.size()) {
        auto end = magnet.find('&', pos);
        if (end == std::string::npos) end = magnet.size();
        auto eq = magnet.find('=', pos);
        if (eq != std::string::npos && eq < end &&
            toLowerCopy(magnet.substr(pos, eq - pos)) == key) {
            return magnet.substr(eq + 1, end - eq - 1);
        }
        pos = end + 1;
    }
    return std::nullopt;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '+') {
            out.push_back(' ');
        } else if (value[i] == '%' && i + 2 < value.size() &&
                   hexValue(value[i + 1]) >= 0 && hexValue(value[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(value[i + 1]) * 16 + hexValue(value[i + 2])));
            i += 2;
        } else {
            out.push_back(value[i]);
        }
    }
    return out;
}

std::optional<std::string> base32ToHex(const std::string& encoded) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    unsigned int buffer = 0;
    int bits = 0;
    for (char c : encoded) {
        int v;
        if (c >= 'A' && c <= 'Z') v = c - 'A';
        else if (c >= 'a' && c <= 'z') v = c - 'a';
        else if (c >= '2' && c <= '7') v = c - '2' + 26;
        else return std::nullopt;
        buffer = (buffer << 5) | static_cast<unsigned int>(v);
        bits += 5;
        while (bits >= 4) {
            bits -= 4;
            hex.push_back(digits[(buffer >> bits) & 0xF]);
        }
    }
    return hex;
}
}

std::optional<DescriptorKind> descriptorKind(const std::filesystem::path& path) noexcept {
    try {
        auto ext = toLowerCopy(path.extension().string());
        if (ext == ".magnet") return DescriptorKind::Link;
        if (ext == ".torrent") return DescriptorKind::ContainerFile;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return std::nullopt;
}

PayloadStatus loadPayload(Descriptor& descriptor) noexcept {
    try {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(descriptor.path, ec)) {
            return PayloadStatus::Missing;
        }

        std::ifstream file(descriptor.path, std::ios::binary);
        if (!file) {
            LOG_ERROR("Failed to open descriptor: " + descriptor.path.string());
            return PayloadStatus::IoError;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        if (descriptor.kind == DescriptorKind::Link) {
            content = trim(content);
        }
        if (trim(content).empty()) {
            return PayloadStatus::Empty;
        }

        descriptor.payload = std::move(content);
        return PayloadStatus::Ok;
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading descriptor " + descriptor.path.string() + ": " + e.what());
        return PayloadStatus::IoError;
    }
}

std::optional<std::string> magnetInfoHash(const std::string& magnet) {
    auto xt = magnetParam(magnet, "xt");
    if (!xt) {
        return std::nullopt;
    }
    const std::string prefix = "urn:btih:";
    std::string value = *xt;
    if (toLowerCopy(value.substr(0, prefix.size())) != prefix) {
        return std::nullopt;
    }
    value = value.substr(prefix.size());

    if (value.size() == 40 &&
        std::all_of(value.begin(), value.end(), [](char c) { return hexValue(c) >= 0; })) {
        return toLowerCopy(value);
    }
    if (value.size() == 32) {
        return base32ToHex(value);
    }
    return std::nullopt;
}

std::optional<std::string> magnetDisplayName(const std::string& magnet) {
    auto dn = magnetParam(magnet, "dn");
    if (!dn || dn->empty()) {
        return std::nullopt;
    }
    return percentDecode(*dn);
}

}
