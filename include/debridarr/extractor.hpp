/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace debridarr {

enum class ArchiveType : uint8_t {
    None,
    Zip,
    Rar,
    SevenZip,
    Tar,
    TarGzip,
    TarBzip2,
    TarXz,
    Gzip,
    Bzip2,
    Xz
};

[[nodiscard]] ArchiveType archiveTypeFor(const std::filesystem::path& path) noexcept;
[[nodiscard]] const char* toString(ArchiveType type) noexcept;

// True when the leading bytes match the magic of the claimed type.
[[nodiscard]] bool hasArchiveSignature(const std::filesystem::path& path, ArchiveType type) noexcept;

class Extractor {
public:
    virtual ~Extractor() = default;
    [[nodiscard]] virtual bool extract(const std::filesystem::path& archive, ArchiveType type,
                                       const std::filesystem::path& destination, std::string& error) = 0;
};

// Dispatches to the system archive tools (unzip, unrar, 7z, tar, gzip,
// bzip2, xz). Single-stream compressors write to <destination>/<stem>.
class CommandExtractor final : public Extractor {
public:
    struct Command {
        std::vector<std::string> argv;
        std::filesystem::path stdoutTo;  // empty unless the tool writes to stdout
    };

    [[nodiscard]] bool extract(const std::filesystem::path& archive, ArchiveType type,
                               const std::filesystem::path& destination, std::string& error) override;

    [[nodiscard]] static Command commandFor(const std::filesystem::path& archive, ArchiveType type,
                                            const std::filesystem::path& destination);

private:
    [[nodiscard]] static bool run(const Command& command, std::string& error);
};

enum class PostProcessResult : uint8_t { Skipped, Invalid, Extracted, ExtractionFailed };

[[nodiscard]] const char* toString(PostProcessResult result) noexcept;

// Best-effort archive handling for a completed payload file. Never throws.
class PostProcessor final {
public:
    PostProcessor(std::shared_ptr<Extractor> extractor, bool enabled, std::uintmax_t minSize);

    [[nodiscard]] PostProcessResult process(const std::filesystem::path& file) noexcept;

    [[nodiscard]] static std::string failedName(const std::filesystem::path& file);

private:
    std::shared_ptr<Extractor> extractor_;
    bool enabled_;
    std::uintmax_t minSize_;
};

}
