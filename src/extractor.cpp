/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/extractor.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string lowerName(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() > suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string& data, const char* magic, std::size_t len, std::size_t offset = 0) {
    return data.size() >= offset + len && std::memcmp(data.data() + offset, magic, len) == 0;
}

// Strip the compression suffix: movie.mkv.gz -> movie.mkv
std::string streamOutputName(const std::filesystem::path& archive) {
    return archive.stem().string();
}

}

namespace debridarr {

ArchiveType archiveTypeFor(const std::filesystem::path& path) noexcept {
    try {
        const std::string name = lowerName(path);
        if (endsWith(name, ".tar.gz") || endsWith(name, ".tgz")) return ArchiveType::TarGzip;
        if (endsWith(name, ".tar.bz2") || endsWith(name, ".tbz2") || endsWith(name, ".tbz")) return ArchiveType::TarBzip2;
        if (endsWith(name, ".tar.xz") || endsWith(name, ".txz")) return ArchiveType::TarXz;
        if (endsWith(name, ".tar")) return ArchiveType::Tar;
        if (endsWith(name, ".zip")) return ArchiveType::Zip;
        if (endsWith(name, ".rar")) return ArchiveType::Rar;
        if (endsWith(name, ".7z")) return ArchiveType::SevenZip;
        if (endsWith(name, ".gz")) return ArchiveType::Gzip;
        if (endsWith(name, ".bz2")) return ArchiveType::Bzip2;
        if (endsWith(name, ".xz")) return ArchiveType::Xz;
    } catch (const std::exception&) {
        return ArchiveType::None;
    }
    return ArchiveType::None;
}

const char* toString(ArchiveType type) noexcept {
    switch (type) {
        case ArchiveType::None: return "none";
        case ArchiveType::Zip: return "zip";
        case ArchiveType::Rar: return "rar";
        case ArchiveType::SevenZip: return "7z";
        case ArchiveType::Tar: return "tar";
        case ArchiveType::TarGzip: return "tar.gz";
        case ArchiveType::TarBzip2: return "tar.bz2";
        case ArchiveType::TarXz: return "tar.xz";
        case ArchiveType::Gzip: return "gz";
        case ArchiveType::Bzip2: return "bz2";
        case ArchiveType::Xz: return "xz";
    }
    return "unknown";
}

bool hasArchiveSignature(const std::filesystem::path& path, ArchiveType type) noexcept {
    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return false;
        }
        std::string head(512, '\0');
        in.read(head.data(), static_cast<std::streamsize>(head.size()));
        head.resize(static_cast<std::size_t>(in.gcount()));

        switch (type) {
            case ArchiveType::Zip:
                return startsWith(head, "PK\x03\x04", 4);
            case ArchiveType::Rar:
                return startsWith(head, "Rar!\x1A\x07", 6);
            case ArchiveType::SevenZip:
                return startsWith(head, "7z\xBC\xAF\x27\x1C", 6);
            case ArchiveType::Tar:
                return startsWith(head, "ustar", 5, 257);
            case ArchiveType::TarGzip:
            case ArchiveType::Gzip:
                return startsWith(head, "\x1F\x8B", 2);
            case ArchiveType::TarBzip2:
            case ArchiveType::Bzip2:
                return startsWith(head, "BZh", 3);
            case ArchiveType::TarXz:
            case ArchiveType::Xz:
                return startsWith(head, "\xFD" "7zXZ\x00", 6);
            case ArchiveType::None:
                return false;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Signature check failed for " + path.string() + ": " + e.what());
    }
    return false;
}

bool CommandExtractor::extract(const std::filesystem::path& archive, ArchiveType type,
                               const std::filesystem::path& destination, std::string& error) {
    Command command = commandFor(archive, type, destination);
    if (command.argv.empty()) {
        error = std::string("no extractor for ") + toString(type);
        return false;
    }

    LOG_DEBUG("Extracting " + archive.filename().string() + " with " + command.argv.front());
    if (run(command, error)) {
        return true;
    }
    if (!command.stdoutTo.empty()) {
        std::error_code ec;
        std::filesystem::remove(command.stdoutTo, ec);
    }
    return false;
}

CommandExtractor::Command CommandExtractor::commandFor(const std::filesystem::path& archive, ArchiveType type,
                                                       const std::filesystem::path& destination) {
    const std::string src = archive.string();
    const std::string dest = destination.string();
    Command command;

    switch (type) {
        case ArchiveType::Zip:
            command.argv = {"unzip", "-o", "-q", src, "-d", dest};
            break;
        case ArchiveType::Rar:
            command.argv = {"unrar", "x", "-o+", "-idq", src, dest + "/"};
            break;
        case ArchiveType::SevenZip:
            command.argv = {"7z", "x", "-y", "-o" + dest, src};
            break;
        case ArchiveType::Tar:
            command.argv = {"tar", "-xf", src, "-C", dest};
            break;
        case ArchiveType::TarGzip:
            command.argv = {"tar", "-xzf", src, "-C", dest};
            break;
        case ArchiveType::TarBzip2:
            command.argv = {"tar", "-xjf", src, "-C", dest};
            break;
        case ArchiveType::TarXz:
            command.argv = {"tar", "-xJf", src, "-C", dest};
            break;
        case ArchiveType::Gzip:
            command.argv = {"gzip", "-dc", src};
            command.stdoutTo = destination / streamOutputName(archive);
            break;
        case ArchiveType::Bzip2:
            command.argv = {"bzip2", "-dc", src};
            command.stdoutTo = destination / streamOutputName(archive);
            break;
        case ArchiveType::Xz:
            command.argv = {"xz", "-dc", src};
            command.stdoutTo = destination / streamOutputName(archive);
            break;
        case ArchiveType::None:
            break;
    }
    return command;
}

bool CommandExtractor::run(const Command& command, std::string& error) {
    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const char* outPath = command.stdoutTo.empty() ? "/dev/null" : command.stdoutTo.c_str();
    int outFlags = command.stdoutTo.empty() ? O_WRONLY : (O_WRONLY | O_CREAT | O_TRUNC);
    int outFd = ::open(outPath, outFlags | O_CLOEXEC, 0644);
    if (outFd < 0) {
        error = "cannot open " + std::string(outPath) + ": " + std::strerror(errno);
        return false;
    }
    int nullFd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (nullFd < 0) {
        error = std::string("cannot open /dev/null: ") + std::strerror(errno);
        ::close(outFd);
        return false;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        ::close(outFd);
        ::close(nullFd);
        return false;
    }

    if (pid == 0) {
        // Only async-signal-safe calls until exec
        ::dup2(nullFd, STDIN_FILENO);
        ::dup2(outFd, STDOUT_FILENO);
        ::dup2(nullFd, STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(outFd);
    ::close(nullFd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            error = std::string("waitpid failed: ") + std::strerror(errno);
            return false;
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            return true;
        }
        error = code == 127 ? command.argv.front() + " not available"
                            : command.argv.front() + " exited with status " + std::to_string(code);
        return false;
    }
    if (WIFSIGNALED(status)) {
        error = command.argv.front() + " killed by signal " + std::to_string(WTERMSIG(status));
        return false;
    }
    error = command.argv.front() + " terminated abnormally";
    return false;
}

const char* toString(PostProcessResult result) noexcept {
    switch (result) {
        case PostProcessResult::Skipped: return "skipped";
        case PostProcessResult::Invalid: return "invalid";
        case PostProcessResult::Extracted: return "extracted";
        case PostProcessResult::ExtractionFailed: return "extraction failed";
    }
    return "unknown";
}

PostProcessor::PostProcessor(std::shared_ptr<Extractor> extractor, bool enabled, std::uintmax_t minSize)
    : extractor_(std::move(extractor)), enabled_(enabled), minSize_(minSize) {
}

std::string PostProcessor::failedName(const std::filesystem::path& file) {
    return "FAILED_EXTRACT_" + file.filename().string();
}

PostProcessResult PostProcessor::process(const std::filesystem::path& file) noexcept {
    try {
        if (!enabled_ || !extractor_) {
            return PostProcessResult::Skipped;
        }

        ArchiveType type = archiveTypeFor(file);
        if (type == ArchiveType::None) {
            return PostProcessResult::Skipped;
        }

        std::error_code ec;
        auto size = std::filesystem::file_size(file, ec);
        if (ec || size < minSize_) {
            LOG_INFO("Not extracting " + file.filename().string() + ": below minimum archive size");
            return PostProcessResult::Invalid;
        }
        if (!hasArchiveSignature(file, type)) {
            LOG_WARN("Not extracting " + file.filename().string() + ": header does not match " + toString(type));
            return PostProcessResult::Invalid;
        }

        std::string error;
        if (extractor_->extract(file, type, file.parent_path(), error)) {
            std::filesystem::remove(file, ec);
            if (ec) {
                LOG_WARN("Extracted but could not delete " + file.filename().string() + ": " + ec.message());
            }
            LOG_INFO("Extracted " + file.filename().string());
            return PostProcessResult::Extracted;
        }

        LOG_ERROR("Extraction of " + file.filename().string() + " failed: " + error);
        std::filesystem::rename(file, file.parent_path() / failedName(file), ec);
        if (ec) {
            LOG_WARN("Could not mark failed archive " + file.filename().string() + ": " + ec.message());
        }
        return PostProcessResult::ExtractionFailed;

    } catch (const std::exception& e) {
        LOG_ERROR("Post-processing " + file.filename().string() + " failed: " + std::string(e.what()));
        return PostProcessResult::ExtractionFailed;
    }
}

}
