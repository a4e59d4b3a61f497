/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/flow.hpp"
#include "debridarr/descriptor.hpp"
#include "debridarr/files.hpp"
#include "debridarr/logger.hpp"
#include <algorithm>
#include <fstream>

namespace debridarr {

namespace {
LedgerEntry entryFor(const std::filesystem::directory_entry& entry, Status status) {
    std::error_code ec;
    LedgerEntry result{entry.path().filename().string(), status, 0, {}};
    result.size = entry.file_size(ec);
    if (ec) {
        result.size = 0;
    }
    auto mtime = entry.last_write_time(ec);
    result.timestamp = ec ? std::chrono::system_clock::now() : toSystemTime(mtime);
    return result;
}

bool isDescriptor(const std::filesystem::directory_entry& entry) {
    auto name = entry.path().filename().string();
    return entry.is_regular_file() && !name.empty() && name.front() != '.' &&
           descriptorKind(entry.path()).has_value();
}
}

Flow::Flow(ClientLayout layout) noexcept
    : layout_(std::move(layout)) {
    LOG_DEBUG("Flow created for client: " + layout_.name);
}

Status Flow::status(const std::string& name) const noexcept {
    try {
        if (!isSafeName(name)) {
            return Status::Missing;
        }
        // Check in order of completion states
        if (std::filesystem::exists(layout_.completed / name)) {
            return Status::Done;
        }
        if (std::filesystem::exists(layout_.failed / name)) {
            return Status::Failed;
        }
        if (std::filesystem::exists(layout_.inbox / name)) {
            return Status::Queued;
        }
        return Status::Missing;

    } catch (const std::exception&) {
        return Status::Missing;
    }
}

std::vector<LedgerEntry> Flow::list(std::size_t max) const noexcept {
    std::vector<LedgerEntry> entries;
    try {
        const std::pair<std::filesystem::path, Status> dirs[] = {
            {layout_.inbox, Status::Queued},
            {layout_.completed, Status::Done},
            {layout_.failed, Status::Failed},
        };
        for (const auto& [dir, status] : dirs) {
            if (!std::filesystem::exists(dir)) {
                continue;
            }
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (isDescriptor(entry)) {
                    entries.push_back(entryFor(entry, status));
                }
            }
        }

        // Newest first
        std::sort(entries.begin(), entries.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
            return a.timestamp > b.timestamp;
        });

        if (entries.size() > max) {
            entries.resize(max);
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Error listing descriptors: " + std::string(e.what()));
    }

    return entries;
}

std::vector<LedgerEntry> Flow::completedFiles() const noexcept {
    std::vector<LedgerEntry> files;
    try {
        if (!std::filesystem::exists(layout_.completed)) {
            return files;
        }
        for (const auto& entry : std::filesystem::directory_iterator(layout_.completed)) {
            if (isDescriptor(entry)) {
                continue;
            }
            files.push_back(entryFor(entry, Status::Done));
        }
        std::sort(files.begin(), files.end(), [](const LedgerEntry& a, const LedgerEntry& b) {
            return a.name < b.name;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing completed files: " + std::string(e.what()));
    }
    return files;
}

LedgerCounts Flow::counts() const noexcept {
    LedgerCounts counts;
    try {
        auto tally = [](const std::filesystem::path& dir, auto&& accept) {
            std::size_t n = 0;
            if (!std::filesystem::exists(dir)) {
                return n;
            }
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (accept(entry)) ++n;
            }
            return n;
        };

        counts.queued = tally(layout_.inbox, isDescriptor);
        counts.done = tally(layout_.completed, isDescriptor);
        counts.failed = tally(layout_.failed, isDescriptor);
        counts.files = tally(layout_.completed, [](const std::filesystem::directory_entry& e) {
            return !isDescriptor(e);
        });
        counts.staging = tally(layout_.staging, [](const std::filesystem::directory_entry& e) {
            return e.path().extension() == ".part";
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Error counting ledger: " + std::string(e.what()));
    }
    return counts;
}

std::optional<std::string> Flow::error(const std::string& name) const {
    try {
        if (!isSafeName(name)) {
            return std::nullopt;
        }
        auto errorFile = notePath(name);
        if (!std::filesystem::exists(errorFile)) {
            return std::nullopt;
        }

        std::ifstream file(errorFile);
        std::string content, line;
        while (std::getline(file, line)) {
            content += line + "\n";
        }
        return content;

    } catch (const std::exception& e) {
        LOG_ERROR("Error reading failure note for " + name + ": " + e.what());
        return std::nullopt;
    }
}

bool Flow::retry(const std::string& name, std::string* message) const noexcept {
    try {
        auto fail = [message](const std::string& text) {
            if (message) *message = text;
            return false;
        };

        if (!isSafeName(name)) {
            return fail("Invalid name: " + name);
        }

        std::filesystem::path source;
        switch (status(name)) {
            case Status::Done:
                source = layout_.completed / name;
                break;
            case Status::Failed:
                source = layout_.failed / name;
                break;
            case Status::Queued:
                return fail("Already queued: " + name);
            case Status::Missing:
                return fail("Not found: " + name);
        }

        std::string error;
        if (!moveFile(source, layout_.inbox / name, &error)) {
            return fail("Cannot move " + name + " to inbox: " + error);
        }

        std::error_code ec;
        std::filesystem::remove(notePath(name), ec);
        LOG_INFO("Requeued " + name);
        return true;

    } catch (const std::exception& e) {
        if (message) *message = e.what();
        return false;
    }
}

bool Flow::abort(const std::string& name, std::string* message) const noexcept {
    try {
        auto fail = [message](const std::string& text) {
            if (message) *message = text;
            return false;
        };

        if (!isSafeName(name) || !descriptorKind(name)) {
            return fail("Invalid descriptor name: " + name);
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(layout_.inbox / name, ec)) {
            return fail("Not queued: " + name);
        }
        if (!std::filesystem::remove(layout_.inbox / name, ec)) {
            return fail("Cannot delete " + name + ": " + (ec ? ec.message() : "already gone"));
        }
        LOG_INFO("Aborted " + name);
        return true;

    } catch (const std::exception& e) {
        if (message) *message = e.what();
        return false;
    }
}

bool Flow::removeFile(const std::string& name, std::string* message) const noexcept {
    try {
        auto fail = [message](const std::string& text) {
            if (message) *message = text;
            return false;
        };

        if (!isSafeName(name)) {
            return fail("Invalid name: " + name);
        }
        auto path = layout_.completed / name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return fail("Not found: " + name);
        }
        if (descriptorKind(path)) {
            return fail("Refusing to delete descriptor " + name + "; use retry instead");
        }
        if (!std::filesystem::remove(path, ec)) {
            return fail("Cannot delete " + name + ": " + ec.message());
        }
        LOG_INFO("Deleted " + path.string());
        return true;

    } catch (const std::exception& e) {
        if (message) *message = e.what();
        return false;
    }
}

int Flow::cleanup() const noexcept {
    int removed = 0;
    try {
        auto removeEach = [&removed](const std::filesystem::path& dir, auto&& stray) {
            if (!std::filesystem::exists(dir)) {
                return;
            }
            std::vector<std::filesystem::path> doomed;
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_regular_file() && stray(entry)) {
                    doomed.push_back(entry.path());
                }
            }
            for (const auto& path : doomed) {
                std::error_code ec;
                if (std::filesystem::remove(path, ec)) {
                    LOG_DEBUG("Removed " + path.string());
                    ++removed;
                } else if (ec) {
                    LOG_WARN("Cannot remove " + path.string() + ": " + ec.message());
                }
            }
        };

        removeEach(layout_.staging, [](const std::filesystem::directory_entry& e) {
            return e.path().extension() == ".part";
        });
        removeEach(layout_.inbox, [](const std::filesystem::directory_entry& e) {
            return !isDescriptor(e);
        });

    } catch (const std::exception& e) {
        LOG_ERROR("Cleanup error: " + std::string(e.what()));
    }
    return removed;
}

std::filesystem::path Flow::notePath(const std::string& name) const {
    return layout_.failed / (name + ".error.txt");
}

bool Flow::isSafeName(const std::string& name) noexcept {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

}
