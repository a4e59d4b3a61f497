#pragma once
#include <cstdint>
#include <string>

namespace debridarr {

// Job lifecycle phases, in the order a healthy job walks through them.
enum class Phase : std::uint8_t {
    Detected,
    CheckingExisting,
    UsingExisting,
    Submitting,
    SelectingEntries,
    CachingPoll,
    EnqueuedForDownload,
    Downloading,
    RetryCooldown,
    PostProcess,
    Completed,
    Failed
};

enum class FileStatus : std::uint8_t {
    Queued,
    Downloading,
    Completed,
    Extracted,
    FailedExtraction,
    Failed
};

enum class FailureClass : std::uint8_t {
    None,
    PermanentReject,
    RateLimited,
    NetworkError,
    HosterUnavailable,
    DeadJob,
    TransferFailed,
    PostProcessFailure
};

enum class DescriptorKind : std::uint8_t { Link, ContainerFile };

// Directory-ledger view of a descriptor (where it currently sits on disk).
enum class Status : std::uint8_t { Queued, Done, Failed, Missing };

// Stable job identifier: hash of source path + detection time.
using JobId = std::string;

[[nodiscard]] const char* toString(Phase phase) noexcept;
[[nodiscard]] const char* toString(FileStatus status) noexcept;
[[nodiscard]] const char* toString(FailureClass failure) noexcept;
[[nodiscard]] const char* toString(Status status) noexcept;

[[nodiscard]] constexpr bool isTerminal(Phase phase) noexcept {
    return phase == Phase::Completed || phase == Phase::Failed;
}

} // namespace debridarr
