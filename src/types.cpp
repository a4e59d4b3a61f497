/*
 * debridarr - Debrid-backed fetch orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "debridarr/types.hpp"

namespace debridarr {

const char* toString(Phase phase) noexcept {
    switch (phase) {
        case Phase::Detected: return "Detected";
        case Phase::CheckingExisting: return "CheckingExisting";
        case Phase::UsingExisting: return "UsingExisting";
        case Phase::Submitting: return "Submitting";
        case Phase::SelectingEntries: return "SelectingEntries";
        case Phase::CachingPoll: return "CachingPoll";
        case Phase::EnqueuedForDownload: return "EnqueuedForDownload";
        case Phase::Downloading: return "Downloading";
        case Phase::RetryCooldown: return "RetryCooldown";
        case Phase::PostProcess: return "PostProcess";
        case Phase::Completed: return "Completed";
        case Phase::Failed: return "Failed";
        default: return "Unknown";
    }
}

const char* toString(FileStatus status) noexcept {
    switch (status) {
        case FileStatus::Queued: return "Queued";
        case FileStatus::Downloading: return "Downloading";
        case FileStatus::Completed: return "Completed";
        case FileStatus::Extracted: return "Extracted";
        case FileStatus::FailedExtraction: return "FailedExtraction";
        case FileStatus::Failed: return "Failed";
        default: return "Unknown";
    }
}

const char* toString(FailureClass failure) noexcept {
    switch (failure) {
        case FailureClass::None: return "None";
        case FailureClass::PermanentReject: return "PermanentReject";
        case FailureClass::RateLimited: return "RateLimited";
        case FailureClass::NetworkError: return "NetworkError";
        case FailureClass::HosterUnavailable: return "HosterUnavailable";
        case FailureClass::DeadJob: return "DeadJob";
        case FailureClass::TransferFailed: return "TransferFailed";
        case FailureClass::PostProcessFailure: return "PostProcessFailure";
        default: return "Unknown";
    }
}

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Queued: return "QUEUED";
        case Status::Done: return "DONE";
        case Status::Failed: return "FAILED";
        case Status::Missing: return "MISSING";
        default: return "UNKNOWN";
    }
}

}
