/**
 * @file Types.cpp
 * @brief String conversions for core enumerations
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/core/Types.h"

namespace Baresha {

QString jobStateToString(JobState state) {
    switch (state) {
        case JobState::Queued: return QStringLiteral("Queued");
        case JobState::Resolving: return QStringLiteral("Resolving");
        case JobState::Downloading: return QStringLiteral("Downloading");
        case JobState::Paused: return QStringLiteral("Paused");
        case JobState::Completed: return QStringLiteral("Completed");
        case JobState::Failed: return QStringLiteral("Failed");
        case JobState::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

QString transitionToString(JobTransition transition) {
    switch (transition) {
        case JobTransition::Start: return QStringLiteral("start");
        case JobTransition::Resolved: return QStringLiteral("resolved");
        case JobTransition::ResolveFail: return QStringLiteral("resolve_fail");
        case JobTransition::Complete: return QStringLiteral("complete");
        case JobTransition::TransferFail: return QStringLiteral("transfer_fail");
        case JobTransition::Pause: return QStringLiteral("pause");
        case JobTransition::Resume: return QStringLiteral("resume");
        case JobTransition::Cancel: return QStringLiteral("cancel");
    }
    return QStringLiteral("unknown");
}

QString errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return QStringLiteral("None");
        case ErrorKind::InvalidUrl: return QStringLiteral("InvalidUrl");
        case ErrorKind::InvalidState: return QStringLiteral("InvalidState");
        case ErrorKind::Resolve: return QStringLiteral("Resolve");
        case ErrorKind::Transfer: return QStringLiteral("Transfer");
        case ErrorKind::RateLimitConfig: return QStringLiteral("RateLimitConfig");
    }
    return QStringLiteral("None");
}

QString errorCauseToString(ErrorCause cause) {
    switch (cause) {
        case ErrorCause::None: return QStringLiteral("None");
        case ErrorCause::Unreachable: return QStringLiteral("Unreachable");
        case ErrorCause::Restricted: return QStringLiteral("Restricted");
        case ErrorCause::NotFound: return QStringLiteral("NotFound");
        case ErrorCause::Timeout: return QStringLiteral("Timeout");
        case ErrorCause::Network: return QStringLiteral("Network");
        case ErrorCause::DiskWrite: return QStringLiteral("DiskWrite");
        case ErrorCause::StorageExhausted: return QStringLiteral("StorageExhausted");
        case ErrorCause::Unknown: return QStringLiteral("Unknown");
    }
    return QStringLiteral("Unknown");
}

std::optional<JobState> jobStateFromString(const QString& text) {
    for (auto s : {JobState::Queued, JobState::Resolving, JobState::Downloading,
                   JobState::Paused, JobState::Completed, JobState::Failed,
                   JobState::Cancelled}) {
        if (jobStateToString(s) == text) return s;
    }
    return std::nullopt;
}

std::optional<ErrorKind> errorKindFromString(const QString& text) {
    for (auto k : {ErrorKind::None, ErrorKind::InvalidUrl, ErrorKind::InvalidState,
                   ErrorKind::Resolve, ErrorKind::Transfer, ErrorKind::RateLimitConfig}) {
        if (errorKindToString(k) == text) return k;
    }
    return std::nullopt;
}

std::optional<ErrorCause> errorCauseFromString(const QString& text) {
    for (auto c : {ErrorCause::None, ErrorCause::Unreachable, ErrorCause::Restricted,
                   ErrorCause::NotFound, ErrorCause::Timeout, ErrorCause::Network,
                   ErrorCause::DiskWrite, ErrorCause::StorageExhausted,
                   ErrorCause::Unknown}) {
        if (errorCauseToString(c) == text) return c;
    }
    return std::nullopt;
}

} // namespace Baresha
