/**
 * @file ProgressSink.h
 * @brief Observer interface for job state and progress events
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <optional>

#include <QDateTime>

namespace Baresha {

struct ProgressEvent {
    enum class Kind : uint8_t {
        StateChanged,   ///< Emitted synchronously with every transition
        Progress        ///< Coalesced byte progress while Downloading
    };

    Kind kind = Kind::Progress;
    JobId jobId;
    JobState state = JobState::Queued;
    ByteCount bytesReceived = 0;
    std::optional<ByteCount> bytesTotal;
    SpeedBps rate = 0.0;
    QDateTime timestamp;
    JobError error;                         ///< Set when state is Failed
};

/**
 * @class ProgressSink
 * @brief Receives events from the execution thread
 *
 * Events arrive on the controller's worker thread (and, for commands that
 * act on idle jobs, on the caller's thread). Implementations must be
 * thread-safe and must not block for long.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onEvent(const ProgressEvent& event) = 0;

    /// Called once the batch loop has nothing left to run
    virtual void onBatchFinished() {}
};

} // namespace Baresha
