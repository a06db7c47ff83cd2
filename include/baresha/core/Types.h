/**
 * @file Types.h
 * @brief Core type definitions and enumerations for the Baresha job engine
 *
 * This header defines fundamental types, enumerations, and constants used
 * throughout the download queue and execution controller.
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <optional>

#include <QByteArray>
#include <QMetaType>
#include <QString>
#include <QUuid>

namespace Baresha {

// ═══════════════════════════════════════════════════════════════════════════════
// Type Aliases
// ═══════════════════════════════════════════════════════════════════════════════

using JobId = QUuid;
using ByteOffset = int64_t;
using ByteCount = int64_t;
using Duration = std::chrono::milliseconds;
using SleepDuration = std::chrono::microseconds;
using SpeedBps = double;  // Bytes per second

// ═══════════════════════════════════════════════════════════════════════════════
// Job State Machine
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Job lifecycle states
 *
 * State transitions:
 *   Queued → Resolving → Downloading → Completed
 *               ↓           ↓    ↑
 *             Failed      Paused ┘
 *
 *   Queued / Resolving / Downloading / Paused → Cancelled
 *   Downloading → Failed
 */
enum class JobState : uint8_t {
    Queued,      ///< Waiting in queue to start
    Resolving,   ///< Fetching stream metadata from the engine
    Downloading, ///< Transfer in progress
    Paused,      ///< Suspended by user, holds a resume token
    Completed,   ///< Successfully finished
    Failed,      ///< Engine reported an error (see JobError)
    Cancelled    ///< Cancelled by user
};

/**
 * @brief Events that drive the job state machine
 */
enum class JobTransition : uint8_t {
    Start,         ///< Queued → Resolving
    Resolved,      ///< Resolving → Downloading
    ResolveFail,   ///< Resolving → Failed
    Complete,      ///< Downloading → Completed
    TransferFail,  ///< Downloading → Failed
    Pause,         ///< Downloading → Paused
    Resume,        ///< Paused → Downloading
    Cancel         ///< Queued/Resolving/Downloading/Paused → Cancelled
};

// ═══════════════════════════════════════════════════════════════════════════════
// Error Taxonomy
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Error kinds reported by the core
 */
enum class ErrorKind : uint8_t {
    None,
    InvalidUrl,        ///< Malformed input, rejected at enqueue
    InvalidState,      ///< Command not accepted in the job's current state
    Resolve,           ///< Engine could not retrieve metadata
    Transfer,          ///< Engine failed mid-download
    RateLimitConfig    ///< Invalid throughput configuration
};

/**
 * @brief Finer classification of resolve/transfer failures
 */
enum class ErrorCause : uint8_t {
    None,
    Unreachable,       ///< DNS/connect failure, host down
    Restricted,        ///< Private, login-only, geo-blocked
    NotFound,          ///< Media does not exist
    Timeout,           ///< No progress within the allowed time
    Network,           ///< Connection dropped mid-transfer
    DiskWrite,         ///< Output file could not be written
    StorageExhausted,  ///< Disk full or quota exceeded
    Unknown
};

// ═══════════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════════

namespace Constants {
    // Transfer
    constexpr ByteCount CHUNK_SIZE = 64 * 1024;                   // 64 KB
    constexpr Duration CONTROL_POLL_INTERVAL{100};                // pause/cancel latency bound
    constexpr Duration THROTTLE_SLICE{50};                        // max single throttle sleep

    // Progress events
    constexpr ByteCount PROGRESS_EVENT_BYTES = 256 * 1024;        // 256 KB
    constexpr Duration PROGRESS_EVENT_INTERVAL{250};              // 250ms

    // Resolve
    constexpr Duration DEFAULT_RESOLVE_TIMEOUT{30000};            // 30 seconds

    // Speed calculation
    constexpr Duration SPEED_SMOOTHING_WINDOW{3000};              // 3 seconds
    constexpr double SPEED_SMOOTHING_FACTOR = 0.3;                // Exponential smoothing

    // Persistence
    constexpr ByteCount PERSISTENCE_CHECKPOINT_BYTES = 1 * 1024 * 1024;  // 1 MB
    constexpr int HISTORY_DEFAULT_LIMIT = 50;

    // Network timeouts
    constexpr Duration CONNECT_TIMEOUT{30000};                    // 30 seconds
    constexpr int LOW_SPEED_TIME_SECONDS = 60;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Progress Information
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Transfer progress of a single job
 */
struct JobProgress {
    ByteCount bytesReceived = 0;              ///< Bytes on disk for this job
    std::optional<ByteCount> bytesTotal;      ///< Unknown until resolved
    SpeedBps instantaneousRate = 0.0;         ///< Smoothed current rate

    double percent() const {
        if (!bytesTotal || *bytesTotal <= 0) return 0.0;
        return (static_cast<double>(bytesReceived) / *bytesTotal) * 100.0;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Resume Checkpoint
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Engine-opaque checkpoint that lets a transfer continue
 *
 * The core only reads sourceUrl/format (to bind the token to its job) and
 * offset (to restore progress). Everything else belongs to the engine.
 */
struct ResumeToken {
    QString sourceUrl;                  ///< URL the checkpoint was taken for
    QString format;                     ///< Requested format at checkpoint time
    ByteOffset offset = 0;              ///< Last acknowledged byte offset
    QString partialPath;                ///< Partial output file, if any
    QByteArray engineState;             ///< Free-form engine data

    bool isValid() const { return offset >= 0 && !sourceUrl.isEmpty(); }
    bool matches(const QString& url, const QString& fmt) const {
        return sourceUrl == url && format == fmt;
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Error Information
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Classified failure stored on a Failed job
 */
struct JobError {
    ErrorKind kind = ErrorKind::None;
    ErrorCause cause = ErrorCause::None;
    QString message;                    ///< Human-readable description

    bool hasError() const { return kind != ErrorKind::None; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Utility Functions
// ═══════════════════════════════════════════════════════════════════════════════

QString jobStateToString(JobState state);
QString transitionToString(JobTransition transition);
QString errorKindToString(ErrorKind kind);
QString errorCauseToString(ErrorCause cause);

std::optional<JobState> jobStateFromString(const QString& text);
std::optional<ErrorKind> errorKindFromString(const QString& text);
std::optional<ErrorCause> errorCauseFromString(const QString& text);

/**
 * @brief Format byte count for display (e.g., "1.5 GB")
 */
inline QString formatByteSize(ByteCount bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    if (bytes < 0) return QStringLiteral("Unknown");
    if (bytes < KB) return QStringLiteral("%1 B").arg(bytes);
    if (bytes < MB) return QStringLiteral("%1 KB").arg(bytes / KB, 0, 'f', 1);
    if (bytes < GB) return QStringLiteral("%1 MB").arg(bytes / MB, 0, 'f', 2);
    if (bytes < TB) return QStringLiteral("%1 GB").arg(bytes / GB, 0, 'f', 2);
    return QStringLiteral("%1 TB").arg(bytes / TB, 0, 'f', 2);
}

/**
 * @brief Format speed for display (e.g., "1.5 MB/s")
 */
inline QString formatSpeed(SpeedBps speed) {
    return formatByteSize(static_cast<ByteCount>(speed)) + QStringLiteral("/s");
}

} // namespace Baresha

Q_DECLARE_METATYPE(Baresha::JobState)
Q_DECLARE_METATYPE(Baresha::JobTransition)
Q_DECLARE_METATYPE(Baresha::ErrorCause)
