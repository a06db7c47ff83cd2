/**
 * @file HistoryRecorder.h
 * @brief Sinks for terminal job outcomes and in-flight checkpoints
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Job.h"

#include <optional>

#include <QDateTime>
#include <QString>

namespace Baresha {

/**
 * @brief One finished job, as stored in history
 */
struct HistoryRecord {
    JobId jobId;
    QString sourceUrl;
    QString title;
    QString format;
    QString quality;
    JobState state = JobState::Completed;
    QDateTime startedAt;
    QDateTime finishedAt;
    std::optional<ByteCount> bytesTotal;
    std::optional<ErrorKind> errorKind;
    ErrorCause errorCause = ErrorCause::None;
    QString errorMessage;

    static HistoryRecord fromJob(const Job& job) {
        HistoryRecord record;
        record.jobId = job.id();
        record.sourceUrl = job.sourceUrl();
        record.title = job.title();
        record.format = job.requestedFormat();
        record.quality = job.requestedQuality();
        record.state = job.state();
        record.startedAt = job.startedAt();
        record.finishedAt = job.finishedAt();
        record.bytesTotal = job.progress().bytesTotal;
        if (job.error().hasError()) {
            record.errorKind = job.error().kind;
            record.errorCause = job.error().cause;
            record.errorMessage = job.error().message;
        }
        return record;
    }
};

/**
 * @class HistoryRecorder
 * @brief Receives exactly one record per job that reaches a terminal state
 */
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;
    virtual void record(const HistoryRecord& record) = 0;
};

/**
 * @class CheckpointStore
 * @brief Durable copy of non-terminal jobs for restart recovery
 */
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;
    virtual void saveCheckpoint(const Job& job) = 0;
    virtual void dropCheckpoint(const JobId& id) = 0;
};

} // namespace Baresha
