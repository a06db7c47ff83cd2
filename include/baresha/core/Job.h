/**
 * @file Job.h
 * @brief A single requested media download and its lifecycle state machine
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <optional>

#include <QDateTime>
#include <QString>

namespace Baresha {

/**
 * @brief Flat representation of a Job used by persistence
 */
struct JobRecord {
    JobId id;
    QString sourceUrl;
    QString quality;
    QString format;
    QString title;
    JobState state = JobState::Queued;
    ByteCount bytesReceived = 0;
    std::optional<ByteCount> bytesTotal;
    std::optional<ResumeToken> resumeToken;
    JobError error;
    QDateTime createdAt;
    QDateTime startedAt;
    QDateTime finishedAt;
};

/**
 * @class Job
 * @brief The unit of work: one URL, its selections, state and checkpoint
 *
 * Job is a value type. The queue owns the authoritative copy and hands out
 * snapshots; all mutation goes through JobQueue so that a job never has two
 * concurrent writers.
 *
 * State changes are only possible through apply(), which enforces the
 * transition table and throws InvalidStateError for anything else.
 */
class Job {
public:
    Job(JobId id, QString sourceUrl, QString quality, QString format);

    /**
     * @brief Rebuild a job from a stored checkpoint
     *
     * A job that was Downloading when the process died comes back Paused
     * (keeping its token), one that was Resolving comes back Queued.
     */
    static Job fromRecord(const JobRecord& record);
    JobRecord toRecord() const;

    // ───────────────────────────────────────────────────────────────────────
    // Identification
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] JobId id() const { return m_id; }
    [[nodiscard]] QString idString() const { return m_id.toString(QUuid::WithoutBraces); }
    [[nodiscard]] const QString& sourceUrl() const { return m_sourceUrl; }

    // ───────────────────────────────────────────────────────────────────────
    // User Selections
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] const QString& requestedQuality() const { return m_quality; }
    [[nodiscard]] const QString& requestedFormat() const { return m_format; }

    /// @throws InvalidStateError unless the job is Queued
    void setRequestedQuality(const QString& quality);
    /// @throws InvalidStateError unless the job is Queued
    void setRequestedFormat(const QString& format);

    [[nodiscard]] const QString& title() const { return m_title; }
    void setTitle(const QString& title) { m_title = title; }

    // ───────────────────────────────────────────────────────────────────────
    // State Machine
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] JobState state() const { return m_state; }
    [[nodiscard]] bool isTerminal() const { return isTerminal(m_state); }
    [[nodiscard]] bool isActive() const {
        return m_state == JobState::Resolving || m_state == JobState::Downloading;
    }

    /**
     * @brief Apply a transition to the job
     * @return The state the job was in before the transition
     * @throws InvalidStateError if the transition is not allowed from the current state
     */
    JobState apply(JobTransition transition);

    /// @return Target state, or nullopt if @p transition is not allowed from @p from
    static std::optional<JobState> nextState(JobState from, JobTransition transition);
    static bool canApply(JobState from, JobTransition transition) {
        return nextState(from, transition).has_value();
    }
    static bool isTerminal(JobState state) {
        return state == JobState::Completed || state == JobState::Failed ||
               state == JobState::Cancelled;
    }

    // ───────────────────────────────────────────────────────────────────────
    // Progress
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] const JobProgress& progress() const { return m_progress; }

    /**
     * @brief Record transfer progress
     *
     * Only accepted while Downloading. bytesReceived never goes backwards;
     * a lower value is ignored.
     *
     * @return true if bytesReceived advanced
     */
    bool recordProgress(ByteCount bytesReceived, SpeedBps rate);
    void setBytesTotal(std::optional<ByteCount> total);

    // ───────────────────────────────────────────────────────────────────────
    // Resume / Error
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::optional<ResumeToken>& resumeToken() const { return m_resumeToken; }

    /// @throws InvalidStateError if the token belongs to a different URL/format
    void setResumeToken(std::optional<ResumeToken> token);

    [[nodiscard]] const JobError& error() const { return m_error; }
    void setError(JobError error) { m_error = std::move(error); }

    // ───────────────────────────────────────────────────────────────────────
    // Timestamps
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] const QDateTime& createdAt() const { return m_createdAt; }
    [[nodiscard]] const QDateTime& startedAt() const { return m_startedAt; }
    [[nodiscard]] const QDateTime& finishedAt() const { return m_finishedAt; }

private:
    Job() = default;

    JobId m_id;
    QString m_sourceUrl;
    QString m_quality;
    QString m_format;
    QString m_title;

    JobState m_state = JobState::Queued;
    JobProgress m_progress;
    std::optional<ResumeToken> m_resumeToken;
    JobError m_error;

    QDateTime m_createdAt;
    QDateTime m_startedAt;
    QDateTime m_finishedAt;
};

} // namespace Baresha
