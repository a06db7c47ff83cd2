/**
 * @file Job.cpp
 * @brief Job state machine implementation
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/core/Job.h"
#include "baresha/core/Errors.h"

#include <QDebug>

namespace Baresha {

Job::Job(JobId id, QString sourceUrl, QString quality, QString format)
    : m_id(id)
    , m_sourceUrl(std::move(sourceUrl))
    , m_quality(std::move(quality))
    , m_format(std::move(format))
    , m_createdAt(QDateTime::currentDateTimeUtc())
{
}

Job Job::fromRecord(const JobRecord& record) {
    Job job;
    job.m_id = record.id;
    job.m_sourceUrl = record.sourceUrl;
    job.m_quality = record.quality;
    job.m_format = record.format;
    job.m_title = record.title;
    job.m_state = record.state;
    job.m_progress.bytesReceived = record.bytesReceived;
    job.m_progress.bytesTotal = record.bytesTotal;
    job.m_error = record.error;
    job.m_createdAt = record.createdAt;
    job.m_startedAt = record.startedAt;
    job.m_finishedAt = record.finishedAt;

    if (record.resumeToken && record.resumeToken->matches(record.sourceUrl, record.format)) {
        job.m_resumeToken = record.resumeToken;
    }

    // Interrupted by an unclean shutdown
    if (job.m_state == JobState::Downloading) {
        job.m_state = JobState::Paused;
        job.m_progress.bytesReceived = job.m_resumeToken ? job.m_resumeToken->offset : 0;
    } else if (job.m_state == JobState::Resolving) {
        job.m_state = JobState::Queued;
    }

    return job;
}

JobRecord Job::toRecord() const {
    JobRecord record;
    record.id = m_id;
    record.sourceUrl = m_sourceUrl;
    record.quality = m_quality;
    record.format = m_format;
    record.title = m_title;
    record.state = m_state;
    record.bytesReceived = m_progress.bytesReceived;
    record.bytesTotal = m_progress.bytesTotal;
    record.resumeToken = m_resumeToken;
    record.error = m_error;
    record.createdAt = m_createdAt;
    record.startedAt = m_startedAt;
    record.finishedAt = m_finishedAt;
    return record;
}

void Job::setRequestedQuality(const QString& quality) {
    if (m_state != JobState::Queued) {
        throw InvalidStateError(QStringLiteral("Cannot change quality of job %1 in state %2")
                                    .arg(idString(), jobStateToString(m_state)));
    }
    m_quality = quality;
}

void Job::setRequestedFormat(const QString& format) {
    if (m_state != JobState::Queued) {
        throw InvalidStateError(QStringLiteral("Cannot change format of job %1 in state %2")
                                    .arg(idString(), jobStateToString(m_state)));
    }
    m_format = format;
}

// ═══════════════════════════════════════════════════════════════════════════════
// State Machine
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<JobState> Job::nextState(JobState from, JobTransition transition) {
    switch (from) {
        case JobState::Queued:
            if (transition == JobTransition::Start) return JobState::Resolving;
            if (transition == JobTransition::Cancel) return JobState::Cancelled;
            break;

        case JobState::Resolving:
            if (transition == JobTransition::Resolved) return JobState::Downloading;
            if (transition == JobTransition::ResolveFail) return JobState::Failed;
            if (transition == JobTransition::Cancel) return JobState::Cancelled;
            break;

        case JobState::Downloading:
            if (transition == JobTransition::Complete) return JobState::Completed;
            if (transition == JobTransition::Pause) return JobState::Paused;
            if (transition == JobTransition::TransferFail) return JobState::Failed;
            if (transition == JobTransition::Cancel) return JobState::Cancelled;
            break;

        case JobState::Paused:
            if (transition == JobTransition::Resume) return JobState::Downloading;
            if (transition == JobTransition::Cancel) return JobState::Cancelled;
            break;

        case JobState::Completed:
        case JobState::Failed:
        case JobState::Cancelled:
            break;
    }
    return std::nullopt;
}

JobState Job::apply(JobTransition transition) {
    auto target = nextState(m_state, transition);
    if (!target) {
        throw InvalidStateError(QStringLiteral("Job %1: '%2' not allowed in state %3")
                                    .arg(idString(), transitionToString(transition),
                                         jobStateToString(m_state)));
    }

    const JobState previous = m_state;
    m_state = *target;

    switch (transition) {
        case JobTransition::Start:
            m_startedAt = QDateTime::currentDateTimeUtc();
            m_error = JobError{};
            break;

        case JobTransition::Resume:
            // Continue from the last acknowledged offset, not from zero
            m_progress.bytesReceived = m_resumeToken ? m_resumeToken->offset : 0;
            break;

        case JobTransition::Complete:
            m_resumeToken.reset();
            if (!m_progress.bytesTotal) {
                m_progress.bytesTotal = m_progress.bytesReceived;
            }
            break;

        default:
            break;
    }

    if (m_state != JobState::Downloading) {
        m_progress.instantaneousRate = 0.0;
    }
    if (isTerminal()) {
        m_finishedAt = QDateTime::currentDateTimeUtc();
    }

    qDebug() << "Job:" << idString() << jobStateToString(previous)
             << "->" << jobStateToString(m_state);
    return previous;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Progress / Resume
// ═══════════════════════════════════════════════════════════════════════════════

bool Job::recordProgress(ByteCount bytesReceived, SpeedBps rate) {
    if (m_state != JobState::Downloading) {
        return false;
    }
    m_progress.instantaneousRate = rate;
    if (bytesReceived <= m_progress.bytesReceived) {
        return false;
    }
    m_progress.bytesReceived = bytesReceived;
    return true;
}

void Job::setBytesTotal(std::optional<ByteCount> total) {
    if (total && *total < 0) {
        total.reset();
    }
    m_progress.bytesTotal = total;
}

void Job::setResumeToken(std::optional<ResumeToken> token) {
    if (token && !token->matches(m_sourceUrl, m_format)) {
        throw InvalidStateError(QStringLiteral("Resume token for %1 [%2] does not belong to job %3")
                                    .arg(token->sourceUrl, token->format, idString()));
    }
    m_resumeToken = std::move(token);
}

} // namespace Baresha
