/**
 * @file JobQueue.cpp
 * @brief JobQueue implementation
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/core/JobQueue.h"

#include <algorithm>

#include <QDebug>
#include <QUrl>

namespace Baresha {

bool JobQueue::isValidSourceUrl(const QString& url) {
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty()) {
        return false;
    }

    const QUrl parsed(trimmed, QUrl::StrictMode);
    if (!parsed.isValid() || parsed.isRelative()) {
        return false;
    }

    const QString scheme = parsed.scheme().toLower();
    if (scheme != QLatin1String("http") && scheme != QLatin1String("https")) {
        return false;
    }
    return !parsed.host().isEmpty();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Insertion / Removal
// ═══════════════════════════════════════════════════════════════════════════════

Job JobQueue::enqueue(const QString& url, const QString& quality, const QString& format) {
    if (!isValidSourceUrl(url)) {
        throw InvalidUrlError(QStringLiteral("Not a valid media URL: '%1'").arg(url));
    }

    Job job(QUuid::createUuid(), url.trimmed(), quality, format);

    QMutexLocker locker(&m_mutex);
    m_jobs.push_back(job);
    qDebug() << "JobQueue: Enqueued" << job.idString() << job.sourceUrl()
             << "quality:" << quality << "format:" << format;
    return job;
}

Job JobQueue::enqueueRetry(const JobId& failedId) {
    QMutexLocker locker(&m_mutex);
    const Job* failed = findLockedConst(failedId);
    if (!failed || failed->state() != JobState::Failed) {
        throw InvalidStateError(QStringLiteral("Job %1 is not a failed job")
                                    .arg(failedId.toString(QUuid::WithoutBraces)));
    }

    Job retry(QUuid::createUuid(), failed->sourceUrl(),
              failed->requestedQuality(), failed->requestedFormat());
    retry.setTitle(failed->title());
    retry.setResumeToken(failed->resumeToken());

    m_jobs.push_back(retry);
    qDebug() << "JobQueue: Retry of" << failedId.toString(QUuid::WithoutBraces)
             << "queued as" << retry.idString()
             << "from offset" << (retry.resumeToken() ? retry.resumeToken()->offset : 0);
    return retry;
}

void JobQueue::restore(const Job& job) {
    QMutexLocker locker(&m_mutex);
    if (findLockedConst(job.id())) {
        throw InvalidStateError(QStringLiteral("Job %1 is already queued").arg(job.idString()));
    }
    m_jobs.push_back(job);
}

void JobQueue::remove(const JobId& id) {
    QMutexLocker locker(&m_mutex);
    auto it = std::find_if(m_jobs.begin(), m_jobs.end(),
                           [&id](const Job& j) { return j.id() == id; });
    if (it == m_jobs.end()) {
        throw InvalidStateError(QStringLiteral("Unknown job %1")
                                    .arg(id.toString(QUuid::WithoutBraces)));
    }
    // A paused job keeps its checkpoint and may hold the batch
    if (it->isActive() || it->state() == JobState::Paused) {
        throw InvalidStateError(QStringLiteral("Job %1 is %2, cancel it first")
                                    .arg(it->idString(), jobStateToString(it->state())));
    }
    m_jobs.erase(it);
}

int JobQueue::clearFinished() {
    QMutexLocker locker(&m_mutex);
    const auto before = m_jobs.size();
    m_jobs.erase(std::remove_if(m_jobs.begin(), m_jobs.end(),
                                [](const Job& j) { return j.isTerminal(); }),
                 m_jobs.end());
    return static_cast<int>(before - m_jobs.size());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Query
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<Job> JobQueue::nextEligible() const {
    QMutexLocker locker(&m_mutex);
    for (const auto& job : m_jobs) {
        if (job.state() == JobState::Queued) {
            return job;
        }
    }
    return std::nullopt;
}

JobSnapshot JobQueue::snapshot() const {
    QMutexLocker locker(&m_mutex);
    return JobSnapshot(m_jobs);
}

std::optional<Job> JobQueue::find(const JobId& id) const {
    QMutexLocker locker(&m_mutex);
    if (const Job* job = findLockedConst(id)) {
        return *job;
    }
    return std::nullopt;
}

int JobQueue::size() const {
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_jobs.size());
}

int JobQueue::countInState(JobState state) const {
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(std::count_if(m_jobs.begin(), m_jobs.end(),
                                          [state](const Job& j) { return j.state() == state; }));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Mutation
// ═══════════════════════════════════════════════════════════════════════════════

Job JobQueue::transition(const JobId& id, JobTransition transition) {
    QMutexLocker locker(&m_mutex);
    Job& job = findLocked(id);
    job.apply(transition);
    return job;
}

std::vector<Job> JobQueue::cancelPending() {
    QMutexLocker locker(&m_mutex);
    std::vector<Job> cancelled;
    for (auto& job : m_jobs) {
        if (job.state() == JobState::Queued || job.state() == JobState::Paused) {
            job.apply(JobTransition::Cancel);
            cancelled.push_back(job);
        }
    }
    return cancelled;
}

Job& JobQueue::findLocked(const JobId& id) {
    auto it = std::find_if(m_jobs.begin(), m_jobs.end(),
                           [&id](const Job& j) { return j.id() == id; });
    if (it == m_jobs.end()) {
        throw InvalidStateError(QStringLiteral("Unknown job %1")
                                    .arg(id.toString(QUuid::WithoutBraces)));
    }
    return *it;
}

const Job* JobQueue::findLockedConst(const JobId& id) const {
    auto it = std::find_if(m_jobs.begin(), m_jobs.end(),
                           [&id](const Job& j) { return j.id() == id; });
    return it == m_jobs.end() ? nullptr : &*it;
}

} // namespace Baresha
