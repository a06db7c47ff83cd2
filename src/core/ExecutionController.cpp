/**
 * @file ExecutionController.cpp
 * @brief Sequential batch execution, control commands and checkpointing
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/core/ExecutionController.h"
#include "baresha/core/Errors.h"
#include "baresha/core/FetchEngine.h"
#include "baresha/core/HistoryRecorder.h"
#include "baresha/core/JobQueue.h"
#include "baresha/core/ProgressCoalescer.h"
#include "baresha/core/ProgressSink.h"
#include "baresha/core/RateLimiter.h"
#include "baresha/core/SpeedCalculator.h"

#include <algorithm>
#include <chrono>

#include <QDebug>
#include <QUrl>

namespace Baresha {

namespace {

QString shortId(const JobId& id) {
    return id.toString(QUuid::WithoutBraces).left(8);
}

// A token that doesn't belong to the job is an engine bug; keep the old one
void adoptToken(Job& job, const std::optional<ResumeToken>& token) {
    if (!token) {
        return;
    }
    if (!token->matches(job.sourceUrl(), job.requestedFormat())) {
        qWarning() << "ExecutionController: Ignoring foreign resume token for" << job.idString();
        return;
    }
    job.setResumeToken(token);
}

bool releaseHold(std::vector<JobId>& held, const JobId& id) {
    const auto it = std::find(held.begin(), held.end(), id);
    if (it == held.end()) {
        return false;
    }
    held.erase(it);
    return true;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════════

ExecutionController::ExecutionController(JobQueue& queue, FetchEngine& engine,
                                         RateLimiter& rateLimiter, ProgressSink* sink,
                                         HistoryRecorder* history)
    : m_queue(queue)
    , m_engine(engine)
    , m_rateLimiter(rateLimiter)
    , m_sink(sink)
    , m_history(history)
{
}

ExecutionController::~ExecutionController() {
    shutdown();
}

void ExecutionController::shutdown() {
    std::lock_guard lifecycle(m_lifecycleMutex);
    {
        QMutexLocker locker(&m_mutex);
        if (!m_shutdown) {
            qDebug() << "ExecutionController: Shutting down";
        }
        m_shutdown = true;
        if (m_currentJobId) {
            // Pause rather than cancel so the checkpoint survives
            m_pauseSignal.store(true);
        }
        m_wakeCondition.wakeAll();
    }

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Batch Commands
// ═══════════════════════════════════════════════════════════════════════════════

void ExecutionController::startBatch() {
    std::lock_guard lifecycle(m_lifecycleMutex);
    {
        QMutexLocker locker(&m_mutex);
        if (m_shutdown) {
            throw InvalidStateError(QStringLiteral("Controller has been shut down"));
        }
        m_stopRequested = false;
        if (m_running) {
            qDebug() << "ExecutionController: Batch already running";
            return;
        }
    }
    launch();
}

void ExecutionController::launch() {
    // The previous worker has left its loop; reap it
    if (m_thread.joinable()) {
        m_thread.join();
    }
    {
        QMutexLocker locker(&m_mutex);
        m_running = true;
    }
    m_thread = std::thread(&ExecutionController::run, this);
}

void ExecutionController::pauseCurrent() {
    QMutexLocker locker(&m_mutex);
    if (!m_currentJobId) {
        throw InvalidStateError(QStringLiteral("No job is downloading"));
    }
    auto job = m_queue.find(*m_currentJobId);
    if (!job || job->state() != JobState::Downloading) {
        throw InvalidStateError(QStringLiteral("Job %1 is %2, only a downloading job can be paused")
                                    .arg(shortId(*m_currentJobId),
                                         job ? jobStateToString(job->state()) : QStringLiteral("gone")));
    }
    m_pauseSignal.store(true);
    qDebug() << "ExecutionController: Pause requested for" << shortId(*m_currentJobId);
}

void ExecutionController::resumeCurrent() {
    {
        QMutexLocker locker(&m_mutex);
        if (m_shutdown) {
            throw InvalidStateError(QStringLiteral("Controller has been shut down"));
        }
        if (m_currentJobId) {
            throw InvalidStateError(QStringLiteral("Job %1 is still in flight")
                                        .arg(shortId(*m_currentJobId)));
        }

        std::optional<JobId> paused;
        int count = 0;
        for (const auto& job : m_queue.snapshot()) {
            if (job.state() == JobState::Paused) {
                paused = job.id();
                ++count;
            }
        }
        if (count != 1) {
            throw InvalidStateError(QStringLiteral("Resume needs exactly one paused job, found %1")
                                        .arg(count));
        }

        m_resumeTarget = paused;
        m_wakeCondition.wakeAll();
        qDebug() << "ExecutionController: Resume requested for" << shortId(*paused);
    }
    startBatch();
}

void ExecutionController::cancelCurrent() {
    std::optional<JobId> held;
    {
        QMutexLocker locker(&m_mutex);
        if (m_currentJobId) {
            requireCancellableLocked(*m_currentJobId);
            m_cancelSignal.store(true);
            qDebug() << "ExecutionController: Cancel requested for" << shortId(*m_currentJobId);
            return;
        }
        if (!m_heldJobIds.empty()) {
            held = m_heldJobIds.back();
        }
    }

    if (!held) {
        throw InvalidStateError(QStringLiteral("No job to cancel"));
    }
    cancelJob(*held);
}

void ExecutionController::cancelAll() {
    std::vector<Job> cancelled;
    {
        QMutexLocker locker(&m_mutex);
        m_stopRequested = true;
        m_resumeTarget.reset();
        m_heldJobIds.clear();
        if (m_currentJobId) {
            m_cancelSignal.store(true);
        }
        cancelled = m_queue.cancelPending();
        m_wakeCondition.wakeAll();
    }

    qInfo() << "ExecutionController: Cancel all," << cancelled.size() << "pending job(s) cancelled";
    for (const auto& job : cancelled) {
        publish(job);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Per-Job Commands
// ═══════════════════════════════════════════════════════════════════════════════

void ExecutionController::resumeJob(const JobId& id) {
    {
        QMutexLocker locker(&m_mutex);
        if (m_shutdown) {
            throw InvalidStateError(QStringLiteral("Controller has been shut down"));
        }
        if (m_currentJobId) {
            throw InvalidStateError(QStringLiteral("Job %1 is still in flight")
                                        .arg(shortId(*m_currentJobId)));
        }
        auto job = m_queue.find(id);
        if (!job || job->state() != JobState::Paused) {
            throw InvalidStateError(QStringLiteral("Job %1 is not paused").arg(shortId(id)));
        }

        m_resumeTarget = id;
        m_wakeCondition.wakeAll();
        qDebug() << "ExecutionController: Resume requested for" << shortId(id);
    }
    startBatch();
}

void ExecutionController::cancelJob(const JobId& id) {
    std::optional<Job> cancelled;
    {
        QMutexLocker locker(&m_mutex);
        if (m_currentJobId == id) {
            requireCancellableLocked(id);
            m_cancelSignal.store(true);
            qDebug() << "ExecutionController: Cancel requested for" << shortId(id);
            return;
        }

        cancelled = m_queue.transition(id, JobTransition::Cancel);
        if (m_resumeTarget == id) {
            m_resumeTarget.reset();
        }
        if (releaseHold(m_heldJobIds, id)) {
            m_wakeCondition.wakeAll();
        }
    }
    publish(*cancelled);
}

// ═══════════════════════════════════════════════════════════════════════════════
// State
// ═══════════════════════════════════════════════════════════════════════════════

bool ExecutionController::isRunning() const {
    QMutexLocker locker(&m_mutex);
    return m_running;
}

bool ExecutionController::isHeld() const {
    QMutexLocker locker(&m_mutex);
    return !m_heldJobIds.empty();
}

void ExecutionController::requireCancellableLocked(const JobId& id) const {
    // The worker may not have cleared m_currentJobId yet after the job settled
    const auto job = m_queue.find(id);
    if (!job || job->isTerminal()) {
        throw InvalidStateError(QStringLiteral("Job %1 is %2, nothing to cancel")
                                    .arg(shortId(id),
                                         job ? jobStateToString(job->state()) : QStringLiteral("gone")));
    }
}

std::optional<JobId> ExecutionController::currentJobId() const {
    QMutexLocker locker(&m_mutex);
    return m_currentJobId;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Worker Thread
// ═══════════════════════════════════════════════════════════════════════════════

void ExecutionController::run() {
    qInfo() << "ExecutionController: Batch started";

    for (;;) {
        JobId jobId;
        bool resuming = false;
        {
            QMutexLocker locker(&m_mutex);
            // A paused job holds the batch until it is resumed or cancelled
            while (!m_heldJobIds.empty() && !m_resumeTarget && !m_shutdown && !m_stopRequested) {
                m_wakeCondition.wait(&m_mutex);
            }
            if (m_shutdown || m_stopRequested) {
                m_running = false;
                break;
            }

            if (m_resumeTarget) {
                jobId = *m_resumeTarget;
                m_resumeTarget.reset();
                // Resuming another paused job leaves the existing holds in place
                releaseHold(m_heldJobIds, jobId);
                resuming = true;
            } else {
                auto next = m_queue.nextEligible();
                if (!next) {
                    m_running = false;
                    break;
                }
                jobId = next->id();
            }

            m_currentJobId = jobId;
            m_pauseSignal.store(false);
            m_cancelSignal.store(false);
        }

        const bool held = resuming ? resumeHeldJob(jobId) : executeJob(jobId);

        bool cancelHeld = false;
        {
            QMutexLocker locker(&m_mutex);
            m_currentJobId.reset();
            if (held) {
                // cancelJob() may have targeted the job while it was settling into Paused
                if (m_cancelSignal.load()) {
                    cancelHeld = true;
                } else {
                    m_heldJobIds.push_back(jobId);
                }
            }
        }

        if (cancelHeld) {
            try {
                commit(jobId, JobTransition::Cancel);
            } catch (const InvalidStateError& e) {
                qDebug() << "ExecutionController:" << e.what();
            }
        }
    }

    qInfo() << "ExecutionController: Batch finished";
    if (m_sink) {
        m_sink->onBatchFinished();
    }
}

bool ExecutionController::executeJob(const JobId& id) {
    std::optional<Job> started;
    try {
        started = commit(id, JobTransition::Start);
    } catch (const InvalidStateError& e) {
        // Cancelled between nextEligible() and here
        qDebug() << "ExecutionController: Skipping" << shortId(id) << "-" << e.what();
        return false;
    }
    Job job = *started;

    // ───────────────────────────────────────────────────────────────────────
    // Resolve
    // ───────────────────────────────────────────────────────────────────────

    using SteadyClock = std::chrono::steady_clock;
    const auto deadline = SteadyClock::now() + m_resolveTimeout;
    auto expired = [deadline] { return SteadyClock::now() >= deadline; };
    auto shouldAbort = [this, &expired] {
        return m_cancelSignal.load() || m_pauseSignal.load() || expired();
    };

    std::optional<StreamInfo> info;
    JobError resolveError{ErrorKind::Resolve, ErrorCause::Unknown, {}};
    try {
        info = m_engine.resolve(QUrl(job.sourceUrl()), shouldAbort);
    } catch (const ResolveError& e) {
        resolveError = {ErrorKind::Resolve, e.cause(), e.message()};
    } catch (const std::exception& e) {
        resolveError = {ErrorKind::Resolve, ErrorCause::Unknown, QString::fromUtf8(e.what())};
    }

    try {
        if (m_cancelSignal.load()) {
            commit(id, JobTransition::Cancel);
            return false;
        }
        if (m_pauseSignal.load()) {
            // Only shutdown() pauses a resolving job; its checkpoint restores it as Queued
            qDebug() << "ExecutionController: Resolve of" << shortId(id) << "interrupted by shutdown";
            return false;
        }
        if (!info) {
            if (expired()) {
                resolveError = {ErrorKind::Resolve, ErrorCause::Timeout,
                                QStringLiteral("No response within %1 ms")
                                    .arg(m_resolveTimeout.count())};
            }
            failJob(id, JobTransition::ResolveFail, resolveError);
            return false;
        }

        job = commit(id, JobTransition::Resolved, [&info](Job& j) {
            if (!info->title.isEmpty()) {
                j.setTitle(info->title);
            }
            j.setBytesTotal(info->bytesTotal);
        });
    } catch (const InvalidStateError& e) {
        qDebug() << "ExecutionController:" << e.what();
        return false;
    }

    // A retried job carries the checkpoint of the failed attempt
    if (job.resumeToken() && job.resumeToken()->offset > 0) {
        const ByteOffset offset = job.resumeToken()->offset;
        job = m_queue.modify(id, [offset](Job& j) { j.recordProgress(offset, 0.0); });
    }

    return runTransfer(id, job, info);
}

bool ExecutionController::resumeHeldJob(const JobId& id) {
    try {
        Job job = commit(id, JobTransition::Resume);
        qInfo() << "ExecutionController: Resuming" << shortId(id)
                << "from" << formatByteSize(job.progress().bytesReceived);
        return runTransfer(id, job, std::nullopt);
    } catch (const InvalidStateError& e) {
        qDebug() << "ExecutionController: Not resuming" << shortId(id) << "-" << e.what();
        return false;
    }
}

bool ExecutionController::runTransfer(const JobId& id, const Job& job,
                                      const std::optional<StreamInfo>& info) {
    using SteadyClock = std::chrono::steady_clock;

    TransferRequest request;
    request.url = QUrl(job.sourceUrl());
    request.sourceUrl = job.sourceUrl();
    request.quality = job.requestedQuality();
    request.format = job.requestedFormat();
    request.outputDirectory = m_outputDirectory;
    request.resumeToken = job.resumeToken();
    request.streamInfo = info;

    ProgressCoalescer coalescer(m_progressBytes, m_progressInterval);
    coalescer.reset(job.progress().bytesReceived, SteadyClock::now());
    SpeedCalculator speed;
    ByteCount lastSeen = job.progress().bytesReceived;
    ByteOffset lastCheckpoint = job.resumeToken() ? job.resumeToken()->offset : 0;

    TransferControl control;
    control.rateLimiter = &m_rateLimiter;
    control.shouldPause = [this] { return m_pauseSignal.load(); };
    control.shouldCancel = [this] { return m_cancelSignal.load(); };

    control.onProgress = [&](ByteCount received, std::optional<ByteCount> total) {
        const auto now = SteadyClock::now();
        if (received > lastSeen) {
            speed.addBytes(received - lastSeen, now);
            lastSeen = received;
        }
        const Job updated = m_queue.modify(id, [&](Job& j) {
            if (total && *total > 0 && j.progress().bytesTotal != total) {
                j.setBytesTotal(total);
            }
            j.recordProgress(received, speed.smoothedSpeed());
        });

        if (m_sink && coalescer.shouldEmit(updated.progress().bytesReceived, now)) {
            ProgressEvent event;
            event.kind = ProgressEvent::Kind::Progress;
            event.jobId = id;
            event.state = updated.state();
            event.bytesReceived = updated.progress().bytesReceived;
            event.bytesTotal = updated.progress().bytesTotal;
            event.rate = updated.progress().instantaneousRate;
            event.timestamp = QDateTime::currentDateTimeUtc();
            m_sink->onEvent(event);
        }
    };

    control.onCheckpoint = [&](const ResumeToken& token) {
        const Job updated = m_queue.modify(id, [&token](Job& j) { adoptToken(j, token); });
        if (m_checkpoints &&
            token.offset - lastCheckpoint >= Constants::PERSISTENCE_CHECKPOINT_BYTES) {
            m_checkpoints->saveCheckpoint(updated);
            lastCheckpoint = token.offset;
        }
    };

    TransferOutcome outcome;
    try {
        outcome = m_engine.transfer(request, control);
    } catch (const TransferError& e) {
        if (m_cancelSignal.load()) {
            try {
                commit(id, JobTransition::Cancel,
                       [&e](Job& j) { adoptToken(j, e.resumeToken()); });
            } catch (const InvalidStateError& stateError) {
                qDebug() << "ExecutionController:" << stateError.what();
            }
        } else {
            failJob(id, JobTransition::TransferFail,
                    {ErrorKind::Transfer, e.cause(), e.message()}, e.resumeToken());
        }
        return false;
    } catch (const std::exception& e) {
        failJob(id, JobTransition::TransferFail,
                {ErrorKind::Transfer, ErrorCause::Unknown, QString::fromUtf8(e.what())});
        return false;
    }

    try {
        switch (outcome.status) {
            case TransferStatus::Completed:
                commit(id, JobTransition::Complete, [&outcome](Job& j) {
                    j.recordProgress(outcome.bytesReceived, 0.0);
                });
                return false;

            case TransferStatus::Paused:
                if (m_cancelSignal.load()) {
                    commit(id, JobTransition::Cancel,
                           [&outcome](Job& j) { adoptToken(j, outcome.resumeToken); });
                    return false;
                }
                commit(id, JobTransition::Pause,
                       [&outcome](Job& j) { adoptToken(j, outcome.resumeToken); });
                return true;

            case TransferStatus::Cancelled:
                commit(id, JobTransition::Cancel,
                       [&outcome](Job& j) { adoptToken(j, outcome.resumeToken); });
                return false;
        }
    } catch (const InvalidStateError& e) {
        qDebug() << "ExecutionController:" << e.what();
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Transitions
// ═══════════════════════════════════════════════════════════════════════════════

Job ExecutionController::commit(const JobId& id, JobTransition transition,
                                const std::function<void(Job&)>& prepare) {
    Job job = m_queue.modify(id, [&](Job& j) {
        if (!Job::canApply(j.state(), transition)) {
            throw InvalidStateError(QStringLiteral("Job %1: '%2' not allowed in state %3")
                                        .arg(shortId(id), transitionToString(transition),
                                             jobStateToString(j.state())));
        }
        if (prepare) {
            prepare(j);
        }
        j.apply(transition);
    });

    publish(job);
    return job;
}

void ExecutionController::failJob(const JobId& id, JobTransition transition,
                                  const JobError& error,
                                  const std::optional<ResumeToken>& token) {
    try {
        commit(id, transition, [&](Job& j) {
            adoptToken(j, token);
            j.setError(error);
        });
    } catch (const InvalidStateError& e) {
        qDebug() << "ExecutionController:" << e.what();
    }
}

void ExecutionController::publish(const Job& job) {
    switch (job.state()) {
        case JobState::Completed:
            qInfo() << "ExecutionController: Completed" << shortId(job.id()) << job.sourceUrl()
                    << formatByteSize(job.progress().bytesReceived);
            break;
        case JobState::Failed:
            qWarning() << "ExecutionController: Failed" << shortId(job.id()) << job.sourceUrl()
                       << errorKindToString(job.error().kind) << errorCauseToString(job.error().cause)
                       << job.error().message;
            break;
        default:
            qDebug() << "ExecutionController:" << shortId(job.id()) << "now"
                     << jobStateToString(job.state());
            break;
    }

    if (m_sink) {
        ProgressEvent event;
        event.kind = ProgressEvent::Kind::StateChanged;
        event.jobId = job.id();
        event.state = job.state();
        event.bytesReceived = job.progress().bytesReceived;
        event.bytesTotal = job.progress().bytesTotal;
        event.rate = job.progress().instantaneousRate;
        event.timestamp = QDateTime::currentDateTimeUtc();
        event.error = job.error();
        m_sink->onEvent(event);
    }

    if (m_checkpoints) {
        if (job.isTerminal()) {
            m_checkpoints->dropCheckpoint(job.id());
        } else {
            m_checkpoints->saveCheckpoint(job);
        }
    }

    if (job.isTerminal()) {
        if (m_history) {
            m_history->record(HistoryRecord::fromJob(job));
        }
        if (job.state() == JobState::Cancelled && job.resumeToken()) {
            m_engine.discardPartial(*job.resumeToken());
        }
    }
}

} // namespace Baresha
