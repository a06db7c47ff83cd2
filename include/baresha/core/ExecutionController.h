/**
 * @file ExecutionController.h
 * @brief Drives the job queue one job at a time
 *
 * The controller owns a single worker thread that pulls jobs from the
 * JobQueue, resolves and transfers them through the FetchEngine under the
 * shared RateLimiter, and reports every transition to the ProgressSink.
 * Control commands are fire-and-forget: they set signals that the worker
 * and the engine observe at chunk boundaries.
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"
#include "baresha/core/Job.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <QMutex>
#include <QString>
#include <QWaitCondition>

namespace Baresha {

class JobQueue;
class FetchEngine;
class RateLimiter;
class ProgressSink;
class HistoryRecorder;
class CheckpointStore;
struct StreamInfo;

/**
 * @class ExecutionController
 * @brief Sequential batch executor with pause/resume/cancel
 *
 * Threading:
 * - The worker thread mutates the job it is running (and the job it holds
 *   paused). Commands that target idle Queued/Paused jobs mutate them
 *   directly through JobQueue under the controller lock, so a job never has
 *   two writers.
 * - pause/cancel of the in-flight job are delivered as atomic flags.
 * - Engine exceptions are converted into Failed transitions and never leave
 *   the worker thread.
 *
 * Commands that do not fit the current state throw InvalidStateError on the
 * caller's thread and change nothing.
 */
class ExecutionController {
public:
    ExecutionController(JobQueue& queue, FetchEngine& engine, RateLimiter& rateLimiter,
                        ProgressSink* sink = nullptr, HistoryRecorder* history = nullptr);

    /// Pauses the in-flight job (so it keeps its checkpoint) and joins the worker
    ~ExecutionController();

    ExecutionController(const ExecutionController&) = delete;
    ExecutionController& operator=(const ExecutionController&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Configuration
    // ───────────────────────────────────────────────────────────────────────

    void setCheckpointStore(CheckpointStore* store) { m_checkpoints = store; }
    void setResolveTimeout(Duration timeout) { m_resolveTimeout = timeout; }
    void setOutputDirectory(const QString& directory) { m_outputDirectory = directory; }
    void setProgressInterval(ByteCount bytes, Duration interval) {
        m_progressBytes = bytes;
        m_progressInterval = interval;
    }

    // ───────────────────────────────────────────────────────────────────────
    // Batch Commands
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Start pulling Queued jobs until the queue is exhausted
     *
     * No-op while a batch is already running.
     * @throws InvalidStateError after shutdown()
     */
    void startBatch();

    /**
     * @brief Suspend the Downloading job
     *
     * The job becomes Paused and holds the batch: no other job starts until
     * it is resumed or cancelled.
     * @throws InvalidStateError if no job is Downloading
     */
    void pauseCurrent();

    /**
     * @brief Continue the single Paused job from its checkpoint
     * @throws InvalidStateError unless exactly one job is Paused and none is in flight
     */
    void resumeCurrent();

    /**
     * @brief Stop the in-flight job; the batch moves on to the next job
     * @throws InvalidStateError if nothing is in flight
     */
    void cancelCurrent();

    /**
     * @brief Cancel the in-flight job and every Queued/Paused job, and stop the batch
     *
     * Pending jobs are cancelled directly without touching the engine.
     */
    void cancelAll();

    // ───────────────────────────────────────────────────────────────────────
    // Per-Job Commands
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Resume a specific Paused job (e.g. one restored after restart)
     * @throws InvalidStateError if the job is not Paused or another job is in flight
     */
    void resumeJob(const JobId& id);

    /**
     * @brief Cancel a specific job, in flight or pending
     * @throws InvalidStateError if the job is unknown or already terminal
     */
    void cancelJob(const JobId& id);

    /**
     * @brief Stop the worker for good
     *
     * The in-flight job is paused (keeping its checkpoint) rather than cancelled.
     */
    void shutdown();

    // ───────────────────────────────────────────────────────────────────────
    // State
    // ───────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] bool isHeld() const;
    [[nodiscard]] std::optional<JobId> currentJobId() const;

private:
    void run();
    void launch();

    /// @return true if the job ended Paused and now holds the batch
    bool executeJob(const JobId& id);
    bool resumeHeldJob(const JobId& id);
    bool runTransfer(const JobId& id, const Job& job, const std::optional<StreamInfo>& info);

    /// @throws InvalidStateError if @p id has already settled into a terminal state
    void requireCancellableLocked(const JobId& id) const;

    /**
     * @brief Apply a transition and publish it
     *
     * Runs @p prepare on the stored job under the queue lock right before the
     * transition, then emits the state event, updates the checkpoint store and
     * records history for terminal states.
     */
    Job commit(const JobId& id, JobTransition transition,
               const std::function<void(Job&)>& prepare = {});
    void publish(const Job& job);
    void failJob(const JobId& id, JobTransition transition, const JobError& error,
                 const std::optional<ResumeToken>& token = std::nullopt);

    JobQueue& m_queue;
    FetchEngine& m_engine;
    RateLimiter& m_rateLimiter;
    ProgressSink* m_sink;
    HistoryRecorder* m_history;
    CheckpointStore* m_checkpoints = nullptr;

    Duration m_resolveTimeout = Constants::DEFAULT_RESOLVE_TIMEOUT;
    QString m_outputDirectory;
    ByteCount m_progressBytes = Constants::PROGRESS_EVENT_BYTES;
    Duration m_progressInterval = Constants::PROGRESS_EVENT_INTERVAL;

    // Serializes startBatch()/shutdown() so the worker is joined once
    std::mutex m_lifecycleMutex;
    std::thread m_thread;

    // Guarded by m_mutex
    mutable QMutex m_mutex;
    QWaitCondition m_wakeCondition;
    bool m_running = false;
    bool m_shutdown = false;
    bool m_stopRequested = false;
    std::optional<JobId> m_currentJobId;
    // Jobs explicitly paused by the user; while any remain the batch does not advance
    std::vector<JobId> m_heldJobIds;
    std::optional<JobId> m_resumeTarget;

    // Polled by the engine
    std::atomic<bool> m_pauseSignal{false};
    std::atomic<bool> m_cancelSignal{false};
};

} // namespace Baresha
