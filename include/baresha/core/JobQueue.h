/**
 * @file JobQueue.h
 * @brief Ordered, thread-safe collection of jobs
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Job.h"
#include "baresha/core/Errors.h"

#include <memory>
#include <optional>
#include <vector>

#include <QMutex>
#include <QString>

namespace Baresha {

/**
 * @class JobSnapshot
 * @brief Read-only view of the queue at one instant
 *
 * Iterating does not touch the live queue and can be restarted any number
 * of times. Copies share the same underlying list.
 */
class JobSnapshot {
public:
    using const_iterator = std::vector<Job>::const_iterator;

    JobSnapshot() : m_jobs(std::make_shared<const std::vector<Job>>()) {}
    explicit JobSnapshot(std::vector<Job> jobs)
        : m_jobs(std::make_shared<const std::vector<Job>>(std::move(jobs))) {}

    const_iterator begin() const { return m_jobs->cbegin(); }
    const_iterator end() const { return m_jobs->cend(); }
    size_t size() const { return m_jobs->size(); }
    bool empty() const { return m_jobs->empty(); }
    const Job& operator[](size_t index) const { return (*m_jobs)[index]; }

private:
    std::shared_ptr<const std::vector<Job>> m_jobs;
};

/**
 * @class JobQueue
 * @brief FIFO of jobs; insertion order is execution order
 *
 * The queue owns the authoritative copy of every job. Readers get copies,
 * writers go through transition()/modify() which run under the queue lock,
 * so a state check and the mutation that depends on it are atomic.
 */
class JobQueue {
public:
    JobQueue() = default;

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // ───────────────────────────────────────────────────────────────────────
    // Insertion / Removal
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Create a Queued job and append it
     * @throws InvalidUrlError if @p url is not an http(s) URL with a host
     */
    Job enqueue(const QString& url, const QString& quality, const QString& format);

    /**
     * @brief Append a fresh job that retries a Failed one
     *
     * The new job carries the failed job's resume token, if it kept one.
     * @throws InvalidStateError if @p failedId is unknown or not Failed
     */
    Job enqueueRetry(const JobId& failedId);

    /**
     * @brief Append a job rebuilt from a checkpoint
     * @throws InvalidStateError if a job with the same id is already queued
     */
    void restore(const Job& job);

    /**
     * @brief Remove a Queued or terminal job
     * @throws InvalidStateError if the job is Resolving/Downloading/Paused or unknown
     */
    void remove(const JobId& id);

    /// Remove every Completed/Failed/Cancelled job. @return number removed
    int clearFinished();

    // ───────────────────────────────────────────────────────────────────────
    // Query
    // ───────────────────────────────────────────────────────────────────────

    /// @return Earliest Queued job in insertion order, if any
    std::optional<Job> nextEligible() const;

    JobSnapshot snapshot() const;
    std::optional<Job> find(const JobId& id) const;
    int size() const;
    int countInState(JobState state) const;

    static bool isValidSourceUrl(const QString& url);

    // ───────────────────────────────────────────────────────────────────────
    // Mutation
    // ───────────────────────────────────────────────────────────────────────

    /**
     * @brief Apply a state transition to a job
     * @return Copy of the job after the transition
     * @throws InvalidStateError if the job is unknown or rejects the transition
     */
    Job transition(const JobId& id, JobTransition transition);

    /**
     * @brief Run @p fn on the stored job under the queue lock
     * @return Copy of the job after @p fn returned
     */
    template<typename Fn>
    Job modify(const JobId& id, Fn&& fn) {
        QMutexLocker locker(&m_mutex);
        Job& job = findLocked(id);
        fn(job);
        return job;
    }

    /**
     * @brief Cancel every Queued and Paused job in one step
     * @return The jobs that were cancelled, in queue order
     */
    std::vector<Job> cancelPending();

private:
    Job& findLocked(const JobId& id);
    const Job* findLockedConst(const JobId& id) const;

    mutable QMutex m_mutex;
    std::vector<Job> m_jobs;
};

} // namespace Baresha
