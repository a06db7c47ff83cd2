/**
 * @file BatchRunner.h
 * @brief Wires queue, engines, limiter and controller for the command line
 *
 * Owns the whole execution stack for one run, feeds it the URLs from the
 * command line and translates interactive stdin commands:
 * - p: pause current
 * - r: resume
 * - c: cancel current
 * - q: cancel all
 * - s: status
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/app/AppSettings.h"
#include "baresha/app/ConsoleProgressSink.h"
#include "baresha/core/ExecutionController.h"
#include "baresha/core/JobQueue.h"
#include "baresha/core/RateLimiter.h"
#include "baresha/engine/CurlFetchEngine.h"
#include "baresha/engine/FetchEngineRouter.h"
#include "baresha/engine/YtDlpFetchEngine.h"

#include <memory>

#include <QFile>
#include <QObject>
#include <QStringList>

class QSocketNotifier;

namespace Baresha {

class PersistenceManager;

class BatchRunner : public QObject {
    Q_OBJECT

public:
    /// @param persistence May be null; the run is then not checkpointed
    BatchRunner(const AppSettings& settings, PersistenceManager* persistence, QObject* parent = nullptr);
    ~BatchRunner() override;

    /**
     * @brief Enqueue every URL with the configured quality/format
     * @return Number of URLs rejected as invalid
     */
    int addUrls(const QStringList& urls);

    /**
     * @brief Put checkpointed jobs from an earlier run back into the queue
     * @param resumeInterrupted Resume restored Paused jobs one after another
     * @return Number of jobs restored
     */
    int restoreCheckpoints(bool resumeInterrupted);

    /// Start the batch; with @p interactive, listen for commands on stdin
    void start(bool interactive);

    /// Execute one console command; unknown or inapplicable ones print a message
    void handleCommand(const QString& command);

    /// 0 if every job completed, 1 otherwise
    [[nodiscard]] int exitCode() const;

    [[nodiscard]] JobQueue& queue() { return m_queue; }
    [[nodiscard]] ExecutionController& controller() { return *m_controller; }

signals:
    void finished(int exitCode);

private slots:
    void onStdinReadable();
    void onBatchFinished();

private:
    bool resumeNextInterrupted();

    AppSettings m_settings;
    PersistenceManager* m_persistence;

    JobQueue m_queue;
    RateLimiter m_rateLimiter;
    CurlFetchEngine m_curlEngine;
    YtDlpFetchEngine m_ytDlpEngine;
    FetchEngineRouter m_router;
    ConsoleProgressSink m_sink;
    std::unique_ptr<ExecutionController> m_controller;

    QFile m_stdin;
    QSocketNotifier* m_stdinNotifier = nullptr;
    bool m_resumeInterrupted = false;
};

} // namespace Baresha
