/**
 * @file ConsoleProgressSink.h
 * @brief Prints job events as single lines on stdout
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/ProgressSink.h"
#include "baresha/core/JobQueue.h"

#include <functional>

#include <QMutex>
#include <QTextStream>

namespace Baresha {

class ConsoleProgressSink : public ProgressSink {
public:
    explicit ConsoleProgressSink(const JobQueue& queue);

    void onEvent(const ProgressEvent& event) override;
    void onBatchFinished() override;

    /// Invoked from onBatchFinished() on the worker thread
    void setBatchFinishedHandler(std::function<void()> handler) { m_batchFinished = std::move(handler); }

    void printLine(const QString& line);
    void printStatus(const JobSnapshot& jobs, SpeedBps throughput);

    static QString describeJob(const Job& job);

private:
    QString label(const JobId& id) const;

    const JobQueue& m_queue;
    std::function<void()> m_batchFinished;

    QMutex m_mutex;
    QTextStream m_out;
};

} // namespace Baresha
