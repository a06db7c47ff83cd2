/**
 * @file ConsoleProgressSink.cpp
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/app/ConsoleProgressSink.h"

#include <cstdio>

namespace Baresha {

namespace {

QString shortId(const JobId& id) {
    return id.toString(QUuid::WithoutBraces).left(8);
}

} // namespace

ConsoleProgressSink::ConsoleProgressSink(const JobQueue& queue)
    : m_queue(queue)
    , m_out(stdout)
{
}

void ConsoleProgressSink::onEvent(const ProgressEvent& event) {
    QString line = QStringLiteral("[%1] ").arg(shortId(event.jobId));

    if (event.kind == ProgressEvent::Kind::Progress) {
        if (event.bytesTotal && *event.bytesTotal > 0) {
            const double percent = 100.0 * static_cast<double>(event.bytesReceived) /
                                   static_cast<double>(*event.bytesTotal);
            line += QStringLiteral("%1%  %2 / %3  %4")
                        .arg(percent, 5, 'f', 1)
                        .arg(formatByteSize(event.bytesReceived), formatByteSize(*event.bytesTotal),
                             formatSpeed(event.rate));
        } else {
            line += QStringLiteral("%1  %2").arg(formatByteSize(event.bytesReceived), formatSpeed(event.rate));
        }
        printLine(line);
        return;
    }

    line += QStringLiteral("%1  %2").arg(jobStateToString(event.state).leftJustified(11), label(event.jobId));
    if (event.state == JobState::Failed && event.error.hasError()) {
        line += QStringLiteral("  (%1/%2: %3)")
                    .arg(errorKindToString(event.error.kind), errorCauseToString(event.error.cause),
                         event.error.message);
    } else if (event.state == JobState::Completed) {
        line += QStringLiteral("  %1").arg(formatByteSize(event.bytesReceived));
    } else if (event.state == JobState::Paused) {
        line += QStringLiteral("  at %1").arg(formatByteSize(event.bytesReceived));
    }
    printLine(line);
}

void ConsoleProgressSink::onBatchFinished() {
    printLine(QStringLiteral("Batch finished: %1 completed, %2 failed, %3 cancelled, %4 paused")
                  .arg(m_queue.countInState(JobState::Completed))
                  .arg(m_queue.countInState(JobState::Failed))
                  .arg(m_queue.countInState(JobState::Cancelled))
                  .arg(m_queue.countInState(JobState::Paused)));
    if (m_batchFinished) {
        m_batchFinished();
    }
}

void ConsoleProgressSink::printLine(const QString& line) {
    QMutexLocker locker(&m_mutex);
    m_out << line << Qt::endl;
}

void ConsoleProgressSink::printStatus(const JobSnapshot& jobs, SpeedBps throughput) {
    if (jobs.empty()) {
        printLine(QStringLiteral("No jobs"));
        return;
    }
    printLine(QStringLiteral("%1 job(s), total %2")
                  .arg(static_cast<qulonglong>(jobs.size()))
                  .arg(formatSpeed(throughput)));
    for (const Job& job : jobs) {
        printLine(describeJob(job));
    }
}

QString ConsoleProgressSink::describeJob(const Job& job) {
    const JobProgress& progress = job.progress();
    QString line = QStringLiteral("[%1] %2  %3  %4/%5")
                       .arg(shortId(job.id()), jobStateToString(job.state()).leftJustified(11),
                            job.title().isEmpty() ? job.sourceUrl() : job.title(),
                            job.requestedQuality(), job.requestedFormat());

    if (progress.bytesReceived > 0 || progress.bytesTotal) {
        line += QStringLiteral("  %1").arg(formatByteSize(progress.bytesReceived));
        if (progress.bytesTotal) {
            line += QStringLiteral(" / %1").arg(formatByteSize(*progress.bytesTotal));
        }
    }
    if (job.error().hasError()) {
        line += QStringLiteral("  %1").arg(job.error().message);
    }
    return line;
}

QString ConsoleProgressSink::label(const JobId& id) const {
    const auto job = m_queue.find(id);
    if (!job) {
        return QString();
    }
    return job->title().isEmpty() ? job->sourceUrl() : job->title();
}

} // namespace Baresha
