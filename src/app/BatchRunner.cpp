/**
 * @file BatchRunner.cpp
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/app/BatchRunner.h"
#include "baresha/core/Errors.h"
#include "baresha/persistence/PersistenceManager.h"

#include <QDebug>
#include <QMetaObject>
#include <QSocketNotifier>

#include <cstdio>

namespace Baresha {

BatchRunner::BatchRunner(const AppSettings& settings, PersistenceManager* persistence, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_persistence(persistence)
    , m_rateLimiter(settings.speedLimit)
    , m_ytDlpEngine(YtDlpFetchEngine::Options{settings.ytDlpPath, settings.ffmpegPath})
    , m_router(m_curlEngine, m_ytDlpEngine)
    , m_sink(m_queue)
{
    m_controller = std::make_unique<ExecutionController>(m_queue, m_router, m_rateLimiter, &m_sink,
                                                         persistence);
    if (persistence) {
        m_controller->setCheckpointStore(persistence);
        connect(persistence, &PersistenceManager::error, this, [](const QString& message) {
            qWarning() << "BatchRunner: Persistence error:" << message;
        });
    }
    m_controller->setOutputDirectory(settings.downloadPath);
    m_controller->setResolveTimeout(settings.resolveTimeout);

    m_sink.setBatchFinishedHandler([this]() {
        QMetaObject::invokeMethod(this, &BatchRunner::onBatchFinished, Qt::QueuedConnection);
    });

    qDebug() << "BatchRunner: Output to" << settings.downloadPath
             << "limit" << (settings.speedLimit > 0 ? formatSpeed(settings.speedLimit) : QStringLiteral("none"));
}

BatchRunner::~BatchRunner() {
    m_controller->shutdown();
    m_sink.setBatchFinishedHandler({});
}

int BatchRunner::addUrls(const QStringList& urls) {
    int rejected = 0;
    for (const QString& url : urls) {
        try {
            const Job job = m_queue.enqueue(url, m_settings.defaultQuality, m_settings.defaultFormat);
            qDebug() << "BatchRunner: Queued" << job.idString() << url;
        } catch (const InvalidUrlError& e) {
            m_sink.printLine(QStringLiteral("Skipping %1: %2").arg(url, e.message()));
            ++rejected;
        }
    }
    return rejected;
}

int BatchRunner::restoreCheckpoints(bool resumeInterrupted) {
    m_resumeInterrupted = resumeInterrupted;
    if (!m_persistence) {
        return 0;
    }

    int restored = 0;
    for (const Job& job : m_persistence->loadCheckpoints()) {
        try {
            m_queue.restore(job);
            m_persistence->saveCheckpoint(job);  // normalized state
            ++restored;
        } catch (const Error& e) {
            qWarning() << "BatchRunner: Cannot restore" << job.idString() << e.message();
        }
    }

    if (restored > 0) {
        m_sink.printLine(QStringLiteral("Restored %1 interrupted job(s)").arg(restored));
    }
    return restored;
}

void BatchRunner::start(bool interactive) {
#ifdef Q_OS_UNIX
    if (interactive && !m_stdinNotifier && m_stdin.open(stdin, QIODevice::ReadOnly)) {
        m_stdinNotifier = new QSocketNotifier(m_stdin.handle(), QSocketNotifier::Read, this);
        connect(m_stdinNotifier, &QSocketNotifier::activated, this, &BatchRunner::onStdinReadable);
        m_sink.printLine(QStringLiteral("Commands: p=pause r=resume c=cancel q=cancel all s=status"));
    }
#else
    Q_UNUSED(interactive)
#endif

    if (m_resumeInterrupted && resumeNextInterrupted()) {
        return;
    }
    m_controller->startBatch();
}

void BatchRunner::handleCommand(const QString& command) {
    const QString key = command.trimmed().toLower();
    if (key.isEmpty()) {
        return;
    }

    try {
        switch (key.at(0).toLatin1()) {
            case 'p':
                m_controller->pauseCurrent();
                break;
            case 'r':
                m_controller->resumeCurrent();
                break;
            case 'c':
                m_controller->cancelCurrent();
                break;
            case 'q':
                m_controller->cancelAll();
                break;
            case 's':
                m_sink.printStatus(m_queue.snapshot(), m_rateLimiter.currentThroughput());
                break;
            default:
                m_sink.printLine(QStringLiteral("Unknown command \"%1\" (p, r, c, q, s)").arg(key));
                break;
        }
    } catch (const Error& e) {
        m_sink.printLine(e.message());
    }
}

int BatchRunner::exitCode() const {
    // Failed, Cancelled and jobs left Paused or Queued all count against the run
    for (const Job& job : m_queue.snapshot()) {
        if (job.state() != JobState::Completed) {
            return 1;
        }
    }
    return 0;
}

void BatchRunner::onStdinReadable() {
    const QByteArray line = m_stdin.readLine();
    if (line.isEmpty()) {
        // EOF: stop watching, the batch runs on unattended
        m_stdinNotifier->setEnabled(false);
        return;
    }
    handleCommand(QString::fromLocal8Bit(line));
}

void BatchRunner::onBatchFinished() {
    if (m_resumeInterrupted && resumeNextInterrupted()) {
        return;
    }
    emit finished(exitCode());
}

bool BatchRunner::resumeNextInterrupted() {
    if (m_controller->isRunning()) {
        return false;
    }

    for (const Job& job : m_queue.snapshot()) {
        if (job.state() != JobState::Paused) {
            continue;
        }
        try {
            m_sink.printLine(QStringLiteral("Resuming %1").arg(ConsoleProgressSink::describeJob(job)));
            m_controller->resumeJob(job.id());
            return true;
        } catch (const InvalidStateError& e) {
            qWarning() << "BatchRunner: Cannot resume" << job.idString() << e.message();
        }
    }
    return false;
}

} // namespace Baresha
