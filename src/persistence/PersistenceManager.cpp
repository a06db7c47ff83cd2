/**
 * @file PersistenceManager.cpp
 * @brief SQLite persistence implementation
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#include "baresha/persistence/PersistenceManager.h"
#include "baresha/persistence/DatabaseSchema.h"

#include <QDebug>
#include <QDir>
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>
#include <QUuid>
#include <QVariant>

namespace Baresha {

namespace {

QVariant toVariant(const QDateTime& time) {
    return time.isValid() ? QVariant(time.toMSecsSinceEpoch()) : QVariant();
}

QVariant toVariant(const std::optional<ByteCount>& value) {
    return value ? QVariant(static_cast<qlonglong>(*value)) : QVariant();
}

QDateTime toDateTime(const QVariant& value) {
    return value.isNull() ? QDateTime() : QDateTime::fromMSecsSinceEpoch(value.toLongLong(), Qt::UTC);
}

std::optional<ByteCount> toOptionalBytes(const QVariant& value) {
    if (value.isNull()) {
        return std::nullopt;
    }
    return static_cast<ByteCount>(value.toLongLong());
}

QString idText(const JobId& id) {
    return id.toString(QUuid::WithoutBraces);
}

} // namespace

PersistenceManager::PersistenceManager(QObject* parent)
    : QObject(parent)
    , m_connectionName(QStringLiteral("baresha_%1").arg(QUuid::createUuid().toString(QUuid::Id128)))
    , m_writerConnectionName(m_connectionName + QStringLiteral("_writer"))
{
}

PersistenceManager::~PersistenceManager() {
    close();
}

bool PersistenceManager::initialize(const QString& dbPath) {
    if (m_ready) {
        return true;
    }

    // Determine database path
    if (dbPath.isEmpty()) {
        QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        if (dataDir.isEmpty()) {
            dataDir = QDir::homePath() + QStringLiteral("/.baresha");
        }
        QDir().mkpath(dataDir);
        m_dbPath = dataDir + QStringLiteral("/baresha.db");
    } else {
        m_dbPath = dbPath;
    }

    qDebug() << "PersistenceManager: Opening database at" << m_dbPath;

    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
        db.setDatabaseName(m_dbPath);

        if (!db.open()) {
            qCritical() << "PersistenceManager: Failed to open database:" << db.lastError().text();
            db = QSqlDatabase();
            QSqlDatabase::removeDatabase(m_connectionName);
            return false;
        }

        QSqlQuery query(db);
        for (const char* pragma : DatabaseSchema::PRAGMAS) {
            if (!query.exec(QString::fromLatin1(pragma))) {
                qWarning() << "PersistenceManager: Pragma failed:" << pragma << query.lastError().text();
            }
        }
    }

    if (!createSchema()) {
        qCritical() << "PersistenceManager: Failed to create schema";
        {
            QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
            db.close();
        }
        QSqlDatabase::removeDatabase(m_connectionName);
        return false;
    }

    // Start write thread
    m_running = true;
    m_writeThread = std::thread(&PersistenceManager::writeThreadLoop, this);

    m_ready = true;
    qDebug() << "PersistenceManager: Initialized successfully, schema version" << schemaVersion();
    return true;
}

void PersistenceManager::close() {
    if (!m_ready) {
        return;
    }

    // Stop write thread; the loop drains the queue before exiting
    m_running = false;
    m_queueCondition.notify_all();
    if (m_writeThread.joinable()) {
        m_writeThread.join();
    }

    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen()) {
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(m_connectionName);

    m_ready = false;
    qDebug() << "PersistenceManager: Closed" << m_dbPath;
}

bool PersistenceManager::createSchema() {
    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
    QSqlQuery query(db);

    const char* statements[] = {
        DatabaseSchema::CREATE_JOBS_TABLE,
        DatabaseSchema::CREATE_JOBS_CREATED_INDEX,
        DatabaseSchema::CREATE_HISTORY_TABLE,
        DatabaseSchema::CREATE_HISTORY_FINISHED_INDEX,
        DatabaseSchema::CREATE_SETTINGS_TABLE,
        DatabaseSchema::CREATE_SCHEMA_VERSION_TABLE,
    };

    for (const char* statement : statements) {
        if (!query.exec(QString::fromLatin1(statement))) {
            qCritical() << "PersistenceManager: Schema statement failed:" << query.lastError().text();
            return false;
        }
    }

    if (schemaVersion() == 0) {
        query.prepare(QStringLiteral("INSERT INTO schema_version (version) VALUES (?)"));
        query.addBindValue(DatabaseSchema::CURRENT_VERSION);
        if (!query.exec()) {
            qCritical() << "PersistenceManager: Failed to record schema version:" << query.lastError().text();
            return false;
        }
    }
    return true;
}

int PersistenceManager::schemaVersion() {
    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    if (query.exec(QStringLiteral("SELECT MAX(version) FROM schema_version")) && query.next()) {
        return query.value(0).toInt();
    }
    return 0;
}

void PersistenceManager::flush() {
    std::unique_lock lock(m_queueMutex);
    m_idleCondition.wait(lock, [this]() {
        return m_pendingWrites == 0 || !m_running;
    });
}

// ═══════════════════════════════════════════════════════════════════════════════
// Checkpoints
// ═══════════════════════════════════════════════════════════════════════════════

void PersistenceManager::saveCheckpoint(const Job& job) {
    WriteRequest request;
    request.op = WriteOp::SaveJob;
    request.job = job.toRecord();
    enqueueWrite(std::move(request));
}

void PersistenceManager::dropCheckpoint(const JobId& id) {
    WriteRequest request;
    request.op = WriteOp::DeleteJob;
    request.id = id;
    enqueueWrite(std::move(request));
}

std::vector<Job> PersistenceManager::loadCheckpoints() {
    std::vector<Job> result;
    if (!m_ready) {
        return result;
    }
    flush();

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    query.prepare(QStringLiteral(R"(
        SELECT id, source_url, quality, format, title, state, bytes_received, bytes_total,
               token_offset, token_format, token_partial_path, token_engine_state,
               error_kind, error_cause, error_message, created_at, started_at
        FROM jobs
        ORDER BY created_at
    )"));

    if (!query.exec()) {
        qWarning() << "PersistenceManager: Failed to load checkpoints:" << query.lastError().text();
        return result;
    }

    while (query.next()) {
        const auto state = jobStateFromString(query.value(5).toString());
        if (!state) {
            qWarning() << "PersistenceManager: Skipping checkpoint with unknown state"
                       << query.value(5).toString();
            continue;
        }

        JobRecord record;
        record.id = QUuid::fromString(query.value(0).toString());
        record.sourceUrl = query.value(1).toString();
        record.quality = query.value(2).toString();
        record.format = query.value(3).toString();
        record.title = query.value(4).toString();
        record.state = *state;
        record.bytesReceived = query.value(6).toLongLong();
        record.bytesTotal = toOptionalBytes(query.value(7));

        if (!query.value(8).isNull()) {
            ResumeToken token;
            token.sourceUrl = record.sourceUrl;
            token.offset = query.value(8).toLongLong();
            token.format = query.value(9).toString();
            token.partialPath = query.value(10).toString();
            token.engineState = query.value(11).toByteArray();
            record.resumeToken = token;
        }

        record.error.kind = errorKindFromString(query.value(12).toString()).value_or(ErrorKind::None);
        record.error.cause = errorCauseFromString(query.value(13).toString()).value_or(ErrorCause::None);
        record.error.message = query.value(14).toString();
        record.createdAt = toDateTime(query.value(15));
        record.startedAt = toDateTime(query.value(16));

        if (record.id.isNull()) {
            continue;
        }
        result.push_back(Job::fromRecord(record));
    }

    qDebug() << "PersistenceManager: Loaded" << result.size() << "checkpoints";
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// History
// ═══════════════════════════════════════════════════════════════════════════════

void PersistenceManager::record(const HistoryRecord& record) {
    WriteRequest request;
    request.op = WriteOp::SaveHistory;
    request.history = record;
    enqueueWrite(std::move(request));
}

std::vector<HistoryRecord> PersistenceManager::loadHistory(int limit) {
    std::vector<HistoryRecord> result;
    if (!m_ready) {
        return result;
    }
    flush();

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    query.prepare(QStringLiteral(R"(
        SELECT job_id, source_url, title, format, quality, state, bytes_total,
               error_kind, error_cause, error_message, started_at, finished_at
        FROM history
        ORDER BY finished_at DESC
        LIMIT ?
    )"));
    query.addBindValue(limit > 0 ? limit : -1);

    if (!query.exec()) {
        qWarning() << "PersistenceManager: Failed to load history:" << query.lastError().text();
        return result;
    }

    while (query.next()) {
        HistoryRecord record;
        record.jobId = QUuid::fromString(query.value(0).toString());
        record.sourceUrl = query.value(1).toString();
        record.title = query.value(2).toString();
        record.format = query.value(3).toString();
        record.quality = query.value(4).toString();
        record.state = jobStateFromString(query.value(5).toString()).value_or(JobState::Failed);
        record.bytesTotal = toOptionalBytes(query.value(6));
        if (!query.value(7).isNull()) {
            record.errorKind = errorKindFromString(query.value(7).toString());
        }
        record.errorCause = errorCauseFromString(query.value(8).toString()).value_or(ErrorCause::None);
        record.errorMessage = query.value(9).toString();
        record.startedAt = toDateTime(query.value(10));
        record.finishedAt = toDateTime(query.value(11));
        result.push_back(std::move(record));
    }
    return result;
}

void PersistenceManager::clearHistory() {
    WriteRequest request;
    request.op = WriteOp::ClearHistory;
    enqueueWrite(std::move(request));
}

HistoryStatistics PersistenceManager::historyStatistics() {
    HistoryStatistics stats;
    if (!m_ready) {
        return stats;
    }
    flush();

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    if (!query.exec(QStringLiteral("SELECT state, COUNT(*) FROM history GROUP BY state"))) {
        qWarning() << "PersistenceManager: Failed to compute statistics:" << query.lastError().text();
        return stats;
    }

    while (query.next()) {
        const int count = query.value(1).toInt();
        stats.total += count;
        switch (jobStateFromString(query.value(0).toString()).value_or(JobState::Queued)) {
            case JobState::Completed: stats.completed += count; break;
            case JobState::Failed:    stats.failed += count; break;
            case JobState::Cancelled: stats.cancelled += count; break;
            default: break;
        }
    }
    return stats;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════════════════

void PersistenceManager::saveSetting(const QString& key, const QString& value) {
    WriteRequest request;
    request.op = WriteOp::SaveSetting;
    request.key = key;
    request.value = value;
    enqueueWrite(std::move(request));
}

QString PersistenceManager::loadSetting(const QString& key, const QString& defaultValue) {
    if (!m_ready) {
        return defaultValue;
    }
    flush();

    QSqlQuery query(QSqlDatabase::database(m_connectionName, false));
    query.prepare(QStringLiteral("SELECT value FROM settings WHERE key = ?"));
    query.addBindValue(key);

    if (query.exec() && query.next()) {
        return query.value(0).toString();
    }
    return defaultValue;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Async Write Implementation
// ═══════════════════════════════════════════════════════════════════════════════

void PersistenceManager::enqueueWrite(WriteRequest request) {
    if (!m_running) {
        qWarning() << "PersistenceManager: Write dropped, database not open";
        return;
    }
    {
        std::lock_guard lock(m_queueMutex);
        m_writeQueue.push(std::move(request));
        ++m_pendingWrites;
    }
    m_queueCondition.notify_one();
}

void PersistenceManager::writeThreadLoop() {
    qDebug() << "PersistenceManager: Write thread started";

    {
        QSqlDatabase db = QSqlDatabase::cloneDatabase(m_connectionName, m_writerConnectionName);
        if (!db.open()) {
            reportError(QStringLiteral("Write connection failed: %1").arg(db.lastError().text()));
        } else {
            QSqlQuery pragma(db);
            pragma.exec(QStringLiteral("PRAGMA busy_timeout = 5000"));
        }

        while (true) {
            WriteRequest request;

            {
                std::unique_lock lock(m_queueMutex);
                m_queueCondition.wait(lock, [this]() {
                    return !m_writeQueue.empty() || !m_running;
                });

                if (m_writeQueue.empty()) {
                    break;  // Stopped and drained
                }

                request = std::move(m_writeQueue.front());
                m_writeQueue.pop();
            }

            if (db.isOpen()) {
                processWrite(db, request);
            }

            {
                std::lock_guard lock(m_queueMutex);
                --m_pendingWrites;
            }
            m_idleCondition.notify_all();
        }

        db.close();
    }
    QSqlDatabase::removeDatabase(m_writerConnectionName);

    m_idleCondition.notify_all();
    qDebug() << "PersistenceManager: Write thread stopped";
}

void PersistenceManager::processWrite(QSqlDatabase& db, const WriteRequest& request) {
    switch (request.op) {
        case WriteOp::SaveJob:
            doSaveJob(db, request.job);
            break;
        case WriteOp::DeleteJob:
            doDeleteJob(db, request.id);
            break;
        case WriteOp::SaveHistory:
            doSaveHistory(db, request.history);
            break;
        case WriteOp::ClearHistory:
            doClearHistory(db);
            break;
        case WriteOp::SaveSetting:
            doSaveSetting(db, request.key, request.value);
            break;
    }
}

void PersistenceManager::doSaveJob(QSqlDatabase& db, const JobRecord& job) {
    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        INSERT OR REPLACE INTO jobs
        (id, source_url, quality, format, title, state, bytes_received, bytes_total,
         token_offset, token_format, token_partial_path, token_engine_state,
         error_kind, error_cause, error_message, created_at, started_at, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )"));

    query.addBindValue(idText(job.id));
    query.addBindValue(job.sourceUrl);
    query.addBindValue(job.quality);
    query.addBindValue(job.format);
    query.addBindValue(job.title);
    query.addBindValue(jobStateToString(job.state));
    query.addBindValue(static_cast<qlonglong>(job.bytesReceived));
    query.addBindValue(toVariant(job.bytesTotal));
    if (job.resumeToken) {
        query.addBindValue(static_cast<qlonglong>(job.resumeToken->offset));
        query.addBindValue(job.resumeToken->format);
        query.addBindValue(job.resumeToken->partialPath);
        query.addBindValue(job.resumeToken->engineState);
    } else {
        query.addBindValue(QVariant());
        query.addBindValue(QVariant());
        query.addBindValue(QVariant());
        query.addBindValue(QVariant());
    }
    query.addBindValue(job.error.hasError() ? QVariant(errorKindToString(job.error.kind)) : QVariant());
    query.addBindValue(job.error.hasError() ? QVariant(errorCauseToString(job.error.cause)) : QVariant());
    query.addBindValue(job.error.message);
    query.addBindValue(job.createdAt.isValid() ? job.createdAt.toMSecsSinceEpoch()
                                               : QDateTime::currentMSecsSinceEpoch());
    query.addBindValue(toVariant(job.startedAt));
    query.addBindValue(QDateTime::currentMSecsSinceEpoch());

    if (!query.exec()) {
        reportError(QStringLiteral("Failed to save checkpoint: %1").arg(query.lastError().text()));
    }
}

void PersistenceManager::doDeleteJob(QSqlDatabase& db, const JobId& id) {
    QSqlQuery query(db);
    query.prepare(QStringLiteral("DELETE FROM jobs WHERE id = ?"));
    query.addBindValue(idText(id));

    if (!query.exec()) {
        reportError(QStringLiteral("Failed to drop checkpoint: %1").arg(query.lastError().text()));
    }
}

void PersistenceManager::doSaveHistory(QSqlDatabase& db, const HistoryRecord& record) {
    QSqlQuery query(db);
    query.prepare(QStringLiteral(R"(
        INSERT OR REPLACE INTO history
        (job_id, source_url, title, format, quality, state, bytes_total,
         error_kind, error_cause, error_message, started_at, finished_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )"));

    query.addBindValue(idText(record.jobId));
    query.addBindValue(record.sourceUrl);
    query.addBindValue(record.title);
    query.addBindValue(record.format);
    query.addBindValue(record.quality);
    query.addBindValue(jobStateToString(record.state));
    query.addBindValue(toVariant(record.bytesTotal));
    query.addBindValue(record.errorKind ? QVariant(errorKindToString(*record.errorKind)) : QVariant());
    query.addBindValue(record.errorKind ? QVariant(errorCauseToString(record.errorCause)) : QVariant());
    query.addBindValue(record.errorMessage);
    query.addBindValue(toVariant(record.startedAt));
    query.addBindValue(record.finishedAt.isValid() ? record.finishedAt.toMSecsSinceEpoch()
                                                   : QDateTime::currentMSecsSinceEpoch());

    if (!query.exec()) {
        reportError(QStringLiteral("Failed to save history: %1").arg(query.lastError().text()));
    }
}

void PersistenceManager::doClearHistory(QSqlDatabase& db) {
    QSqlQuery query(db);
    if (!query.exec(QStringLiteral("DELETE FROM history"))) {
        reportError(QStringLiteral("Failed to clear history: %1").arg(query.lastError().text()));
    }
}

void PersistenceManager::doSaveSetting(QSqlDatabase& db, const QString& key, const QString& value) {
    QSqlQuery query(db);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)"));
    query.addBindValue(key);
    query.addBindValue(value);

    if (!query.exec()) {
        reportError(QStringLiteral("Failed to save setting: %1").arg(query.lastError().text()));
    }
}

void PersistenceManager::reportError(const QString& message) {
    qWarning() << "PersistenceManager:" << message;
    emit error(message);
}

} // namespace Baresha
