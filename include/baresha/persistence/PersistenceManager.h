/**
 * @file PersistenceManager.h
 * @brief SQLite-based persistence for checkpoints, history and settings
 *
 * Handles all database operations for storing and retrieving:
 * - Checkpoints of non-terminal jobs (restart recovery)
 * - History of terminal jobs
 * - Application settings
 *
 * Uses WAL mode for better concurrent access and crash recovery. Writes are
 * queued and executed on a dedicated thread with its own connection, so the
 * controller's worker never blocks on disk I/O. Reads run on the connection
 * opened by initialize() and must come from that thread; they flush pending
 * writes first.
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/HistoryRecorder.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <QObject>
#include <QSqlDatabase>

namespace Baresha {

struct HistoryStatistics {
    int total = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;
};

class PersistenceManager : public QObject, public HistoryRecorder, public CheckpointStore {
    Q_OBJECT

public:
    explicit PersistenceManager(QObject* parent = nullptr);
    ~PersistenceManager() override;

    // Non-copyable
    PersistenceManager(const PersistenceManager&) = delete;
    PersistenceManager& operator=(const PersistenceManager&) = delete;

    // ═══════════════════════════════════════════════════════════════════════════
    // Initialization
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Open (or create) the database and start the write thread
     * @param dbPath Database file; empty selects the application data directory
     * @return true on success
     */
    bool initialize(const QString& dbPath = QString());

    /**
     * @brief Drain pending writes, stop the write thread and close the database
     */
    void close();

    [[nodiscard]] bool isReady() const { return m_ready; }
    [[nodiscard]] QString databasePath() const { return m_dbPath; }

    /**
     * @brief Block until every queued write has been executed
     */
    void flush();

    // ═══════════════════════════════════════════════════════════════════════════
    // Checkpoints
    // ═══════════════════════════════════════════════════════════════════════════

    void saveCheckpoint(const Job& job) override;
    void dropCheckpoint(const JobId& id) override;

    /**
     * @brief Load every stored checkpoint, oldest first
     *
     * Jobs come back normalized by Job::fromRecord(): Downloading returns as
     * Paused, Resolving as Queued.
     */
    [[nodiscard]] std::vector<Job> loadCheckpoints();

    // ═══════════════════════════════════════════════════════════════════════════
    // History
    // ═══════════════════════════════════════════════════════════════════════════

    void record(const HistoryRecord& record) override;

    /// Most recent @p limit records, newest first
    [[nodiscard]] std::vector<HistoryRecord> loadHistory(int limit = Constants::HISTORY_DEFAULT_LIMIT);

    void clearHistory();

    [[nodiscard]] HistoryStatistics historyStatistics();

    // ═══════════════════════════════════════════════════════════════════════════
    // Settings
    // ═══════════════════════════════════════════════════════════════════════════

    void saveSetting(const QString& key, const QString& value);
    [[nodiscard]] QString loadSetting(const QString& key, const QString& defaultValue = QString());

signals:
    /**
     * @brief Emitted on database error (from the write thread)
     */
    void error(const QString& message);

private:
    enum class WriteOp {
        SaveJob,
        DeleteJob,
        SaveHistory,
        ClearHistory,
        SaveSetting
    };

    struct WriteRequest {
        WriteOp op = WriteOp::SaveJob;
        JobRecord job;
        HistoryRecord history;
        JobId id;
        QString key;
        QString value;
    };

    bool createSchema();
    int schemaVersion();

    void enqueueWrite(WriteRequest request);
    void writeThreadLoop();
    void processWrite(QSqlDatabase& db, const WriteRequest& request);

    void doSaveJob(QSqlDatabase& db, const JobRecord& job);
    void doDeleteJob(QSqlDatabase& db, const JobId& id);
    void doSaveHistory(QSqlDatabase& db, const HistoryRecord& record);
    void doClearHistory(QSqlDatabase& db);
    void doSaveSetting(QSqlDatabase& db, const QString& key, const QString& value);

    void reportError(const QString& message);

    QString m_dbPath;
    QString m_connectionName;
    QString m_writerConnectionName;
    bool m_ready = false;

    // Async write queue
    std::thread m_writeThread;
    std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::condition_variable m_idleCondition;
    std::queue<WriteRequest> m_writeQueue;
    int m_pendingWrites = 0;
    std::atomic<bool> m_running{false};
};

} // namespace Baresha
