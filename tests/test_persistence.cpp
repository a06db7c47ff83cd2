/**
 * @file test_persistence.cpp
 * @brief Tests for the SQLite checkpoint/history store and stored settings
 */

#include <QtTest>
#include <QTemporaryDir>

#include <memory>

#include "baresha/app/AppSettings.h"
#include "baresha/app/BatchRunner.h"
#include "baresha/core/Errors.h"
#include "baresha/core/HistoryRecorder.h"
#include "baresha/core/Job.h"
#include "baresha/persistence/PersistenceManager.h"

using namespace Baresha;

namespace {

const QString URL = QStringLiteral("https://media.example.com/talk.webm");

JobRecord recordInState(JobState state, qint64 createdMsAgo) {
    JobRecord record;
    record.id = QUuid::createUuid();
    record.sourceUrl = URL;
    record.quality = QStringLiteral("720p");
    record.format = QStringLiteral("webm");
    record.title = QStringLiteral("A talk");
    record.state = state;
    record.createdAt = QDateTime::currentDateTimeUtc().addMSecs(-createdMsAgo);
    return record;
}

ResumeToken tokenAt(ByteOffset offset) {
    ResumeToken token;
    token.sourceUrl = URL;
    token.format = QStringLiteral("webm");
    token.offset = offset;
    token.partialPath = QStringLiteral("/downloads/talk.webm.part");
    token.engineState = QByteArrayLiteral("talk.webm");
    return token;
}

HistoryRecord historyEntry(JobState state, qint64 finishedMsAgo) {
    HistoryRecord record;
    record.jobId = QUuid::createUuid();
    record.sourceUrl = URL;
    record.title = QStringLiteral("Entry %1").arg(finishedMsAgo);
    record.format = QStringLiteral("webm");
    record.quality = QStringLiteral("best");
    record.state = state;
    record.startedAt = QDateTime::currentDateTimeUtc().addMSecs(-finishedMsAgo - 1000);
    record.finishedAt = QDateTime::currentDateTimeUtc().addMSecs(-finishedMsAgo);
    record.bytesTotal = 4096;
    return record;
}

} // namespace

class TestPersistence : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Checkpoints
    void testCheckpointRoundTrip();
    void testCheckpointNormalizesInterruptedJobs();
    void testCheckpointOverwriteAndDrop();
    void testCheckpointsSurviveReopen();

    // History
    void testHistoryNewestFirstWithLimit();
    void testHistoryKeepsErrorDetails();
    void testClearHistory();
    void testHistoryStatistics();

    // Settings
    void testSettingsStore();
    void testAppSettingsRoundTrip();
    void testAppSettingsIgnoresInvalidValues();
    void testParseRate_data();
    void testParseRate();
    void testParseRateRejects_data();
    void testParseRateRejects();

    // Runner
    void testExitCodeCountsRestoredPausedJobs();
    void testExitCodeZeroOnlyWhenAllCompleted();

private:
    AppSettings runnerSettings() const;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<PersistenceManager> m_db;

    QString dbPath() const { return m_dir->filePath(QStringLiteral("test.db")); }
};

void TestPersistence::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_db = std::make_unique<PersistenceManager>();
    QVERIFY(m_db->initialize(dbPath()));
    QVERIFY(m_db->isReady());
}

void TestPersistence::cleanup()
{
    m_db.reset();
    m_dir.reset();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Checkpoints
// ═══════════════════════════════════════════════════════════════════════════════

void TestPersistence::testCheckpointRoundTrip()
{
    JobRecord record = recordInState(JobState::Paused, 0);
    record.bytesReceived = 2048;
    record.bytesTotal = 8192;
    record.resumeToken = tokenAt(2048);
    record.startedAt = QDateTime::currentDateTimeUtc();
    const Job job = Job::fromRecord(record);

    m_db->saveCheckpoint(job);
    const auto loaded = m_db->loadCheckpoints();

    QCOMPARE(loaded.size(), size_t(1));
    const Job& restored = loaded.front();
    QCOMPARE(restored.id(), job.id());
    QCOMPARE(restored.sourceUrl(), URL);
    QCOMPARE(restored.requestedQuality(), QStringLiteral("720p"));
    QCOMPARE(restored.requestedFormat(), QStringLiteral("webm"));
    QCOMPARE(restored.title(), QStringLiteral("A talk"));
    QCOMPARE(restored.state(), JobState::Paused);
    QCOMPARE(restored.progress().bytesReceived, ByteCount(2048));
    QCOMPARE(restored.progress().bytesTotal, std::optional<ByteCount>(8192));
    QVERIFY(restored.resumeToken().has_value());
    QCOMPARE(restored.resumeToken()->offset, ByteOffset(2048));
    QCOMPARE(restored.resumeToken()->partialPath, QStringLiteral("/downloads/talk.webm.part"));
    QCOMPARE(restored.resumeToken()->engineState, QByteArrayLiteral("talk.webm"));
    QCOMPARE(restored.createdAt().toMSecsSinceEpoch(), job.createdAt().toMSecsSinceEpoch());
}

void TestPersistence::testCheckpointNormalizesInterruptedJobs()
{
    // Checkpoints as they stand when the process dies mid-resolve/mid-transfer
    Job queued = Job::fromRecord(recordInState(JobState::Queued, 3000));

    Job downloading = Job::fromRecord(recordInState(JobState::Queued, 2000));
    downloading.apply(JobTransition::Start);
    downloading.apply(JobTransition::Resolved);
    downloading.recordProgress(5000, 100.0);
    downloading.setResumeToken(tokenAt(4096));

    Job resolving = Job::fromRecord(recordInState(JobState::Queued, 1000));
    resolving.apply(JobTransition::Start);

    m_db->saveCheckpoint(queued);
    m_db->saveCheckpoint(downloading);
    m_db->saveCheckpoint(resolving);

    const auto loaded = m_db->loadCheckpoints();
    QCOMPARE(loaded.size(), size_t(3));

    // Oldest first
    QCOMPARE(loaded[0].id(), queued.id());
    QCOMPARE(loaded[0].state(), JobState::Queued);

    QCOMPARE(loaded[1].id(), downloading.id());
    QCOMPARE(loaded[1].state(), JobState::Paused);
    QCOMPARE(loaded[1].progress().bytesReceived, ByteCount(4096));
    QCOMPARE(loaded[1].resumeToken()->offset, ByteOffset(4096));

    QCOMPARE(loaded[2].id(), resolving.id());
    QCOMPARE(loaded[2].state(), JobState::Queued);
}

void TestPersistence::testCheckpointOverwriteAndDrop()
{
    Job job(QUuid::createUuid(), URL, QStringLiteral("best"), QStringLiteral("webm"));
    m_db->saveCheckpoint(job);

    job.apply(JobTransition::Start);
    job.apply(JobTransition::Resolved);
    job.recordProgress(1024, 10.0);
    job.setResumeToken(tokenAt(1024));
    job.apply(JobTransition::Pause);
    m_db->saveCheckpoint(job);

    auto loaded = m_db->loadCheckpoints();
    QCOMPARE(loaded.size(), size_t(1));
    QCOMPARE(loaded.front().state(), JobState::Paused);
    QCOMPARE(loaded.front().resumeToken()->offset, ByteOffset(1024));

    m_db->dropCheckpoint(job.id());
    QVERIFY(m_db->loadCheckpoints().empty());
}

void TestPersistence::testCheckpointsSurviveReopen()
{
    JobRecord record = recordInState(JobState::Paused, 0);
    record.resumeToken = tokenAt(100);
    record.bytesReceived = 100;
    m_db->saveCheckpoint(Job::fromRecord(record));
    m_db->close();
    QVERIFY(!m_db->isReady());

    PersistenceManager reopened;
    QVERIFY(reopened.initialize(dbPath()));
    const auto loaded = reopened.loadCheckpoints();
    QCOMPARE(loaded.size(), size_t(1));
    QCOMPARE(loaded.front().id(), record.id);
    QCOMPARE(loaded.front().resumeToken()->offset, ByteOffset(100));
}

// ═══════════════════════════════════════════════════════════════════════════════
// History
// ═══════════════════════════════════════════════════════════════════════════════

void TestPersistence::testHistoryNewestFirstWithLimit()
{
    for (int i = 0; i < 5; ++i) {
        m_db->record(historyEntry(JobState::Completed, (5 - i) * 1000));
    }

    const auto all = m_db->loadHistory(10);
    QCOMPARE(all.size(), size_t(5));
    for (size_t i = 1; i < all.size(); ++i) {
        QVERIFY(all[i - 1].finishedAt >= all[i].finishedAt);
    }
    QCOMPARE(all.front().title, QStringLiteral("Entry 1000"));

    const auto recent = m_db->loadHistory(2);
    QCOMPARE(recent.size(), size_t(2));
    QCOMPARE(recent[0].title, QStringLiteral("Entry 1000"));
    QCOMPARE(recent[1].title, QStringLiteral("Entry 2000"));
}

void TestPersistence::testHistoryKeepsErrorDetails()
{
    HistoryRecord failed = historyEntry(JobState::Failed, 0);
    failed.bytesTotal.reset();
    failed.errorKind = ErrorKind::Resolve;
    failed.errorCause = ErrorCause::Restricted;
    failed.errorMessage = QStringLiteral("Private video");
    m_db->record(failed);

    const auto loaded = m_db->loadHistory();
    QCOMPARE(loaded.size(), size_t(1));
    const HistoryRecord& record = loaded.front();
    QCOMPARE(record.jobId, failed.jobId);
    QCOMPARE(record.state, JobState::Failed);
    QCOMPARE(record.errorKind, std::optional<ErrorKind>(ErrorKind::Resolve));
    QCOMPARE(record.errorCause, ErrorCause::Restricted);
    QCOMPARE(record.errorMessage, QStringLiteral("Private video"));
    QVERIFY(!record.bytesTotal.has_value());
    QCOMPARE(record.finishedAt.toMSecsSinceEpoch(), failed.finishedAt.toMSecsSinceEpoch());
}

void TestPersistence::testClearHistory()
{
    m_db->record(historyEntry(JobState::Completed, 10));
    m_db->record(historyEntry(JobState::Cancelled, 20));
    QCOMPARE(m_db->loadHistory().size(), size_t(2));

    m_db->clearHistory();
    QVERIFY(m_db->loadHistory().empty());
    QCOMPARE(m_db->historyStatistics().total, 0);
}

void TestPersistence::testHistoryStatistics()
{
    m_db->record(historyEntry(JobState::Completed, 10));
    m_db->record(historyEntry(JobState::Completed, 20));
    m_db->record(historyEntry(JobState::Completed, 30));
    m_db->record(historyEntry(JobState::Failed, 40));
    m_db->record(historyEntry(JobState::Cancelled, 50));

    const HistoryStatistics stats = m_db->historyStatistics();
    QCOMPARE(stats.total, 5);
    QCOMPARE(stats.completed, 3);
    QCOMPARE(stats.failed, 1);
    QCOMPARE(stats.cancelled, 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════════════════

void TestPersistence::testSettingsStore()
{
    QCOMPARE(m_db->loadSetting(QStringLiteral("missing"), QStringLiteral("fallback")),
             QStringLiteral("fallback"));

    m_db->saveSetting(QStringLiteral("key"), QStringLiteral("one"));
    m_db->saveSetting(QStringLiteral("key"), QStringLiteral("two"));
    QCOMPARE(m_db->loadSetting(QStringLiteral("key")), QStringLiteral("two"));
}

void TestPersistence::testAppSettingsRoundTrip()
{
    AppSettings settings = AppSettings::defaults();
    QCOMPARE(settings.defaultQuality, QStringLiteral("best"));
    QCOMPARE(settings.defaultFormat, QStringLiteral("mp4"));
    QCOMPARE(settings.speedLimit, ByteCount(0));

    settings.downloadPath = m_dir->path();
    settings.defaultQuality = QStringLiteral("480p");
    settings.defaultFormat = QStringLiteral("mp3");
    settings.speedLimit = 512 * 1024;
    settings.resolveTimeout = Duration(5000);
    settings.ytDlpPath = QStringLiteral("/opt/bin/yt-dlp");
    settings.save(*m_db);

    const AppSettings loaded = AppSettings::load(*m_db);
    QCOMPARE(loaded.downloadPath, m_dir->path());
    QCOMPARE(loaded.defaultQuality, QStringLiteral("480p"));
    QCOMPARE(loaded.defaultFormat, QStringLiteral("mp3"));
    QCOMPARE(loaded.speedLimit, ByteCount(512 * 1024));
    QCOMPARE(loaded.resolveTimeout, Duration(5000));
    QCOMPARE(loaded.ytDlpPath, QStringLiteral("/opt/bin/yt-dlp"));
    QVERIFY(loaded.ffmpegPath.isEmpty());
}

void TestPersistence::testAppSettingsIgnoresInvalidValues()
{
    m_db->saveSetting(QString::fromLatin1(SettingsKeys::DEFAULT_QUALITY), QStringLiteral("8k-ultra"));
    m_db->saveSetting(QString::fromLatin1(SettingsKeys::DEFAULT_FORMAT), QStringLiteral("exe"));
    m_db->saveSetting(QString::fromLatin1(SettingsKeys::SPEED_LIMIT), QStringLiteral("-5"));
    m_db->saveSetting(QString::fromLatin1(SettingsKeys::RESOLVE_TIMEOUT), QStringLiteral("soon"));

    const AppSettings loaded = AppSettings::load(*m_db);
    const AppSettings defaults = AppSettings::defaults();
    QCOMPARE(loaded.defaultQuality, defaults.defaultQuality);
    QCOMPARE(loaded.defaultFormat, defaults.defaultFormat);
    QCOMPARE(loaded.speedLimit, ByteCount(0));
    QCOMPARE(loaded.resolveTimeout, Constants::DEFAULT_RESOLVE_TIMEOUT);
}

void TestPersistence::testParseRate_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<qint64>("expected");

    QTest::newRow("plain") << QStringLiteral("1500") << qint64(1500);
    QTest::newRow("zero") << QStringLiteral("0") << qint64(0);
    QTest::newRow("kilo") << QStringLiteral("500K") << qint64(500 * 1024);
    QTest::newRow("lower-kilo-bytes") << QStringLiteral("500kb") << qint64(500 * 1024);
    QTest::newRow("mega-per-second") << QStringLiteral("2M/s") << qint64(2 * 1024 * 1024);
    QTest::newRow("fraction") << QStringLiteral("1.5G") << qint64(1610612736);
    QTest::newRow("spaces") << QStringLiteral("  64 K ") << qint64(64 * 1024);
}

void TestPersistence::testParseRate()
{
    QFETCH(QString, text);
    QFETCH(qint64, expected);

    QCOMPARE(AppSettings::parseRate(text), ByteCount(expected));
}

void TestPersistence::testParseRateRejects_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("negative") << QStringLiteral("-1");
    QTest::newRow("negative-unit") << QStringLiteral("-2M");
    QTest::newRow("garbage") << QStringLiteral("fast");
    QTest::newRow("empty") << QString();
    QTest::newRow("unit-only") << QStringLiteral("K");
    QTest::newRow("huge") << QStringLiteral("1e30G");
    QTest::newRow("two-to-the-63") << QStringLiteral("8589934592G");
}

void TestPersistence::testParseRateRejects()
{
    QFETCH(QString, text);

    QVERIFY_THROWS_EXCEPTION(RateLimitConfigError, AppSettings::parseRate(text));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Runner
// ═══════════════════════════════════════════════════════════════════════════════

AppSettings TestPersistence::runnerSettings() const
{
    AppSettings settings = AppSettings::defaults();
    settings.downloadPath = m_dir->path();
    settings.ytDlpPath = m_dir->filePath(QStringLiteral("yt-dlp"));
    settings.ffmpegPath = m_dir->filePath(QStringLiteral("ffmpeg"));
    return settings;
}

void TestPersistence::testExitCodeCountsRestoredPausedJobs()
{
    JobRecord record = recordInState(JobState::Paused, 0);
    record.bytesReceived = 2048;
    record.resumeToken = tokenAt(2048);
    m_db->saveCheckpoint(Job::fromRecord(record));

    BatchRunner runner(runnerSettings(), m_db.get());
    QCOMPARE(runner.restoreCheckpoints(false), 1);
    QCOMPARE(runner.queue().countInState(JobState::Paused), 1);

    // A restored job left unresumed is not a completed run
    QCOMPARE(runner.exitCode(), 1);
}

void TestPersistence::testExitCodeZeroOnlyWhenAllCompleted()
{
    BatchRunner runner(runnerSettings(), nullptr);
    QCOMPARE(runner.addUrls({URL, QStringLiteral("not a url")}), 1);

    const JobId id = runner.queue().snapshot()[0].id();
    runner.queue().transition(id, JobTransition::Start);
    runner.queue().transition(id, JobTransition::Resolved);
    runner.queue().transition(id, JobTransition::Complete);
    QCOMPARE(runner.exitCode(), 0);

    runner.addUrls({URL});
    QCOMPARE(runner.exitCode(), 1);
}

QTEST_MAIN(TestPersistence)
#include "test_persistence.moc"
