/**
 * @file test_job.cpp
 * @brief Unit tests for the Job state machine
 */

#include <QtTest>

#include "baresha/core/Errors.h"
#include "baresha/core/Job.h"

using namespace Baresha;

namespace {

const QString URL = QStringLiteral("https://media.example.com/clip.mp4");

Job makeJob() {
    return Job(QUuid::createUuid(), URL, QStringLiteral("720p"), QStringLiteral("mp4"));
}

Job downloadingJob() {
    Job job = makeJob();
    job.apply(JobTransition::Start);
    job.apply(JobTransition::Resolved);
    return job;
}

ResumeToken tokenAt(ByteOffset offset) {
    ResumeToken token;
    token.sourceUrl = URL;
    token.format = QStringLiteral("mp4");
    token.offset = offset;
    token.partialPath = QStringLiteral("/tmp/clip.mp4.part");
    return token;
}

} // namespace

class TestJob : public QObject
{
    Q_OBJECT

private slots:
    void testInitialState();
    void testTransitionTable_data();
    void testTransitionTable();
    void testInvalidTransitionThrows();
    void testTerminalStatesAcceptNothing();
    void testStartStampsAndClearsError();
    void testProgressIsMonotonic();
    void testProgressIgnoredOutsideDownloading();
    void testResumeContinuesFromTokenOffset();
    void testResumeWithoutTokenStartsOver();
    void testCompleteClearsToken();
    void testCancelKeepsToken();
    void testSelectionsOnlyChangeWhileQueued();
    void testForeignTokenRejected();
    void testNegativeTotalIsUnknown();
    void testRestoreNormalizesInterruptedStates();
    void testRestoreDropsForeignToken();
};

void TestJob::testInitialState()
{
    const Job job = makeJob();

    QCOMPARE(job.state(), JobState::Queued);
    QCOMPARE(job.progress().bytesReceived, ByteCount(0));
    QVERIFY(!job.progress().bytesTotal.has_value());
    QVERIFY(!job.resumeToken().has_value());
    QVERIFY(!job.error().hasError());
    QVERIFY(job.createdAt().isValid());
    QVERIFY(!job.startedAt().isValid());
    QVERIFY(!job.isTerminal());
}

void TestJob::testTransitionTable_data()
{
    QTest::addColumn<JobState>("from");
    QTest::addColumn<int>("transition");
    QTest::addColumn<JobState>("to");

    QTest::newRow("queued-start") << JobState::Queued << int(JobTransition::Start) << JobState::Resolving;
    QTest::newRow("queued-cancel") << JobState::Queued << int(JobTransition::Cancel) << JobState::Cancelled;
    QTest::newRow("resolving-resolved") << JobState::Resolving << int(JobTransition::Resolved) << JobState::Downloading;
    QTest::newRow("resolving-fail") << JobState::Resolving << int(JobTransition::ResolveFail) << JobState::Failed;
    QTest::newRow("resolving-cancel") << JobState::Resolving << int(JobTransition::Cancel) << JobState::Cancelled;
    QTest::newRow("downloading-complete") << JobState::Downloading << int(JobTransition::Complete) << JobState::Completed;
    QTest::newRow("downloading-pause") << JobState::Downloading << int(JobTransition::Pause) << JobState::Paused;
    QTest::newRow("downloading-fail") << JobState::Downloading << int(JobTransition::TransferFail) << JobState::Failed;
    QTest::newRow("downloading-cancel") << JobState::Downloading << int(JobTransition::Cancel) << JobState::Cancelled;
    QTest::newRow("paused-resume") << JobState::Paused << int(JobTransition::Resume) << JobState::Downloading;
    QTest::newRow("paused-cancel") << JobState::Paused << int(JobTransition::Cancel) << JobState::Cancelled;
}

void TestJob::testTransitionTable()
{
    QFETCH(JobState, from);
    QFETCH(int, transition);
    QFETCH(JobState, to);

    const auto next = Job::nextState(from, static_cast<JobTransition>(transition));
    QVERIFY(next.has_value());
    QCOMPARE(*next, to);
}

void TestJob::testInvalidTransitionThrows()
{
    Job job = makeJob();

    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.apply(JobTransition::Pause));
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.apply(JobTransition::Resume));
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.apply(JobTransition::Complete));
    QCOMPARE(job.state(), JobState::Queued);

    job.apply(JobTransition::Start);
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.apply(JobTransition::Pause));
    QCOMPARE(job.state(), JobState::Resolving);
}

void TestJob::testTerminalStatesAcceptNothing()
{
    const JobTransition all[] = {
        JobTransition::Start, JobTransition::Resolved, JobTransition::ResolveFail,
        JobTransition::Complete, JobTransition::TransferFail, JobTransition::Pause,
        JobTransition::Resume, JobTransition::Cancel,
    };
    for (JobState state : {JobState::Completed, JobState::Failed, JobState::Cancelled}) {
        QVERIFY(Job::isTerminal(state));
        for (JobTransition transition : all) {
            QVERIFY(!Job::canApply(state, transition));
        }
    }
}

void TestJob::testStartStampsAndClearsError()
{
    Job job = makeJob();
    job.setError({ErrorKind::Resolve, ErrorCause::Timeout, QStringLiteral("stale")});

    const JobState previous = job.apply(JobTransition::Start);

    QCOMPARE(previous, JobState::Queued);
    QVERIFY(job.startedAt().isValid());
    QVERIFY(!job.error().hasError());
}

void TestJob::testProgressIsMonotonic()
{
    Job job = downloadingJob();

    QVERIFY(job.recordProgress(1000, 50.0));
    QVERIFY(!job.recordProgress(500, 50.0));
    QCOMPARE(job.progress().bytesReceived, ByteCount(1000));
    QVERIFY(job.recordProgress(4000, 80.0));
    QCOMPARE(job.progress().bytesReceived, ByteCount(4000));
    QCOMPARE(job.progress().instantaneousRate, 80.0);
}

void TestJob::testProgressIgnoredOutsideDownloading()
{
    Job job = makeJob();
    QVERIFY(!job.recordProgress(100, 1.0));
    QCOMPARE(job.progress().bytesReceived, ByteCount(0));
}

void TestJob::testResumeContinuesFromTokenOffset()
{
    Job job = downloadingJob();
    job.recordProgress(9000, 100.0);
    job.setResumeToken(tokenAt(8192));
    job.apply(JobTransition::Pause);

    QCOMPARE(job.progress().instantaneousRate, 0.0);

    job.apply(JobTransition::Resume);
    QCOMPARE(job.state(), JobState::Downloading);
    QCOMPARE(job.progress().bytesReceived, ByteCount(8192));
}

void TestJob::testResumeWithoutTokenStartsOver()
{
    Job job = downloadingJob();
    job.recordProgress(9000, 100.0);
    job.apply(JobTransition::Pause);
    job.apply(JobTransition::Resume);

    QCOMPARE(job.progress().bytesReceived, ByteCount(0));
}

void TestJob::testCompleteClearsToken()
{
    Job job = downloadingJob();
    job.setResumeToken(tokenAt(100));
    job.recordProgress(2048, 0.0);
    job.apply(JobTransition::Complete);

    QVERIFY(!job.resumeToken().has_value());
    QCOMPARE(job.progress().bytesTotal, std::optional<ByteCount>(2048));
    QVERIFY(job.finishedAt().isValid());
}

void TestJob::testCancelKeepsToken()
{
    Job job = downloadingJob();
    job.setResumeToken(tokenAt(100));
    job.apply(JobTransition::Cancel);

    QCOMPARE(job.state(), JobState::Cancelled);
    QVERIFY(job.resumeToken().has_value());
    QVERIFY(job.finishedAt().isValid());
}

void TestJob::testSelectionsOnlyChangeWhileQueued()
{
    Job job = makeJob();
    job.setRequestedQuality(QStringLiteral("1080p"));
    job.setRequestedFormat(QStringLiteral("webm"));
    QCOMPARE(job.requestedQuality(), QStringLiteral("1080p"));
    QCOMPARE(job.requestedFormat(), QStringLiteral("webm"));

    job.apply(JobTransition::Start);
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.setRequestedQuality(QStringLiteral("360p")));
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.setRequestedFormat(QStringLiteral("mp3")));
    QCOMPARE(job.requestedQuality(), QStringLiteral("1080p"));
}

void TestJob::testForeignTokenRejected()
{
    Job job = downloadingJob();

    ResumeToken other = tokenAt(10);
    other.sourceUrl = QStringLiteral("https://elsewhere.example.com/x.mp4");
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.setResumeToken(other));

    ResumeToken wrongFormat = tokenAt(10);
    wrongFormat.format = QStringLiteral("mp3");
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, job.setResumeToken(wrongFormat));

    QVERIFY(!job.resumeToken().has_value());
}

void TestJob::testNegativeTotalIsUnknown()
{
    Job job = makeJob();
    job.setBytesTotal(-1);
    QVERIFY(!job.progress().bytesTotal.has_value());
    job.setBytesTotal(500);
    QCOMPARE(job.progress().percent(), 0.0);
}

void TestJob::testRestoreNormalizesInterruptedStates()
{
    Job downloading = downloadingJob();
    downloading.recordProgress(70000, 10.0);
    downloading.setResumeToken(tokenAt(65536));

    const Job restored = Job::fromRecord(downloading.toRecord());
    QCOMPARE(restored.id(), downloading.id());
    QCOMPARE(restored.state(), JobState::Paused);
    QCOMPARE(restored.progress().bytesReceived, ByteCount(65536));
    QVERIFY(restored.resumeToken().has_value());

    Job resolving = makeJob();
    resolving.apply(JobTransition::Start);
    QCOMPARE(Job::fromRecord(resolving.toRecord()).state(), JobState::Queued);

    const Job queued = makeJob();
    QCOMPARE(Job::fromRecord(queued.toRecord()).state(), JobState::Queued);
}

void TestJob::testRestoreDropsForeignToken()
{
    JobRecord record = downloadingJob().toRecord();
    ResumeToken foreign = tokenAt(4096);
    foreign.format = QStringLiteral("webm");
    record.resumeToken = foreign;

    const Job restored = Job::fromRecord(record);
    QVERIFY(!restored.resumeToken().has_value());
    QCOMPARE(restored.progress().bytesReceived, ByteCount(0));
}

QTEST_MAIN(TestJob)
#include "test_job.moc"
