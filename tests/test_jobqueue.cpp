/**
 * @file test_jobqueue.cpp
 * @brief Unit tests for JobQueue
 */

#include <QtTest>

#include "baresha/core/Errors.h"
#include "baresha/core/JobQueue.h"

using namespace Baresha;

namespace {

const QString QUALITY = QStringLiteral("best");
const QString FORMAT = QStringLiteral("mp4");

QString url(int n) {
    return QStringLiteral("https://cdn.example.com/video%1.mp4").arg(n);
}

} // namespace

class TestJobQueue : public QObject
{
    Q_OBJECT

private slots:
    void testEnqueuePreservesOrder();
    void testInvalidUrlRejected_data();
    void testInvalidUrlRejected();
    void testEnqueueTrimsUrl();
    void testSnapshotIsStable();
    void testNextEligibleSkipsNonQueued();
    void testTransitionThroughQueue();
    void testCancelPendingTouchesOnlyIdleJobs();
    void testRemove();
    void testClearFinished();
    void testEnqueueRetryCarriesToken();
    void testEnqueueRetryRequiresFailedJob();
    void testRestoreRejectsDuplicates();
    void testModifyUnknownJobThrows();
};

void TestJobQueue::testEnqueuePreservesOrder()
{
    JobQueue queue;
    std::vector<JobId> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(queue.enqueue(url(i), QUALITY, FORMAT).id());
    }

    const JobSnapshot snapshot = queue.snapshot();
    QCOMPARE(snapshot.size(), size_t(5));
    for (size_t i = 0; i < ids.size(); ++i) {
        QCOMPARE(snapshot[i].id(), ids[i]);
        QCOMPARE(snapshot[i].state(), JobState::Queued);
    }
}

void TestJobQueue::testInvalidUrlRejected_data()
{
    QTest::addColumn<QString>("input");

    QTest::newRow("empty") << QString();
    QTest::newRow("blank") << QStringLiteral("   ");
    QTest::newRow("no-scheme") << QStringLiteral("www.example.com/video");
    QTest::newRow("ftp") << QStringLiteral("ftp://example.com/file.mp4");
    QTest::newRow("no-host") << QStringLiteral("https:///path");
    QTest::newRow("garbage") << QStringLiteral("not a url at all");
    QTest::newRow("file") << QStringLiteral("file:///etc/passwd");
}

void TestJobQueue::testInvalidUrlRejected()
{
    QFETCH(QString, input);

    JobQueue queue;
    queue.enqueue(url(1), QUALITY, FORMAT);

    QVERIFY_THROWS_EXCEPTION(InvalidUrlError, queue.enqueue(input, QUALITY, FORMAT));
    QCOMPARE(queue.size(), 1);
}

void TestJobQueue::testEnqueueTrimsUrl()
{
    JobQueue queue;
    const Job job = queue.enqueue(QStringLiteral("  https://youtu.be/abc123 \n"), QUALITY, FORMAT);
    QCOMPARE(job.sourceUrl(), QStringLiteral("https://youtu.be/abc123"));
}

void TestJobQueue::testSnapshotIsStable()
{
    JobQueue queue;
    const JobId first = queue.enqueue(url(1), QUALITY, FORMAT).id();

    const JobSnapshot before = queue.snapshot();
    queue.enqueue(url(2), QUALITY, FORMAT);
    queue.transition(first, JobTransition::Cancel);

    QCOMPARE(before.size(), size_t(1));
    QCOMPARE(before[0].state(), JobState::Queued);

    int iterations = 0;
    for (int pass = 0; pass < 2; ++pass) {
        for (const Job& job : before) {
            QCOMPARE(job.id(), first);
            ++iterations;
        }
    }
    QCOMPARE(iterations, 2);
}

void TestJobQueue::testNextEligibleSkipsNonQueued()
{
    JobQueue queue;
    const JobId a = queue.enqueue(url(1), QUALITY, FORMAT).id();
    const JobId b = queue.enqueue(url(2), QUALITY, FORMAT).id();

    QCOMPARE(queue.nextEligible()->id(), a);

    queue.transition(a, JobTransition::Cancel);
    QCOMPARE(queue.nextEligible()->id(), b);

    queue.transition(b, JobTransition::Start);
    QVERIFY(!queue.nextEligible().has_value());
}

void TestJobQueue::testTransitionThroughQueue()
{
    JobQueue queue;
    const JobId id = queue.enqueue(url(1), QUALITY, FORMAT).id();

    QCOMPARE(queue.transition(id, JobTransition::Start).state(), JobState::Resolving);
    QCOMPARE(queue.find(id)->state(), JobState::Resolving);
    QCOMPARE(queue.countInState(JobState::Resolving), 1);

    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.transition(id, JobTransition::Resume));
    QCOMPARE(queue.find(id)->state(), JobState::Resolving);
}

void TestJobQueue::testCancelPendingTouchesOnlyIdleJobs()
{
    JobQueue queue;
    const JobId running = queue.enqueue(url(1), QUALITY, FORMAT).id();
    const JobId paused = queue.enqueue(url(2), QUALITY, FORMAT).id();
    const JobId queued = queue.enqueue(url(3), QUALITY, FORMAT).id();
    const JobId done = queue.enqueue(url(4), QUALITY, FORMAT).id();

    queue.transition(running, JobTransition::Start);
    queue.transition(paused, JobTransition::Start);
    queue.transition(paused, JobTransition::Resolved);
    queue.transition(paused, JobTransition::Pause);
    queue.transition(done, JobTransition::Start);
    queue.transition(done, JobTransition::ResolveFail);

    const auto cancelled = queue.cancelPending();
    QCOMPARE(cancelled.size(), size_t(2));

    QCOMPARE(queue.find(running)->state(), JobState::Resolving);
    QCOMPARE(queue.find(paused)->state(), JobState::Cancelled);
    QCOMPARE(queue.find(queued)->state(), JobState::Cancelled);
    QCOMPARE(queue.find(done)->state(), JobState::Failed);
}

void TestJobQueue::testRemove()
{
    JobQueue queue;
    const JobId idle = queue.enqueue(url(1), QUALITY, FORMAT).id();
    const JobId active = queue.enqueue(url(2), QUALITY, FORMAT).id();
    const JobId paused = queue.enqueue(url(3), QUALITY, FORMAT).id();
    queue.transition(active, JobTransition::Start);
    queue.transition(paused, JobTransition::Start);
    queue.transition(paused, JobTransition::Resolved);
    queue.transition(paused, JobTransition::Pause);

    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.remove(active));
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.remove(paused));
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.remove(QUuid::createUuid()));
    QCOMPARE(queue.find(paused)->state(), JobState::Paused);

    queue.remove(idle);
    QCOMPARE(queue.size(), 2);
    QVERIFY(!queue.find(idle).has_value());
}

void TestJobQueue::testClearFinished()
{
    JobQueue queue;
    const JobId a = queue.enqueue(url(1), QUALITY, FORMAT).id();
    queue.enqueue(url(2), QUALITY, FORMAT);
    const JobId c = queue.enqueue(url(3), QUALITY, FORMAT).id();
    queue.transition(a, JobTransition::Cancel);
    queue.transition(c, JobTransition::Cancel);

    QCOMPARE(queue.clearFinished(), 2);
    QCOMPARE(queue.size(), 1);
    QCOMPARE(queue.snapshot()[0].sourceUrl(), url(2));
}

void TestJobQueue::testEnqueueRetryCarriesToken()
{
    JobQueue queue;
    const JobId id = queue.enqueue(url(1), QStringLiteral("720p"), FORMAT).id();
    queue.transition(id, JobTransition::Start);
    queue.modify(id, [](Job& job) {
        job.setTitle(QStringLiteral("Clip"));
        job.apply(JobTransition::Resolved);
        ResumeToken token;
        token.sourceUrl = job.sourceUrl();
        token.format = job.requestedFormat();
        token.offset = 4096;
        job.setResumeToken(token);
        job.apply(JobTransition::TransferFail);
    });

    const Job retry = queue.enqueueRetry(id);
    QVERIFY(retry.id() != id);
    QCOMPARE(retry.state(), JobState::Queued);
    QCOMPARE(retry.sourceUrl(), url(1));
    QCOMPARE(retry.requestedQuality(), QStringLiteral("720p"));
    QCOMPARE(retry.title(), QStringLiteral("Clip"));
    QVERIFY(retry.resumeToken().has_value());
    QCOMPARE(retry.resumeToken()->offset, ByteOffset(4096));
    QCOMPARE(queue.size(), 2);
    QCOMPARE(queue.find(id)->state(), JobState::Failed);
}

void TestJobQueue::testEnqueueRetryRequiresFailedJob()
{
    JobQueue queue;
    const JobId id = queue.enqueue(url(1), QUALITY, FORMAT).id();
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.enqueueRetry(id));
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.enqueueRetry(QUuid::createUuid()));
    QCOMPARE(queue.size(), 1);
}

void TestJobQueue::testRestoreRejectsDuplicates()
{
    JobQueue queue;
    const Job job = queue.enqueue(url(1), QUALITY, FORMAT);
    QVERIFY_THROWS_EXCEPTION(InvalidStateError, queue.restore(job));

    const Job other(QUuid::createUuid(), url(2), QUALITY, FORMAT);
    queue.restore(other);
    QCOMPARE(queue.size(), 2);
}

void TestJobQueue::testModifyUnknownJobThrows()
{
    JobQueue queue;
    QVERIFY_THROWS_EXCEPTION(InvalidStateError,
                             queue.modify(QUuid::createUuid(), [](Job&) {}));
}

QTEST_MAIN(TestJobQueue)
#include "test_jobqueue.moc"
