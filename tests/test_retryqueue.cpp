/**
 * @file test_retryqueue.cpp
 * @brief Unit tests for RetryQueue
 *
 * Tests ordering, backoff scheduling, dead letters and persistence.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include "sync/retryqueue.h"
#include "fakes.h"

using namespace FieldSync;
using namespace FieldSync::Testing;

class TestRetryQueue : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    // ========== Ordering Tests ==========
    void testFifoOrder();
    void testOneItemPerKey();
    void testBatchLimit();
    void testOnlyPendingAreEligible();

    // ========== Backoff Tests ==========
    void testBackoffDelayTable();
    void testBackoffMonotonicAndBounded();
    void testFailureSchedulesRetry();
    void testJitterStaysWithinBound();

    // ========== Dead Letter Tests ==========
    void testDeadLetterAtMaxAttempts();
    void testRetryDeadLetter();
    void testEnqueueReplacesDeadLetter();
    void testNeedsReviewNotRequeued();
    void testRejection();
    void testDiscard();

    // ========== State Tests ==========
    void testReleaseKeepsAttempts();
    void testPendingCount();

    // ========== Idempotency Tests ==========
    void testIdempotencyKeyStable();
    void testIdempotencyKeyChangesWithContent();

    // ========== Persistence Tests ==========
    void testPersistAndReload();
    void testInFlightResetOnReload();
    void testSequenceContinuesAfterReload();
    void testInMemoryWithoutDirectory();
};

void TestRetryQueue::initTestCase()
{
    qDebug() << "Starting RetryQueue tests";
}

void TestRetryQueue::cleanupTestCase()
{
    qDebug() << "RetryQueue tests complete";
}

// ========== Ordering Tests ==========

void TestRetryQueue::testFifoOrder()
{
    RetryQueue queue;
    queue.enqueue(makeKey("C"), "c");
    queue.enqueue(makeKey("A"), "a");
    queue.enqueue(makeKey("B"), "b");

    QList<SyncQueueItem> batch = queue.nextEligibleBatch(QDateTime::currentDateTimeUtc());
    QCOMPARE(batch.size(), 3);
    QCOMPARE(batch.at(0).key.entityId, QString("C"));
    QCOMPARE(batch.at(1).key.entityId, QString("A"));
    QCOMPARE(batch.at(2).key.entityId, QString("B"));
    QVERIFY(batch.at(0).sequence < batch.at(1).sequence);
}

void TestRetryQueue::testOneItemPerKey()
{
    RetryQueue queue;
    QVERIFY(queue.enqueue(makeKey("A"), "first"));
    QVERIFY(!queue.enqueue(makeKey("A"), "second"));

    QCOMPARE(queue.size(), 1);

    SyncQueueItem item;
    QVERIFY(queue.item(makeKey("A"), item));
    QCOMPARE(item.idempotencyKey, QString("second"));
}

void TestRetryQueue::testBatchLimit()
{
    RetryQueue queue;
    for (int i = 0; i < 10; ++i) {
        queue.enqueue(makeKey(QString("E%1").arg(i)), QString::number(i));
    }

    QList<SyncQueueItem> batch = queue.nextEligibleBatch(QDateTime::currentDateTimeUtc(), 4);
    QCOMPARE(batch.size(), 4);
    QCOMPARE(batch.first().key.entityId, QString("E0"));
    QCOMPARE(batch.last().key.entityId, QString("E3"));
}

void TestRetryQueue::testOnlyPendingAreEligible()
{
    RetryQueue queue;
    queue.enqueue(makeKey("A"), "a");
    queue.enqueue(makeKey("B"), "b");
    queue.enqueue(makeKey("C"), "c");

    queue.markInFlight({makeKey("A")});
    queue.recordRejection(makeKey("B"), "bad value");

    QList<SyncQueueItem> batch = queue.nextEligibleBatch(QDateTime::currentDateTimeUtc());
    QCOMPARE(batch.size(), 1);
    QCOMPARE(batch.first().key.entityId, QString("C"));
}

// ========== Backoff Tests ==========

void TestRetryQueue::testBackoffDelayTable()
{
    QCOMPARE(RetryQueue::backoffDelay(0, 3000, 15000, 0), qint64(3000));
    QCOMPARE(RetryQueue::backoffDelay(1, 3000, 15000, 0), qint64(6000));
    QCOMPARE(RetryQueue::backoffDelay(2, 3000, 15000, 0), qint64(12000));
    QCOMPARE(RetryQueue::backoffDelay(3, 3000, 15000, 0), qint64(15000));
    QCOMPARE(RetryQueue::backoffDelay(30, 3000, 15000, 0), qint64(15000));

    QCOMPARE(RetryQueue::backoffDelay(0, 3000, 15000, 200), qint64(3200));
    QCOMPARE(RetryQueue::backoffDelay(2, 3000, 15000, 5000), qint64(15000));
}

void TestRetryQueue::testBackoffMonotonicAndBounded()
{
    const qint64 base = 1000;
    const qint64 max = 60000;
    const qint64 jitter = base - 1;

    qint64 previous = 0;
    for (int attempt = 0; attempt < 20; ++attempt) {
        qint64 low = RetryQueue::backoffDelay(attempt, base, max, 0);
        qint64 high = RetryQueue::backoffDelay(attempt, base, max, jitter);
        QVERIFY(low <= high);
        QVERIFY(high <= max);
        QVERIFY2(low >= previous, qPrintable(QString("attempt %1").arg(attempt)));
        previous = high;
    }
}

void TestRetryQueue::testFailureSchedulesRetry()
{
    RetryQueue queue;
    queue.setJitterMs(0);
    queue.setBackoff(1000, 8000);

    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");
    queue.markInFlight({key});

    QDateTime now = QDateTime::currentDateTimeUtc();
    QueueItemState state = queue.recordFailure(key, SyncError::transient("timeout"), now);
    QCOMPARE(state, QueueItemState::Pending);

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.attemptCount, 1);
    QCOMPARE(item.nextEligibleAt, now.addMSecs(1000));
    QVERIFY(item.lastError.contains("timeout"));

    // Not eligible until the delay has elapsed
    QVERIFY(queue.nextEligibleBatch(now).isEmpty());
    QCOMPARE(queue.nextEligibleBatch(now.addMSecs(1000)).size(), 1);

    queue.recordFailure(key, SyncError::transient("timeout"), now);
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.nextEligibleAt, now.addMSecs(2000));
}

void TestRetryQueue::testJitterStaysWithinBound()
{
    RetryQueue queue;
    queue.setRandomSeed(42);
    queue.setBackoff(100, 100000);
    queue.setJitterMs(5000);   // clamped below the base
    queue.setMaxAttempts(100);

    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");

    QDateTime now = QDateTime::currentDateTimeUtc();
    queue.recordFailure(key, SyncError::transient("timeout"), now);

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    qint64 delay = now.msecsTo(item.nextEligibleAt);
    QVERIFY(delay >= 100);
    QVERIFY(delay < 200);
}

// ========== Dead Letter Tests ==========

void TestRetryQueue::testDeadLetterAtMaxAttempts()
{
    RetryQueue queue;
    queue.setMaxAttempts(3);
    QSignalSpy spy(&queue, &RetryQueue::itemDeadLettered);

    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");
    QDateTime now = QDateTime::currentDateTimeUtc();

    QCOMPARE(queue.recordFailure(key, SyncError::transient("x"), now), QueueItemState::Pending);
    QCOMPARE(queue.recordFailure(key, SyncError::transient("x"), now), QueueItemState::Pending);
    QCOMPARE(queue.recordFailure(key, SyncError::transient("x"), now), QueueItemState::DeadLetter);

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.first().at(0).toString(), key.toString());

    QCOMPARE(queue.deadLetters().size(), 1);
    QVERIFY(queue.nextEligibleBatch(now.addDays(1)).isEmpty());
    QCOMPARE(queue.pendingCount(), 0);
    QCOMPARE(queue.size(), 1);
}

void TestRetryQueue::testRetryDeadLetter()
{
    RetryQueue queue;
    queue.setMaxAttempts(1);

    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");
    queue.recordFailure(key, SyncError::transient("x"));
    QCOMPARE(queue.deadLetters().size(), 1);

    QVERIFY(queue.retryDeadLetter(key));

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.state, QueueItemState::Pending);
    QCOMPARE(item.attemptCount, 0);
    QVERIFY(item.lastError.isEmpty());
    QCOMPARE(queue.nextEligibleBatch(QDateTime::currentDateTimeUtc().addSecs(1)).size(), 1);

    // Live items are not retried manually
    QVERIFY(!queue.retryDeadLetter(key));
    QVERIFY(!queue.retryDeadLetter(makeKey("missing")));
}

void TestRetryQueue::testEnqueueReplacesDeadLetter()
{
    RetryQueue queue;
    queue.setMaxAttempts(1);

    RecordKey key = makeKey("A");
    queue.enqueue(key, "old");
    queue.recordFailure(key, SyncError::transient("x"));

    QVERIFY(queue.enqueue(key, "new"));

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.state, QueueItemState::Pending);
    QCOMPARE(item.attemptCount, 0);
    QCOMPARE(item.idempotencyKey, QString("new"));
    QCOMPARE(queue.size(), 1);
}

void TestRetryQueue::testNeedsReviewNotRequeued()
{
    RetryQueue queue;
    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");
    queue.markNeedsReview(key, "rollback failed");

    QVERIFY(!queue.enqueue(key, "b"));

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.state, QueueItemState::NeedsReview);
    QCOMPARE(item.idempotencyKey, QString("a"));
    QCOMPARE(queue.itemsInState(QueueItemState::NeedsReview).size(), 1);

    QVERIFY(queue.retryDeadLetter(key));
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.state, QueueItemState::Pending);
}

void TestRetryQueue::testRejection()
{
    RetryQueue queue;
    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");
    queue.markInFlight({key});

    queue.recordRejection(key, "Value out of range");

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.state, QueueItemState::Rejected);
    QCOMPARE(item.lastError, QString("Value out of range"));
    QCOMPARE(item.attemptCount, 0);
}

void TestRetryQueue::testDiscard()
{
    RetryQueue queue;
    QSignalSpy spy(&queue, &RetryQueue::queueChanged);
    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");

    QVERIFY(queue.discard(key));
    QVERIFY(!queue.discard(key));
    QVERIFY(!queue.contains(key));
    QCOMPARE(spy.count(), 2);
}

// ========== State Tests ==========

void TestRetryQueue::testReleaseKeepsAttempts()
{
    RetryQueue queue;
    RecordKey key = makeKey("A");
    queue.enqueue(key, "a");
    queue.markInFlight({key});

    queue.release(key);

    SyncQueueItem item;
    QVERIFY(queue.item(key, item));
    QCOMPARE(item.state, QueueItemState::Pending);
    QCOMPARE(item.attemptCount, 0);
}

void TestRetryQueue::testPendingCount()
{
    RetryQueue queue;
    queue.enqueue(makeKey("A"), "a");
    queue.enqueue(makeKey("B"), "b");
    queue.enqueue(makeKey("C"), "c");
    queue.markInFlight({makeKey("B")});
    queue.recordRejection(makeKey("C"), "no");

    QCOMPARE(queue.pendingCount(), 2);
    QCOMPARE(queue.size(), 3);
}

// ========== Idempotency Tests ==========

void TestRetryQueue::testIdempotencyKeyStable()
{
    LocalRecord record;
    record.key = makeKey("A");
    record.value = "12";
    record.serverRevision = "rev-1";

    QString first = RetryQueue::makeIdempotencyKey(record);
    record.lastModified = QDateTime::currentDateTimeUtc();
    record.dirty = true;

    QCOMPARE(RetryQueue::makeIdempotencyKey(record), first);
    QCOMPARE(first.size(), 64);
}

void TestRetryQueue::testIdempotencyKeyChangesWithContent()
{
    LocalRecord record;
    record.key = makeKey("A");
    record.value = "12";
    QString original = RetryQueue::makeIdempotencyKey(record);

    LocalRecord edited = record;
    edited.value = "13";
    QVERIFY(RetryQueue::makeIdempotencyKey(edited) != original);

    LocalRecord rebased = record;
    rebased.serverRevision = "rev-2";
    QVERIFY(RetryQueue::makeIdempotencyKey(rebased) != original);

    LocalRecord other = record;
    other.key = makeKey("B");
    QVERIFY(RetryQueue::makeIdempotencyKey(other) != original);
}

// ========== Persistence Tests ==========

void TestRetryQueue::testPersistAndReload()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    QDateTime now = QDateTime::currentDateTimeUtc();
    {
        RetryQueue queue;
        queue.setStateDirectory(tempDir.path());
        queue.setJitterMs(0);
        queue.enqueue(makeKey("A"), "a");
        queue.enqueue(makeKey("B"), "b");
        queue.recordFailure(makeKey("B"), SyncError::transient("timeout"), now);
        QVERIFY(QFile::exists(queue.queueFilePath()));
    }

    RetryQueue reloaded;
    reloaded.setStateDirectory(tempDir.path());
    QVERIFY(reloaded.load());

    QCOMPARE(reloaded.size(), 2);
    SyncQueueItem item;
    QVERIFY(reloaded.item(makeKey("B"), item));
    QCOMPARE(item.attemptCount, 1);
    QCOMPARE(item.idempotencyKey, QString("b"));
    QCOMPARE(item.nextEligibleAt, now.addMSecs(reloaded.baseBackoffMs()));
}

void TestRetryQueue::testInFlightResetOnReload()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    {
        RetryQueue queue;
        queue.setStateDirectory(tempDir.path());
        queue.enqueue(makeKey("A"), "a");
        queue.markInFlight({makeKey("A")});
    }

    RetryQueue reloaded;
    reloaded.setStateDirectory(tempDir.path());
    QVERIFY(reloaded.load());

    SyncQueueItem item;
    QVERIFY(reloaded.item(makeKey("A"), item));
    QCOMPARE(item.state, QueueItemState::Pending);
    QCOMPARE(item.attemptCount, 0);
    QCOMPARE(reloaded.nextEligibleBatch(QDateTime::currentDateTimeUtc()).size(), 1);
}

void TestRetryQueue::testSequenceContinuesAfterReload()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    {
        RetryQueue queue;
        queue.setStateDirectory(tempDir.path());
        queue.enqueue(makeKey("A"), "a");
        queue.enqueue(makeKey("B"), "b");
    }

    RetryQueue reloaded;
    reloaded.setStateDirectory(tempDir.path());
    QVERIFY(reloaded.load());
    reloaded.enqueue(makeKey("C"), "c");

    QList<SyncQueueItem> batch = reloaded.nextEligibleBatch(QDateTime::currentDateTimeUtc());
    QCOMPARE(batch.size(), 3);
    QCOMPARE(batch.last().key.entityId, QString("C"));
}

void TestRetryQueue::testInMemoryWithoutDirectory()
{
    RetryQueue queue;
    QVERIFY(queue.queueFilePath().isEmpty());
    queue.enqueue(makeKey("A"), "a");
    QVERIFY(queue.save());
    QVERIFY(queue.load());
    QCOMPARE(queue.size(), 1);
}

QTEST_MAIN(TestRetryQueue)
#include "test_retryqueue.moc"
