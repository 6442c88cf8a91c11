/**
 * @file test_jsonlocalstore.cpp
 * @brief Unit tests for JsonLocalStore
 *
 * Tests record operations, persistence, rollback points and the region
 * lock seen by readers.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QThread>
#include <atomic>
#include "sync/jsonlocalstore.h"
#include "fakes.h"

using namespace FieldSync;
using namespace FieldSync::Testing;

class TestJsonLocalStore : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Record Tests ==========
    void testWriteAndRead();
    void testReadMissing();
    void testWriteInvalidKey();
    void testWriteKeepsDirtyAndRevision();
    void testMarkDirtyAndDirtyKeys();
    void testClearDirty();
    void testRemove();
    void testRecordChangedSignal();

    // ========== Persistence Tests ==========
    void testReloadIsExact();
    void testLoadCorruptFile();

    // ========== Rollback Tests ==========
    void testSnapshotRestoreIsExact();
    void testRestoreRemovesRecordsAbsentAtSnapshot();
    void testRestoreSubset();
    void testRestoreUnknownPointFails();
    void testRestoreIsPersisted();
    void testDiscardClosesPoint();

    // ========== Locking Tests ==========
    void testReaderWaitsForLockedKey();
    void testOwnerReadsLockedKey();
    void testWriterWaitsForLockedKey();
    void testOwnerWritesLockedKey();

private:
    QTemporaryDir *m_tempDir;
    JsonLocalStore *m_store;
};

void TestJsonLocalStore::initTestCase()
{
    qDebug() << "Starting JsonLocalStore tests";
}

void TestJsonLocalStore::cleanupTestCase()
{
    qDebug() << "JsonLocalStore tests complete";
}

void TestJsonLocalStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    m_store = new JsonLocalStore(m_tempDir->path());
}

void TestJsonLocalStore::cleanup()
{
    delete m_store;
    delete m_tempDir;
    m_store = nullptr;
    m_tempDir = nullptr;
}

// ========== Record Tests ==========

void TestJsonLocalStore::testWriteAndRead()
{
    RecordKey key = makeKey("DE_1");
    QVERIFY(m_store->write(key, "42"));

    LocalRecord record;
    QVERIFY(m_store->read(key, record));
    QCOMPARE(record.key, key);
    QCOMPARE(record.value, QString("42"));
    QVERIFY(record.lastModified.isValid());
    QVERIFY(!record.dirty);
    QVERIFY(!record.isSynced());
    QCOMPARE(m_store->recordCount(), 1);
}

void TestJsonLocalStore::testReadMissing()
{
    LocalRecord record;
    QVERIFY(!m_store->read(makeKey("nope"), record));
}

void TestJsonLocalStore::testWriteInvalidKey()
{
    QSignalSpy spy(m_store, &LocalStore::errorOccurred);

    QVERIFY(!m_store->write(RecordKey(), "1"));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(m_store->recordCount(), 0);
}

void TestJsonLocalStore::testWriteKeepsDirtyAndRevision()
{
    RecordKey key = makeKey("DE_1");
    m_store->write(key, "1");
    m_store->markDirty(key);
    m_store->clearDirty(key, "rev-3");
    m_store->markDirty(key);

    m_store->write(key, "2");

    LocalRecord record;
    QVERIFY(m_store->read(key, record));
    QCOMPARE(record.value, QString("2"));
    QVERIFY(record.dirty);
    QCOMPARE(record.serverRevision, QString("rev-3"));
}

void TestJsonLocalStore::testMarkDirtyAndDirtyKeys()
{
    m_store->write(makeKey("A"), "1");
    m_store->write(makeKey("B"), "2");
    m_store->write(makeKey("C"), "3");

    QVERIFY(m_store->markDirty(makeKey("A")));
    QVERIFY(m_store->markDirty(makeKey("C")));
    QVERIFY(!m_store->markDirty(makeKey("missing")));

    QList<RecordKey> dirty = m_store->dirtyKeys();
    QCOMPARE(dirty.size(), 2);
    QVERIFY(dirty.contains(makeKey("A")));
    QVERIFY(dirty.contains(makeKey("C")));
}

void TestJsonLocalStore::testClearDirty()
{
    RecordKey key = makeKey("A");
    m_store->write(key, "1");
    m_store->markDirty(key);

    QVERIFY(m_store->clearDirty(key, "rev-7"));

    LocalRecord record;
    QVERIFY(m_store->read(key, record));
    QVERIFY(!record.dirty);
    QCOMPARE(record.serverRevision, QString("rev-7"));
    QVERIFY(record.lastSyncedAt.isValid());
    QVERIFY(m_store->dirtyKeys().isEmpty());
}

void TestJsonLocalStore::testRemove()
{
    RecordKey key = makeKey("A");
    m_store->write(key, "1");

    QVERIFY(m_store->remove(key));
    QVERIFY(!m_store->remove(key));

    LocalRecord record;
    QVERIFY(!m_store->read(key, record));
}

void TestJsonLocalStore::testRecordChangedSignal()
{
    QSignalSpy spy(m_store, &LocalStore::recordChanged);
    RecordKey key = makeKey("A");

    m_store->write(key, "1");
    m_store->markDirty(key);
    m_store->clearDirty(key, "rev-1");
    m_store->remove(key);

    QCOMPARE(spy.count(), 4);
    QCOMPARE(spy.at(0).at(0).toString(), key.toString());
}

// ========== Persistence Tests ==========

void TestJsonLocalStore::testReloadIsExact()
{
    RecordKey a = makeKey("A");
    RecordKey b = makeKey("B", "202406", "OU_9", "male");
    m_store->write(a, "1");
    m_store->write(b, "two words");
    m_store->markDirty(b);
    m_store->clearDirty(a, "rev-1");

    LocalRecord beforeA, beforeB;
    QVERIFY(m_store->read(a, beforeA));
    QVERIFY(m_store->read(b, beforeB));

    JsonLocalStore reloaded(m_tempDir->path());
    LocalRecord afterA, afterB;
    QVERIFY(reloaded.read(a, afterA));
    QVERIFY(reloaded.read(b, afterB));

    QVERIFY(afterA == beforeA);
    QVERIFY(afterB == beforeB);
    QCOMPARE(reloaded.recordCount(), 2);
}

void TestJsonLocalStore::testLoadCorruptFile()
{
    QFile file(m_store->storeFilePath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    JsonLocalStore store(m_tempDir->path());
    QSignalSpy spy(&store, &LocalStore::errorOccurred);

    QVERIFY(!store.load());
    QCOMPARE(spy.count(), 1);
}

// ========== Rollback Tests ==========

void TestJsonLocalStore::testSnapshotRestoreIsExact()
{
    RecordKey key = makeKey("A");
    m_store->write(key, "original");
    m_store->markDirty(key);

    LocalRecord before;
    QVERIFY(m_store->read(key, before));

    RollbackPoint point = m_store->snapshot({key});
    QVERIFY(point.isValid());

    QTest::qWait(5);
    m_store->clearDirty(key, "rev-9");
    m_store->write(key, "changed");

    QVERIFY(m_store->restoreAll(point));

    LocalRecord after;
    QVERIFY(m_store->read(key, after));
    QVERIFY(after == before);

    m_store->discard(point);
}

void TestJsonLocalStore::testRestoreRemovesRecordsAbsentAtSnapshot()
{
    RecordKey key = makeKey("late");

    RollbackPoint point = m_store->snapshot({key});
    m_store->write(key, "created after snapshot");

    QVERIFY(m_store->restore(point, {key}));

    LocalRecord record;
    QVERIFY(!m_store->read(key, record));
    m_store->discard(point);
}

void TestJsonLocalStore::testRestoreSubset()
{
    RecordKey a = makeKey("A");
    RecordKey b = makeKey("B");
    m_store->write(a, "a0");
    m_store->write(b, "b0");

    RollbackPoint point = m_store->snapshot({a, b});
    m_store->write(a, "a1");
    m_store->write(b, "b1");

    QVERIFY(m_store->restore(point, {b}));

    LocalRecord ra, rb;
    m_store->read(a, ra);
    m_store->read(b, rb);
    QCOMPARE(ra.value, QString("a1"));
    QCOMPARE(rb.value, QString("b0"));

    m_store->discard(point);
}

void TestJsonLocalStore::testRestoreUnknownPointFails()
{
    RollbackPoint bogus;
    bogus.id = 999;
    bogus.keys = {makeKey("A")};

    QVERIFY(!m_store->restoreAll(bogus));
    QVERIFY(!m_store->restoreAll(RollbackPoint()));
}

void TestJsonLocalStore::testRestoreIsPersisted()
{
    RecordKey key = makeKey("A");
    m_store->write(key, "v1");

    RollbackPoint point = m_store->snapshot({key});
    m_store->write(key, "v2");
    QVERIFY(m_store->restoreAll(point));
    m_store->discard(point);

    JsonLocalStore reloaded(m_tempDir->path());
    LocalRecord record;
    QVERIFY(reloaded.read(key, record));
    QCOMPARE(record.value, QString("v1"));
}

void TestJsonLocalStore::testDiscardClosesPoint()
{
    RollbackPoint first = m_store->snapshot({makeKey("A")});
    RollbackPoint second = m_store->snapshot({makeKey("B")});
    QVERIFY(first.id != second.id);
    QCOMPARE(m_store->openRollbackPoints(), 2);

    m_store->discard(first);
    QCOMPARE(m_store->openRollbackPoints(), 1);

    m_store->discard(second);
    QCOMPARE(m_store->openRollbackPoints(), 0);

    // A discarded point can no longer be restored
    QVERIFY(!m_store->restoreAll(first));
}

// ========== Locking Tests ==========

void TestJsonLocalStore::testReaderWaitsForLockedKey()
{
    RecordKey locked = makeKey("locked");
    RecordKey unlocked = makeKey("unlocked");
    m_store->write(locked, "1");
    m_store->write(unlocked, "2");

    m_store->locks().lock({locked.toString()});

    std::atomic<bool> lockedRead{false};
    std::atomic<bool> freeRead{false};

    QThread *freeReader = QThread::create([this, unlocked, &freeRead]() {
        LocalRecord record;
        m_store->read(unlocked, record);
        freeRead = true;
    });
    QThread *lockedReader = QThread::create([this, locked, &lockedRead]() {
        LocalRecord record;
        m_store->read(locked, record);
        lockedRead = true;
    });

    freeReader->start();
    lockedReader->start();

    QVERIFY(freeReader->wait(2000));
    QVERIFY(freeRead);

    QTest::qWait(100);
    QVERIFY(!lockedRead);

    m_store->locks().unlock({locked.toString()});
    QVERIFY(lockedReader->wait(2000));
    QVERIFY(lockedRead);

    delete freeReader;
    delete lockedReader;
}

void TestJsonLocalStore::testOwnerReadsLockedKey()
{
    RecordKey key = makeKey("A");
    m_store->write(key, "1");

    RegionLocker region(m_store->locks(), {key.toString()});
    QVERIFY(m_store->locks().isLocked(key.toString()));

    LocalRecord record;
    QVERIFY(m_store->read(key, record));
    QCOMPARE(record.value, QString("1"));
}

void TestJsonLocalStore::testWriterWaitsForLockedKey()
{
    RecordKey key = makeKey("locked");
    m_store->write(key, "before");

    m_store->locks().lock({key.toString()});
    RollbackPoint point = m_store->snapshot({key});

    std::atomic<bool> written{false};
    QThread *writer = QThread::create([this, key, &written]() {
        m_store->write(key, "user-edit");
        m_store->markDirty(key);
        written = true;
    });
    writer->start();

    QTest::qWait(100);
    QVERIFY(!written);

    // Rolling back while the writer waits must not lose its edit
    QVERIFY(m_store->restoreAll(point));
    m_store->discard(point);
    QVERIFY(!written);

    m_store->locks().unlock({key.toString()});
    QVERIFY(writer->wait(2000));
    QVERIFY(written);
    delete writer;

    LocalRecord record;
    QVERIFY(m_store->read(key, record));
    QCOMPARE(record.value, QString("user-edit"));
    QVERIFY(record.dirty);
}

void TestJsonLocalStore::testOwnerWritesLockedKey()
{
    RecordKey key = makeKey("A");
    m_store->write(key, "1");

    m_store->locks().lock({key.toString()});
    QVERIFY(m_store->write(key, "2"));
    QVERIFY(m_store->markDirty(key));

    // The store's own locking must not release the outer hold
    QVERIFY(m_store->locks().isLocked(key.toString()));

    m_store->locks().unlock({key.toString()});
    QVERIFY(!m_store->locks().isLocked(key.toString()));

    LocalRecord record;
    QVERIFY(m_store->read(key, record));
    QCOMPARE(record.value, QString("2"));
    QVERIFY(record.dirty);
}

QTEST_MAIN(TestJsonLocalStore)
#include "test_jsonlocalstore.moc"
