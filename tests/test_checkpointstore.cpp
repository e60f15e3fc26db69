/**
 * @file test_checkpointstore.cpp
 * @brief Unit tests for CheckpointStore class
 *
 * Tests checkpoint bookkeeping, the pending conflict queue, folding of
 * run results and persistence.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QFile>
#include "sync/checkpointstore.h"

using namespace Replica;

class TestCheckpointStore : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Checkpoint Tests ==========
    void testNoCheckpointInitially();
    void testRecordCheckpoint();
    void testCheckpointsArePerDestinationAndCollection();
    void testClearCheckpoint();

    // ========== Conflict Queue Tests ==========
    void testAddConflicts();
    void testTakeConflicts();

    // ========== Run Result Tests ==========
    void testSuccessClearsCheckpoint();
    void testCancelledKeepsCheckpoint();
    void testFailureBeforeFirstCheckpointClears();
    void testAbortedLeavesCheckpoint();
    void testResultConflictsQueued();

    // ========== Persistence Tests ==========
    void testSaveAndLoad();
    void testLoadNonExistent();
    void testLoadCorrupt();
    void testClear();

    // ========== Signal Tests ==========
    void testStateChangedSignal();

private:
    static Checkpoint makeCheckpoint(int batchIndex, const QString &lastKey, int processed);
    static ConflictEntry makeConflict(const QString &key);

    QTemporaryDir *m_tempDir;
    CheckpointStore *m_store;
};

void TestCheckpointStore::initTestCase()
{
    qDebug() << "Starting CheckpointStore tests";
}

void TestCheckpointStore::cleanupTestCase()
{
    qDebug() << "CheckpointStore tests complete";
}

void TestCheckpointStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_store = new CheckpointStore(m_tempDir->filePath(".state"));
}

void TestCheckpointStore::cleanup()
{
    delete m_store;
    delete m_tempDir;
    m_store = nullptr;
    m_tempDir = nullptr;
}

Checkpoint TestCheckpointStore::makeCheckpoint(int batchIndex, const QString &lastKey, int processed)
{
    Checkpoint checkpoint;
    checkpoint.batchIndex = batchIndex;
    checkpoint.lastKey = lastKey;
    checkpoint.recordsProcessed = processed;
    checkpoint.timestamp = QDateTime(QDate(2024, 6, 15), QTime(10, 30, 0), Qt::UTC);
    return checkpoint;
}

ConflictEntry TestCheckpointStore::makeConflict(const QString &key)
{
    ConflictEntry entry;
    entry.key = key;
    entry.sourceRecord = QJsonObject{{"_key", key}, {"name", "Source"}};
    entry.destinationRecord = QJsonObject{{"_key", key}, {"name", "Dest"}};
    entry.detectedAt = QDateTime(QDate(2024, 6, 15), QTime(11, 0, 0), Qt::UTC);
    return entry;
}

// ========== Checkpoint Tests ==========

void TestCheckpointStore::testNoCheckpointInitially()
{
    QVERIFY(!m_store->checkpoint("dr-site", "orders").isValid());
    QVERIFY(m_store->pendingConflicts("dr-site", "orders").isEmpty());
    QVERIFY(m_store->lastRunStatus("dr-site", "orders").isEmpty());
}

void TestCheckpointStore::testRecordCheckpoint()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(4, "ord-500", 500));

    Checkpoint stored = m_store->checkpoint("dr-site", "orders");
    QVERIFY(stored.isValid());
    QCOMPARE(stored.batchIndex, 4);
    QCOMPARE(stored.lastKey, QString("ord-500"));
    QCOMPARE(stored.recordsProcessed, 500);
}

void TestCheckpointStore::testCheckpointsArePerDestinationAndCollection()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(1, "a", 10));
    m_store->recordCheckpoint("analytics", "orders", makeCheckpoint(2, "b", 20));

    QCOMPARE(m_store->checkpoint("dr-site", "orders").batchIndex, 1);
    QCOMPARE(m_store->checkpoint("analytics", "orders").batchIndex, 2);
    QVERIFY(!m_store->checkpoint("dr-site", "users").isValid());
}

void TestCheckpointStore::testClearCheckpoint()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(1, "a", 10));
    m_store->clearCheckpoint("dr-site", "orders");

    QVERIFY(!m_store->checkpoint("dr-site", "orders").isValid());
}

// ========== Conflict Queue Tests ==========

void TestCheckpointStore::testAddConflicts()
{
    m_store->addConflicts("dr-site", "orders", {makeConflict("k1")});
    m_store->addConflicts("dr-site", "orders", {makeConflict("k2")});

    QList<ConflictEntry> pending = m_store->pendingConflicts("dr-site", "orders");
    QCOMPARE(pending.size(), 2);
    QCOMPARE(pending.at(0).key, QString("k1"));
    QCOMPARE(pending.at(1).key, QString("k2"));
}

void TestCheckpointStore::testTakeConflicts()
{
    m_store->addConflicts("dr-site", "orders", {makeConflict("k1"), makeConflict("k2")});

    QList<ConflictEntry> taken = m_store->takeConflicts("dr-site", "orders");
    QCOMPARE(taken.size(), 2);
    QVERIFY(m_store->pendingConflicts("dr-site", "orders").isEmpty());
    QVERIFY(m_store->takeConflicts("nowhere", "orders").isEmpty());
}

// ========== Run Result Tests ==========

void TestCheckpointStore::testSuccessClearsCheckpoint()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(1, "a", 10));

    SyncResult result;
    result.destination = "dr-site";
    result.collection = "orders";
    result.status = SyncStatus::Success;
    result.endTime = QDateTime(QDate(2024, 6, 15), QTime(12, 0, 0), Qt::UTC);
    result.checkpoints << makeCheckpoint(2, "b", 20);
    m_store->recordResult(result);

    QVERIFY(!m_store->checkpoint("dr-site", "orders").isValid());
    QCOMPARE(m_store->lastRunStatus("dr-site", "orders"), QString("success"));
    QCOMPARE(m_store->lastRunTime("dr-site", "orders"), result.endTime);
}

void TestCheckpointStore::testCancelledKeepsCheckpoint()
{
    SyncResult result;
    result.destination = "dr-site";
    result.collection = "orders";
    result.status = SyncStatus::Cancelled;
    result.checkpoints << makeCheckpoint(0, "a", 10) << makeCheckpoint(1, "b", 20);
    m_store->recordResult(result);

    Checkpoint stored = m_store->checkpoint("dr-site", "orders");
    QCOMPARE(stored.batchIndex, 1);
    QCOMPARE(stored.lastKey, QString("b"));
    QCOMPARE(m_store->lastRunStatus("dr-site", "orders"), QString("cancelled"));
}

void TestCheckpointStore::testFailureBeforeFirstCheckpointClears()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(2, "b", 20));

    // Replay from batch 2 failed in its first batch
    SyncResult result;
    result.destination = "dr-site";
    result.collection = "orders";
    result.status = SyncStatus::PartialFailure;
    result.firstFailedBatch = 3;
    m_store->recordResult(result);

    QVERIFY(!m_store->checkpoint("dr-site", "orders").isValid());
    QCOMPARE(m_store->lastRunStatus("dr-site", "orders"), QString("partial_failure"));
}

void TestCheckpointStore::testAbortedLeavesCheckpoint()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(3, "c", 30));

    SyncResult result;
    result.destination = "dr-site";
    result.collection = "orders";
    result.status = SyncStatus::Aborted;
    m_store->recordResult(result);

    QCOMPARE(m_store->checkpoint("dr-site", "orders").batchIndex, 3);
    QCOMPARE(m_store->lastRunStatus("dr-site", "orders"), QString("aborted"));
    QVERIFY(m_store->lastRunTime("dr-site", "orders").isValid());
}

void TestCheckpointStore::testResultConflictsQueued()
{
    SyncResult result;
    result.destination = "dr-site";
    result.collection = "orders";
    result.status = SyncStatus::Success;
    result.conflicts << makeConflict("k1");
    m_store->recordResult(result);

    QCOMPARE(m_store->pendingConflicts("dr-site", "orders").size(), 1);
}

// ========== Persistence Tests ==========

void TestCheckpointStore::testSaveAndLoad()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(4, "ord-500", 500));
    m_store->addConflicts("dr-site", "orders", {makeConflict("k1")});

    SyncResult result;
    result.destination = "analytics";
    result.collection = "users";
    result.status = SyncStatus::PartialFailure;
    result.endTime = QDateTime(QDate(2024, 6, 15), QTime(12, 0, 0), Qt::UTC);
    result.checkpoints << makeCheckpoint(7, "u-80", 80);
    m_store->recordResult(result);

    QVERIFY(m_store->save());
    QVERIFY(QFile::exists(m_store->filePath()));

    CheckpointStore store2(m_tempDir->filePath(".state"));
    QVERIFY(store2.load());

    Checkpoint loaded = store2.checkpoint("dr-site", "orders");
    QCOMPARE(loaded.batchIndex, 4);
    QCOMPARE(loaded.lastKey, QString("ord-500"));
    QCOMPARE(loaded.recordsProcessed, 500);
    QCOMPARE(loaded.timestamp, makeCheckpoint(4, "ord-500", 500).timestamp);

    QList<ConflictEntry> conflicts = store2.pendingConflicts("dr-site", "orders");
    QCOMPARE(conflicts.size(), 1);
    QCOMPARE(conflicts.first().key, QString("k1"));
    QCOMPARE(conflicts.first().sourceRecord["name"].toString(), QString("Source"));
    QCOMPARE(conflicts.first().destinationRecord["name"].toString(), QString("Dest"));

    QCOMPARE(store2.checkpoint("analytics", "users").batchIndex, 7);
    QCOMPARE(store2.lastRunStatus("analytics", "users"), QString("partial_failure"));
    QCOMPARE(store2.lastRunTime("analytics", "users"), result.endTime);
}

void TestCheckpointStore::testLoadNonExistent()
{
    CheckpointStore store(m_tempDir->filePath("missing"));
    QVERIFY(store.load());
    QVERIFY(!store.checkpoint("dr-site", "orders").isValid());
}

void TestCheckpointStore::testLoadCorrupt()
{
    QVERIFY(QDir().mkpath(m_store->stateDirectory()));
    QFile file(m_store->filePath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QSignalSpy errorSpy(m_store, &CheckpointStore::errorOccurred);
    QVERIFY(!m_store->load());
    QCOMPARE(errorSpy.count(), 1);
}

void TestCheckpointStore::testClear()
{
    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(1, "a", 10));
    m_store->clear();

    QVERIFY(!m_store->checkpoint("dr-site", "orders").isValid());
}

// ========== Signal Tests ==========

void TestCheckpointStore::testStateChangedSignal()
{
    QSignalSpy spy(m_store, &CheckpointStore::stateChanged);

    m_store->recordCheckpoint("dr-site", "orders", makeCheckpoint(1, "a", 10));
    QCOMPARE(spy.count(), 1);

    m_store->addConflicts("dr-site", "orders", {});
    QCOMPARE(spy.count(), 1);

    m_store->addConflicts("dr-site", "orders", {makeConflict("k1")});
    QCOMPARE(spy.count(), 2);
}

QTEST_MAIN(TestCheckpointStore)
#include "test_checkpointstore.moc"
