/**
 * @file test_conflictresolver.cpp
 * @brief Unit tests for ConflictResolver class
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QJsonArray>
#include "sync/conflictresolver.h"

using namespace Replica;

class TestConflictResolver : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    // ========== Strategy Tests ==========
    void testSourceWins();
    void testDestinationWins();
    void testNewestWinsSourceNewer();
    void testNewestWinsDestinationNewer();
    void testNewestWinsTieFavorsSource();
    void testNewestWinsMissingTimestamp();
    void testNewestWinsNumericStrings();
    void testNewestWinsCustomField();
    void testMerge();
    void testMergeReplacesArrays();
    void testManualReview();

    // ========== Helper Tests ==========
    void testTimestampValue();
};

void TestConflictResolver::initTestCase()
{
    qDebug() << "Starting ConflictResolver tests";
}

void TestConflictResolver::cleanupTestCase()
{
    qDebug() << "ConflictResolver tests complete";
}

// ========== Strategy Tests ==========

void TestConflictResolver::testSourceWins()
{
    Record source{{"_key", "rec-1"}, {"name", "A"}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::SourceWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Apply);
    QCOMPARE(resolution.record, source);
}

void TestConflictResolver::testDestinationWins()
{
    Record source{{"_key", "rec-1"}, {"name", "A"}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::DestinationWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::KeepDestination);
    QCOMPARE(resolution.record, dest);
}

void TestConflictResolver::testNewestWinsSourceNewer()
{
    Record source{{"_key", "rec-1"}, {"name", "A"}, {"_updated", 2000}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}, {"_updated", 1000}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::NewestWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Apply);
    QCOMPARE(resolution.record, source);
}

void TestConflictResolver::testNewestWinsDestinationNewer()
{
    Record source{{"_key", "rec-1"}, {"name", "A"}, {"_updated", 1000}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}, {"_updated", 2000}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::NewestWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::KeepDestination);
    QCOMPARE(resolution.record, dest);
}

void TestConflictResolver::testNewestWinsTieFavorsSource()
{
    Record source{{"_key", "rec-1"}, {"name", "A"}, {"_updated", 1500}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}, {"_updated", 1500}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::NewestWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Apply);
    QCOMPARE(resolution.record, source);
}

void TestConflictResolver::testNewestWinsMissingTimestamp()
{
    // Missing counts as 0
    Record source{{"_key", "rec-1"}, {"name", "A"}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}, {"_updated", 5}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::NewestWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::KeepDestination);

    Record destNoTime{{"_key", "rec-1"}, {"name", "B"}};
    resolution = ConflictResolver::resolve(source, destNoTime, ConflictResolution::NewestWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Apply);
}

void TestConflictResolver::testNewestWinsNumericStrings()
{
    Record source{{"_key", "rec-1"}, {"_updated", "900"}};
    Record dest{{"_key", "rec-1"}, {"_updated", 1000}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::NewestWins);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::KeepDestination);
}

void TestConflictResolver::testNewestWinsCustomField()
{
    Record source{{"_key", "rec-1"}, {"modified", 10}, {"_updated", 1}};
    Record dest{{"_key", "rec-1"}, {"modified", 5}, {"_updated", 99}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::NewestWins, "modified");
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Apply);
    QCOMPARE(resolution.record, source);
}

void TestConflictResolver::testMerge()
{
    Record source{{"name", "A"}, {"status", "active"}};
    Record dest{{"name", "B"}, {"location", "NYC"}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::Merge);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Apply);
    QCOMPARE(resolution.record,
             (Record{{"name", "A"}, {"status", "active"}, {"location", "NYC"}}));
}

void TestConflictResolver::testMergeReplacesArrays()
{
    Record source{{"_key", "rec-1"}, {"tags", QJsonArray{"x"}}};
    Record dest{{"_key", "rec-1"}, {"tags", QJsonArray{"a", "b"}}, {"owner", "ops"}};

    Record merged = ConflictResolver::merge(source, dest);
    QCOMPARE(merged.value("tags").toArray(), QJsonArray{"x"});
    QCOMPARE(merged.value("owner").toString(), QString("ops"));
}

void TestConflictResolver::testManualReview()
{
    Record source{{"_key", "rec-1"}, {"name", "A"}};
    Record dest{{"_key", "rec-1"}, {"name", "B"}};

    auto resolution = ConflictResolver::resolve(source, dest, ConflictResolution::ManualReview);
    QCOMPARE(resolution.action, ConflictResolver::Resolution::Queue);
    QCOMPARE(resolution.record, dest);
    QCOMPARE(resolution.entry.key, QString("rec-1"));
    QCOMPARE(resolution.entry.sourceRecord, source);
    QCOMPARE(resolution.entry.destinationRecord, dest);
    QVERIFY(resolution.entry.detectedAt.isValid());
}

// ========== Helper Tests ==========

void TestConflictResolver::testTimestampValue()
{
    QCOMPARE(ConflictResolver::timestampValue(QJsonValue(12.5)), 12.5);
    QCOMPARE(ConflictResolver::timestampValue(QJsonValue("42")), 42.0);
    QCOMPARE(ConflictResolver::timestampValue(QJsonValue("yesterday")), 0.0);
    QCOMPARE(ConflictResolver::timestampValue(QJsonValue()), 0.0);
    QCOMPARE(ConflictResolver::timestampValue(QJsonValue(true)), 0.0);
}

QTEST_MAIN(TestConflictResolver)
#include "test_conflictresolver.moc"
