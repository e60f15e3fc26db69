/**
 * @file test_parityblocks.cpp
 * @brief Unit tests for ParityBlocks and ParityBlockSet
 *
 * Tests XOR parity, single-block recovery and corruption localization.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include "integrity/parityblocks.h"
#include "integrity/checksum.h"

using namespace Replica;

class TestParityBlocks : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    // ========== Parity Tests ==========
    void testEmptyParity();
    void testParityOfEqualBlocks();
    void testParityPadsShortBlocks();
    void testVerifyParity();
    void testSingleByteFlipFailsVerification();

    // ========== Recovery Tests ==========
    void testRecoverEachBlock();
    void testRecoverShortBlock();
    void testRecoverInvalidIndex();

    // ========== Block Set Tests ==========
    void testBlockSetLayout();
    void testBlockSetVerifyAndRecover();
    void testFailedBlocksIdentical();
    void testFailedBlocksLocalizesChange();
    void testFailedBlocksMissingAndExtraKeys();
    void testEmptyBlockSet();

private:
    static QMap<QString, QString> makeChecksums(int count);
};

void TestParityBlocks::initTestCase()
{
    qDebug() << "Starting ParityBlocks tests";
}

void TestParityBlocks::cleanupTestCase()
{
    qDebug() << "ParityBlocks tests complete";
}

QMap<QString, QString> TestParityBlocks::makeChecksums(int count)
{
    QMap<QString, QString> checksums;
    for (int i = 0; i < count; ++i) {
        QString key = QString("rec-%1").arg(i, 3, 10, QChar('0'));
        checksums.insert(key, Checksum::hashHex(key.toUtf8()));
    }
    return checksums;
}

// ========== Parity Tests ==========

void TestParityBlocks::testEmptyParity()
{
    QVERIFY(ParityBlocks::computeParity(QList<QByteArray>()).isEmpty());
    QVERIFY(ParityBlocks::verifyParity(QList<QByteArray>(), QByteArray()));
}

void TestParityBlocks::testParityOfEqualBlocks()
{
    QList<QByteArray> blocks{QByteArray("\x01\x02", 2), QByteArray("\x03\x04", 2)};
    QCOMPARE(ParityBlocks::computeParity(blocks), QByteArray("\x02\x06", 2));

    // A block XORed with itself cancels out
    QList<QByteArray> same{QByteArray("abc"), QByteArray("abc")};
    QCOMPARE(ParityBlocks::computeParity(same), QByteArray(3, '\0'));
}

void TestParityBlocks::testParityPadsShortBlocks()
{
    QList<QByteArray> blocks{QByteArray("\x0f\x0f\x0f", 3), QByteArray("\xf0", 1)};
    QCOMPARE(ParityBlocks::computeParity(blocks), QByteArray("\xff\x0f\x0f", 3));
}

void TestParityBlocks::testVerifyParity()
{
    QList<QByteArray> blocks{QByteArray("alpha"), QByteArray("beta"), QByteArray("gamma!")};
    QByteArray parity = ParityBlocks::computeParity(blocks);

    QVERIFY(ParityBlocks::verifyParity(blocks, parity));
}

void TestParityBlocks::testSingleByteFlipFailsVerification()
{
    QList<QByteArray> blocks{QByteArray("alpha"), QByteArray("beta"), QByteArray("gamma!")};
    QByteArray parity = ParityBlocks::computeParity(blocks);

    for (int b = 0; b < blocks.size(); ++b) {
        for (int i = 0; i < blocks.at(b).size(); ++i) {
            QList<QByteArray> corrupted = blocks;
            corrupted[b][i] = static_cast<char>(corrupted[b].at(i) ^ 0x01);
            QVERIFY2(!ParityBlocks::verifyParity(corrupted, parity),
                     qPrintable(QString("block %1 byte %2").arg(b).arg(i)));
        }
    }
}

// ========== Recovery Tests ==========

void TestParityBlocks::testRecoverEachBlock()
{
    QList<QByteArray> blocks{QByteArray("block-one"), QByteArray("block-two"), QByteArray("block-3!!")};
    QByteArray parity = ParityBlocks::computeParity(blocks);

    for (int i = 0; i < blocks.size(); ++i) {
        QList<QByteArray> damaged = blocks;
        damaged[i] = QByteArray("garbage");
        QCOMPARE(ParityBlocks::recoverBlock(damaged, i, parity, blocks.at(i).size()), blocks.at(i));
    }
}

void TestParityBlocks::testRecoverShortBlock()
{
    QList<QByteArray> blocks{QByteArray("longer block"), QByteArray("short")};
    QByteArray parity = ParityBlocks::computeParity(blocks);

    QByteArray recovered = ParityBlocks::recoverBlock(blocks, 1, parity, 5);
    QCOMPARE(recovered, QByteArray("short"));

    // Without a length the zero padding stays
    QByteArray padded = ParityBlocks::recoverBlock(blocks, 1, parity);
    QCOMPARE(padded.size(), parity.size());
    QVERIFY(padded.startsWith("short"));
}

void TestParityBlocks::testRecoverInvalidIndex()
{
    QList<QByteArray> blocks{QByteArray("a"), QByteArray("b")};
    QByteArray parity = ParityBlocks::computeParity(blocks);

    QVERIFY(ParityBlocks::recoverBlock(blocks, -1, parity).isEmpty());
    QVERIFY(ParityBlocks::recoverBlock(blocks, 2, parity).isEmpty());
}

// ========== Block Set Tests ==========

void TestParityBlocks::testBlockSetLayout()
{
    ParityBlockSet set = ParityBlockSet::build(makeChecksums(25), 10);

    QCOMPARE(set.blockCount(), 3);
    QCOMPARE(set.recordsPerBlock(), 10);

    QList<ParityBlock> blocks = set.blocks();
    QCOMPARE(blocks.at(0).firstKey, QString("rec-000"));
    QCOMPARE(blocks.at(0).lastKey, QString("rec-009"));
    QCOMPARE(blocks.at(0).recordCount, 10);
    QCOMPARE(blocks.at(0).data.size(), 10 * 32);
    QCOMPARE(blocks.at(2).firstKey, QString("rec-020"));
    QCOMPARE(blocks.at(2).lastKey, QString("rec-024"));
    QCOMPARE(blocks.at(2).recordCount, 5);
    QCOMPARE(blocks.at(1).digest, Checksum::hashHex(blocks.at(1).data));
    QCOMPARE(set.parity().size(), 10 * 32);
}

void TestParityBlocks::testBlockSetVerifyAndRecover()
{
    ParityBlockSet set = ParityBlockSet::build(makeChecksums(25), 10);

    QVERIFY(set.verify());
    for (int i = 0; i < set.blockCount(); ++i) {
        QCOMPARE(set.recoverBlock(i), set.blocks().at(i).data);
    }
}

void TestParityBlocks::testFailedBlocksIdentical()
{
    QMap<QString, QString> checksums = makeChecksums(25);
    ParityBlockSet set = ParityBlockSet::build(checksums, 10);

    QVERIFY(set.failedBlocks(checksums).isEmpty());
}

void TestParityBlocks::testFailedBlocksLocalizesChange()
{
    QMap<QString, QString> checksums = makeChecksums(25);
    ParityBlockSet set = ParityBlockSet::build(checksums, 10);

    QMap<QString, QString> other = checksums;
    other["rec-013"] = Checksum::hashHex("changed");

    QCOMPARE(set.failedBlocks(other), QList<int>{1});
}

void TestParityBlocks::testFailedBlocksMissingAndExtraKeys()
{
    QMap<QString, QString> checksums = makeChecksums(25);
    ParityBlockSet set = ParityBlockSet::build(checksums, 10);

    QMap<QString, QString> other = checksums;
    other.remove("rec-002");                                // block 0
    other.insert("rec-999", Checksum::hashHex("extra"));    // past the last key: block 2

    QCOMPARE(set.failedBlocks(other), (QList<int>{0, 2}));

    // A key sorting before the first block lands in block 0
    QMap<QString, QString> lower = checksums;
    lower.insert("aaa", Checksum::hashHex("aaa"));
    QCOMPARE(set.failedBlocks(lower), QList<int>{0});
}

void TestParityBlocks::testEmptyBlockSet()
{
    ParityBlockSet set = ParityBlockSet::build(QMap<QString, QString>());

    QVERIFY(set.isEmpty());
    QVERIFY(set.parity().isEmpty());
    QVERIFY(set.verify());
    QVERIFY(set.failedBlocks(makeChecksums(3)).isEmpty());
    QCOMPARE(set.recordsPerBlock(), ParityBlockSet::DEFAULT_RECORDS_PER_BLOCK);
}

QTEST_MAIN(TestParityBlocks)
#include "test_parityblocks.moc"
