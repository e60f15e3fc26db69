#ifndef PARITYBLOCKS_H
#define PARITYBLOCKS_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>

namespace Replica {

/**
 * @brief XOR parity over byte blocks
 *
 * Blocks of unequal length are right-padded with zero bytes to the
 * longest block before XOR. The parity of no blocks is empty.
 */
class ParityBlocks
{
public:
    /**
     * @brief Byte-wise XOR of all blocks
     */
    static QByteArray computeParity(const QList<QByteArray> &blocks);

    /**
     * @brief Recompute parity and compare
     */
    static bool verifyParity(const QList<QByteArray> &blocks, const QByteArray &parity);

    /**
     * @brief Rebuild one block from the others plus the parity
     *
     * @param blocks All blocks; the entry at missingIndex is ignored
     * @param missingIndex Index of the lost or corrupted block
     * @param parity Parity computed while the block was intact
     * @param originalLength Length to truncate the result to (-1 keeps
     *        the padded parity length)
     * @return Reconstructed block, or empty if missingIndex is out of range
     */
    static QByteArray recoverBlock(const QList<QByteArray> &blocks,
                                   int missingIndex,
                                   const QByteArray &parity,
                                   int originalLength = -1);
};

/**
 * @brief One group of records covered by a parity set
 */
struct ParityBlock {
    int index = 0;
    QString firstKey;
    QString lastKey;
    int recordCount = 0;
    QByteArray data;        ///< Concatenated raw record digests, key order
    QString digest;         ///< SHA-256 hex of data
};

/**
 * @brief Corruption-localizing parity layout for one collection
 *
 * Key-sorted record checksums are grouped into blocks of a fixed record
 * count. Each block keeps its own digest, and the set keeps the XOR
 * parity of all blocks. Comparing another replica block by block (on
 * this set's key partition) pinpoints which groups diverged, and a single
 * lost block can be rebuilt from the rest plus the parity.
 */
class ParityBlockSet
{
public:
    static constexpr int DEFAULT_RECORDS_PER_BLOCK = 100;

    ParityBlockSet() = default;

    /**
     * @brief Build the layout from key -> checksum (hex) pairs
     */
    static ParityBlockSet build(const QMap<QString, QString> &checksumsByKey,
                                int recordsPerBlock = DEFAULT_RECORDS_PER_BLOCK);

    bool isEmpty() const { return m_blocks.isEmpty(); }
    int blockCount() const { return m_blocks.size(); }
    int recordsPerBlock() const { return m_recordsPerBlock; }
    QList<ParityBlock> blocks() const { return m_blocks; }
    QByteArray parity() const { return m_parity; }

    /**
     * @brief Check the stored blocks against the stored parity
     */
    bool verify() const;

    /**
     * @brief Indexes of blocks whose content differs in another replica
     *
     * The other replica's checksums are grouped by this set's key ranges:
     * block i covers keys from its first key up to (not including) the
     * next block's first key, the first block also takes every lower key
     * and the last block every higher key.
     */
    QList<int> failedBlocks(const QMap<QString, QString> &otherChecksumsByKey) const;

    /**
     * @brief Rebuild a block's data from the others plus the parity
     */
    QByteArray recoverBlock(int index) const;

private:
    int blockIndexForKey(const QString &key) const;
    static QByteArray blockData(const QStringList &checksums);

    QList<ParityBlock> m_blocks;
    QByteArray m_parity;
    int m_recordsPerBlock = DEFAULT_RECORDS_PER_BLOCK;
};

} // namespace Replica

#endif // PARITYBLOCKS_H
