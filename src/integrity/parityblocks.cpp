#include "parityblocks.h"
#include "checksum.h"

#include <algorithm>

namespace Replica {

// ========== ParityBlocks ==========

QByteArray ParityBlocks::computeParity(const QList<QByteArray> &blocks)
{
    if (blocks.isEmpty()) {
        return QByteArray();
    }

    int maxLength = 0;
    for (const QByteArray &block : blocks) {
        maxLength = std::max(maxLength, static_cast<int>(block.size()));
    }

    // Shorter blocks act as if zero-padded: XOR with 0 is a no-op
    QByteArray result(maxLength, '\0');
    for (const QByteArray &block : blocks) {
        for (int i = 0; i < block.size(); ++i) {
            result[i] = static_cast<char>(result.at(i) ^ block.at(i));
        }
    }
    return result;
}

bool ParityBlocks::verifyParity(const QList<QByteArray> &blocks, const QByteArray &parity)
{
    return computeParity(blocks) == parity;
}

QByteArray ParityBlocks::recoverBlock(const QList<QByteArray> &blocks,
                                      int missingIndex,
                                      const QByteArray &parity,
                                      int originalLength)
{
    if (missingIndex < 0 || missingIndex >= blocks.size()) {
        return QByteArray();
    }

    QList<QByteArray> remaining;
    remaining.reserve(blocks.size());
    for (int i = 0; i < blocks.size(); ++i) {
        if (i != missingIndex) {
            remaining.append(blocks.at(i));
        }
    }
    remaining.append(parity);

    QByteArray recovered = computeParity(remaining);
    if (originalLength >= 0 && originalLength < recovered.size()) {
        recovered.truncate(originalLength);
    }
    return recovered;
}

// ========== ParityBlockSet ==========

ParityBlockSet ParityBlockSet::build(const QMap<QString, QString> &checksumsByKey,
                                     int recordsPerBlock)
{
    ParityBlockSet set;
    set.m_recordsPerBlock = std::max(1, recordsPerBlock);

    QStringList pending;
    ParityBlock current;

    auto flush = [&]() {
        current.index = set.m_blocks.size();
        current.recordCount = pending.size();
        current.data = blockData(pending);
        current.digest = Checksum::hashHex(current.data);
        set.m_blocks.append(current);
        current = ParityBlock();
        pending.clear();
    };

    for (auto it = checksumsByKey.begin(); it != checksumsByKey.end(); ++it) {
        if (pending.isEmpty()) {
            current.firstKey = it.key();
        }
        current.lastKey = it.key();
        pending.append(it.value());

        if (pending.size() == set.m_recordsPerBlock) {
            flush();
        }
    }
    if (!pending.isEmpty()) {
        flush();
    }

    QList<QByteArray> data;
    for (const ParityBlock &block : set.m_blocks) {
        data.append(block.data);
    }
    set.m_parity = ParityBlocks::computeParity(data);
    return set;
}

bool ParityBlockSet::verify() const
{
    QList<QByteArray> data;
    for (const ParityBlock &block : m_blocks) {
        data.append(block.data);
    }
    return ParityBlocks::verifyParity(data, m_parity);
}

QList<int> ParityBlockSet::failedBlocks(const QMap<QString, QString> &otherChecksumsByKey) const
{
    QList<int> failed;
    if (m_blocks.isEmpty()) {
        return failed;
    }

    QList<QStringList> grouped;
    for (int i = 0; i < m_blocks.size(); ++i) {
        grouped.append(QStringList());
    }

    for (auto it = otherChecksumsByKey.begin(); it != otherChecksumsByKey.end(); ++it) {
        grouped[blockIndexForKey(it.key())].append(it.value());
    }

    for (int i = 0; i < m_blocks.size(); ++i) {
        if (Checksum::hashHex(blockData(grouped.at(i))) != m_blocks.at(i).digest) {
            failed.append(i);
        }
    }
    return failed;
}

QByteArray ParityBlockSet::recoverBlock(int index) const
{
    QList<QByteArray> data;
    for (const ParityBlock &block : m_blocks) {
        data.append(block.data);
    }

    const int length = (index >= 0 && index < m_blocks.size())
        ? m_blocks.at(index).data.size() : -1;
    return ParityBlocks::recoverBlock(data, index, m_parity, length);
}

int ParityBlockSet::blockIndexForKey(const QString &key) const
{
    // Last block whose first key is <= key; lower keys fall into block 0
    int index = 0;
    for (int i = 1; i < m_blocks.size(); ++i) {
        if (m_blocks.at(i).firstKey <= key) {
            index = i;
        } else {
            break;
        }
    }
    return index;
}

QByteArray ParityBlockSet::blockData(const QStringList &checksums)
{
    QByteArray data;
    data.reserve(checksums.size() * 32);
    for (const QString &checksum : checksums) {
        data.append(QByteArray::fromHex(checksum.toLatin1()));
    }
    return data;
}

} // namespace Replica
