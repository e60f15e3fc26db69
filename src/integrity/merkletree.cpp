#include "merkletree.h"
#include "checksum.h"

namespace Replica {

QString MerkleTree::root(const QStringList &checksums)
{
    return levels(checksums).last().first();
}

QList<QStringList> MerkleTree::levels(const QStringList &checksums)
{
    QList<QStringList> result;

    if (checksums.isEmpty()) {
        result.append(QStringList{emptyRoot()});
        return result;
    }

    result.append(checksums);

    // A lone leaf is still combined with itself once
    QStringList level = nextLevel(checksums);
    result.append(level);

    while (level.size() > 1) {
        level = nextLevel(level);
        result.append(level);
    }

    return result;
}

QString MerkleTree::collectionRoot(const QMap<QString, QString> &checksumsByKey)
{
    // QMap iterates in key order
    return root(checksumsByKey.values());
}

CollectionFingerprint MerkleTree::collectionFingerprint(const QList<Record> &records,
                                                        const QString &keyField,
                                                        const QStringList &exclude)
{
    CollectionFingerprint fingerprint;
    for (const Record &record : records) {
        fingerprint.checksums.insert(record.value(keyField).toString(),
                                     Checksum::compute(record, exclude));
    }
    fingerprint.recordCount = records.size();
    fingerprint.merkleRoot = collectionRoot(fingerprint.checksums);
    return fingerprint;
}

QString MerkleTree::emptyRoot()
{
    return Checksum::hashHex(QByteArray());
}

QStringList MerkleTree::nextLevel(const QStringList &level)
{
    QStringList next;
    next.reserve((level.size() + 1) / 2);

    for (int i = 0; i < level.size(); i += 2) {
        const QString &left = level.at(i);
        const QString &right = (i + 1 < level.size()) ? level.at(i + 1) : left;
        next.append(Checksum::hashHex((left + right).toUtf8()));
    }
    return next;
}

} // namespace Replica
