#ifndef MERKLETREE_H
#define MERKLETREE_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include "../sync/synctypes.h"

namespace Replica {

/**
 * @brief Collection-level fingerprint
 */
struct CollectionFingerprint {
    int recordCount = 0;
    QString merkleRoot;
    QMap<QString, QString> checksums;   ///< key -> record checksum, key-sorted
};

/**
 * @brief Merkle root over per-record checksums
 *
 * Each level hashes the concatenation of adjacent hex digests; an odd
 * level pairs its last digest with itself. The empty tree is the SHA-256
 * of the empty string, and a single leaf x yields sha256(x + x).
 *
 * root() depends on leaf order. collectionRoot() and
 * collectionFingerprint() sort leaves by primary key first, so physical
 * storage order never changes a collection's root.
 */
class MerkleTree
{
public:
    /**
     * @brief Root of leaves in the given order
     */
    static QString root(const QStringList &checksums);

    /**
     * @brief Every level from the leaves up to the root
     *
     * levels().first() is the leaf list, levels().last() holds the root.
     * A single leaf produces two levels; an empty list produces one level
     * holding the empty-string digest.
     */
    static QList<QStringList> levels(const QStringList &checksums);

    /**
     * @brief Root of a key -> checksum map, leaves in key order
     */
    static QString collectionRoot(const QMap<QString, QString> &checksumsByKey);

    /**
     * @brief Fingerprint a collection
     * @param records Records in any order
     * @param keyField Primary key field
     * @param exclude Fields left out of each record checksum
     */
    static CollectionFingerprint collectionFingerprint(
        const QList<Record> &records,
        const QString &keyField = QStringLiteral("_key"),
        const QStringList &exclude = defaultChecksumExclusions());

    /**
     * @brief Root of the empty tree
     */
    static QString emptyRoot();

private:
    static QStringList nextLevel(const QStringList &level);
};

} // namespace Replica

#endif // MERKLETREE_H
