#ifndef CHECKSUM_H
#define CHECKSUM_H

#include <QString>
#include <QStringList>
#include <QByteArray>
#include <QJsonObject>
#include "../sync/synctypes.h"

namespace Replica {

/**
 * @brief Deterministic per-record fingerprint
 *
 * A record's checksum is the SHA-256 of its canonical serialization:
 *   - excluded fields are dropped (top level only)
 *   - null-valued fields are dropped at every object level, so a null
 *     field and an omitted field hash the same
 *   - keys are written in lexicographic order at every level
 *     (QJsonObject keeps keys sorted), compact JSON, UTF-8
 *
 * Field insertion order never affects the result.
 */
class Checksum
{
public:
    static constexpr int HEX_LENGTH = 64;

    /**
     * @brief Compute a record checksum
     * @param record Record to fingerprint
     * @param exclude Fields left out of the digest
     * @return 64-char lowercase hex SHA-256 digest
     */
    static QString compute(const Record &record,
                           const QStringList &exclude = defaultChecksumExclusions());

    /**
     * @brief Canonical bytes hashed by compute()
     */
    static QByteArray canonicalBytes(const Record &record,
                                     const QStringList &exclude = defaultChecksumExclusions());

    /**
     * @brief Compare two records by content, ignoring excluded fields
     */
    static bool recordsEqual(const Record &a, const Record &b,
                             const QStringList &exclude = defaultChecksumExclusions());

    /**
     * @brief SHA-256 of arbitrary bytes as lowercase hex
     */
    static QString hashHex(const QByteArray &data);

    /**
     * @brief Raw 32-byte SHA-256 digest
     */
    static QByteArray hashRaw(const QByteArray &data);

private:
    static QJsonObject stripNulls(const QJsonObject &object);
};

} // namespace Replica

#endif // CHECKSUM_H
