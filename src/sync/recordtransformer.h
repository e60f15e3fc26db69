#ifndef RECORDTRANSFORMER_H
#define RECORDTRANSFORMER_H

#include <QList>
#include <QJsonObject>
#include "synctypes.h"

namespace Replica {

/**
 * @brief Field-level reshaping and selection of records
 *
 * transform() drops excluded fields, then renames fields per the
 * profile's mappings. Unmapped fields pass through unchanged. The key
 * field is never dropped or renamed.
 */
class RecordTransformer
{
public:
    /**
     * @brief Apply the profile's exclusions and mappings to one record
     */
    static Record transform(const Record &record, const SyncProfile &profile);

    /**
     * @brief Check a record against a conjunction of field == value constraints
     *
     * An empty query matches every record.
     */
    static bool matchesFilter(const Record &record, const QJsonObject &query);

    /**
     * @brief Keep the records matching the query, order preserved
     */
    static QList<Record> filter(const QList<Record> &records, const QJsonObject &query);
};

} // namespace Replica

#endif // RECORDTRANSFORMER_H
