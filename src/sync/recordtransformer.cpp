#include "recordtransformer.h"

namespace Replica {

Record RecordTransformer::transform(const Record &record, const SyncProfile &profile)
{
    Record result;

    for (auto it = record.begin(); it != record.end(); ++it) {
        const QString &field = it.key();

        if (field == profile.keyField) {
            result.insert(field, it.value());
            continue;
        }
        if (profile.fieldExclusions.contains(field)) {
            continue;
        }

        const QString target = profile.fieldMappings.value(field, field);
        if (target.isEmpty() || target == profile.keyField) {
            // Mapping onto the key would overwrite record identity
            result.insert(field, it.value());
            continue;
        }
        result.insert(target, it.value());
    }

    return result;
}

bool RecordTransformer::matchesFilter(const Record &record, const QJsonObject &query)
{
    for (auto it = query.begin(); it != query.end(); ++it) {
        if (!record.contains(it.key()) || record.value(it.key()) != it.value()) {
            return false;
        }
    }
    return true;
}

QList<Record> RecordTransformer::filter(const QList<Record> &records, const QJsonObject &query)
{
    if (query.isEmpty()) {
        return records;
    }

    QList<Record> result;
    for (const Record &record : records) {
        if (matchesFilter(record, query)) {
            result.append(record);
        }
    }
    return result;
}

} // namespace Replica
