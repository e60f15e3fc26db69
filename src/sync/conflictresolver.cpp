#include "conflictresolver.h"

#include <QDebug>

namespace Replica {

ConflictResolver::Resolution ConflictResolver::resolve(const Record &source,
                                                       const Record &destination,
                                                       ConflictResolution strategy,
                                                       const QString &timestampField,
                                                       const QString &keyField)
{
    Resolution resolution;

    switch (strategy) {
        case ConflictResolution::SourceWins:
            resolution.action = Resolution::Apply;
            resolution.record = source;
            break;

        case ConflictResolution::DestinationWins:
            resolution.action = Resolution::KeepDestination;
            resolution.record = destination;
            break;

        case ConflictResolution::NewestWins: {
            double sourceTime = timestampValue(source.value(timestampField));
            double destTime = timestampValue(destination.value(timestampField));
            if (sourceTime >= destTime) {
                resolution.action = Resolution::Apply;
                resolution.record = source;
            } else {
                resolution.action = Resolution::KeepDestination;
                resolution.record = destination;
            }
            break;
        }

        case ConflictResolution::Merge:
            resolution.action = Resolution::Apply;
            resolution.record = merge(source, destination);
            break;

        case ConflictResolution::ManualReview: {
            resolution.action = Resolution::Queue;
            resolution.record = destination;

            QString key = source.value(keyField).toString();
            if (key.isEmpty()) {
                key = destination.value(keyField).toString();
            }
            resolution.entry.key = key;
            resolution.entry.sourceRecord = source;
            resolution.entry.destinationRecord = destination;
            resolution.entry.detectedAt = QDateTime::currentDateTimeUtc();

            qDebug() << "[ConflictResolver] Queued for manual review:" << key;
            break;
        }
    }

    return resolution;
}

Record ConflictResolver::merge(const Record &source, const Record &destination)
{
    Record merged = destination;
    for (auto it = source.begin(); it != source.end(); ++it) {
        merged.insert(it.key(), it.value());
    }
    return merged;
}

double ConflictResolver::timestampValue(const QJsonValue &value)
{
    if (value.isDouble()) {
        return value.toDouble();
    }
    if (value.isString()) {
        bool ok = false;
        double parsed = value.toString().trimmed().toDouble(&ok);
        return ok ? parsed : 0.0;
    }
    return 0.0;
}

} // namespace Replica
