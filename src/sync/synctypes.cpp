#include "synctypes.h"

namespace Replica {

// ========== Enum String Forms ==========

QString syncModeToString(SyncMode mode)
{
    switch (mode) {
        case SyncMode::FullSync:    return "full_sync";
        case SyncMode::Incremental: return "incremental";
        case SyncMode::AppendOnly:  return "append_only";
        case SyncMode::MasterSlave: return "master_slave";
    }
    return "full_sync";
}

SyncMode syncModeFromString(const QString &value, bool *ok)
{
    const QString v = value.trimmed().toLower();
    if (ok) *ok = true;

    if (v == "full_sync" || v == "full") return SyncMode::FullSync;
    if (v == "incremental") return SyncMode::Incremental;
    if (v == "append_only" || v == "append") return SyncMode::AppendOnly;
    if (v == "master_slave") return SyncMode::MasterSlave;

    if (ok) *ok = false;
    return SyncMode::FullSync;
}

QString conflictResolutionToString(ConflictResolution strategy)
{
    switch (strategy) {
        case ConflictResolution::SourceWins:      return "source_wins";
        case ConflictResolution::DestinationWins: return "destination_wins";
        case ConflictResolution::NewestWins:      return "newest_wins";
        case ConflictResolution::Merge:           return "merge";
        case ConflictResolution::ManualReview:    return "manual_review";
    }
    return "source_wins";
}

ConflictResolution conflictResolutionFromString(const QString &value, bool *ok)
{
    const QString v = value.trimmed().toLower();
    if (ok) *ok = true;

    if (v == "source_wins") return ConflictResolution::SourceWins;
    if (v == "destination_wins") return ConflictResolution::DestinationWins;
    if (v == "newest_wins") return ConflictResolution::NewestWins;
    if (v == "merge") return ConflictResolution::Merge;
    if (v == "manual_review") return ConflictResolution::ManualReview;

    if (ok) *ok = false;
    return ConflictResolution::SourceWins;
}

QString syncStatusToString(SyncStatus status)
{
    switch (status) {
        case SyncStatus::Idle:           return "idle";
        case SyncStatus::Running:        return "running";
        case SyncStatus::Success:        return "success";
        case SyncStatus::PartialFailure: return "partial_failure";
        case SyncStatus::Cancelled:      return "cancelled";
        case SyncStatus::Aborted:        return "aborted";
    }
    return "idle";
}

QStringList defaultChecksumExclusions()
{
    return {"_user", "_raw", "_batchID"};
}

// ========== SyncProfile ==========

QJsonObject SyncProfile::toJson() const
{
    QJsonObject obj;
    obj["name"] = name;
    obj["mode"] = syncModeToString(mode);
    obj["conflictResolution"] = conflictResolutionToString(conflictResolution);
    obj["batchSize"] = batchSize;
    obj["deleteOrphans"] = deleteOrphans;
    obj["preserveKey"] = preserveKey;
    obj["timestampField"] = timestampField;
    obj["keyField"] = keyField;

    QJsonObject mappings;
    for (auto it = fieldMappings.begin(); it != fieldMappings.end(); ++it) {
        mappings[it.key()] = it.value();
    }
    obj["fieldMappings"] = mappings;
    obj["fieldExclusions"] = QJsonArray::fromStringList(fieldExclusions);
    obj["filterQuery"] = filterQuery;
    return obj;
}

SyncProfile SyncProfile::fromJson(const QJsonObject &json)
{
    SyncProfile profile;
    profile.name = json["name"].toString();
    profile.mode = syncModeFromString(json["mode"].toString());
    profile.conflictResolution = conflictResolutionFromString(json["conflictResolution"].toString());
    profile.batchSize = json["batchSize"].toInt(1000);
    profile.deleteOrphans = json["deleteOrphans"].toBool(false);
    profile.preserveKey = json["preserveKey"].toBool(true);
    profile.timestampField = json["timestampField"].toString("_updated");
    profile.keyField = json["keyField"].toString("_key");

    const QJsonObject mappings = json["fieldMappings"].toObject();
    for (auto it = mappings.begin(); it != mappings.end(); ++it) {
        profile.fieldMappings[it.key()] = it.value().toString();
    }

    for (const QJsonValue &val : json["fieldExclusions"].toArray()) {
        profile.fieldExclusions << val.toString();
    }
    profile.filterQuery = json["filterQuery"].toObject();
    return profile;
}

// ========== Checkpoint ==========

QJsonObject Checkpoint::toJson() const
{
    QJsonObject obj;
    obj["batch"] = batchIndex;
    obj["lastKey"] = lastKey;
    obj["recordsProcessed"] = recordsProcessed;
    obj["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    return obj;
}

Checkpoint Checkpoint::fromJson(const QJsonObject &json)
{
    Checkpoint checkpoint;
    checkpoint.batchIndex = json["batch"].toInt(-1);
    checkpoint.lastKey = json["lastKey"].toString();
    checkpoint.recordsProcessed = json["recordsProcessed"].toInt();
    checkpoint.timestamp = QDateTime::fromString(json["timestamp"].toString(), Qt::ISODateWithMs);
    return checkpoint;
}

// ========== ConflictEntry ==========

QJsonObject ConflictEntry::toJson() const
{
    QJsonObject obj;
    obj["key"] = key;
    obj["source"] = sourceRecord;
    obj["destination"] = destinationRecord;
    obj["detectedAt"] = detectedAt.toString(Qt::ISODateWithMs);
    return obj;
}

ConflictEntry ConflictEntry::fromJson(const QJsonObject &json)
{
    ConflictEntry entry;
    entry.key = json["key"].toString();
    entry.sourceRecord = json["source"].toObject();
    entry.destinationRecord = json["destination"].toObject();
    entry.detectedAt = QDateTime::fromString(json["detectedAt"].toString(), Qt::ISODateWithMs);
    return entry;
}

// ========== SyncResult ==========

QJsonObject SyncResult::toJson() const
{
    QJsonObject obj;
    obj["success"] = success;
    obj["status"] = syncStatusToString(status);
    obj["mode"] = syncModeToString(mode);
    obj["collection"] = collection;
    obj["destination"] = destination;

    obj["recordsRead"] = stats.read;
    obj["recordsWritten"] = stats.written;
    obj["recordsSkipped"] = stats.skipped;
    obj["recordsDeleted"] = stats.deleted;
    obj["recordsFailed"] = stats.failed;
    obj["conflictsDetected"] = stats.conflictsDetected;
    obj["conflictsResolved"] = stats.conflictsResolved;
    obj["batchesProcessed"] = stats.batchesProcessed;

    obj["startedAt"] = startTime.toString(Qt::ISODateWithMs);
    obj["completedAt"] = endTime.toString(Qt::ISODateWithMs);
    obj["durationMs"] = durationMs();
    if (!errorMessage.isEmpty()) {
        obj["errorMessage"] = errorMessage;
    }
    obj["errors"] = QJsonArray::fromStringList(errors);
    if (firstFailedBatch >= 0) {
        obj["firstFailedBatch"] = firstFailedBatch;
    }

    QJsonArray checkpointArray;
    for (const Checkpoint &checkpoint : checkpoints) {
        checkpointArray.append(checkpoint.toJson());
    }
    obj["checkpoints"] = checkpointArray;

    QJsonArray conflictArray;
    for (const ConflictEntry &entry : conflicts) {
        conflictArray.append(entry.toJson());
    }
    obj["conflicts"] = conflictArray;
    return obj;
}

} // namespace Replica
