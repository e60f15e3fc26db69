#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QJsonObject>
#include <QJsonArray>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for the replication engine
 *
 * Everything a scheduler or UI layer needs to persist or display lives
 * here and serializes to JSON.
 */

namespace Replica {

/**
 * @brief A keyed record
 *
 * Field values are limited to what QJsonValue can hold: string, number,
 * bool, null, nested object and array. QJsonObject keeps its keys sorted,
 * so insertion order never leaks into serialization.
 */
using Record = QJsonObject;

/**
 * @brief Replication modes
 */
enum class SyncMode {
    FullSync,       ///< Write every source record, optionally delete orphans
    Incremental,    ///< Write only records whose checksum changed
    AppendOnly,     ///< Write only keys absent from the destination
    MasterSlave     ///< Full sync with orphan deletion forced on
};

/**
 * @brief Conflict resolution strategies
 *
 * Applied when both sides hold the same key with different content.
 */
enum class ConflictResolution {
    SourceWins,         ///< Source record overwrites destination
    DestinationWins,    ///< Destination record is kept
    NewestWins,         ///< Compare the timestamp field, ties favor source
    Merge,              ///< Destination fields overlaid with source fields
    ManualReview        ///< Queue for review, leave destination untouched
};

/**
 * @brief Lifecycle of a single sync run
 */
enum class SyncStatus {
    Idle,
    Running,
    Success,            ///< Every record written
    PartialFailure,     ///< Completed with record-level errors
    Cancelled,          ///< Stopped at a batch boundary
    Aborted             ///< Failed before any write (connection, schema)
};

QString syncModeToString(SyncMode mode);
SyncMode syncModeFromString(const QString &value, bool *ok = nullptr);

QString conflictResolutionToString(ConflictResolution strategy);
ConflictResolution conflictResolutionFromString(const QString &value, bool *ok = nullptr);

QString syncStatusToString(SyncStatus status);

/**
 * @brief Fields excluded from checksums by default (internal bookkeeping)
 */
QStringList defaultChecksumExclusions();

/**
 * @brief Immutable configuration of one sync run
 */
struct SyncProfile {
    QString name;
    SyncMode mode = SyncMode::FullSync;
    ConflictResolution conflictResolution = ConflictResolution::SourceWins;
    int batchSize = 1000;
    bool deleteOrphans = false;
    bool preserveKey = true;
    QString timestampField = QStringLiteral("_updated");
    QString keyField = QStringLiteral("_key");
    QMap<QString, QString> fieldMappings;   ///< source name -> destination name
    QStringList fieldExclusions;
    QJsonObject filterQuery;                ///< field -> required value

    QJsonObject toJson() const;
    static SyncProfile fromJson(const QJsonObject &json);
};

/**
 * @brief Resumable marker written after each confirmed batch
 */
struct Checkpoint {
    int batchIndex = -1;        ///< Index of the last batch confirmed written
    QString lastKey;            ///< Key of the last record in that batch
    int recordsProcessed = 0;   ///< Source records covered so far
    QDateTime timestamp;

    bool isValid() const { return batchIndex >= 0; }

    QJsonObject toJson() const;
    static Checkpoint fromJson(const QJsonObject &json);
};

/**
 * @brief A conflict deferred for manual review
 */
struct ConflictEntry {
    QString key;
    Record sourceRecord;
    Record destinationRecord;
    QDateTime detectedAt;

    QJsonObject toJson() const;
    static ConflictEntry fromJson(const QJsonObject &json);
};

/**
 * @brief Outcome of a handler write or delete call
 */
struct WriteOutcome {
    int count = 0;          ///< Records written or deleted
    QStringList errors;     ///< One message per failed record

    bool ok() const { return errors.isEmpty(); }
};

/**
 * @brief Record counters for one run
 */
struct SyncStats {
    int read = 0;
    int written = 0;
    int skipped = 0;
    int deleted = 0;
    int failed = 0;
    int conflictsDetected = 0;
    int conflictsResolved = 0;
    int batchesProcessed = 0;

    QString summary() const {
        return QString("Read: %1, Written: %2, Skipped: %3, Deleted: %4, Failed: %5, Conflicts: %6/%7")
            .arg(read).arg(written).arg(skipped).arg(deleted).arg(failed)
            .arg(conflictsResolved).arg(conflictsDetected);
    }
};

/**
 * @brief Result of a complete sync run against one destination
 */
struct SyncResult {
    bool success = false;
    SyncStatus status = SyncStatus::Idle;
    SyncMode mode = SyncMode::FullSync;
    QString collection;
    QString destination;
    SyncStats stats;
    QString errorMessage;
    QStringList errors;
    QList<Checkpoint> checkpoints;      ///< Only batches fully written, up to the first failure
    int firstFailedBatch = -1;          ///< First batch with record errors, -1 if none
    QList<ConflictEntry> conflicts;     ///< Queued for manual review
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    /**
     * @brief Last checkpoint of the run, invalid if no batch completed
     */
    Checkpoint lastCheckpoint() const {
        return checkpoints.isEmpty() ? Checkpoint() : checkpoints.last();
    }

    QJsonObject toJson() const;
};

} // namespace Replica

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(Replica::SyncResult)
Q_DECLARE_METATYPE(Replica::ConflictEntry)
Q_DECLARE_METATYPE(Replica::Checkpoint)

#endif // SYNCTYPES_H
