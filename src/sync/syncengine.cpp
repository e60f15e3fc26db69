#include "syncengine.h"
#include "batcher.h"
#include "conflictresolver.h"
#include "recordtransformer.h"
#include "../integrity/checksum.h"

#include <QDebug>

namespace Replica {

SyncEngine::SyncEngine(RecordHandler *source, const SyncProfile &profile, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_profile(profile)
{
}

// ========== Destination Management ==========

void SyncEngine::addDestination(RecordHandler *destination)
{
    if (!destination) return;

    removeDestination(destination->name());
    m_destinations.append(destination);

    emit logMessage(QString("Registered destination: %1").arg(destination->name()));
}

void SyncEngine::removeDestination(const QString &name)
{
    for (int i = 0; i < m_destinations.size(); ++i) {
        if (m_destinations.at(i)->name() == name) {
            m_destinations.removeAt(i);
            return;
        }
    }
}

RecordHandler* SyncEngine::destination(const QString &name) const
{
    for (RecordHandler *handler : m_destinations) {
        if (handler->name() == name) {
            return handler;
        }
    }
    return nullptr;
}

// ========== Sync Operations ==========

SyncResult SyncEngine::sync(RecordHandler *destination,
                            const QString &collection,
                            const Checkpoint &resumeFrom)
{
    m_cancelled = false;
    return runSync(destination, collection, resumeFrom);
}

QList<SyncResult> SyncEngine::syncAll(const QString &collection)
{
    QList<SyncResult> results;
    m_cancelled = false;

    for (RecordHandler *dest : m_destinations) {
        if (cancelRequested()) {
            SyncResult skipped;
            skipped.status = SyncStatus::Cancelled;
            skipped.mode = m_profile.mode;
            skipped.collection = collection;
            skipped.destination = dest->name();
            skipped.errorMessage = "Cancelled before start";
            skipped.startTime = QDateTime::currentDateTimeUtc();
            skipped.endTime = skipped.startTime;
            results.append(skipped);
            continue;
        }

        results.append(runSync(dest, collection, Checkpoint()));
    }

    return results;
}

void SyncEngine::cancel()
{
    m_cancelled = true;
    emit logMessage("Cancel requested...");
}

bool SyncEngine::isCancelled() const
{
    return m_cancelled;
}

void SyncEngine::setCancelCheck(std::function<bool()> callback)
{
    m_cancelCheck = callback;
}

void SyncEngine::setProgressCallback(std::function<void(int, int, const QString&)> callback)
{
    m_progressCallback = callback;
}

// ========== Run ==========

SyncResult SyncEngine::runSync(RecordHandler *destination,
                               const QString &collection,
                               const Checkpoint &resumeFrom)
{
    SyncResult result;
    result.startTime = QDateTime::currentDateTimeUtc();
    result.mode = m_profile.mode;
    result.collection = collection;
    result.destination = destination ? destination->name() : QString();

    if (!m_source || !destination) {
        abortRun(result, "Source or destination handler missing");
        return result;
    }

    m_syncing = true;
    result.status = SyncStatus::Running;
    emit syncStarted(result.destination, collection);
    emit logMessage(QString("=== %1: %2 -> %3 (%4) ===")
        .arg(collection, m_source->name(), result.destination,
             syncModeToString(m_profile.mode)));

    if (!m_source->openConnection()) {
        abortRun(result, QString("Failed to connect to source %1").arg(m_source->name()));
        m_syncing = false;
        return result;
    }

    if (!destination->openConnection()) {
        m_source->closeConnection();
        abortRun(result, QString("Failed to connect to destination %1").arg(result.destination));
        m_syncing = false;
        return result;
    }

    auto closeBoth = [&]() {
        m_source->closeConnection();
        destination->closeConnection();
    };

    // Reading a missing collection would look like an empty source and
    // let orphan deletion wipe the destination
    if (!m_source->collectionExists(collection)) {
        closeBoth();
        abortRun(result, QString("Source collection not found: %1").arg(collection));
        m_syncing = false;
        return result;
    }

    if (!destination->collectionExists(collection)) {
        QJsonObject schema = m_source->getSchema(collection);
        if (!destination->createCollection(collection, schema)) {
            closeBoth();
            abortRun(result, QString("Failed to create collection %1 on %2")
                .arg(collection, result.destination));
            m_syncing = false;
            return result;
        }
        emit logMessage(QString("Created collection %1 on %2").arg(collection, result.destination));
    }

    // Filter at selection time, re-checked in case the handler ignores the query
    QList<Record> sourceRecords = RecordTransformer::filter(
        m_source->readRecords(collection, m_profile.filterQuery),
        m_profile.filterQuery);
    result.stats.read = sourceRecords.size();

    QSet<QString> sourceKeys;
    for (const Record &record : sourceRecords) {
        sourceKeys.insert(record.value(m_profile.keyField).toString());
    }

    // Snapshot of the destination taken once, before any batch is written
    QMap<QString, Record> destinationRecords;
    if (m_profile.mode != SyncMode::FullSync || m_profile.deleteOrphans) {
        for (const Record &record : destination->readRecords(collection)) {
            destinationRecords.insert(record.value(m_profile.keyField).toString(), record);
        }
    }

    const QList<Batcher::Chunk> allChunks = Batcher::batch(sourceRecords, m_profile.batchSize);
    int firstIndex = 0;
    const QList<Batcher::Chunk> chunks = Batcher::resumeFrom(allChunks, resumeFrom,
                                                             m_profile.keyField, &firstIndex);

    int processed = sourceRecords.size();
    for (const Batcher::Chunk &chunk : chunks) {
        processed -= chunk.size();
    }
    if (firstIndex > 0) {
        emit logMessage(QString("Resuming after batch %1 (key %2), %3 records already written")
            .arg(resumeFrom.batchIndex).arg(resumeFrom.lastKey).arg(processed));
    }

    const int totalBatches = firstIndex + chunks.size();

    bool cancelled = false;
    for (int i = 0; i < chunks.size(); ++i) {
        if (cancelRequested()) {
            emit logMessage("Sync cancelled");
            cancelled = true;
            break;
        }

        const int batchIndex = firstIndex + i;
        const Batcher::Chunk &chunk = chunks.at(i);

        reportProgress(batchIndex + 1, totalBatches,
            QString("Batch %1 of %2 (%3 records)").arg(batchIndex + 1).arg(totalBatches).arg(chunk.size()));

        const int failedBefore = result.stats.failed;
        processBatch(destination, collection, chunk, destinationRecords, result);
        result.stats.batchesProcessed++;
        processed += chunk.size();

        // A resume point must never lie past a record that failed to write
        if (result.stats.failed > failedBefore && result.firstFailedBatch < 0) {
            result.firstFailedBatch = batchIndex;
            emit logMessage(QString("Batch %1 had write failures, no further checkpoints this run")
                .arg(batchIndex));
        }
        if (result.firstFailedBatch < 0) {
            Checkpoint checkpoint = Batcher::makeCheckpoint(batchIndex, chunk, m_profile.keyField, processed);
            result.checkpoints.append(checkpoint);
            emit checkpointReached(checkpoint);
        }
    }

    // A cancel that arrived during the last batch still stops orphan deletion
    if (!cancelled && cancelRequested()) {
        emit logMessage("Sync cancelled");
        cancelled = true;
    }

    const bool removeOrphans = m_profile.deleteOrphans || m_profile.mode == SyncMode::MasterSlave;
    const bool fullReplace = m_profile.mode == SyncMode::FullSync
        || m_profile.mode == SyncMode::MasterSlave;

    if (!cancelled && fullReplace && removeOrphans) {
        deleteOrphans(destination, collection, sourceKeys, destinationRecords, result);
    }

    closeBoth();

    result.endTime = QDateTime::currentDateTimeUtc();
    result.success = result.errors.isEmpty() && !cancelled;
    if (cancelled) {
        result.status = SyncStatus::Cancelled;
        result.errorMessage = "Cancelled";
    } else if (!result.errors.isEmpty()) {
        result.status = SyncStatus::PartialFailure;
        result.errorMessage = QString("%1 record(s) failed").arg(result.stats.failed);
    } else {
        result.status = SyncStatus::Success;
    }

    m_syncing = false;

    qDebug() << "[SyncEngine]" << collection << "->" << result.destination
             << syncStatusToString(result.status) << result.stats.summary();
    emit logMessage(QString("Sync %1. %2. Duration: %3ms")
        .arg(syncStatusToString(result.status))
        .arg(result.stats.summary())
        .arg(result.durationMs()));
    emit syncFinished(result);

    return result;
}

void SyncEngine::processBatch(RecordHandler *destination,
                              const QString &collection,
                              const QList<Record> &batch,
                              const QMap<QString, Record> &destinationRecords,
                              SyncResult &result)
{
    QList<Record> toWrite;

    for (const Record &sourceRecord : batch) {
        const Record transformed = RecordTransformer::transform(sourceRecord, m_profile);
        const QString key = transformed.value(m_profile.keyField).toString();
        const bool exists = destinationRecords.contains(key);

        switch (m_profile.mode) {
            case SyncMode::FullSync:
            case SyncMode::MasterSlave:
                toWrite.append(transformed);
                break;

            case SyncMode::AppendOnly:
                if (exists) {
                    result.stats.skipped++;
                } else {
                    toWrite.append(transformed);
                }
                break;

            case SyncMode::Incremental: {
                if (!exists) {
                    toWrite.append(transformed);
                    break;
                }

                const Record current = destinationRecords.value(key);
                if (Checksum::compute(transformed) == Checksum::compute(current)) {
                    result.stats.skipped++;
                    break;
                }

                result.stats.conflictsDetected++;
                ConflictResolver::Resolution resolution = ConflictResolver::resolve(
                    transformed, current, m_profile.conflictResolution,
                    m_profile.timestampField, m_profile.keyField);

                switch (resolution.action) {
                    case ConflictResolver::Resolution::Apply:
                        result.stats.conflictsResolved++;
                        toWrite.append(resolution.record);
                        break;
                    case ConflictResolver::Resolution::KeepDestination:
                        result.stats.conflictsResolved++;
                        result.stats.skipped++;
                        break;
                    case ConflictResolver::Resolution::Queue:
                        result.stats.skipped++;
                        result.conflicts.append(resolution.entry);
                        emit conflictDetected(resolution.entry);
                        emit logMessage(QString("Conflict on %1 queued for review").arg(key));
                        break;
                }
                break;
            }
        }
    }

    applyWrite(destination, collection, toWrite, result);
}

void SyncEngine::applyWrite(RecordHandler *destination,
                            const QString &collection,
                            const QList<Record> &records,
                            SyncResult &result)
{
    if (records.isEmpty()) return;

    WriteOutcome outcome = destination->writeRecords(collection, records, m_profile.preserveKey);
    result.stats.written += outcome.count;
    result.stats.failed += outcome.errors.size();
    result.errors.append(outcome.errors);

    for (const QString &error : outcome.errors) {
        emit errorOccurred(error);
    }
}

void SyncEngine::deleteOrphans(RecordHandler *destination,
                               const QString &collection,
                               const QSet<QString> &sourceKeys,
                               const QMap<QString, Record> &destinationRecords,
                               SyncResult &result)
{
    QStringList orphans;
    for (auto it = destinationRecords.begin(); it != destinationRecords.end(); ++it) {
        if (!sourceKeys.contains(it.key())) {
            orphans.append(it.key());
        }
    }

    if (orphans.isEmpty()) return;

    emit logMessage(QString("Deleting %1 orphan(s) from %2").arg(orphans.size()).arg(destination->name()));

    WriteOutcome outcome = destination->deleteRecords(collection, orphans);
    result.stats.deleted += outcome.count;
    result.stats.failed += outcome.errors.size();
    result.errors.append(outcome.errors);

    for (const QString &error : outcome.errors) {
        emit errorOccurred(error);
    }
}

void SyncEngine::abortRun(SyncResult &result, const QString &message)
{
    result.success = false;
    result.status = SyncStatus::Aborted;
    result.errorMessage = message;
    result.errors.append(message);
    result.endTime = QDateTime::currentDateTimeUtc();

    qWarning() << "[SyncEngine]" << message;
    emit errorOccurred(message);
    emit syncFinished(result);
}

bool SyncEngine::cancelRequested() const
{
    // Check both internal flag and external cancel callback
    return m_cancelled || (m_cancelCheck && m_cancelCheck());
}

void SyncEngine::reportProgress(int current, int total, const QString &message)
{
    emit progressUpdated(current, total, message);

    if (m_progressCallback) {
        m_progressCallback(current, total, message);
    }
}

} // namespace Replica
