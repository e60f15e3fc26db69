#include "reconciler.h"
#include "../sync/recordtransformer.h"

#include <QJsonArray>
#include <QDebug>

namespace Replica {

QString reconcileActionTypeToString(ReconcileAction::Type type)
{
    switch (type) {
        case ReconcileAction::CreateCollection:    return "create_collection";
        case ReconcileAction::CopyMissing:         return "copy_missing";
        case ReconcileAction::OverwriteMismatched: return "overwrite_mismatched";
        case ReconcileAction::QueueMismatched:     return "queue_mismatched";
        case ReconcileAction::DeleteExtra:         return "delete_extra";
    }
    return "copy_missing";
}

QJsonObject ReconcileAction::toJson() const
{
    QJsonObject obj;
    obj["action"] = reconcileActionTypeToString(type);
    obj["destination"] = destination;
    obj["collection"] = collection;
    obj["keys"] = QJsonArray::fromStringList(keys);
    return obj;
}

QJsonObject ReconcileResult::toJson() const
{
    QJsonObject obj;
    obj["success"] = success;
    obj["dryRun"] = dryRun;
    obj["converged"] = converged;
    obj["copied"] = copied;
    obj["overwritten"] = overwritten;
    obj["deleted"] = deleted;
    obj["failed"] = failed;
    obj["errors"] = QJsonArray::fromStringList(errors);

    QJsonArray actionsArray;
    for (const ReconcileAction &action : actions) {
        actionsArray.append(action.toJson());
    }
    obj["actions"] = actionsArray;

    QJsonArray conflictsArray;
    for (const ConflictEntry &entry : conflicts) {
        conflictsArray.append(entry.toJson());
    }
    obj["conflicts"] = conflictsArray;

    QJsonArray reprobesArray;
    for (const ProbeResult &probe : reprobes) {
        QJsonObject entry = probe.toJson();
        entry["destination"] = probe.destination;
        entry["collection"] = probe.collection;
        reprobesArray.append(entry);
    }
    obj["reprobes"] = reprobesArray;
    return obj;
}

// ========== Reconciler ==========

Reconciler::Reconciler(RecordHandler *source, QObject *parent)
    : QObject(parent)
    , m_source(source)
{
}

void Reconciler::setProfile(const SyncProfile &profile)
{
    m_profile = profile;
}

void Reconciler::setRecordsPerBlock(int recordsPerBlock)
{
    m_recordsPerBlock = qMax(1, recordsPerBlock);
}

QList<ReconcileAction> Reconciler::plan(const IntegrityReport &report,
                                        const ReconcileOptions &options) const
{
    QList<ReconcileAction> actions;

    for (const ProbeResult &probe : report.results()) {
        if (probe.status != ProbeStatus::Mismatch) continue;

        auto add = [&](ReconcileAction::Type type, const QStringList &keys) {
            ReconcileAction action;
            action.type = type;
            action.destination = probe.destination;
            action.collection = probe.collection;
            action.keys = keys;
            actions.append(action);
        };

        if (probe.destinationCollectionMissing) {
            add(ReconcileAction::CreateCollection, QStringList());
        }
        if (options.copyMissing && !probe.missingKeys.isEmpty()) {
            add(ReconcileAction::CopyMissing, probe.missingKeys);
        }
        if (!probe.mismatchedKeys.isEmpty()) {
            if (options.queueMismatched) {
                add(ReconcileAction::QueueMismatched, probe.mismatchedKeys);
            } else if (options.overwriteMismatched) {
                add(ReconcileAction::OverwriteMismatched, probe.mismatchedKeys);
            }
        }
        if (options.deleteExtra && !probe.extraKeys.isEmpty()) {
            add(ReconcileAction::DeleteExtra, probe.extraKeys);
        }
    }

    return actions;
}

ReconcileResult Reconciler::reconcile(const IntegrityReport &report,
                                      const QList<RecordHandler*> &destinations,
                                      const ReconcileOptions &options)
{
    ReconcileResult result;
    result.dryRun = options.dryRun;
    result.actions = plan(report, options);

    if (options.dryRun) {
        emit logMessage(QString("Dry run: %1 action(s) planned").arg(result.actions.size()));
        result.success = true;
        return result;
    }

    auto findDestination = [&](const QString &name) -> RecordHandler* {
        for (RecordHandler *handler : destinations) {
            if (handler && handler->name() == name) {
                return handler;
            }
        }
        return nullptr;
    };

    if (!result.actions.isEmpty()) {
        if (!m_source || !m_source->openConnection()) {
            fail(result, "Failed to connect to source");
            return result;
        }

        for (const ReconcileAction &action : result.actions) {
            RecordHandler *dest = findDestination(action.destination);
            if (!dest) {
                fail(result, QString("Unknown destination: %1").arg(action.destination));
                continue;
            }
            if (!dest->openConnection()) {
                fail(result, QString("Failed to connect to destination %1").arg(action.destination));
                continue;
            }

            apply(action, dest, result);
            dest->closeConnection();
        }

        m_source->closeConnection();
    }

    // Re-probe every pair that was not ok, repaired or not
    IntegrityAuditor auditor(m_source);
    auditor.setProfile(m_profile);
    auditor.setRecordsPerBlock(m_recordsPerBlock);

    result.converged = true;
    for (const ProbeResult &probe : report.results()) {
        if (probe.isOk()) continue;

        RecordHandler *dest = findDestination(probe.destination);
        ProbeResult reprobe = auditor.probe(dest, probe.collection);
        if (!dest) {
            reprobe.destination = probe.destination;
        }
        if (!reprobe.isOk()) {
            result.converged = false;
        }
        result.reprobes.append(reprobe);
    }

    result.success = result.errors.isEmpty();

    qDebug() << "[Reconciler] Copied" << result.copied << "overwritten" << result.overwritten
             << "deleted" << result.deleted << "failed" << result.failed
             << "converged" << result.converged;
    emit logMessage(QString("Reconciliation %1: copied %2, overwritten %3, deleted %4, queued %5, failed %6")
        .arg(result.converged ? "converged" : "did not converge")
        .arg(result.copied).arg(result.overwritten).arg(result.deleted)
        .arg(result.conflicts.size()).arg(result.failed));

    return result;
}

void Reconciler::apply(const ReconcileAction &action, RecordHandler *destination,
                       ReconcileResult &result)
{
    const QString &collection = action.collection;

    switch (action.type) {
        case ReconcileAction::CreateCollection:
            if (!destination->createCollection(collection, m_source->getSchema(collection))) {
                fail(result, QString("Failed to create collection %1 on %2")
                    .arg(collection, action.destination));
            }
            break;

        case ReconcileAction::CopyMissing: {
            QList<Record> records;
            for (const QString &key : action.keys) {
                Record record = sourceRecord(collection, key);
                if (record.isEmpty()) {
                    fail(result, QString("Source record %1 no longer exists").arg(key));
                    continue;
                }
                records.append(record);
            }
            if (records.isEmpty()) break;

            WriteOutcome outcome = destination->writeRecords(collection, records, m_profile.preserveKey);
            result.copied += outcome.count;
            for (const QString &error : outcome.errors) {
                fail(result, error);
            }
            break;
        }

        case ReconcileAction::OverwriteMismatched:
            for (const QString &key : action.keys) {
                Record record = sourceRecord(collection, key);
                if (record.isEmpty()) {
                    fail(result, QString("Source record %1 no longer exists").arg(key));
                    continue;
                }
                if (destination->updateRecord(collection, key, record)) {
                    result.overwritten++;
                } else {
                    fail(result, QString("Failed to overwrite %1 on %2").arg(key, action.destination));
                }
            }
            break;

        case ReconcileAction::QueueMismatched:
            for (const QString &key : action.keys) {
                ConflictEntry entry;
                entry.key = key;
                entry.sourceRecord = sourceRecord(collection, key);
                entry.destinationRecord = destination->getRecordByKey(collection, key);
                entry.detectedAt = QDateTime::currentDateTimeUtc();
                result.conflicts.append(entry);
            }
            break;

        case ReconcileAction::DeleteExtra: {
            WriteOutcome outcome = destination->deleteRecords(collection, action.keys);
            result.deleted += outcome.count;
            for (const QString &error : outcome.errors) {
                fail(result, error);
            }
            break;
        }
    }
}

Record Reconciler::sourceRecord(const QString &collection, const QString &key) const
{
    const Record record = m_source->getRecordByKey(collection, key);
    if (record.isEmpty()) {
        return record;
    }
    return RecordTransformer::transform(record, m_profile);
}

void Reconciler::fail(ReconcileResult &result, const QString &message)
{
    result.failed++;
    result.errors.append(message);
    qWarning() << "[Reconciler]" << message;
    emit errorOccurred(message);
}

} // namespace Replica
