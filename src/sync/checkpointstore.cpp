#include "checkpointstore.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

namespace Replica {

CheckpointStore::CheckpointStore(const QString &stateDir, QObject *parent)
    : QObject(parent)
    , m_stateDir(stateDir)
{
}

// ========== Checkpoints ==========

Checkpoint CheckpointStore::checkpoint(const QString &destination, const QString &collection) const
{
    return m_entries.value(entryKey(destination, collection)).checkpoint;
}

void CheckpointStore::recordCheckpoint(const QString &destination,
                                       const QString &collection,
                                       const Checkpoint &checkpoint)
{
    m_entries[entryKey(destination, collection)].checkpoint = checkpoint;
    emit stateChanged();
}

void CheckpointStore::clearCheckpoint(const QString &destination, const QString &collection)
{
    const QString key = entryKey(destination, collection);
    if (m_entries.contains(key)) {
        m_entries[key].checkpoint = Checkpoint();
        emit stateChanged();
    }
}

// ========== Conflict Queue ==========

void CheckpointStore::addConflicts(const QString &destination,
                                   const QString &collection,
                                   const QList<ConflictEntry> &conflicts)
{
    if (conflicts.isEmpty()) return;

    m_entries[entryKey(destination, collection)].conflicts.append(conflicts);
    emit stateChanged();
}

QList<ConflictEntry> CheckpointStore::pendingConflicts(const QString &destination,
                                                       const QString &collection) const
{
    return m_entries.value(entryKey(destination, collection)).conflicts;
}

QList<ConflictEntry> CheckpointStore::takeConflicts(const QString &destination,
                                                    const QString &collection)
{
    const QString key = entryKey(destination, collection);
    if (!m_entries.contains(key)) {
        return QList<ConflictEntry>();
    }

    QList<ConflictEntry> taken = m_entries[key].conflicts;
    m_entries[key].conflicts.clear();
    if (!taken.isEmpty()) {
        emit stateChanged();
    }
    return taken;
}

// ========== Run Results ==========

void CheckpointStore::recordResult(const SyncResult &result)
{
    Entry &entry = m_entries[entryKey(result.destination, result.collection)];

    entry.lastRun = result.endTime.isValid() ? result.endTime : QDateTime::currentDateTimeUtc();
    entry.lastStatus = syncStatusToString(result.status);

    switch (result.status) {
        case SyncStatus::Success:
            entry.checkpoint = Checkpoint();
            break;
        case SyncStatus::Cancelled:
        case SyncStatus::PartialFailure:
            if (result.lastCheckpoint().isValid()) {
                entry.checkpoint = result.lastCheckpoint();
            } else if (result.firstFailedBatch >= 0) {
                // Failed before any batch completed, replay from the start
                entry.checkpoint = Checkpoint();
            }
            break;
        default:
            break;
    }

    entry.conflicts.append(result.conflicts);
    emit stateChanged();
}

QDateTime CheckpointStore::lastRunTime(const QString &destination, const QString &collection) const
{
    return m_entries.value(entryKey(destination, collection)).lastRun;
}

QString CheckpointStore::lastRunStatus(const QString &destination, const QString &collection) const
{
    return m_entries.value(entryKey(destination, collection)).lastStatus;
}

// ========== Persistence ==========

QString CheckpointStore::filePath() const
{
    return QDir(m_stateDir).filePath("checkpoints.json");
}

bool CheckpointStore::load()
{
    QFile file(filePath());
    if (!file.exists()) {
        // No previous state - this is fine for a first run
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open checkpoint file: %1").arg(filePath()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse checkpoints: %1").arg(parseError.errorString()));
        return false;
    }

    m_entries.clear();
    const QJsonObject entries = doc.object()["entries"].toObject();
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        m_entries.insert(it.key(), entryFromJson(it.value().toObject()));
    }

    qDebug() << "[CheckpointStore] Loaded" << m_entries.size() << "entries from" << m_stateDir;
    return true;
}

bool CheckpointStore::save()
{
    if (!QDir().mkpath(m_stateDir)) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }

    QJsonObject entries;
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        entries[it.key()] = entryToJson(it.value());
    }

    QJsonObject root;
    root["version"] = 1;
    root["entries"] = entries;

    QFile file(filePath());
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save checkpoints: %1").arg(filePath()));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();

    qDebug() << "[CheckpointStore] Saved" << m_entries.size() << "entries";
    return true;
}

void CheckpointStore::clear()
{
    m_entries.clear();
    emit stateChanged();
}

// ========== Private Helpers ==========

QString CheckpointStore::entryKey(const QString &destination, const QString &collection)
{
    return destination + QLatin1Char('/') + collection;
}

QJsonObject CheckpointStore::entryToJson(const Entry &entry)
{
    QJsonObject obj;
    if (entry.checkpoint.isValid()) {
        obj["checkpoint"] = entry.checkpoint.toJson();
    }

    QJsonArray conflicts;
    for (const ConflictEntry &conflict : entry.conflicts) {
        conflicts.append(conflict.toJson());
    }
    obj["conflicts"] = conflicts;
    obj["lastRun"] = entry.lastRun.toString(Qt::ISODateWithMs);
    obj["lastStatus"] = entry.lastStatus;
    return obj;
}

CheckpointStore::Entry CheckpointStore::entryFromJson(const QJsonObject &json)
{
    Entry entry;
    if (json.contains("checkpoint")) {
        entry.checkpoint = Checkpoint::fromJson(json["checkpoint"].toObject());
    }

    const QJsonArray conflicts = json["conflicts"].toArray();
    for (const QJsonValue &val : conflicts) {
        entry.conflicts.append(ConflictEntry::fromJson(val.toObject()));
    }
    entry.lastRun = QDateTime::fromString(json["lastRun"].toString(), Qt::ISODateWithMs);
    entry.lastStatus = json["lastStatus"].toString();
    return entry;
}

} // namespace Replica
