#ifndef CHECKPOINTSTORE_H
#define CHECKPOINTSTORE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QMap>
#include <QList>
#include <QJsonObject>
#include "synctypes.h"

namespace Replica {

/**
 * @brief Caller-side persistence of checkpoints and the review queue
 *
 * The engine never persists anything itself. A scheduler keeps one store
 * per state directory and feeds it every SyncResult so an interrupted run
 * can be resumed after a restart.
 *
 * State is stored in:
 *   <stateDir>/
 *     └── checkpoints.json   - per destination/collection: last checkpoint,
 *                              last run status and time, pending conflicts
 */
class CheckpointStore : public QObject
{
    Q_OBJECT

public:
    explicit CheckpointStore(const QString &stateDir, QObject *parent = nullptr);
    ~CheckpointStore() override = default;

    // ========== Checkpoints ==========

    /**
     * @brief Latest checkpoint for a destination/collection
     * @return Invalid checkpoint if none is stored
     */
    Checkpoint checkpoint(const QString &destination, const QString &collection) const;

    void recordCheckpoint(const QString &destination,
                          const QString &collection,
                          const Checkpoint &checkpoint);

    void clearCheckpoint(const QString &destination, const QString &collection);

    // ========== Conflict Queue ==========

    void addConflicts(const QString &destination,
                      const QString &collection,
                      const QList<ConflictEntry> &conflicts);

    QList<ConflictEntry> pendingConflicts(const QString &destination,
                                          const QString &collection) const;

    /**
     * @brief Remove and return the pending conflicts (for out-of-band review)
     */
    QList<ConflictEntry> takeConflicts(const QString &destination, const QString &collection);

    // ========== Run Results ==========

    /**
     * @brief Fold a finished run into the stored state
     *
     * A successful run clears the checkpoint; a cancelled or partially
     * failed run keeps its last checkpoint for resumption. A run whose
     * first batch already had write failures clears it so the next run
     * replays everything. Queued
     * conflicts are appended to the pending queue. Aborted runs wrote
     * nothing and leave the checkpoint as it was.
     */
    void recordResult(const SyncResult &result);

    QDateTime lastRunTime(const QString &destination, const QString &collection) const;
    QString lastRunStatus(const QString &destination, const QString &collection) const;

    // ========== Persistence ==========

    /**
     * @brief Load state from disk
     * @return true if loaded successfully (or if no previous state exists)
     */
    bool load();

    /**
     * @brief Save state to disk
     * @return true if saved successfully
     */
    bool save();

    /**
     * @brief Forget all state in memory (call save() to persist)
     */
    void clear();

    QString stateDirectory() const { return m_stateDir; }
    QString filePath() const;

signals:
    void stateChanged();
    void errorOccurred(const QString &error);

private:
    struct Entry {
        Checkpoint checkpoint;
        QList<ConflictEntry> conflicts;
        QDateTime lastRun;
        QString lastStatus;
    };

    static QString entryKey(const QString &destination, const QString &collection);
    static QJsonObject entryToJson(const Entry &entry);
    static Entry entryFromJson(const QJsonObject &json);

    QString m_stateDir;
    QMap<QString, Entry> m_entries;     // "destination/collection" -> entry
};

} // namespace Replica

#endif // CHECKPOINTSTORE_H
