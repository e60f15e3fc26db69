#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMap>
#include <QSet>
#include <atomic>
#include <functional>
#include "synctypes.h"
#include "recordhandler.h"

namespace Replica {

/**
 * @brief Replicates collections from one source to its destinations
 *
 * The SyncEngine coordinates:
 *   - Connecting source and destination handlers
 *   - Creating missing destination collections from the source schema
 *   - Filtering, batching and transforming source records
 *   - Mode-specific write decisions and conflict resolution
 *   - Checkpointing after every batch and orphan deletion
 *   - Progress reporting and cooperative cancellation
 *
 * Usage:
 * @code
 * SyncProfile profile;
 * profile.mode = SyncMode::Incremental;
 *
 * SyncEngine engine(&primary, profile);
 * engine.addDestination(&drSite);
 * engine.addDestination(&analytics);
 *
 * QList<SyncResult> results = engine.syncAll("orders");
 * @endcode
 *
 * Handlers are not owned by the engine. Each destination run reads the
 * source through its own readRecords() call, so a caller may drive
 * several engines (one per destination) from different threads.
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    SyncEngine(RecordHandler *source, const SyncProfile &profile, QObject *parent = nullptr);
    ~SyncEngine() override = default;

    RecordHandler* source() const { return m_source; }
    const SyncProfile& profile() const { return m_profile; }

    // ========== Destination Management ==========

    /**
     * @brief Register a destination (replaces one with the same name)
     */
    void addDestination(RecordHandler *destination);

    void removeDestination(const QString &name);

    RecordHandler* destination(const QString &name) const;

    /**
     * @brief Registered destinations in registration order
     */
    QList<RecordHandler*> destinations() const { return m_destinations; }

    // ========== Sync Operations ==========

    /**
     * @brief Replicate one collection to one destination
     *
     * @param destination Target handler (need not be registered)
     * @param collection Collection name, same on both sides
     * @param resumeFrom Checkpoint of an earlier interrupted run; batches
     *        it confirms are not written again
     */
    SyncResult sync(RecordHandler *destination,
                    const QString &collection,
                    const Checkpoint &resumeFrom = Checkpoint());

    /**
     * @brief Replicate one collection to every registered destination
     *
     * Destinations run one after another. After a cancellation the
     * remaining destinations are reported as cancelled without running.
     */
    QList<SyncResult> syncAll(const QString &collection);

    /**
     * @brief Request cancellation (thread-safe)
     *
     * Checked before every batch and once more before orphan deletion;
     * the in-flight batch finishes first.
     */
    void cancel();

    bool isCancelled() const;
    bool isSyncing() const { return m_syncing; }

    /**
     * @brief External cancellation check, polled before every batch
     */
    void setCancelCheck(std::function<bool()> callback);

    /**
     * @brief Progress callback for worker-thread integration
     */
    void setProgressCallback(std::function<void(int, int, const QString&)> callback);

signals:
    void syncStarted(const QString &destination, const QString &collection);
    void syncFinished(const SyncResult &result);
    void progressUpdated(int current, int total, const QString &message);
    void checkpointReached(const Checkpoint &checkpoint);
    void conflictDetected(const ConflictEntry &entry);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    SyncResult runSync(RecordHandler *destination,
                       const QString &collection,
                       const Checkpoint &resumeFrom);

    /**
     * @brief Decide and write one batch according to the mode
     */
    void processBatch(RecordHandler *destination,
                      const QString &collection,
                      const QList<Record> &batch,
                      const QMap<QString, Record> &destinationRecords,
                      SyncResult &result);

    void deleteOrphans(RecordHandler *destination,
                       const QString &collection,
                       const QSet<QString> &sourceKeys,
                       const QMap<QString, Record> &destinationRecords,
                       SyncResult &result);

    void applyWrite(RecordHandler *destination,
                    const QString &collection,
                    const QList<Record> &records,
                    SyncResult &result);

    void abortRun(SyncResult &result, const QString &message);
    bool cancelRequested() const;
    void reportProgress(int current, int total, const QString &message);

    RecordHandler *m_source = nullptr;
    SyncProfile m_profile;
    QList<RecordHandler*> m_destinations;

    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_syncing{false};

    std::function<bool()> m_cancelCheck;
    std::function<void(int, int, const QString&)> m_progressCallback;
};

} // namespace Replica

#endif // SYNCENGINE_H
