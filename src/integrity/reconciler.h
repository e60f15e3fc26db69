#ifndef RECONCILER_H
#define RECONCILER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QJsonObject>
#include "integrityauditor.h"
#include "../sync/synctypes.h"
#include "../sync/recordhandler.h"

namespace Replica {

/**
 * @brief One repair step derived from an integrity report
 */
struct ReconcileAction {
    enum Type {
        CreateCollection,       ///< Destination collection missing
        CopyMissing,            ///< Write source records absent at destination
        OverwriteMismatched,    ///< Replace diverged destination records
        QueueMismatched,        ///< Defer diverged records to manual review
        DeleteExtra             ///< Remove destination-only records
    };

    Type type = CopyMissing;
    QString destination;
    QString collection;
    QStringList keys;

    QJsonObject toJson() const;
};

QString reconcileActionTypeToString(ReconcileAction::Type type);

/**
 * @brief What a reconciliation is allowed to do
 */
struct ReconcileOptions {
    bool dryRun = false;                ///< Plan only, touch nothing
    bool copyMissing = true;
    bool overwriteMismatched = true;
    bool deleteExtra = false;
    bool queueMismatched = false;       ///< Manual review instead of overwrite
};

/**
 * @brief Outcome of a reconciliation
 */
struct ReconcileResult {
    bool success = false;       ///< No handler errors
    bool dryRun = false;
    bool converged = false;     ///< Every re-probe is ok
    QList<ReconcileAction> actions;
    int copied = 0;
    int overwritten = 0;
    int deleted = 0;
    int failed = 0;
    QStringList errors;
    QList<ConflictEntry> conflicts;     ///< Queued for manual review
    QList<ProbeResult> reprobes;

    QJsonObject toJson() const;
};

/**
 * @brief Repairs destinations from the findings of an integrity audit
 *
 * Only mismatched destination/collection pairs are repaired; unreachable
 * or errored pairs are reported but left alone. Records copied from the
 * source go through the same transformation a sync applies.
 */
class Reconciler : public QObject
{
    Q_OBJECT

public:
    explicit Reconciler(RecordHandler *source, QObject *parent = nullptr);
    ~Reconciler() override = default;

    void setProfile(const SyncProfile &profile);
    void setRecordsPerBlock(int recordsPerBlock);

    /**
     * @brief Actions a reconciliation with these options would take
     */
    QList<ReconcileAction> plan(const IntegrityReport &report,
                                const ReconcileOptions &options = ReconcileOptions()) const;

    /**
     * @brief Apply the plan, then re-probe every touched pair
     *
     * In dry-run mode the plan is returned and no destination is touched.
     */
    ReconcileResult reconcile(const IntegrityReport &report,
                              const QList<RecordHandler*> &destinations,
                              const ReconcileOptions &options = ReconcileOptions());

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    void apply(const ReconcileAction &action, RecordHandler *destination, ReconcileResult &result);
    Record sourceRecord(const QString &collection, const QString &key) const;
    void fail(ReconcileResult &result, const QString &message);

    RecordHandler *m_source = nullptr;
    SyncProfile m_profile;
    int m_recordsPerBlock = ParityBlockSet::DEFAULT_RECORDS_PER_BLOCK;
};

} // namespace Replica

#endif // RECONCILER_H
