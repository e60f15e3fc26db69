#ifndef INTEGRITYAUDITOR_H
#define INTEGRITYAUDITOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QJsonObject>
#include "merkletree.h"
#include "parityblocks.h"
#include "../sync/synctypes.h"
#include "../sync/recordhandler.h"

namespace Replica {

/**
 * @brief Classification of one destination/collection probe
 */
enum class ProbeStatus {
    Pending,
    Ok,             ///< Roots and counts equal
    Mismatch,       ///< Roots or counts differ (or destination collection missing)
    Unreachable,    ///< Destination connection failed
    Error           ///< Collection absent at source
};

QString probeStatusToString(ProbeStatus status);

/**
 * @brief Overall health of an integrity report
 */
enum class OverallStatus {
    Unknown,        ///< No probes recorded
    Ok,             ///< Every probe ok
    Degraded,       ///< Only mismatches besides ok
    Error           ///< At least one unreachable or error probe
};

QString overallStatusToString(OverallStatus status);

/**
 * @brief Result of comparing one collection between source and a destination
 */
struct ProbeResult {
    QString destination;
    QString collection;
    ProbeStatus status = ProbeStatus::Pending;
    int sourceCount = 0;
    int destinationCount = 0;
    QString sourceRoot;
    QString destinationRoot;
    QStringList missingKeys;        ///< In source, absent at destination
    QStringList extraKeys;          ///< At destination only
    QStringList mismatchedKeys;     ///< Both sides, different checksum
    QList<int> failedBlocks;        ///< Parity blocks that differ
    bool destinationCollectionMissing = false;
    double latencyMs = 0;
    QString errorMessage;

    bool isOk() const { return status == ProbeStatus::Ok; }

    /**
     * @brief Report entry; roots are truncated to 16 hex chars + "..."
     */
    QJsonObject toJson() const;
};

/**
 * @brief Verification report over a set of destinations and collections
 */
struct IntegrityReport {
    QDateTime timestamp;
    QString source;
    QMap<QString, CollectionFingerprint> sourceCollections;    ///< collection -> fingerprint
    QMap<QString, QMap<QString, ProbeResult>> destinations;     ///< destination -> collection -> probe
    OverallStatus overallStatus = OverallStatus::Unknown;
    int totalCollections = 0;
    int collectionsInSync = 0;
    int collectionsMismatched = 0;

    void addResult(const ProbeResult &result);

    /**
     * @brief Recount totals and derive the overall status
     */
    void computeOverallStatus();

    /**
     * @brief Every probe, destination by destination
     */
    QList<ProbeResult> results() const;

    ProbeResult result(const QString &destination, const QString &collection) const;

    QJsonObject toJson() const;
};

/**
 * @brief Compares destinations against the source by fingerprint
 *
 * A probe fingerprints the source collection and the destination
 * collection (record count and Merkle root over key-sorted record
 * checksums) and classifies the pair. auditAll() additionally computes
 * key-set differences and the failed parity blocks so that mismatches
 * are actionable by the Reconciler.
 *
 * With a profile set, source records go through the same filter and
 * transformation a sync applies, so a correctly synced destination
 * audits as ok.
 */
class IntegrityAuditor : public QObject
{
    Q_OBJECT

public:
    explicit IntegrityAuditor(RecordHandler *source, QObject *parent = nullptr);
    ~IntegrityAuditor() override = default;

    void setProfile(const SyncProfile &profile);
    void setRecordsPerBlock(int recordsPerBlock);
    int recordsPerBlock() const { return m_recordsPerBlock; }

    /**
     * @brief Fingerprint comparison of one collection
     */
    ProbeResult probe(RecordHandler *destination, const QString &collection);

    /**
     * @brief Probe every destination/collection pair with key-level detail
     */
    IntegrityReport auditAll(const QList<RecordHandler*> &destinations,
                             const QStringList &collections);

signals:
    void probeCompleted(const QString &destination, const QString &collection, const QString &status);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    bool fingerprintSource(const QString &collection, CollectionFingerprint &fingerprint,
                           QString &error);
    ProbeResult compare(RecordHandler *destination,
                        const QString &collection,
                        const CollectionFingerprint *source,
                        const QString &sourceError,
                        bool detailed);
    void addKeyDetail(ProbeResult &result,
                      const CollectionFingerprint &source,
                      const CollectionFingerprint &destination) const;

    RecordHandler *m_source = nullptr;
    SyncProfile m_profile;
    int m_recordsPerBlock = ParityBlockSet::DEFAULT_RECORDS_PER_BLOCK;
};

} // namespace Replica

#endif // INTEGRITYAUDITOR_H
