#include "integrityauditor.h"
#include "checksum.h"
#include "../sync/recordtransformer.h"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QSet>
#include <QDebug>

namespace Replica {

namespace {

QString truncatedRoot(const QString &root)
{
    if (root.isEmpty()) {
        return QString();
    }
    return root.left(16) + QStringLiteral("...");
}

} // namespace

QString probeStatusToString(ProbeStatus status)
{
    switch (status) {
        case ProbeStatus::Pending:     return "pending";
        case ProbeStatus::Ok:          return "ok";
        case ProbeStatus::Mismatch:    return "mismatch";
        case ProbeStatus::Unreachable: return "unreachable";
        case ProbeStatus::Error:       return "error";
    }
    return "pending";
}

QString overallStatusToString(OverallStatus status)
{
    switch (status) {
        case OverallStatus::Unknown:  return "unknown";
        case OverallStatus::Ok:       return "ok";
        case OverallStatus::Degraded: return "degraded";
        case OverallStatus::Error:    return "error";
    }
    return "unknown";
}

// ========== ProbeResult ==========

QJsonObject ProbeResult::toJson() const
{
    QJsonObject obj;
    obj["status"] = probeStatusToString(status);
    obj["sourceCount"] = sourceCount;
    obj["destinationCount"] = destinationCount;
    obj["sourceChecksum"] = truncatedRoot(sourceRoot);
    obj["destinationChecksum"] = truncatedRoot(destinationRoot);
    obj["missingKeys"] = QJsonArray::fromStringList(missingKeys);
    obj["extraKeys"] = QJsonArray::fromStringList(extraKeys);
    obj["mismatchedKeys"] = QJsonArray::fromStringList(mismatchedKeys);

    QJsonArray blocks;
    for (int index : failedBlocks) {
        blocks.append(index);
    }
    obj["failedBlocks"] = blocks;
    obj["latencyMs"] = latencyMs;
    if (destinationCollectionMissing) {
        obj["missingCollection"] = true;
    }
    if (!errorMessage.isEmpty()) {
        obj["error"] = errorMessage;
    }
    return obj;
}

// ========== IntegrityReport ==========

void IntegrityReport::addResult(const ProbeResult &result)
{
    destinations[result.destination][result.collection] = result;
}

void IntegrityReport::computeOverallStatus()
{
    totalCollections = 0;
    collectionsInSync = 0;
    collectionsMismatched = 0;

    bool allOk = true;
    bool anyError = false;

    for (const auto &collections : destinations) {
        for (const ProbeResult &result : collections) {
            totalCollections++;
            if (result.status == ProbeStatus::Ok) {
                collectionsInSync++;
            } else if (result.status == ProbeStatus::Mismatch) {
                collectionsMismatched++;
                allOk = false;
            } else {
                anyError = true;
                allOk = false;
            }
        }
    }

    if (totalCollections == 0) {
        overallStatus = OverallStatus::Unknown;
    } else if (allOk) {
        overallStatus = OverallStatus::Ok;
    } else if (anyError) {
        overallStatus = OverallStatus::Error;
    } else {
        overallStatus = OverallStatus::Degraded;
    }
}

QList<ProbeResult> IntegrityReport::results() const
{
    QList<ProbeResult> all;
    for (const auto &collections : destinations) {
        for (const ProbeResult &result : collections) {
            all.append(result);
        }
    }
    return all;
}

ProbeResult IntegrityReport::result(const QString &destination, const QString &collection) const
{
    return destinations.value(destination).value(collection);
}

QJsonObject IntegrityReport::toJson() const
{
    QJsonObject obj;
    obj["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    obj["source"] = source;
    obj["overallStatus"] = overallStatusToString(overallStatus);
    obj["totalCollections"] = totalCollections;
    obj["collectionsInSync"] = collectionsInSync;
    obj["collectionsMismatched"] = collectionsMismatched;

    QJsonObject sourceObj;
    for (auto it = sourceCollections.begin(); it != sourceCollections.end(); ++it) {
        QJsonObject fp;
        fp["recordCount"] = it.value().recordCount;
        fp["merkleRoot"] = it.value().merkleRoot;
        sourceObj[it.key()] = fp;
    }
    obj["sourceCollections"] = sourceObj;

    QJsonObject destObj;
    for (auto dest = destinations.begin(); dest != destinations.end(); ++dest) {
        QJsonObject collections;
        bool allOk = true;
        bool anyError = false;
        for (auto coll = dest.value().begin(); coll != dest.value().end(); ++coll) {
            collections[coll.key()] = coll.value().toJson();
            if (coll.value().status == ProbeStatus::Mismatch) {
                allOk = false;
            } else if (coll.value().status != ProbeStatus::Ok) {
                allOk = false;
                anyError = true;
            }
        }

        QJsonObject entry;
        entry["collections"] = collections;
        entry["status"] = allOk ? QString("ok") : (anyError ? QString("error") : QString("degraded"));
        destObj[dest.key()] = entry;
    }
    obj["destinations"] = destObj;
    return obj;
}

// ========== IntegrityAuditor ==========

IntegrityAuditor::IntegrityAuditor(RecordHandler *source, QObject *parent)
    : QObject(parent)
    , m_source(source)
{
}

void IntegrityAuditor::setProfile(const SyncProfile &profile)
{
    m_profile = profile;
}

void IntegrityAuditor::setRecordsPerBlock(int recordsPerBlock)
{
    m_recordsPerBlock = qMax(1, recordsPerBlock);
}

ProbeResult IntegrityAuditor::probe(RecordHandler *destination, const QString &collection)
{
    CollectionFingerprint source;
    QString sourceError;
    const bool sourceOk = fingerprintSource(collection, source, sourceError);
    return compare(destination, collection, sourceOk ? &source : nullptr, sourceError, false);
}

IntegrityReport IntegrityAuditor::auditAll(const QList<RecordHandler*> &destinations,
                                           const QStringList &collections)
{
    IntegrityReport report;
    report.timestamp = QDateTime::currentDateTimeUtc();
    report.source = m_source ? m_source->name() : QString();

    emit logMessage(QString("Auditing %1 collection(s) on %2 destination(s)")
        .arg(collections.size()).arg(destinations.size()));

    for (const QString &collection : collections) {
        CollectionFingerprint source;
        QString sourceError;
        const bool sourceOk = fingerprintSource(collection, source, sourceError);
        if (sourceOk) {
            report.sourceCollections.insert(collection, source);
        }

        for (RecordHandler *dest : destinations) {
            report.addResult(compare(dest, collection, sourceOk ? &source : nullptr,
                                     sourceError, true));
        }
    }

    report.computeOverallStatus();

    qDebug() << "[IntegrityAuditor] Audit" << overallStatusToString(report.overallStatus)
             << report.collectionsInSync << "/" << report.totalCollections << "in sync";
    emit logMessage(QString("Audit complete: %1 (%2 of %3 in sync, %4 mismatched)")
        .arg(overallStatusToString(report.overallStatus))
        .arg(report.collectionsInSync)
        .arg(report.totalCollections)
        .arg(report.collectionsMismatched));

    return report;
}

bool IntegrityAuditor::fingerprintSource(const QString &collection,
                                         CollectionFingerprint &fingerprint,
                                         QString &error)
{
    if (!m_source) {
        error = "No source handler";
        return false;
    }

    if (!m_source->openConnection()) {
        error = QString("Failed to connect to source %1").arg(m_source->name());
        return false;
    }

    if (!m_source->collectionExists(collection)) {
        m_source->closeConnection();
        error = "Source collection not found";
        return false;
    }

    const QList<Record> selected = RecordTransformer::filter(
        m_source->readRecords(collection, m_profile.filterQuery), m_profile.filterQuery);
    m_source->closeConnection();

    QList<Record> transformed;
    transformed.reserve(selected.size());
    for (const Record &record : selected) {
        transformed.append(RecordTransformer::transform(record, m_profile));
    }

    fingerprint = MerkleTree::collectionFingerprint(transformed, m_profile.keyField);
    return true;
}

ProbeResult IntegrityAuditor::compare(RecordHandler *destination,
                                      const QString &collection,
                                      const CollectionFingerprint *source,
                                      const QString &sourceError,
                                      bool detailed)
{
    ProbeResult result;
    result.destination = destination ? destination->name() : QString();
    result.collection = collection;

    QElapsedTimer timer;
    timer.start();

    auto finish = [&]() {
        result.latencyMs = timer.nsecsElapsed() / 1.0e6;
        emit probeCompleted(result.destination, collection, probeStatusToString(result.status));
        return result;
    };

    if (!source) {
        result.status = ProbeStatus::Error;
        result.errorMessage = sourceError;
        emit errorOccurred(QString("%1: %2").arg(collection, sourceError));
        return finish();
    }

    result.sourceCount = source->recordCount;
    result.sourceRoot = source->merkleRoot;

    if (!destination || !destination->openConnection()) {
        result.status = ProbeStatus::Unreachable;
        result.errorMessage = QString("Destination %1 not reachable").arg(result.destination);
        qWarning() << "[IntegrityAuditor]" << result.errorMessage;
        return finish();
    }

    CollectionFingerprint dest;
    if (!destination->collectionExists(collection)) {
        result.destinationCollectionMissing = true;
        result.errorMessage = QString("Collection %1 missing at %2").arg(collection, result.destination);
        dest.merkleRoot = MerkleTree::emptyRoot();
    } else {
        dest = MerkleTree::collectionFingerprint(destination->readRecords(collection),
                                                 m_profile.keyField);
    }
    destination->closeConnection();

    result.destinationCount = dest.recordCount;
    result.destinationRoot = dest.merkleRoot;

    if (!result.destinationCollectionMissing
        && result.sourceRoot == result.destinationRoot
        && result.sourceCount == result.destinationCount) {
        result.status = ProbeStatus::Ok;
    } else {
        result.status = ProbeStatus::Mismatch;
        if (detailed) {
            addKeyDetail(result, *source, dest);
        }
    }

    return finish();
}

void IntegrityAuditor::addKeyDetail(ProbeResult &result,
                                    const CollectionFingerprint &source,
                                    const CollectionFingerprint &destination) const
{
    for (auto it = source.checksums.begin(); it != source.checksums.end(); ++it) {
        auto other = destination.checksums.constFind(it.key());
        if (other == destination.checksums.constEnd()) {
            result.missingKeys.append(it.key());
        } else if (other.value() != it.value()) {
            result.mismatchedKeys.append(it.key());
        }
    }

    for (auto it = destination.checksums.begin(); it != destination.checksums.end(); ++it) {
        if (!source.checksums.contains(it.key())) {
            result.extraKeys.append(it.key());
        }
    }

    const ParityBlockSet blocks = ParityBlockSet::build(source.checksums, m_recordsPerBlock);
    result.failedBlocks = blocks.failedBlocks(destination.checksums);
}

} // namespace Replica
