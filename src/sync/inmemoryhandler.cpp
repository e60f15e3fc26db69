#include "inmemoryhandler.h"

#include <QMutexLocker>
#include <QJsonDocument>
#include <QCryptographicHash>
#include <QDebug>

namespace Replica {

InMemoryHandler::InMemoryHandler(const QString &name,
                                 const QString &keyField,
                                 QObject *parent)
    : RecordHandler(parent)
    , m_name(name)
    , m_keyField(keyField)
{
}

// ========== Connection ==========

bool InMemoryHandler::openConnection()
{
    QMutexLocker locker(&m_mutex);
    if (!m_reachable) {
        qWarning() << "[InMemoryHandler]" << m_name << "is unreachable";
        return false;
    }
    m_connected = true;
    return true;
}

void InMemoryHandler::closeConnection()
{
    QMutexLocker locker(&m_mutex);
    m_connected = false;
}

QPair<bool, QString> InMemoryHandler::testConnection()
{
    QMutexLocker locker(&m_mutex);
    if (!m_reachable) {
        return qMakePair(false, QString("Store %1 is unreachable").arg(m_name));
    }
    return qMakePair(true, QString("In-memory store %1 is available").arg(m_name));
}

bool InMemoryHandler::isConnected() const
{
    QMutexLocker locker(&m_mutex);
    return m_connected;
}

// ========== Collection Management ==========

bool InMemoryHandler::collectionExists(const QString &collection)
{
    QMutexLocker locker(&m_mutex);
    return m_collections.contains(collection);
}

bool InMemoryHandler::createCollection(const QString &collection, const QJsonObject &schema)
{
    QMutexLocker locker(&m_mutex);

    if (m_refuseCreate) {
        locker.unlock();
        emit errorOccurred(QString("Failed to create collection: %1").arg(collection));
        return false;
    }

    if (!m_collections.contains(collection)) {
        m_collections.insert(collection, QMap<QString, Record>());
        qDebug() << "[InMemoryHandler] Created collection" << collection << "in" << m_name;
    }
    if (!schema.isEmpty()) {
        m_schemas[collection] = schema;
    }
    return true;
}

QJsonObject InMemoryHandler::getSchema(const QString &collection)
{
    QMutexLocker locker(&m_mutex);
    return m_schemas.value(collection);
}

// ========== Record Operations ==========

QList<Record> InMemoryHandler::readRecords(const QString &collection,
                                           const QJsonObject &query,
                                           const QStringList &fields,
                                           int skip,
                                           int limit)
{
    QMutexLocker locker(&m_mutex);

    QList<Record> result;
    const auto coll = m_collections.constFind(collection);
    if (coll == m_collections.constEnd()) {
        return result;
    }

    int matched = 0;
    for (const Record &record : coll.value()) {
        if (!matches(record, query)) continue;

        if (matched++ < skip) continue;
        if (limit > 0 && result.size() >= limit) break;

        if (fields.isEmpty()) {
            result.append(record);
        } else {
            Record projected;
            for (const QString &field : fields) {
                if (record.contains(field)) {
                    projected[field] = record.value(field);
                }
            }
            result.append(projected);
        }
    }

    return result;
}

WriteOutcome InMemoryHandler::writeRecords(const QString &collection,
                                           const QList<Record> &records,
                                           bool preserveKey)
{
    QMutexLocker locker(&m_mutex);

    WriteOutcome outcome;
    m_writeCalls++;

    QMap<QString, Record> &coll = m_collections[collection];
    for (const Record &record : records) {
        QString key = record.value(m_keyField).toString();

        if (!preserveKey || key.isEmpty()) {
            key = generateKey(collection, record);
        }

        if (m_failingKeys.contains(key)) {
            outcome.errors << QString("%1: write rejected for key %2").arg(m_name, key);
            continue;
        }

        Record stored = record;
        stored[m_keyField] = key;
        coll.insert(key, stored);
        outcome.count++;
    }

    return outcome;
}

bool InMemoryHandler::updateRecord(const QString &collection,
                                   const QString &key,
                                   const Record &record)
{
    QMutexLocker locker(&m_mutex);

    if (key.isEmpty() || m_failingKeys.contains(key)) {
        locker.unlock();
        emit errorOccurred(QString("Failed to update record: %1").arg(key));
        return false;
    }

    Record stored = record;
    stored[m_keyField] = key;
    m_collections[collection].insert(key, stored);
    return true;
}

WriteOutcome InMemoryHandler::deleteRecords(const QString &collection,
                                            const QStringList &keys)
{
    QMutexLocker locker(&m_mutex);

    WriteOutcome outcome;
    auto coll = m_collections.find(collection);
    if (coll == m_collections.end()) {
        return outcome;
    }

    for (const QString &key : keys) {
        if (m_failingKeys.contains(key)) {
            outcome.errors << QString("%1: delete rejected for key %2").arg(m_name, key);
            continue;
        }
        if (coll->remove(key) > 0) {
            outcome.count++;
        }
    }

    return outcome;
}

int InMemoryHandler::getRecordCount(const QString &collection, const QJsonObject &query)
{
    QMutexLocker locker(&m_mutex);

    const auto coll = m_collections.constFind(collection);
    if (coll == m_collections.constEnd()) {
        return 0;
    }
    if (query.isEmpty()) {
        return coll->size();
    }

    int count = 0;
    for (const Record &record : coll.value()) {
        if (matches(record, query)) count++;
    }
    return count;
}

Record InMemoryHandler::getRecordByKey(const QString &collection, const QString &key)
{
    QMutexLocker locker(&m_mutex);
    return m_collections.value(collection).value(key);
}

// ========== Direct Access ==========

void InMemoryHandler::setCollection(const QString &collection, const QList<Record> &records)
{
    QMutexLocker locker(&m_mutex);

    QMap<QString, Record> coll;
    for (const Record &record : records) {
        coll.insert(record.value(m_keyField).toString(), record);
    }
    m_collections[collection] = coll;
}

void InMemoryHandler::dropCollection(const QString &collection)
{
    QMutexLocker locker(&m_mutex);
    m_collections.remove(collection);
    m_schemas.remove(collection);
}

QList<Record> InMemoryHandler::records(const QString &collection) const
{
    QMutexLocker locker(&m_mutex);
    return m_collections.value(collection).values();
}

// ========== Fault Injection ==========

void InMemoryHandler::setReachable(bool reachable)
{
    QMutexLocker locker(&m_mutex);
    m_reachable = reachable;
    if (!reachable) {
        m_connected = false;
    }
}

void InMemoryHandler::setFailingKeys(const QStringList &keys)
{
    QMutexLocker locker(&m_mutex);
    m_failingKeys = QSet<QString>(keys.begin(), keys.end());
}

void InMemoryHandler::setRefuseCollectionCreation(bool refuse)
{
    QMutexLocker locker(&m_mutex);
    m_refuseCreate = refuse;
}

int InMemoryHandler::writeCallCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_writeCalls;
}

// ========== Private Helpers ==========

QString InMemoryHandler::generateKey(const QString &collection, const Record &record) const
{
    // Content-derived key, with a numeric suffix on collision
    const QByteArray data = QJsonDocument(record).toJson(QJsonDocument::Compact);
    const QString base = QString::fromLatin1(
        QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex().left(12));

    const QMap<QString, Record> coll = m_collections.value(collection);
    QString key = base;
    int suffix = 1;
    while (coll.contains(key)) {
        key = QString("%1_%2").arg(base).arg(suffix++);
    }
    return key;
}

bool InMemoryHandler::matches(const Record &record, const QJsonObject &query)
{
    for (auto it = query.begin(); it != query.end(); ++it) {
        if (record.value(it.key()) != it.value()) {
            return false;
        }
    }
    return true;
}

} // namespace Replica
