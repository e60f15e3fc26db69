#ifndef INMEMORYHANDLER_H
#define INMEMORYHANDLER_H

#include "recordhandler.h"
#include <QString>
#include <QMap>
#include <QSet>
#include <QMutex>

namespace Replica {

/**
 * @brief Store held entirely in process memory
 *
 * Layout:
 *   <name>
 *   ├── <collection>   - records keyed by primary key, iterated in key order
 *   └── <collection>   - optional schema per collection
 *
 * Serves as the reference handler for embedders and tests. Fault
 * injection (unreachable store, failing keys, refused collection
 * creation) lets callers exercise every error path of the engine.
 *
 * All public methods lock an internal mutex, so several destination runs
 * may read the same instance concurrently.
 */
class InMemoryHandler : public RecordHandler
{
    Q_OBJECT

public:
    /**
     * @brief Create an in-memory store
     * @param name Store name used in results and reports
     * @param keyField Field holding the primary key
     * @param parent Parent QObject
     */
    explicit InMemoryHandler(const QString &name,
                             const QString &keyField = QStringLiteral("_key"),
                             QObject *parent = nullptr);
    ~InMemoryHandler() override = default;

    // ========== RecordHandler ==========

    QString name() const override { return m_name; }

    bool openConnection() override;
    void closeConnection() override;
    QPair<bool, QString> testConnection() override;

    bool collectionExists(const QString &collection) override;
    bool createCollection(const QString &collection,
                          const QJsonObject &schema = QJsonObject()) override;
    QJsonObject getSchema(const QString &collection) override;

    QList<Record> readRecords(const QString &collection,
                              const QJsonObject &query = QJsonObject(),
                              const QStringList &fields = QStringList(),
                              int skip = 0,
                              int limit = 0) override;
    WriteOutcome writeRecords(const QString &collection,
                              const QList<Record> &records,
                              bool preserveKey = true) override;
    bool updateRecord(const QString &collection,
                      const QString &key,
                      const Record &record) override;
    WriteOutcome deleteRecords(const QString &collection,
                               const QStringList &keys) override;
    int getRecordCount(const QString &collection,
                       const QJsonObject &query = QJsonObject()) override;
    Record getRecordByKey(const QString &collection, const QString &key) override;

    // ========== Direct Access ==========

    /**
     * @brief Replace a collection's content wholesale (creates it if needed)
     */
    void setCollection(const QString &collection, const QList<Record> &records);

    /**
     * @brief Remove a collection and its schema
     */
    void dropCollection(const QString &collection);

    /**
     * @brief Snapshot of a collection in key order
     */
    QList<Record> records(const QString &collection) const;

    QString keyField() const { return m_keyField; }
    bool isConnected() const;

    // ========== Fault Injection ==========

    /**
     * @brief Make openConnection() and testConnection() fail
     */
    void setReachable(bool reachable);

    /**
     * @brief Keys whose write, update or delete is rejected
     */
    void setFailingKeys(const QStringList &keys);

    /**
     * @brief Make createCollection() fail
     */
    void setRefuseCollectionCreation(bool refuse);

    /**
     * @brief Number of writeRecords() calls served (for batching checks)
     */
    int writeCallCount() const;

private:
    QString generateKey(const QString &collection, const Record &record) const;
    static bool matches(const Record &record, const QJsonObject &query);

    QString m_name;
    QString m_keyField;

    QMap<QString, QMap<QString, Record>> m_collections;  // collection -> key -> record
    QMap<QString, QJsonObject> m_schemas;                 // collection -> schema

    bool m_connected = false;
    bool m_reachable = true;
    bool m_refuseCreate = false;
    QSet<QString> m_failingKeys;
    int m_writeCalls = 0;

    mutable QMutex m_mutex;
};

} // namespace Replica

#endif // INMEMORYHANDLER_H
