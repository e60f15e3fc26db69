#ifndef RECORDHANDLER_H
#define RECORDHANDLER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QPair>
#include <QJsonObject>
#include "synctypes.h"

namespace Replica {

/**
 * @brief Abstract interface for a source or destination store
 *
 * A handler is responsible for talking to one store. Examples:
 *   - InMemoryHandler: collections held in process memory
 *   - a REST, database-wire, object-storage, log-ingestion or
 *     filesystem-export adapter living outside this library
 *
 * The engine never branches on handler type; everything it needs goes
 * through this method set. Handlers report failures through return values
 * and the errorOccurred() signal, never by throwing.
 */
class RecordHandler : public QObject
{
    Q_OBJECT

public:
    explicit RecordHandler(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RecordHandler() = default;

    // ========== Identity ==========

    /**
     * @brief Name used in results and integrity reports
     *
     * Examples: "source", "cloud-prod", "dr-site"
     */
    virtual QString name() const = 0;

    // ========== Connection ==========

    /**
     * @brief Establish the connection
     * @return true if the store is reachable
     */
    virtual bool openConnection() = 0;

    /**
     * @brief Close the connection (safe to call when not connected)
     */
    virtual void closeConnection() = 0;

    /**
     * @brief Probe the connection without side effects
     * @return (reachable, human-readable message)
     */
    virtual QPair<bool, QString> testConnection() = 0;

    // ========== Collection Management ==========

    virtual bool collectionExists(const QString &collection) = 0;

    /**
     * @brief Create a collection
     * @param schema Optional schema (empty object when unknown)
     * @return true on success or if it already exists
     */
    virtual bool createCollection(const QString &collection,
                                  const QJsonObject &schema = QJsonObject()) = 0;

    /**
     * @brief Get the collection schema
     * @return Schema, or empty object if none is defined
     */
    virtual QJsonObject getSchema(const QString &collection) = 0;

    // ========== Record Operations ==========

    /**
     * @brief Read records from a collection
     *
     * The returned order must be stable between reads of unchanged data
     * so that checkpoints stay meaningful. Each call is an independent
     * cursor; concurrent destination runs may read the same source.
     *
     * @param query Conjunction of field == value constraints (empty = all)
     * @param fields Projection (empty = all fields)
     * @param skip Records to skip
     * @param limit Maximum records to return (0 = unlimited)
     */
    virtual QList<Record> readRecords(const QString &collection,
                                      const QJsonObject &query = QJsonObject(),
                                      const QStringList &fields = QStringList(),
                                      int skip = 0,
                                      int limit = 0) = 0;

    /**
     * @brief Write (insert or fully replace) records
     * @param preserveKey Keep the records' key field as the store key
     */
    virtual WriteOutcome writeRecords(const QString &collection,
                                      const QList<Record> &records,
                                      bool preserveKey = true) = 0;

    /**
     * @brief Replace a single record
     * @return true on success
     */
    virtual bool updateRecord(const QString &collection,
                              const QString &key,
                              const Record &record) = 0;

    virtual WriteOutcome deleteRecords(const QString &collection,
                                       const QStringList &keys) = 0;

    virtual int getRecordCount(const QString &collection,
                               const QJsonObject &query = QJsonObject()) = 0;

    /**
     * @brief Load a single record by key
     * @return Record, or empty object if not found
     */
    virtual Record getRecordByKey(const QString &collection, const QString &key) = 0;

signals:
    void errorOccurred(const QString &error);
};

} // namespace Replica

#endif // RECORDHANDLER_H
