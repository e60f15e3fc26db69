#ifndef PROFILE_H
#define PROFILE_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <QJsonObject>
#include "sync/synctypes.h"

namespace Replica {

/**
 * @brief Profile represents a replication profile with its settings
 *
 * Profile settings are stored in the profile folder itself as
 * .qreplicasync.conf, so the folder can be moved and the settings travel
 * with it. Checkpoints live in the folder's .state/ directory.
 *
 * Each profile corresponds to:
 *   - A replication mode and conflict policy
 *   - Batching, key and timestamp settings
 *   - Field mappings, exclusions and a filter query
 *   - The collections to replicate and audit
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given folder
     * @param folderPath Path to the profile folder (e.g., ~/ReplicaSync/orders)
     */
    explicit Profile(const QString &folderPath = QString());

    // Profile location
    QString folderPath() const { return m_folderPath; }
    void setFolderPath(const QString &path);

    // Profile identity
    QString name() const;
    void setName(const QString &name);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Sync Settings ==========

    SyncMode mode() const { return m_mode; }
    void setMode(SyncMode mode);

    ConflictResolution conflictPolicy() const { return m_conflictPolicy; }
    void setConflictPolicy(ConflictResolution policy);

    int batchSize() const { return m_batchSize; }
    void setBatchSize(int size);

    bool deleteOrphans() const { return m_deleteOrphans; }
    void setDeleteOrphans(bool enabled);

    bool preserveKey() const { return m_preserveKey; }
    void setPreserveKey(bool enabled);

    QString keyField() const { return m_keyField; }
    void setKeyField(const QString &field);

    QString timestampField() const { return m_timestampField; }
    void setTimestampField(const QString &field);

    // ========== Record Shaping ==========

    QMap<QString, QString> fieldMappings() const { return m_fieldMappings; }
    void setFieldMappings(const QMap<QString, QString> &mappings);

    QStringList fieldExclusions() const { return m_fieldExclusions; }
    void setFieldExclusions(const QStringList &fields);

    QJsonObject filterQuery() const { return m_filterQuery; }
    void setFilterQuery(const QJsonObject &query);

    // ========== Collections and Audit ==========

    QStringList collections() const { return m_collections; }
    void setCollections(const QStringList &collections);

    int recordsPerBlock() const { return m_recordsPerBlock; }
    void setRecordsPerBlock(int count);

    /**
     * @brief Settings of one sync run, as the engine consumes them
     */
    SyncProfile toSyncProfile() const;

    /**
     * @brief Copy every sync setting from an engine profile
     */
    void applySyncProfile(const SyncProfile &profile);

    // ========== Persistence ==========

    // Load settings from .qreplicasync.conf in the profile folder
    bool load();

    // Save settings to .qreplicasync.conf in the profile folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

    // Get the path to the profile config file
    QString configFilePath() const;

    // Get the path to the state directory (checkpoints, review queue)
    QString stateDirectoryPath() const;

private:
    QString m_folderPath;
    QString m_name;

    SyncMode m_mode;
    ConflictResolution m_conflictPolicy;
    int m_batchSize;
    bool m_deleteOrphans = false;
    bool m_preserveKey = true;
    QString m_keyField;
    QString m_timestampField;

    QMap<QString, QString> m_fieldMappings;
    QStringList m_fieldExclusions;
    QJsonObject m_filterQuery;

    QStringList m_collections;
    int m_recordsPerBlock;

    // Default values
    static const QString DEFAULT_MODE;
    static const QString DEFAULT_CONFLICT_POLICY;
    static const int DEFAULT_BATCH_SIZE;
    static const QString DEFAULT_KEY_FIELD;
    static const QString DEFAULT_TIMESTAMP_FIELD;
    static const int DEFAULT_RECORDS_PER_BLOCK;
};

} // namespace Replica

#endif // PROFILE_H
