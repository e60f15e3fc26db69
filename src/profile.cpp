#include "profile.h"
#include "integrity/parityblocks.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QJsonDocument>
#include <QDebug>

namespace Replica {

const QString Profile::DEFAULT_MODE = "full_sync";
const QString Profile::DEFAULT_CONFLICT_POLICY = "source_wins";
const int Profile::DEFAULT_BATCH_SIZE = 1000;
const QString Profile::DEFAULT_KEY_FIELD = "_key";
const QString Profile::DEFAULT_TIMESTAMP_FIELD = "_updated";
const int Profile::DEFAULT_RECORDS_PER_BLOCK = ParityBlockSet::DEFAULT_RECORDS_PER_BLOCK;

Profile::Profile(const QString &folderPath)
    : m_folderPath(folderPath)
    , m_mode(syncModeFromString(DEFAULT_MODE))
    , m_conflictPolicy(conflictResolutionFromString(DEFAULT_CONFLICT_POLICY))
    , m_batchSize(DEFAULT_BATCH_SIZE)
    , m_keyField(DEFAULT_KEY_FIELD)
    , m_timestampField(DEFAULT_TIMESTAMP_FIELD)
    , m_recordsPerBlock(DEFAULT_RECORDS_PER_BLOCK)
{
    // Try to load existing settings if path is set
    if (!m_folderPath.isEmpty()) {
        load();
    }
}

void Profile::setFolderPath(const QString &path)
{
    m_folderPath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_folderPath.isEmpty()) {
        return QFileInfo(m_folderPath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

bool Profile::isValid() const
{
    if (m_folderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_folderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Sync Settings ==========

void Profile::setMode(SyncMode mode)
{
    m_mode = mode;
}

void Profile::setConflictPolicy(ConflictResolution policy)
{
    m_conflictPolicy = policy;
}

void Profile::setBatchSize(int size)
{
    m_batchSize = qMax(1, size);
}

void Profile::setDeleteOrphans(bool enabled)
{
    m_deleteOrphans = enabled;
}

void Profile::setPreserveKey(bool enabled)
{
    m_preserveKey = enabled;
}

void Profile::setKeyField(const QString &field)
{
    m_keyField = field;
}

void Profile::setTimestampField(const QString &field)
{
    m_timestampField = field;
}

// ========== Record Shaping ==========

void Profile::setFieldMappings(const QMap<QString, QString> &mappings)
{
    m_fieldMappings = mappings;
}

void Profile::setFieldExclusions(const QStringList &fields)
{
    m_fieldExclusions = fields;
}

void Profile::setFilterQuery(const QJsonObject &query)
{
    m_filterQuery = query;
}

// ========== Collections and Audit ==========

void Profile::setCollections(const QStringList &collections)
{
    m_collections = collections;
}

void Profile::setRecordsPerBlock(int count)
{
    m_recordsPerBlock = qMax(1, count);
}

SyncProfile Profile::toSyncProfile() const
{
    SyncProfile profile;
    profile.name = name();
    profile.mode = m_mode;
    profile.conflictResolution = m_conflictPolicy;
    profile.batchSize = m_batchSize;
    profile.deleteOrphans = m_deleteOrphans;
    profile.preserveKey = m_preserveKey;
    profile.keyField = m_keyField;
    profile.timestampField = m_timestampField;
    profile.fieldMappings = m_fieldMappings;
    profile.fieldExclusions = m_fieldExclusions;
    profile.filterQuery = m_filterQuery;
    return profile;
}

void Profile::applySyncProfile(const SyncProfile &profile)
{
    if (!profile.name.isEmpty()) {
        m_name = profile.name;
    }
    m_mode = profile.mode;
    m_conflictPolicy = profile.conflictResolution;
    setBatchSize(profile.batchSize);
    m_deleteOrphans = profile.deleteOrphans;
    m_preserveKey = profile.preserveKey;
    m_keyField = profile.keyField;
    m_timestampField = profile.timestampField;
    m_fieldMappings = profile.fieldMappings;
    m_fieldExclusions = profile.fieldExclusions;
    m_filterQuery = profile.filterQuery;
}

// ========== Persistence ==========

bool Profile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    m_name = settings.value("profile/name", QString()).toString();

    // Sync settings; unknown strings fall back to the defaults
    bool ok = false;
    SyncMode mode = syncModeFromString(settings.value("sync/mode", DEFAULT_MODE).toString(), &ok);
    if (!ok) {
        qWarning() << "[Profile] Unknown sync mode in" << configPath << "- using" << DEFAULT_MODE;
        mode = syncModeFromString(DEFAULT_MODE);
    }
    m_mode = mode;

    ConflictResolution policy = conflictResolutionFromString(
        settings.value("sync/conflictPolicy", DEFAULT_CONFLICT_POLICY).toString(), &ok);
    if (!ok) {
        qWarning() << "[Profile] Unknown conflict policy in" << configPath
                   << "- using" << DEFAULT_CONFLICT_POLICY;
        policy = conflictResolutionFromString(DEFAULT_CONFLICT_POLICY);
    }
    m_conflictPolicy = policy;

    setBatchSize(settings.value("sync/batchSize", DEFAULT_BATCH_SIZE).toInt());
    m_deleteOrphans = settings.value("sync/deleteOrphans", false).toBool();
    m_preserveKey = settings.value("sync/preserveKey", true).toBool();
    m_keyField = settings.value("sync/keyField", DEFAULT_KEY_FIELD).toString();
    m_timestampField = settings.value("sync/timestampField", DEFAULT_TIMESTAMP_FIELD).toString();

    // Record shaping (mappings and filter stored as JSON strings)
    m_fieldMappings.clear();
    QString mappingsStr = settings.value("records/fieldMappings").toString();
    if (!mappingsStr.isEmpty()) {
        QJsonDocument doc = QJsonDocument::fromJson(mappingsStr.toUtf8());
        if (!doc.isNull() && doc.isObject()) {
            const QJsonObject obj = doc.object();
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                m_fieldMappings.insert(it.key(), it.value().toString());
            }
        }
    }

    m_fieldExclusions = settings.value("records/fieldExclusions").toStringList();

    m_filterQuery = QJsonObject();
    QString filterStr = settings.value("records/filterQuery").toString();
    if (!filterStr.isEmpty()) {
        QJsonDocument doc = QJsonDocument::fromJson(filterStr.toUtf8());
        if (!doc.isNull() && doc.isObject()) {
            m_filterQuery = doc.object();
        }
    }

    // Collections and audit
    m_collections = settings.value("collections/names").toStringList();
    setRecordsPerBlock(settings.value("audit/recordsPerBlock", DEFAULT_RECORDS_PER_BLOCK).toInt());

    return true;
}

bool Profile::save()
{
    if (m_folderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_folderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QString configPath = configFilePath();
    QSettings settings(configPath, QSettings::IniFormat);

    // Profile identity
    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }

    // Sync settings
    settings.setValue("sync/mode", syncModeToString(m_mode));
    settings.setValue("sync/conflictPolicy", conflictResolutionToString(m_conflictPolicy));
    settings.setValue("sync/batchSize", m_batchSize);
    settings.setValue("sync/deleteOrphans", m_deleteOrphans);
    settings.setValue("sync/preserveKey", m_preserveKey);
    settings.setValue("sync/keyField", m_keyField);
    settings.setValue("sync/timestampField", m_timestampField);

    // Record shaping
    QJsonObject mappings;
    for (auto it = m_fieldMappings.begin(); it != m_fieldMappings.end(); ++it) {
        mappings[it.key()] = it.value();
    }
    settings.setValue("records/fieldMappings",
                      QString::fromUtf8(QJsonDocument(mappings).toJson(QJsonDocument::Compact)));
    settings.setValue("records/fieldExclusions", m_fieldExclusions);
    settings.setValue("records/filterQuery",
                      QString::fromUtf8(QJsonDocument(m_filterQuery).toJson(QJsonDocument::Compact)));

    // Collections and audit
    settings.setValue("collections/names", m_collections);
    settings.setValue("audit/recordsPerBlock", m_recordsPerBlock);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_folderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_folderPath);

    // Create main directory
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    if (!dir.mkpath(".state")) {
        return false;
    }

    // Save default settings
    return save();
}

QString Profile::configFilePath() const
{
    if (m_folderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_folderPath).filePath(".qreplicasync.conf");
}

QString Profile::stateDirectoryPath() const
{
    if (m_folderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_folderPath).filePath(".state");
}

} // namespace Replica
