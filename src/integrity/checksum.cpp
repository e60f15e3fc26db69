#include "checksum.h"

#include <QCryptographicHash>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonValue>

namespace Replica {

namespace {

QJsonValue stripNullsValue(const QJsonValue &value);

QJsonArray stripNullsArray(const QJsonArray &array)
{
    // Array positions are significant, so null elements stay
    QJsonArray result;
    for (const QJsonValue &element : array) {
        result.append(stripNullsValue(element));
    }
    return result;
}

QJsonValue stripNullsValue(const QJsonValue &value)
{
    if (value.isObject()) {
        QJsonObject result;
        const QJsonObject object = value.toObject();
        for (auto it = object.begin(); it != object.end(); ++it) {
            if (it.value().isNull() || it.value().isUndefined()) continue;
            result.insert(it.key(), stripNullsValue(it.value()));
        }
        return result;
    }
    if (value.isArray()) {
        return stripNullsArray(value.toArray());
    }
    return value;
}

} // namespace

QString Checksum::compute(const Record &record, const QStringList &exclude)
{
    return hashHex(canonicalBytes(record, exclude));
}

QByteArray Checksum::canonicalBytes(const Record &record, const QStringList &exclude)
{
    Record filtered = record;
    for (const QString &field : exclude) {
        filtered.remove(field);
    }

    return QJsonDocument(stripNulls(filtered)).toJson(QJsonDocument::Compact);
}

bool Checksum::recordsEqual(const Record &a, const Record &b, const QStringList &exclude)
{
    return canonicalBytes(a, exclude) == canonicalBytes(b, exclude);
}

QString Checksum::hashHex(const QByteArray &data)
{
    return QString::fromLatin1(hashRaw(data).toHex());
}

QByteArray Checksum::hashRaw(const QByteArray &data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256);
}

QJsonObject Checksum::stripNulls(const QJsonObject &object)
{
    return stripNullsValue(object).toObject();
}

} // namespace Replica
