#include "jsonlocalstore.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QMutexLocker>
#include <QDebug>

namespace FieldSync {

JsonLocalStore::JsonLocalStore(const QString &basePath, QObject *parent)
    : LocalStore(parent)
    , m_basePath(basePath)
{
    load();
}

QString JsonLocalStore::storeFilePath() const
{
    return QDir(m_basePath).filePath("records.json");
}

// ========== Record Operations ==========

bool JsonLocalStore::read(const RecordKey &key, LocalRecord &out) const
{
    QString id = key.toString();
    m_locks.waitUntilReadable(id);

    QMutexLocker locker(&m_mutex);
    auto it = m_records.constFind(id);
    if (it == m_records.constEnd()) {
        return false;
    }
    out = it.value();
    return true;
}

bool JsonLocalStore::write(const RecordKey &key, const QString &value)
{
    if (!key.isValid()) {
        emit errorOccurred("Cannot write record with empty entity id");
        return false;
    }

    QString id = key.toString();
    RegionLocker region(m_locks, {id});
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        LocalRecord &record = m_records[id];
        record.key = key;
        record.value = value;
        record.lastModified = QDateTime::currentDateTimeUtc();
        ok = persistLocked();
    }

    if (ok) {
        emit recordChanged(id);
    }
    return ok;
}

bool JsonLocalStore::remove(const RecordKey &key)
{
    QString id = key.toString();
    RegionLocker region(m_locks, {id});
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_records.remove(id)) {
            return false;
        }
        ok = persistLocked();
    }

    if (ok) {
        emit recordChanged(id);
    }
    return ok;
}

bool JsonLocalStore::markDirty(const RecordKey &key)
{
    QString id = key.toString();
    RegionLocker region(m_locks, {id});
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            return false;
        }
        it->dirty = true;
        ok = persistLocked();
    }

    if (ok) {
        emit recordChanged(id);
    }
    return ok;
}

bool JsonLocalStore::clearDirty(const RecordKey &key, const QString &newRevision)
{
    QString id = key.toString();
    RegionLocker region(m_locks, {id});
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            return false;
        }
        it->dirty = false;
        it->serverRevision = newRevision;
        it->lastSyncedAt = QDateTime::currentDateTimeUtc();
        ok = persistLocked();
    }

    if (ok) {
        emit recordChanged(id);
    }
    return ok;
}

QList<RecordKey> JsonLocalStore::dirtyKeys() const
{
    QMutexLocker locker(&m_mutex);
    QList<RecordKey> keys;
    for (const LocalRecord &record : m_records) {
        if (record.dirty) {
            keys.append(record.key);
        }
    }
    return keys;
}

// ========== Rollback Points ==========

RollbackPoint JsonLocalStore::snapshot(const QList<RecordKey> &keys)
{
    QMutexLocker locker(&m_mutex);

    SnapshotEntry entry;
    for (const RecordKey &key : keys) {
        QString id = key.toString();
        auto it = m_records.constFind(id);
        if (it == m_records.constEnd()) {
            entry.absent.insert(id);
        } else {
            entry.records.insert(id, it.value());
        }
    }

    RollbackPoint point;
    point.id = m_nextSnapshotId++;
    point.keys = keys;
    m_snapshots.insert(point.id, entry);

    qDebug() << "[JsonLocalStore] Snapshot" << point.id << "over" << keys.size() << "records";
    return point;
}

bool JsonLocalStore::restore(const RollbackPoint &point, const QList<RecordKey> &keys)
{
    QStringList ids;
    for (const RecordKey &key : keys) {
        ids << key.toString();
    }
    RegionLocker region(m_locks, ids);

    QStringList restored;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);

        auto snap = m_snapshots.constFind(point.id);
        if (!point.isValid() || snap == m_snapshots.constEnd()) {
            qCritical() << "[JsonLocalStore] Unknown rollback point" << point.id;
            return false;
        }

        for (const QString &id : ids) {
            if (snap->absent.contains(id)) {
                m_records.remove(id);
                restored << id;
            } else if (snap->records.contains(id)) {
                m_records.insert(id, snap->records.value(id));
                restored << id;
            }
        }

        ok = persistLocked();
    }

    if (!ok) {
        emit errorOccurred(QString("Failed to persist rollback point %1").arg(point.id));
        return false;
    }

    for (const QString &id : restored) {
        emit recordChanged(id);
    }
    return true;
}

void JsonLocalStore::discard(const RollbackPoint &point)
{
    QMutexLocker locker(&m_mutex);
    m_snapshots.remove(point.id);
}

int JsonLocalStore::openRollbackPoints() const
{
    QMutexLocker locker(&m_mutex);
    return m_snapshots.size();
}

// ========== Persistence ==========

bool JsonLocalStore::load()
{
    QFile file(storeFilePath());
    if (!file.exists()) {
        return true;  // Empty store
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open store: %1").arg(storeFilePath()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse store: %1").arg(parseError.errorString()));
        return false;
    }

    QMutexLocker locker(&m_mutex);
    m_records.clear();

    const QJsonArray records = doc.object()["records"].toArray();
    for (const QJsonValue &val : records) {
        LocalRecord record = recordFromJson(val.toObject());
        if (record.key.isValid()) {
            m_records.insert(record.key.toString(), record);
        }
    }

    qDebug() << "[JsonLocalStore] Loaded" << m_records.size() << "records";
    return true;
}

bool JsonLocalStore::save()
{
    QMutexLocker locker(&m_mutex);
    return persistLocked();
}

bool JsonLocalStore::persistLocked()
{
    QDir dir(m_basePath);
    if (!dir.exists() && !dir.mkpath(".")) {
        qWarning() << "[JsonLocalStore] Cannot create directory:" << m_basePath;
        return false;
    }

    QJsonArray records;
    for (const LocalRecord &record : m_records) {
        records.append(recordToJson(record));
    }

    QJsonObject root;
    root["version"] = 1;
    root["records"] = records;

    QSaveFile file(storeFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[JsonLocalStore] Cannot write:" << storeFilePath();
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "[JsonLocalStore] Commit failed:" << file.errorString();
        return false;
    }
    return true;
}

int JsonLocalStore::recordCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_records.size();
}

QList<RecordKey> JsonLocalStore::allKeys() const
{
    QMutexLocker locker(&m_mutex);
    QList<RecordKey> keys;
    for (const LocalRecord &record : m_records) {
        keys.append(record.key);
    }
    return keys;
}

QJsonObject JsonLocalStore::recordToJson(const LocalRecord &record)
{
    QJsonObject obj;
    obj["entityId"] = record.key.entityId;
    obj["period"] = record.key.period;
    obj["location"] = record.key.location;
    obj["category"] = record.key.category;
    obj["value"] = record.value;
    obj["lastModified"] = record.lastModified.toString(Qt::ISODateWithMs);
    obj["serverRevision"] = record.serverRevision;
    obj["lastSyncedAt"] = record.lastSyncedAt.toString(Qt::ISODateWithMs);
    obj["dirty"] = record.dirty;
    return obj;
}

LocalRecord JsonLocalStore::recordFromJson(const QJsonObject &json)
{
    LocalRecord record;
    record.key.entityId = json["entityId"].toString();
    record.key.period = json["period"].toString();
    record.key.location = json["location"].toString();
    record.key.category = json["category"].toString();
    record.value = json["value"].toString();
    record.lastModified = QDateTime::fromString(json["lastModified"].toString(), Qt::ISODateWithMs);
    record.serverRevision = json["serverRevision"].toString();
    record.lastSyncedAt = QDateTime::fromString(json["lastSyncedAt"].toString(), Qt::ISODateWithMs);
    record.dirty = json["dirty"].toBool();
    return record;
}

} // namespace FieldSync
