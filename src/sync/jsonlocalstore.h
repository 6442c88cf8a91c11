#ifndef JSONLOCALSTORE_H
#define JSONLOCALSTORE_H

#include "localstore.h"
#include <QString>
#include <QMap>
#include <QSet>
#include <QMutex>
#include <QJsonObject>

namespace FieldSync {

/**
 * @brief File-based local store
 *
 * Keeps all records in memory and persists them as one JSON document:
 *   <basePath>/
 *   └── records.json    - every LocalRecord, keyed by RecordKey::toString()
 *
 * Every mutation rewrites the file through QSaveFile, so a crash leaves
 * either the old or the new document on disk, never a torn one.
 *
 * Every mutation takes the region lock of the keys it touches, so a write
 * from another thread waits while a batch holds the key. Reads wait the
 * same way.
 *
 * Rollback points live in an in-memory arena: snapshot() copies the
 * affected records (and remembers which keys were absent), restore() puts
 * them back verbatim, discard() frees the copy.
 */
class JsonLocalStore : public LocalStore
{
    Q_OBJECT

public:
    /**
     * @brief Create a store rooted at the given directory
     *
     * Existing records are loaded immediately.
     */
    explicit JsonLocalStore(const QString &basePath, QObject *parent = nullptr);
    ~JsonLocalStore() override = default;

    // ========== LocalStore ==========

    bool read(const RecordKey &key, LocalRecord &out) const override;
    bool write(const RecordKey &key, const QString &value) override;
    bool remove(const RecordKey &key) override;
    bool markDirty(const RecordKey &key) override;
    bool clearDirty(const RecordKey &key, const QString &newRevision) override;
    QList<RecordKey> dirtyKeys() const override;

    RollbackPoint snapshot(const QList<RecordKey> &keys) override;
    bool restore(const RollbackPoint &point, const QList<RecordKey> &keys) override;
    void discard(const RollbackPoint &point) override;

    // ========== Persistence ==========

    /**
     * @brief Load records from disk (missing file = empty store)
     */
    bool load();

    /**
     * @brief Write all records to disk
     */
    bool save();

    QString basePath() const { return m_basePath; }
    QString storeFilePath() const;

    int recordCount() const;
    QList<RecordKey> allKeys() const;

    /**
     * @brief Number of rollback points not yet discarded
     */
    int openRollbackPoints() const;

protected:
    /**
     * @brief Persist after a mutation; caller holds m_mutex
     */
    virtual bool persistLocked();

private:
    struct SnapshotEntry {
        QMap<QString, LocalRecord> records;
        QSet<QString> absent;
    };

    static QJsonObject recordToJson(const LocalRecord &record);
    static LocalRecord recordFromJson(const QJsonObject &json);

    QString m_basePath;

    mutable QMutex m_mutex;
    QMap<QString, LocalRecord> m_records;
    QMap<quint64, SnapshotEntry> m_snapshots;
    quint64 m_nextSnapshotId = 1;
};

} // namespace FieldSync

#endif // JSONLOCALSTORE_H
