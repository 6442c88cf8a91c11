#ifndef LOCALSTORE_H
#define LOCALSTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include "synctypes.h"
#include "recordlocktable.h"

namespace FieldSync {

/**
 * @brief Opaque snapshot token over a subset of the local store
 *
 * Taken immediately before a batch upload. Every point is closed exactly
 * once, either by discard() on success or by restore() on failure.
 */
struct RollbackPoint {
    quint64 id = 0;
    QList<RecordKey> keys;

    bool isValid() const { return id != 0; }
};

/**
 * @brief Abstract interface for the on-device record store
 *
 * The store owns record lifecycles; the sync engine reads records, marks
 * them clean after a confirmed upload, and snapshots/restores the subset a
 * batch touches.
 *
 * Implementations must make snapshot/restore exact: after restore() every
 * restored key is identical to its snapshot, including absence. Mutations
 * must hold locks() for the keys they change, so no other thread can edit a
 * record between a batch's snapshot and its commit or rollback.
 */
class LocalStore : public QObject
{
    Q_OBJECT

public:
    explicit LocalStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~LocalStore() = default;

    // ========== Record Operations ==========

    /**
     * @brief Read a record
     * @return false if no record exists for the key
     */
    virtual bool read(const RecordKey &key, LocalRecord &out) const = 0;

    /**
     * @brief Store a value, creating the record if needed
     *
     * Updates lastModified; does not touch the dirty flag or revision.
     */
    virtual bool write(const RecordKey &key, const QString &value) = 0;

    /**
     * @brief Delete a record
     */
    virtual bool remove(const RecordKey &key) = 0;

    virtual bool markDirty(const RecordKey &key) = 0;

    /**
     * @brief Mark a record as synced at the given server revision
     */
    virtual bool clearDirty(const RecordKey &key, const QString &newRevision) = 0;

    /**
     * @brief Keys of all records with unsynced local changes
     */
    virtual QList<RecordKey> dirtyKeys() const = 0;

    // ========== Rollback Points ==========

    /**
     * @brief Capture the current state of the given keys
     * @return Invalid point if the snapshot could not be taken
     */
    virtual RollbackPoint snapshot(const QList<RecordKey> &keys) = 0;

    /**
     * @brief Restore a subset of a rollback point
     *
     * Keys not contained in the point are ignored. The point stays open
     * until discard().
     *
     * @return false if the store could not be put back (RollbackFailure)
     */
    virtual bool restore(const RollbackPoint &point, const QList<RecordKey> &keys) = 0;

    /**
     * @brief Restore every key of a rollback point
     */
    bool restoreAll(const RollbackPoint &point) { return restore(point, point.keys); }

    /**
     * @brief Release a rollback point
     */
    virtual void discard(const RollbackPoint &point) = 0;

    // ========== Locking ==========

    /**
     * @brief Region lock shared by the sync engine and readers
     */
    RecordLockTable& locks() { return m_locks; }

signals:
    void recordChanged(const QString &key);
    void errorOccurred(const QString &error);

protected:
    mutable RecordLockTable m_locks;
};

} // namespace FieldSync

#endif // LOCALSTORE_H
