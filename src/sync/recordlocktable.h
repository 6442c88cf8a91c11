#ifndef RECORDLOCKTABLE_H
#define RECORDLOCKTABLE_H

#include <QHash>
#include <QMutex>
#include <QStringList>
#include <QWaitCondition>

class QThread;

namespace FieldSync {

/**
 * @brief Exclusive region lock over a set of record keys
 *
 * The sync engine locks the keys of a batch from snapshot to commit. Readers
 * and writers of other keys are never blocked; any access to a locked key
 * from another thread waits until the batch closes. The owning thread may
 * read and write its own locked keys.
 *
 * Locks are re-entrant per thread: a thread that already holds a key takes
 * it again and must release it as often as it took it.
 *
 * A key set is acquired all-or-nothing, so two lockers can never deadlock
 * on overlapping sets.
 */
class RecordLockTable
{
public:
    RecordLockTable() = default;

    RecordLockTable(const RecordLockTable&) = delete;
    RecordLockTable& operator=(const RecordLockTable&) = delete;

    /**
     * @brief Block until every key is free, then take them all
     */
    void lock(const QStringList &keys);

    /**
     * @brief Take every key if all are free right now
     */
    bool tryLock(const QStringList &keys);

    void unlock(const QStringList &keys);

    bool isLocked(const QString &key) const;

    /**
     * @brief Block while the key is held by another thread
     */
    void waitUntilReadable(const QString &key) const;

private:
    struct Owner {
        QThread *thread = nullptr;
        int depth = 0;
    };

    bool allAvailable(const QStringList &keys) const;
    void acquire(const QStringList &keys);

    mutable QMutex m_mutex;
    mutable QWaitCondition m_released;
    QHash<QString, Owner> m_owners;
};

/**
 * @brief RAII holder for a locked key region
 */
class RegionLocker
{
public:
    RegionLocker(RecordLockTable &table, const QStringList &keys)
        : m_table(table), m_keys(keys)
    {
        m_table.lock(m_keys);
    }

    ~RegionLocker() { m_table.unlock(m_keys); }

    RegionLocker(const RegionLocker&) = delete;
    RegionLocker& operator=(const RegionLocker&) = delete;

private:
    RecordLockTable &m_table;
    QStringList m_keys;
};

} // namespace FieldSync

#endif // RECORDLOCKTABLE_H
