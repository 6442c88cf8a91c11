#include "recordlocktable.h"

#include <QMutexLocker>
#include <QThread>

namespace FieldSync {

bool RecordLockTable::allAvailable(const QStringList &keys) const
{
    QThread *self = QThread::currentThread();
    for (const QString &key : keys) {
        auto it = m_owners.constFind(key);
        if (it != m_owners.constEnd() && it->thread != self) {
            return false;
        }
    }
    return true;
}

void RecordLockTable::acquire(const QStringList &keys)
{
    QThread *self = QThread::currentThread();
    for (const QString &key : keys) {
        Owner &owner = m_owners[key];
        owner.thread = self;
        owner.depth++;
    }
}

void RecordLockTable::lock(const QStringList &keys)
{
    QMutexLocker locker(&m_mutex);
    while (!allAvailable(keys)) {
        m_released.wait(&m_mutex);
    }
    acquire(keys);
}

bool RecordLockTable::tryLock(const QStringList &keys)
{
    QMutexLocker locker(&m_mutex);
    if (!allAvailable(keys)) {
        return false;
    }
    acquire(keys);
    return true;
}

void RecordLockTable::unlock(const QStringList &keys)
{
    QMutexLocker locker(&m_mutex);
    QThread *self = QThread::currentThread();
    for (const QString &key : keys) {
        auto it = m_owners.find(key);
        if (it == m_owners.end() || it->thread != self) {
            continue;
        }
        if (--it->depth <= 0) {
            m_owners.erase(it);
        }
    }
    m_released.wakeAll();
}

bool RecordLockTable::isLocked(const QString &key) const
{
    QMutexLocker locker(&m_mutex);
    return m_owners.contains(key);
}

void RecordLockTable::waitUntilReadable(const QString &key) const
{
    QMutexLocker locker(&m_mutex);
    QThread *self = QThread::currentThread();
    for (;;) {
        auto it = m_owners.constFind(key);
        if (it == m_owners.constEnd() || it->thread == self) {
            return;
        }
        m_released.wait(&m_mutex);
    }
}

} // namespace FieldSync
