#include "progresschannel.h"

#include <QMutexLocker>

namespace FieldSync {

ProgressChannel::ProgressChannel(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

void ProgressChannel::publish(const SyncProgress &progress)
{
    QMutexLocker locker(&m_mutex);

    if (!m_events.isEmpty() && m_events.last().phase == progress.phase) {
        m_events.last() = progress;
        return;
    }

    if (m_events.size() >= m_capacity) {
        m_events.removeFirst();
        m_dropped++;
    }
    m_events.append(progress);
}

QList<SyncProgress> ProgressChannel::drain()
{
    QMutexLocker locker(&m_mutex);
    QList<SyncProgress> events;
    events.swap(m_events);
    return events;
}

void ProgressChannel::clear()
{
    QMutexLocker locker(&m_mutex);
    m_events.clear();
}

int ProgressChannel::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_events.size();
}

int ProgressChannel::droppedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_dropped;
}

} // namespace FieldSync
