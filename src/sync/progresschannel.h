#ifndef PROGRESSCHANNEL_H
#define PROGRESSCHANNEL_H

#include <QList>
#include <QMutex>
#include "synctypes.h"

namespace FieldSync {

/**
 * @brief Bounded channel of progress events drained by the presentation layer
 *
 * publish() never blocks the sync task. Consecutive events of the same phase
 * coalesce into the latest one; when the channel is full the oldest event is
 * dropped.
 */
class ProgressChannel
{
public:
    explicit ProgressChannel(int capacity = 64);

    void publish(const SyncProgress &progress);

    /**
     * @brief Take every buffered event, oldest first
     */
    QList<SyncProgress> drain();

    void clear();

    int size() const;
    int capacity() const { return m_capacity; }

    /**
     * @brief Events lost to overflow since construction
     */
    int droppedCount() const;

private:
    mutable QMutex m_mutex;
    QList<SyncProgress> m_events;
    int m_capacity;
    int m_dropped = 0;
};

} // namespace FieldSync

#endif // PROGRESSCHANNEL_H
