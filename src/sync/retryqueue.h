#ifndef RETRYQUEUE_H
#define RETRYQUEUE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QMap>
#include <QList>
#include <QMutex>
#include <QJsonObject>
#include <QRandomGenerator>
#include "synctypes.h"
#include "syncerror.h"

namespace FieldSync {

/**
 * @brief Durable ordered queue of pending uploads
 *
 * Holds at most one SyncQueueItem per record key. Items are served in
 * enqueue order (sequence), subject to their backoff schedule. After
 * maxAttempts transient failures an item becomes a dead letter and is
 * excluded from automatic batches until retried or discarded.
 *
 * State is stored in:
 *   <stateDir>/
 *     └── queue.json      - every item, rewritten on each mutation
 *
 * Without a state directory the queue is in-memory only.
 */
class RetryQueue : public QObject
{
    Q_OBJECT

public:
    explicit RetryQueue(QObject *parent = nullptr);
    ~RetryQueue() override = default;

    // ========== Queue Operations ==========

    /**
     * @brief Queue an upload intent for a record
     *
     * A live item for the key only has its idempotency key refreshed.
     * A dead-lettered or rejected item is replaced by a fresh one, since a
     * new edit supersedes the failed content. Items needing review are
     * left alone until explicitly retried or discarded.
     *
     * @return true if a new item was created
     */
    bool enqueue(const RecordKey &key, const QString &idempotencyKey);

    /**
     * @brief Pending items whose backoff has elapsed, oldest first
     * @param maxItems Upper bound on the result size (-1 = no bound)
     */
    QList<SyncQueueItem> nextEligibleBatch(const QDateTime &now, int maxItems = -1) const;

    void markInFlight(const QList<RecordKey> &keys);

    /**
     * @brief Confirmed upload: the item leaves the queue
     */
    void recordSuccess(const RecordKey &key);

    /**
     * @brief Transient failure: count an attempt and schedule the retry
     * @return Resulting state (Pending or DeadLetter)
     */
    QueueItemState recordFailure(const RecordKey &key, const SyncError &error,
                                 const QDateTime &now = QDateTime::currentDateTimeUtc());

    /**
     * @brief Return an item to Pending without counting an attempt
     */
    void release(const RecordKey &key);

    void recordRejection(const RecordKey &key, const QString &reason);
    void markNeedsReview(const RecordKey &key, const QString &reason);

    QList<SyncQueueItem> deadLetters() const;
    QList<SyncQueueItem> itemsInState(QueueItemState state) const;

    /**
     * @brief Manual retry of a terminal item; resets its attempt count
     */
    bool retryDeadLetter(const RecordKey &key);

    /**
     * @brief Drop an item regardless of state
     */
    bool discard(const RecordKey &key);

    bool contains(const RecordKey &key) const;
    bool item(const RecordKey &key, SyncQueueItem &out) const;

    /**
     * @brief Number of non-terminal items
     */
    int pendingCount() const;
    int size() const;

    // ========== Backoff ==========

    void setBackoff(qint64 baseMs, qint64 maxMs);
    qint64 baseBackoffMs() const { return m_baseBackoffMs; }
    qint64 maxBackoffMs() const { return m_maxBackoffMs; }

    void setMaxAttempts(int attempts);
    int maxAttempts() const { return m_maxAttempts; }

    /**
     * @brief Upper bound of the random jitter added to each delay
     *
     * Clamped below the base backoff so delays never decrease.
     */
    void setJitterMs(qint64 jitterMs);
    qint64 jitterMs() const { return m_jitterMs; }

    void setRandomSeed(quint32 seed);

    /**
     * @brief min(base * 2^attempt + jitter, max)
     */
    static qint64 backoffDelay(int attempt, qint64 baseMs, qint64 maxMs, qint64 jitterMs);

    /**
     * @brief Dedup token for uploading a record's current content
     *
     * SHA-256 over key, base revision and value: identical for every retry
     * of the same content, different once the record is edited again.
     */
    static QString makeIdempotencyKey(const LocalRecord &record);

    // ========== Persistence ==========

    /**
     * @brief Load from disk; items left in flight by a previous run become Pending
     */
    bool load();
    bool save();

    void setStateDirectory(const QString &dir);
    QString stateDirectory() const { return m_stateDir; }
    QString queueFilePath() const;

signals:
    void queueChanged();
    void itemDeadLettered(const QString &key);
    void errorOccurred(const QString &error);

private:
    bool persistLocked();
    qint64 effectiveJitterLocked() const;

    static QJsonObject itemToJson(const SyncQueueItem &item);
    static SyncQueueItem itemFromJson(const QJsonObject &json);

    mutable QMutex m_mutex;
    QMap<QString, SyncQueueItem> m_items;   // key string -> item
    qint64 m_nextSequence = 1;

    QString m_stateDir;

    int m_maxAttempts = 5;
    qint64 m_baseBackoffMs = 3000;
    qint64 m_maxBackoffMs = 15000;
    qint64 m_jitterMs = 250;
    QRandomGenerator m_random;
};

} // namespace FieldSync

#endif // RETRYQUEUE_H
