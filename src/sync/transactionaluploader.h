#ifndef TRANSACTIONALUPLOADER_H
#define TRANSACTIONALUPLOADER_H

#include <QList>
#include <functional>
#include "synctypes.h"
#include "syncerror.h"

namespace FieldSync {

class LocalStore;
class RemoteDataService;
class RetryQueue;
struct RollbackPoint;

/**
 * @brief Rollback-safe batch upload
 *
 * One call uploads one batch under one rollback point:
 *   1. region-lock the batch keys and snapshot them
 *   2. upload item by item, each with an idempotency key derived from the
 *      value being sent
 *   3. accepted items are marked clean at their new revision
 *   4. a rejected item is restored and reported, the batch continues
 *   5. a transient or auth failure restores every unconfirmed item and
 *      returns them to the queue with one more attempt counted
 *   6. the rollback point is discarded and the lock released
 *
 * After uploadBatch() returns, every item is either committed on both sides
 * or identical to its pre-batch snapshot locally. If a restore fails the
 * affected items are marked NeedsReview and the error is RollbackFailure.
 */
class TransactionalUploader
{
public:
    using ProgressCallback = std::function<void(int processed, int total)>;

    struct BatchResult {
        QList<RecordKey> confirmed;
        QList<RecordKey> rejected;
        QList<RecordKey> failed;            ///< Back to Pending, attempt counted
        QList<RecordKey> deadLettered;
        QList<RecordKey> needsReview;       ///< Restore failed
        QList<RecordKey> dropped;           ///< Record vanished locally
        QList<ItemFailure> failures;
        SyncError error;                    ///< Batch-fatal error, if any

        bool aborted() const { return error.isError(); }
    };

    TransactionalUploader(LocalStore *store, RemoteDataService *remote, RetryQueue *queue);

    /**
     * @brief Upload one batch (items must be Pending queue items)
     */
    BatchResult uploadBatch(const QList<SyncQueueItem> &items, const TransferParameters &params);

    /**
     * @brief Called after every item the batch finishes
     */
    void setProgressCallback(ProgressCallback callback) { m_progressCallback = callback; }

private:
    void failUnconfirmed(const QList<SyncQueueItem> &remaining,
                         const RollbackPoint &point,
                         const SyncError &error,
                         BatchResult &result);
    void markForReview(const QList<SyncQueueItem> &remaining,
                       const QString &reason,
                       BatchResult &result);

    LocalStore *m_store;
    RemoteDataService *m_remote;
    RetryQueue *m_queue;
    ProgressCallback m_progressCallback;
};

} // namespace FieldSync

#endif // TRANSACTIONALUPLOADER_H
