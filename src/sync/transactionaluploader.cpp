#include "transactionaluploader.h"
#include "localstore.h"
#include "remotedataservice.h"
#include "retryqueue.h"

#include <QStringList>
#include <QDebug>

namespace FieldSync {

TransactionalUploader::TransactionalUploader(LocalStore *store,
                                             RemoteDataService *remote,
                                             RetryQueue *queue)
    : m_store(store)
    , m_remote(remote)
    , m_queue(queue)
{
}

TransactionalUploader::BatchResult
TransactionalUploader::uploadBatch(const QList<SyncQueueItem> &items,
                                   const TransferParameters &params)
{
    BatchResult result;
    if (items.isEmpty()) {
        return result;
    }

    if (!m_store || !m_remote || !m_queue) {
        result.error = SyncError(SyncError::Kind::Configuration,
                                 "Uploader is missing a store, remote or queue");
        return result;
    }

    QList<RecordKey> keys;
    QStringList keyStrings;
    for (const SyncQueueItem &item : items) {
        keys.append(item.key);
        keyStrings.append(item.key.toString());
    }

    RegionLocker region(m_store->locks(), keyStrings);

    RollbackPoint point = m_store->snapshot(keys);
    if (!point.isValid()) {
        result.error = SyncError(SyncError::Kind::Storage,
                                 "Could not take a rollback point for the batch");
        qWarning() << "[TransactionalUploader]" << result.error.message;
        return result;
    }

    m_queue->markInFlight(keys);
    qDebug() << "[TransactionalUploader] Batch of" << items.size()
             << "items under rollback point" << point.id;

    int processed = 0;
    for (int i = 0; i < items.size(); ++i) {
        const SyncQueueItem &item = items.at(i);

        LocalRecord record;
        if (!m_store->read(item.key, record)) {
            // Deleted locally after it was queued; nothing left to send
            qDebug() << "[TransactionalUploader] Record vanished, dropping:" << item.key.toString();
            m_queue->discard(item.key);
            result.dropped.append(item.key);
            continue;
        }

        // The key must describe the value actually sent, which may be newer
        // than the one the item was queued with
        SyncQueueItem sent = item;
        sent.idempotencyKey = RetryQueue::makeIdempotencyKey(record);
        if (sent.idempotencyKey != item.idempotencyKey) {
            qDebug() << "[TransactionalUploader] Record changed since queued, new idempotency key:"
                     << item.key.toString();
            m_queue->enqueue(item.key, sent.idempotencyKey);
        }

        UploadOutcome outcome = m_remote->upload(sent, record, params.timeoutMs);

        switch (outcome.kind) {
            case UploadOutcome::Kind::Accepted: {
                if (m_store->clearDirty(item.key, outcome.newRevision)) {
                    m_queue->recordSuccess(item.key);
                    result.confirmed.append(item.key);
                    break;
                }
                // Remote holds the value but the local mark failed: put the record
                // back and retry later; the idempotency key absorbs the duplicate.
                if (!m_store->restore(point, {item.key})) {
                    markForReview(items.mid(i), "Rollback failed after local commit error", result);
                    result.error = SyncError::rollbackFailure(
                        QString("Could not restore %1 after a failed local commit").arg(item.key.toString()));
                    m_store->discard(point);
                    return result;
                }
                SyncError storageError(SyncError::Kind::Storage, "Could not mark record as synced");
                if (m_queue->recordFailure(item.key, storageError) == QueueItemState::DeadLetter) {
                    result.deadLettered.append(item.key);
                } else {
                    result.failed.append(item.key);
                }
                result.failures.append(ItemFailure{item.key, storageError});
                break;
            }

            case UploadOutcome::Kind::Rejected: {
                SyncError rejection(SyncError::Kind::ServerRejection, outcome.reason, outcome.httpStatus);
                if (!m_store->restore(point, {item.key})) {
                    markForReview(items.mid(i), "Rollback failed after rejection", result);
                    result.error = SyncError::rollbackFailure(
                        QString("Could not restore %1 after rejection").arg(item.key.toString()));
                    m_store->discard(point);
                    return result;
                }
                qWarning() << "[TransactionalUploader] Rejected:" << item.key.toString() << "-" << outcome.reason;
                m_queue->recordRejection(item.key, outcome.reason);
                result.rejected.append(item.key);
                result.failures.append(ItemFailure{item.key, rejection});
                break;
            }

            case UploadOutcome::Kind::TransientFailure:
            case UploadOutcome::Kind::AuthExpired: {
                SyncError error = outcome.kind == UploadOutcome::Kind::AuthExpired
                    ? SyncError(SyncError::Kind::Authentication, outcome.reason, outcome.httpStatus)
                    : SyncError(SyncError::Kind::TransientNetwork, outcome.reason, outcome.httpStatus);
                qWarning() << "[TransactionalUploader] Batch interrupted after" << result.confirmed.size()
                           << "confirmed:" << error.toString();
                failUnconfirmed(items.mid(i), point, error, result);
                m_store->discard(point);
                return result;
            }
        }

        processed++;
        if (m_progressCallback) {
            m_progressCallback(processed, items.size());
        }
    }

    m_store->discard(point);
    return result;
}

void TransactionalUploader::failUnconfirmed(const QList<SyncQueueItem> &remaining,
                                            const RollbackPoint &point,
                                            const SyncError &error,
                                            BatchResult &result)
{
    QList<RecordKey> keys;
    for (const SyncQueueItem &item : remaining) {
        keys.append(item.key);
    }

    if (!m_store->restore(point, keys)) {
        markForReview(remaining, "Rollback failed after: " + error.message, result);
        result.error = SyncError::rollbackFailure(
            QString("Could not restore %1 unconfirmed records").arg(keys.size()));
        return;
    }

    for (const SyncQueueItem &item : remaining) {
        if (m_queue->recordFailure(item.key, error) == QueueItemState::DeadLetter) {
            result.deadLettered.append(item.key);
        } else {
            result.failed.append(item.key);
        }
        result.failures.append(ItemFailure{item.key, error});
    }
    result.error = error;
}

void TransactionalUploader::markForReview(const QList<SyncQueueItem> &remaining,
                                          const QString &reason,
                                          BatchResult &result)
{
    for (const SyncQueueItem &item : remaining) {
        qCritical() << "[TransactionalUploader] Needs review:" << item.key.toString() << "-" << reason;
        m_queue->markNeedsReview(item.key, reason);
        result.needsReview.append(item.key);
        result.failures.append(ItemFailure{item.key, SyncError::rollbackFailure(reason)});
    }
}

} // namespace FieldSync
