#ifndef REMOTEDATASERVICE_H
#define REMOTEDATASERVICE_H

#include <QString>
#include <QList>
#include <QMap>
#include <QDateTime>
#include "synctypes.h"
#include "syncerror.h"

namespace FieldSync {

/**
 * @brief Result of uploading one record
 */
struct UploadOutcome {
    enum class Kind {
        Accepted,           ///< Remote stored the value; newRevision is set
        Rejected,           ///< Business-rule failure; reason is set
        TransientFailure,   ///< Timeout or connection loss
        AuthExpired         ///< Credentials expired mid-batch
    };

    Kind kind = Kind::TransientFailure;
    QString newRevision;
    QString reason;
    int httpStatus = 0;

    static UploadOutcome accepted(const QString &revision) {
        UploadOutcome o;
        o.kind = Kind::Accepted;
        o.newRevision = revision;
        return o;
    }

    static UploadOutcome rejected(const QString &why, int status = 0) {
        UploadOutcome o;
        o.kind = Kind::Rejected;
        o.reason = why;
        o.httpStatus = status;
        return o;
    }

    static UploadOutcome transient(const QString &why, int status = 0) {
        UploadOutcome o;
        o.kind = Kind::TransientFailure;
        o.reason = why;
        o.httpStatus = status;
        return o;
    }

    static UploadOutcome authExpired(const QString &why, int status = 401) {
        UploadOutcome o;
        o.kind = Kind::AuthExpired;
        o.reason = why;
        o.httpStatus = status;
        return o;
    }

    /**
     * @brief Map an HTTP response to an outcome
     *
     * 2xx accepts with the given revision; everything else is classified
     * through SyncError::classifyHttpStatus().
     */
    static UploadOutcome fromHttpStatus(int status, const QString &revision,
                                        const QString &message);
};

/**
 * @brief Abstract interface for the remote data service
 *
 * The wire protocol is owned by the implementation. Every call is
 * synchronous and bounded by the given timeout; a timeout is reported as a
 * transient failure.
 *
 * upload() must tolerate a duplicate of an earlier upload: the item's
 * idempotencyKey is identical for every attempt at the same content.
 */
class RemoteDataService
{
public:
    virtual ~RemoteDataService() = default;

    /**
     * @brief Upload the local value of one queued item
     * @param item Queue item (key, attempt count, idempotency key)
     * @param record Current local record for the item's key
     */
    virtual UploadOutcome upload(const SyncQueueItem &item,
                                 const LocalRecord &record,
                                 int timeoutMs) = 0;

    /**
     * @brief Fetch every record changed remotely since the given time
     *
     * An invalid @p since requests a full download.
     * @return false on failure, with @p error describing it
     */
    virtual bool download(const QDateTime &since,
                          int timeoutMs,
                          QList<RemoteRecord> &out,
                          SyncError &error) = 0;

    /**
     * @brief Fetch the current remote state for a set of keys
     *
     * Keys unknown to the remote are simply absent from @p out
     * (map key is RecordKey::toString()).
     */
    virtual bool fetchRemoteState(const QList<RecordKey> &keys,
                                  int timeoutMs,
                                  QMap<QString, RemoteRecord> &out,
                                  SyncError &error) = 0;
};

} // namespace FieldSync

#endif // REMOTEDATASERVICE_H
