#ifndef SYNCERROR_H
#define SYNCERROR_H

#include <QString>

namespace FieldSync {

/**
 * @brief Error reported by a sync component
 *
 * Errors are values, never thrown. A default-constructed SyncError means
 * "no error".
 */
struct SyncError {
    enum class Kind {
        None,
        TransientNetwork,   ///< Timeout, connection reset; retried with backoff
        Authentication,     ///< Session invalid or expired; aborts the session
        ServerRejection,    ///< Business-rule failure for one item
        ConflictUnresolved, ///< Session paused waiting for a resolution
        RollbackFailure,    ///< Snapshot could not be restored; broken invariant
        Configuration,      ///< Missing collaborator or bad setup
        Storage             ///< Persistence I/O failure
    };

    Kind kind = Kind::None;
    QString message;
    int httpStatus = 0;     ///< Remote status code when known

    SyncError() = default;
    SyncError(Kind k, const QString &msg, int status = 0)
        : kind(k), message(msg), httpStatus(status) {}

    bool isError() const { return kind != Kind::None; }

    /**
     * @brief Only transient network errors are retried automatically
     */
    bool isRetryable() const { return kind == Kind::TransientNetwork; }

    /**
     * @brief Errors that end the whole session early
     */
    bool isSessionFatal() const {
        return kind == Kind::Authentication || kind == Kind::RollbackFailure;
    }

    QString kindName() const;
    QString toString() const;

    /**
     * @brief Map a remote HTTP status to an error kind
     *
     * 401/403 are authentication failures, 408/429 and 5xx are transient,
     * any other 4xx is a server-side rejection of the submitted value.
     */
    static Kind classifyHttpStatus(int status);

    static SyncError fromHttpStatus(int status, const QString &message);

    static SyncError transient(const QString &msg) { return SyncError(Kind::TransientNetwork, msg); }
    static SyncError authentication(const QString &msg) { return SyncError(Kind::Authentication, msg); }
    static SyncError rejection(const QString &msg) { return SyncError(Kind::ServerRejection, msg); }
    static SyncError rollbackFailure(const QString &msg) { return SyncError(Kind::RollbackFailure, msg); }
};

} // namespace FieldSync

#endif // SYNCERROR_H
