#include "syncerror.h"

namespace FieldSync {

QString SyncError::kindName() const
{
    switch (kind) {
        case Kind::None:               return "None";
        case Kind::TransientNetwork:   return "TransientNetworkError";
        case Kind::Authentication:     return "AuthenticationError";
        case Kind::ServerRejection:    return "ServerRejection";
        case Kind::ConflictUnresolved: return "ConflictUnresolved";
        case Kind::RollbackFailure:    return "RollbackFailure";
        case Kind::Configuration:      return "ConfigurationError";
        case Kind::Storage:            return "StorageError";
    }
    return "Unknown";
}

QString SyncError::toString() const
{
    if (!isError()) {
        return QString();
    }
    if (httpStatus > 0) {
        return QString("%1 (HTTP %2): %3").arg(kindName()).arg(httpStatus).arg(message);
    }
    return QString("%1: %2").arg(kindName(), message);
}

SyncError::Kind SyncError::classifyHttpStatus(int status)
{
    if (status == 401 || status == 403) {
        return Kind::Authentication;
    }
    if (status == 408 || status == 429 || (status >= 500 && status < 600)) {
        return Kind::TransientNetwork;
    }
    if (status >= 400 && status < 500) {
        return Kind::ServerRejection;
    }
    if (status >= 200 && status < 400) {
        return Kind::None;
    }
    // No status at all (0) means the request never completed
    return Kind::TransientNetwork;
}

SyncError SyncError::fromHttpStatus(int status, const QString &message)
{
    return SyncError(classifyHttpStatus(status), message, status);
}

} // namespace FieldSync
