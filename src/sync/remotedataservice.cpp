#include "remotedataservice.h"

namespace FieldSync {

UploadOutcome UploadOutcome::fromHttpStatus(int status, const QString &revision,
                                            const QString &message)
{
    switch (SyncError::classifyHttpStatus(status)) {
        case SyncError::Kind::None:
            return accepted(revision);
        case SyncError::Kind::Authentication:
            return authExpired(message, status);
        case SyncError::Kind::ServerRejection:
            return rejected(message, status);
        case SyncError::Kind::TransientNetwork:
        case SyncError::Kind::ConflictUnresolved:
        case SyncError::Kind::RollbackFailure:
        case SyncError::Kind::Configuration:
        case SyncError::Kind::Storage:
            break;
    }
    return transient(message, status);
}

} // namespace FieldSync
