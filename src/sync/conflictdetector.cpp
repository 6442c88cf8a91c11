#include "conflictdetector.h"

namespace FieldSync {

bool ConflictDetector::isNewer(const QDateTime &timestamp, const QDateTime &syncPoint)
{
    if (!timestamp.isValid()) {
        return false;  // Unknown modification time never counts as a change
    }
    if (!syncPoint.isValid()) {
        return true;   // Never synced: anything with a timestamp is newer
    }
    return timestamp > syncPoint;
}

ConflictType ConflictDetector::classifyTimestamps(const QDateTime &localModified,
                                                  const QDateTime &remoteModified,
                                                  const QDateTime &lastSyncPoint)
{
    bool localChanged = isNewer(localModified, lastSyncPoint);
    bool remoteChanged = isNewer(remoteModified, lastSyncPoint);

    if (localChanged && remoteChanged) {
        return ConflictType::BothModified;
    }
    if (remoteChanged) {
        return ConflictType::ServerNewer;
    }
    if (localChanged) {
        return ConflictType::LocalNewer;
    }
    return ConflictType::None;
}

ConflictType ConflictDetector::classify(const LocalRecord &local, const RemoteRecord *remoteKnown)
{
    if (!remoteKnown) {
        return local.isSynced() ? ConflictType::LocalOnly : ConflictType::None;
    }

    if (remoteKnown->deleted) {
        return ConflictType::DeletedRemotely;
    }

    // Remote still at the revision we last synced: it has not changed
    QDateTime remoteModified = remoteKnown->lastModified;
    if (local.isSynced() && remoteKnown->revision == local.serverRevision) {
        remoteModified = QDateTime();
    }

    QDateTime localModified = local.dirty ? local.lastModified : QDateTime();

    return classifyTimestamps(localModified, remoteModified, local.lastSyncedAt);
}

ConflictRecord ConflictDetector::describe(const LocalRecord &local,
                                          const RemoteRecord *remoteKnown,
                                          ConflictType type)
{
    ConflictRecord conflict;
    conflict.key = local.key;
    conflict.localModified = local.lastModified;
    conflict.localValue = local.value;
    conflict.type = type;
    conflict.suggested = defaultAction(type);

    if (remoteKnown) {
        conflict.remoteModified = remoteKnown->lastModified;
        conflict.remoteRevision = remoteKnown->revision;
        conflict.remoteValue = remoteKnown->value;
    }

    return conflict;
}

ResolvedAction ConflictDetector::defaultAction(ConflictType type)
{
    switch (type) {
        case ConflictType::None:
        case ConflictType::LocalOnly:
        case ConflictType::LocalNewer:
        case ConflictType::DeletedRemotely:
            return ResolvedAction::Upload;
        case ConflictType::ServerNewer:
            return ResolvedAction::AcceptServer;
        case ConflictType::BothModified:
            return ResolvedAction::AwaitUser;
    }
    return ResolvedAction::AwaitUser;
}

ResolvedAction ConflictDetector::resolve(const ConflictRecord &conflict, ResolutionStrategy strategy)
{
    switch (strategy) {
        case ResolutionStrategy::KeepLocal:
            return ResolvedAction::Upload;
        case ResolutionStrategy::KeepServer:
            if (conflict.type == ConflictType::DeletedRemotely
                || conflict.type == ConflictType::LocalOnly) {
                return ResolvedAction::DiscardLocal;
            }
            return ResolvedAction::AcceptServer;
        case ResolutionStrategy::Skip:
            return ResolvedAction::Skip;
    }
    return ResolvedAction::Skip;
}

} // namespace FieldSync
