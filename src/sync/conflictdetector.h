#ifndef CONFLICTDETECTOR_H
#define CONFLICTDETECTOR_H

#include <QDateTime>
#include "synctypes.h"

namespace FieldSync {

/**
 * @brief Classifies local changes against the last-known remote state
 *
 * Rule table (lastSyncPoint = the record's last common sync point; an
 * invalid sync point means "never synced", so every timestamp is newer):
 *
 *   remote absent, local never synced         -> None
 *   remote absent, local synced before         -> LocalOnly
 *   remote tombstone                           -> DeletedRemotely
 *   local newer and remote newer               -> BothModified
 *   only remote newer                          -> ServerNewer
 *   only local newer                           -> LocalNewer
 *   neither newer                              -> None
 *
 * A local record only counts as newer while it is dirty. A remote record
 * whose revision equals the local server revision has not moved, whatever
 * its timestamp says.
 *
 * Only BothModified needs resolution input; every other type resolves
 * deterministically (see defaultAction()).
 */
class ConflictDetector
{
public:
    /**
     * @brief Classify one pending local record
     * @param local The local record (as read from the store)
     * @param remoteKnown Last-known remote state, nullptr if absent remotely
     */
    static ConflictType classify(const LocalRecord &local, const RemoteRecord *remoteKnown);

    /**
     * @brief Timestamp core of the rule table for a record present on both sides
     *
     * Total over all inputs: returns exactly one of None, ServerNewer,
     * LocalNewer or BothModified.
     */
    static ConflictType classifyTimestamps(const QDateTime &localModified,
                                           const QDateTime &remoteModified,
                                           const QDateTime &lastSyncPoint);

    /**
     * @brief Build the conflict record handed to the presentation layer
     */
    static ConflictRecord describe(const LocalRecord &local,
                                   const RemoteRecord *remoteKnown,
                                   ConflictType type);

    /**
     * @brief Deterministic action for a conflict type
     *
     * Server wins on ServerNewer, local wins on LocalNewer, None and
     * LocalOnly upload, DeletedRemotely re-creates the record remotely.
     * BothModified returns AwaitUser.
     */
    static ResolvedAction defaultAction(ConflictType type);

    /**
     * @brief Apply a resolution strategy to a conflict
     *
     * KeepLocal uploads, Skip leaves the item pending. KeepServer takes the
     * remote value, or discards the local record when the remote deleted it.
     */
    static ResolvedAction resolve(const ConflictRecord &conflict, ResolutionStrategy strategy);

private:
    static bool isNewer(const QDateTime &timestamp, const QDateTime &syncPoint);
};

} // namespace FieldSync

#endif // CONFLICTDETECTOR_H
