#include "synctypes.h"

namespace FieldSync {

static const QChar KEY_SEPARATOR('|');

QString RecordKey::toString() const
{
    return QStringList{entityId, period, location, category}.join(KEY_SEPARATOR);
}

RecordKey RecordKey::fromString(const QString &str)
{
    RecordKey key;
    QStringList parts = str.split(KEY_SEPARATOR);
    if (parts.size() != 4) {
        return key;  // Invalid key
    }
    key.entityId = parts[0];
    key.period = parts[1];
    key.location = parts[2];
    key.category = parts[3];
    return key;
}

QString SyncSessionResult::summary() const
{
    return QString("%1: Uploaded: %2, Downloaded: %3, Conflicts: %4, Failed: %5, "
                   "Dead-lettered: %6, Rejected: %7, Skipped: %8")
        .arg(FieldSync::toString(state))
        .arg(uploaded).arg(downloaded).arg(conflicted).arg(failed)
        .arg(deadLettered).arg(rejectedItems).arg(skipped);
}

QString toString(QualityTier tier)
{
    switch (tier) {
        case QualityTier::Excellent: return "EXCELLENT";
        case QualityTier::Good:      return "GOOD";
        case QualityTier::Fair:      return "FAIR";
        case QualityTier::Poor:      return "POOR";
        case QualityTier::Offline:   return "OFFLINE";
    }
    return QString();
}

QString toString(ConflictType type)
{
    switch (type) {
        case ConflictType::None:            return "NONE";
        case ConflictType::LocalOnly:       return "LOCAL_ONLY";
        case ConflictType::ServerNewer:     return "SERVER_NEWER";
        case ConflictType::LocalNewer:      return "LOCAL_NEWER";
        case ConflictType::BothModified:    return "BOTH_MODIFIED";
        case ConflictType::DeletedRemotely: return "DELETED_REMOTELY";
    }
    return QString();
}

QString toString(ResolutionStrategy strategy)
{
    switch (strategy) {
        case ResolutionStrategy::KeepLocal:  return "keep-local";
        case ResolutionStrategy::KeepServer: return "keep-server";
        case ResolutionStrategy::Skip:       return "skip";
    }
    return QString();
}

QString toString(QueueItemState state)
{
    switch (state) {
        case QueueItemState::Pending:     return "pending";
        case QueueItemState::InFlight:    return "in-flight";
        case QueueItemState::DeadLetter:  return "dead-letter";
        case QueueItemState::Rejected:    return "rejected";
        case QueueItemState::NeedsReview: return "needs-review";
    }
    return QString();
}

QString toString(SessionState state)
{
    switch (state) {
        case SessionState::Idle:               return "IDLE";
        case SessionState::CheckingSession:    return "CHECKING_SESSION";
        case SessionState::DetectingConflicts: return "DETECTING_CONFLICTS";
        case SessionState::AwaitingResolution: return "AWAITING_RESOLUTION";
        case SessionState::Uploading:          return "UPLOADING";
        case SessionState::Downloading:        return "DOWNLOADING";
        case SessionState::Finalizing:         return "FINALIZING";
        case SessionState::Completed:          return "COMPLETED";
        case SessionState::Failed:             return "FAILED";
        case SessionState::Cancelled:          return "CANCELLED";
    }
    return QString();
}

QueueItemState queueItemStateFromString(const QString &str)
{
    if (str == "dead-letter") return QueueItemState::DeadLetter;
    if (str == "rejected") return QueueItemState::Rejected;
    if (str == "needs-review") return QueueItemState::NeedsReview;
    if (str == "in-flight") return QueueItemState::InFlight;
    return QueueItemState::Pending;
}

bool resolutionStrategyFromString(const QString &str, ResolutionStrategy &out)
{
    QString s = str.trimmed().toLower();
    if (s == "keep-local") {
        out = ResolutionStrategy::KeepLocal;
        return true;
    }
    if (s == "keep-server") {
        out = ResolutionStrategy::KeepServer;
        return true;
    }
    if (s == "skip") {
        out = ResolutionStrategy::Skip;
        return true;
    }
    return false;  // "ask" or unknown
}

} // namespace FieldSync
