#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>
#include "syncerror.h"

/**
 * @file synctypes.h
 * @brief Common types and enums for the sync engine
 *
 * Every enum here is a closed set; switch statements over them are written
 * without a default branch so the compiler flags a missing case.
 */

namespace FieldSync {

/**
 * @brief Coarse classification of current network conditions
 */
enum class QualityTier {
    Excellent,
    Good,
    Fair,
    Poor,
    Offline         ///< Unreachable or no samples; never attempt transfers
};

/**
 * @brief Relationship between a local record and its remote counterpart
 */
enum class ConflictType {
    None,           ///< Nothing diverged (or a brand new local record)
    LocalOnly,      ///< Previously synced, now missing remotely without tombstone
    ServerNewer,    ///< Only the remote side changed since the last sync point
    LocalNewer,     ///< Only the local side changed since the last sync point
    BothModified,   ///< Both sides changed; needs explicit resolution
    DeletedRemotely ///< Remote holds a tombstone for the record
};

/**
 * @brief User- or policy-supplied answer for a BothModified conflict
 */
enum class ResolutionStrategy {
    KeepLocal,      ///< Upload the local value over the remote one
    KeepServer,     ///< Take the remote value, drop the local edit
    Skip            ///< Leave the item pending, exclude it from this session
};

/**
 * @brief What the engine does with one record after conflict screening
 */
enum class ResolvedAction {
    Upload,         ///< Send local value to the remote
    AcceptServer,   ///< Overwrite local with the remote value
    DiscardLocal,   ///< Drop the local record (remote deleted it, user agreed)
    Skip,           ///< Keep pending, not part of this session
    AwaitUser       ///< Cannot decide without resolution input
};

/**
 * @brief Lifecycle state of a queued upload intent
 */
enum class QueueItemState {
    Pending,
    InFlight,
    DeadLetter,     ///< Retry budget exhausted; manual retry or discard
    Rejected,       ///< Server refused the value; local state preserved
    NeedsReview     ///< Rollback failed; local state may be inconsistent
};

/**
 * @brief States of one orchestrated sync session
 */
enum class SessionState {
    Idle,
    CheckingSession,
    DetectingConflicts,
    AwaitingResolution,
    Uploading,
    Downloading,
    Finalizing,
    Completed,
    Failed,
    Cancelled
};

/**
 * @brief Composite identity of a data value
 *
 * Entity id plus the context dimensions it was captured in.
 */
struct RecordKey {
    QString entityId;       ///< Data element / field id
    QString period;         ///< Reporting period (e.g. "202405")
    QString location;       ///< Organisation unit / site
    QString category;       ///< Category option combination

    bool isValid() const { return !entityId.isEmpty(); }

    /**
     * @brief Stable "entity|period|location|category" form used as map key
     */
    QString toString() const;
    static RecordKey fromString(const QString &str);

    bool operator==(const RecordKey &other) const {
        return entityId == other.entityId && period == other.period
            && location == other.location && category == other.category;
    }
    bool operator!=(const RecordKey &other) const { return !(*this == other); }
};

/**
 * @brief Selects records by context, e.g. one form instance
 *
 * Empty fields match anything; an empty filter matches every record.
 */
struct RecordFilter {
    QString entityId;
    QString period;
    QString location;
    QString category;

    bool isEmpty() const {
        return entityId.isEmpty() && period.isEmpty() && location.isEmpty() && category.isEmpty();
    }

    bool matches(const RecordKey &key) const {
        return (entityId.isEmpty() || entityId == key.entityId)
            && (period.isEmpty() || period == key.period)
            && (location.isEmpty() || location == key.location)
            && (category.isEmpty() || category == key.category);
    }
};

/**
 * @brief A locally captured data value as held by the local store
 */
struct LocalRecord {
    RecordKey key;
    QString value;              ///< Value payload
    QDateTime lastModified;     ///< Local clock
    QString serverRevision;     ///< Empty if never synced
    QDateTime lastSyncedAt;     ///< Last common sync point for this record
    bool dirty = false;

    bool isSynced() const { return !serverRevision.isEmpty(); }

    bool operator==(const LocalRecord &other) const {
        return key == other.key && value == other.value
            && lastModified == other.lastModified
            && serverRevision == other.serverRevision
            && lastSyncedAt == other.lastSyncedAt
            && dirty == other.dirty;
    }
    bool operator!=(const LocalRecord &other) const { return !(*this == other); }
};

/**
 * @brief Last-known state of a record on the remote data service
 */
struct RemoteRecord {
    RecordKey key;
    QString value;
    QString revision;
    QDateTime lastModified;
    bool deleted = false;       ///< Tombstone
};

/**
 * @brief Pending intent to upload one local record
 */
struct SyncQueueItem {
    RecordKey key;
    int attemptCount = 0;
    QDateTime nextEligibleAt;
    QDateTime enqueuedAt;
    qint64 sequence = 0;        ///< FIFO order within the queue
    QString lastError;
    QString idempotencyKey;     ///< Stable across retries of the same content
    QueueItemState state = QueueItemState::Pending;

    bool isTerminal() const {
        return state == QueueItemState::DeadLetter
            || state == QueueItemState::Rejected
            || state == QueueItemState::NeedsReview;
    }
};

/**
 * @brief Conflict found while screening pending changes
 */
struct ConflictRecord {
    RecordKey key;
    QDateTime localModified;
    QDateTime remoteModified;
    QString remoteRevision;
    QString localValue;
    QString remoteValue;
    ConflictType type = ConflictType::None;
    ResolvedAction suggested = ResolvedAction::Upload;
};

/**
 * @brief Emitted when BothModified conflicts need an answer
 */
struct ConflictResolutionRequest {
    QList<ConflictRecord> conflicts;
};

/**
 * @brief Answer to a ConflictResolutionRequest
 *
 * Per-conflict strategies take priority over the session-wide default.
 * Conflicts with neither are skipped.
 */
struct ResolutionAnswer {
    QMap<QString, ResolutionStrategy> perConflict;  ///< key string -> strategy
    bool hasDefault = false;
    ResolutionStrategy sessionDefault = ResolutionStrategy::Skip;

    void setDefault(ResolutionStrategy strategy) {
        hasDefault = true;
        sessionDefault = strategy;
    }

    ResolutionStrategy strategyFor(const RecordKey &key) const {
        auto it = perConflict.constFind(key.toString());
        if (it != perConflict.constEnd()) return it.value();
        return hasDefault ? sessionDefault : ResolutionStrategy::Skip;
    }
};

/**
 * @brief Ephemeral network measurement
 */
struct NetworkQualitySample {
    double bandwidthKbps = 0.0;     ///< Estimated throughput
    int latencyMs = -1;             ///< Round-trip estimate
    bool reachable = false;
    QDateTime timestamp;
};

/**
 * @brief Transfer knobs derived from a quality tier
 */
struct TransferParameters {
    int batchSize = 0;              ///< Records per batch; 0 = do not attempt
    int timeoutMs = 0;              ///< Per network call
    qint64 baseBackoffMs = 0;
    qint64 maxBackoffMs = 0;

    bool shouldAttempt() const { return batchSize > 0; }
};

/**
 * @brief Progress event published to the presentation layer
 */
struct SyncProgress {
    SessionState phase = SessionState::Idle;
    int processedCount = 0;
    int totalCount = 0;
    QString detail;
};

/**
 * @brief Per-record failure collected during a session
 */
struct ItemFailure {
    RecordKey key;
    SyncError error;
};

/**
 * @brief Summary of one sync session
 */
struct SyncSessionResult {
    SessionState state = SessionState::Idle;    ///< Terminal (or paused) state
    bool rejected = false;      ///< Another session was already active
    SyncError error;            ///< Session-level error, if any

    int uploaded = 0;
    int downloaded = 0;
    int conflicted = 0;         ///< BothModified conflicts detected
    int failed = 0;             ///< Items that failed this session
    int deadLettered = 0;       ///< Items moved to DeadLetter this session
    int rejectedItems = 0;      ///< Items refused by the server
    int skipped = 0;            ///< Items left pending by a Skip resolution

    QList<ItemFailure> failures;
    QList<ConflictRecord> pendingConflicts;     ///< Set while awaiting resolution

    QDateTime startTime;
    QDateTime endTime;

    bool isSuccess() const { return state == SessionState::Completed; }

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    QString summary() const;
};

QString toString(QualityTier tier);
QString toString(ConflictType type);
QString toString(ResolutionStrategy strategy);
QString toString(QueueItemState state);
QString toString(SessionState state);

QueueItemState queueItemStateFromString(const QString &str);

/**
 * @brief Parse a config value ("keep-local", "keep-server", "skip")
 * @return false for "ask" or anything unknown
 */
bool resolutionStrategyFromString(const QString &str, ResolutionStrategy &out);

} // namespace FieldSync

Q_DECLARE_METATYPE(FieldSync::QualityTier)
Q_DECLARE_METATYPE(FieldSync::SessionState)
Q_DECLARE_METATYPE(FieldSync::SyncProgress)
Q_DECLARE_METATYPE(FieldSync::SyncSessionResult)
Q_DECLARE_METATYPE(FieldSync::ConflictResolutionRequest)

#endif // SYNCTYPES_H
