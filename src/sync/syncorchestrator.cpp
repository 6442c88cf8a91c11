#include "syncorchestrator.h"
#include "localstore.h"
#include "remotedataservice.h"
#include "sessionprovider.h"
#include "connectivitymonitor.h"
#include "transferstrategy.h"
#include "conflictdetector.h"
#include "transactionaluploader.h"
#include "retryqueue.h"
#include "synccheckpoint.h"

#include <QMetaObject>
#include <QMutexLocker>
#include <QDebug>

namespace FieldSync {

SyncOrchestrator::SyncOrchestrator(QObject *parent)
    : QObject(parent)
    , m_queue(new RetryQueue(this))
    , m_checkpoint(new SyncCheckpoint(this))
{
    connect(m_queue, &RetryQueue::errorOccurred, this, &SyncOrchestrator::errorOccurred);
    connect(m_checkpoint, &SyncCheckpoint::errorOccurred, this, &SyncOrchestrator::errorOccurred);
    connect(m_queue, &RetryQueue::itemDeadLettered, this, [this](const QString &key) {
        emit logMessage(QString("Moved to dead letters after repeated failures: %1").arg(key));
    });
}

SyncOrchestrator::~SyncOrchestrator()
{
    // Queue and checkpoint persist on every change; collaborators are not ours
    unsubscribeMonitor();
}

// ========== Configuration ==========

void SyncOrchestrator::setConnectivityMonitor(ConnectivityMonitor *monitor)
{
    unsubscribeMonitor();
    m_monitor = monitor;
    if (m_autoSync) {
        subscribeMonitor();
    }
}

void SyncOrchestrator::setAutoSyncOnReconnect(bool enabled)
{
    if (m_autoSync == enabled) {
        return;
    }

    m_autoSync = enabled;
    if (enabled) {
        subscribeMonitor();
    } else {
        unsubscribeMonitor();
    }
}

void SyncOrchestrator::subscribeMonitor()
{
    if (!m_monitor || m_monitorSubscription >= 0) {
        return;
    }

    m_monitorSubscription = m_monitor->subscribe([this](QualityTier tier) {
        if (tier == QualityTier::Offline) {
            return;
        }
        QMetaObject::invokeMethod(this, [this]() { autoSync(); }, Qt::QueuedConnection);
    });
}

void SyncOrchestrator::unsubscribeMonitor()
{
    if (m_monitor && m_monitorSubscription >= 0) {
        m_monitor->unsubscribe(m_monitorSubscription);
    }
    m_monitorSubscription = -1;
}

void SyncOrchestrator::autoSync()
{
    if (!m_autoSync || m_active || !m_monitor) {
        return;
    }
    if (m_monitor->currentQuality() == QualityTier::Offline || m_queue->pendingCount() == 0) {
        return;
    }

    qDebug() << "[SyncOrchestrator] Connection available with" << m_queue->pendingCount() << "queued items";
    emit logMessage("Network available, starting queued sync");
    startSync();
}

bool SyncOrchestrator::setStateDirectory(const QString &path)
{
    m_stateDirectory = path;
    m_queue->setStateDirectory(path);
    m_checkpoint->setStateDirectory(path);

    bool ok = m_queue->load();
    ok = m_checkpoint->load() && ok;
    return ok;
}

void SyncOrchestrator::setDefaultStrategy(ResolutionStrategy strategy)
{
    m_hasDefaultStrategy = true;
    m_defaultStrategy = strategy;
}

void SyncOrchestrator::clearDefaultStrategy()
{
    m_hasDefaultStrategy = false;
}

// ========== Sync Operations ==========

SyncSessionResult SyncOrchestrator::startSync()
{
    return runSession(false, RecordFilter());
}

SyncSessionResult SyncOrchestrator::startSync(const RecordFilter &filter)
{
    return runSession(false, filter);
}

SyncSessionResult SyncOrchestrator::startDownloadOnlySync()
{
    return runSession(true, RecordFilter());
}

SyncSessionResult SyncOrchestrator::runSession(bool downloadOnly, const RecordFilter &filter)
{
    bool expected = false;
    if (!m_active.compare_exchange_strong(expected, true)) {
        SyncSessionResult rejected;
        rejected.rejected = true;
        rejected.state = m_state;
        rejected.error = SyncError(SyncError::Kind::Configuration, "Sync already in progress");
        qWarning() << "[SyncOrchestrator] Sync already in progress, request rejected";
        emit logMessage("Sync already in progress");
        return rejected;
    }

    m_cancel.reset();
    m_downloadOnly = downloadOnly;
    m_filter = filter;
    m_session = SyncSessionResult();
    m_session.startTime = QDateTime::currentDateTimeUtc();
    m_uploadList.clear();
    m_pendingConflicts.clear();
    m_conflictItems.clear();
    m_remoteState.clear();

    if (downloadOnly) {
        emit logMessage("Starting download-only sync session");
    } else if (!filter.isEmpty()) {
        emit logMessage(QString("Starting sync session for period %1, location %2")
            .arg(filter.period.isEmpty() ? "*" : filter.period)
            .arg(filter.location.isEmpty() ? "*" : filter.location));
    } else {
        emit logMessage("Starting sync session");
    }

    if (!m_store || !m_remote || !m_sessionProvider || !m_monitor) {
        return fail(SyncError(SyncError::Kind::Configuration,
                              "Sync requires a local store, remote service, session provider and connectivity monitor"));
    }

    // ---------- CHECKING_SESSION ----------
    setState(SessionState::CheckingSession);
    publishProgress(SessionState::CheckingSession, 0, 0, "Validating session");

    if (!m_sessionProvider->isValid()) {
        return fail(SyncError::authentication("Session is not valid; please log in again"));
    }

    QualityTier tier = m_monitor->currentQuality();
    m_params = AdaptiveTransferStrategy::parametersFor(tier);
    if (!m_params.shouldAttempt()) {
        return fail(SyncError::transient("No network connection available"));
    }

    m_queue->setBackoff(m_params.baseBackoffMs, m_params.maxBackoffMs);
    emit logMessage(QString("Network quality %1: batches of %2, timeout %3ms")
        .arg(toString(tier))
        .arg(m_params.batchSize)
        .arg(m_params.timeoutMs));

    if (m_cancel.isCancelled()) {
        return finish(SessionState::Cancelled);
    }

    if (m_downloadOnly) {
        return downloadAndFinalize();
    }

    // ---------- DETECTING_CONFLICTS ----------
    setState(SessionState::DetectingConflicts);

    SyncError detectError = detectConflicts();
    if (detectError.kind == SyncError::Kind::Authentication) {
        return fail(detectError);
    }
    if (detectError.isError()) {
        // Remote state unknown: nothing can be screened, keep the queue as is
        qWarning() << "[SyncOrchestrator] Conflict screening failed:" << detectError.toString();
        emit logMessage(QString("Could not fetch remote state: %1").arg(detectError.message));
        m_session.error = detectError;
        m_uploadList.clear();
        m_pendingConflicts.clear();
    }

    if (m_cancel.isCancelled()) {
        return finish(SessionState::Cancelled);
    }

    if (!m_pendingConflicts.isEmpty()) {
        ConflictResolutionRequest request;
        request.conflicts = m_pendingConflicts;

        ResolutionAnswer answer;
        if (m_resolutionHandler && m_resolutionHandler(request, answer)) {
            return supplyResolution(answer);
        }

        // ---------- AWAITING_RESOLUTION ----------
        SyncSessionResult paused;
        {
            QMutexLocker locker(&m_handoffMutex);
            m_session.state = SessionState::AwaitingResolution;
            m_session.pendingConflicts = m_pendingConflicts;
            paused = m_session;
        }

        // From here on cancel() may end the session from another thread
        setState(SessionState::AwaitingResolution);
        publishProgress(SessionState::AwaitingResolution, 0, request.conflicts.size(),
                        QString("%1 conflicts need a decision").arg(request.conflicts.size()));
        emit logMessage(QString("Waiting for resolution of %1 conflicts").arg(request.conflicts.size()));
        emit conflictResolutionRequested(request);

        QList<ConflictRecord> unanswered;
        QMap<QString, SyncQueueItem> unansweredItems;
        if (m_cancel.isCancelled() && claimPendingConflicts(unanswered, unansweredItems)) {
            return finish(SessionState::Cancelled);
        }
        if (!m_active) {
            // A directly connected slot already answered or cancelled
            return m_lastResult;
        }
        return paused;
    }

    return continueSession();
}

SyncSessionResult SyncOrchestrator::supplyResolution(const ResolutionAnswer &answer)
{
    QList<ConflictRecord> conflicts;
    QMap<QString, SyncQueueItem> items;
    if (!claimPendingConflicts(conflicts, items)) {
        SyncSessionResult rejected;
        rejected.rejected = true;
        rejected.state = m_state;
        rejected.error = SyncError(SyncError::Kind::ConflictUnresolved, "No conflicts are awaiting resolution");
        qWarning() << "[SyncOrchestrator] Resolution supplied while no conflicts are pending";
        return rejected;
    }

    for (const ConflictRecord &conflict : conflicts) {
        ResolutionStrategy strategy = answer.strategyFor(conflict.key);
        ResolvedAction action = ConflictDetector::resolve(conflict, strategy);
        emit logMessage(QString("Conflict %1 resolved: %2")
            .arg(conflict.key.toString())
            .arg(toString(strategy)));
        applyAction(items.value(conflict.key.toString()), action);
    }

    return continueSession();
}

void SyncOrchestrator::cancel()
{
    if (!m_active) {
        return;
    }

    m_cancel.cancel();
    emit logMessage("Cancel requested...");

    if (m_state != SessionState::AwaitingResolution) {
        return;
    }

    // Nothing is running; conflicted items simply stay queued. A resolution
    // that got here first owns the session and sees the cancel flag.
    QList<ConflictRecord> conflicts;
    QMap<QString, SyncQueueItem> items;
    if (claimPendingConflicts(conflicts, items)) {
        finish(SessionState::Cancelled);
    }
}

bool SyncOrchestrator::claimPendingConflicts(QList<ConflictRecord> &conflicts,
                                             QMap<QString, SyncQueueItem> &items)
{
    QMutexLocker locker(&m_handoffMutex);
    if (!m_active || m_pendingConflicts.isEmpty()) {
        return false;
    }

    conflicts = m_pendingConflicts;
    items = m_conflictItems;
    m_pendingConflicts.clear();
    m_conflictItems.clear();
    m_session.pendingConflicts.clear();
    return true;
}

// ========== Queue Operations ==========

bool SyncOrchestrator::notifyRecordChanged(const RecordKey &key)
{
    if (!m_store) {
        return false;
    }

    LocalRecord record;
    if (!m_store->read(key, record)) {
        qWarning() << "[SyncOrchestrator] Change notified for unknown record:" << key.toString();
        return false;
    }

    if (!record.dirty && !m_store->markDirty(key)) {
        emit errorOccurred(QString("Failed to mark %1 dirty").arg(key.toString()));
        return false;
    }

    m_queue->enqueue(key, RetryQueue::makeIdempotencyKey(record));
    return true;
}

bool SyncOrchestrator::retryDeadLetter(const RecordKey &key)
{
    if (!m_queue->retryDeadLetter(key)) {
        return false;
    }
    emit logMessage(QString("Queued for retry: %1").arg(key.toString()));
    return true;
}

bool SyncOrchestrator::discardItem(const RecordKey &key)
{
    if (!m_queue->discard(key)) {
        return false;
    }

    // The edit stays local; clearing the flag keeps recovery from queueing it again
    LocalRecord record;
    if (m_store && m_store->read(key, record) && record.dirty
        && !m_store->clearDirty(key, record.serverRevision)) {
        emit errorOccurred(QString("Failed to clear dirty flag of %1").arg(key.toString()));
    }
    emit logMessage(QString("Discarded from queue: %1").arg(key.toString()));
    return true;
}

QList<SyncQueueItem> SyncOrchestrator::deadLetters() const
{
    return m_queue->deadLetters();
}

// ========== Phases ==========

void SyncOrchestrator::recoverDirtyRecords()
{
    const QList<RecordKey> dirty = m_store->dirtyKeys();
    int recovered = 0;
    for (const RecordKey &key : dirty) {
        if (m_queue->contains(key)) {
            continue;
        }
        LocalRecord record;
        if (m_store->read(key, record)) {
            m_queue->enqueue(key, RetryQueue::makeIdempotencyKey(record));
            recovered++;
        }
    }

    if (recovered > 0) {
        qDebug() << "[SyncOrchestrator] Queued" << recovered << "unqueued dirty records";
    }
}

SyncError SyncOrchestrator::detectConflicts()
{
    recoverDirtyRecords();

    QList<SyncQueueItem> eligible = m_queue->nextEligibleBatch(QDateTime::currentDateTimeUtc());
    if (!m_filter.isEmpty()) {
        QList<SyncQueueItem> inScope;
        for (const SyncQueueItem &item : eligible) {
            if (m_filter.matches(item.key)) {
                inScope.append(item);
            }
        }
        eligible = inScope;
    }
    publishProgress(SessionState::DetectingConflicts, 0, eligible.size(), "Checking for conflicts");
    if (eligible.isEmpty()) {
        return SyncError();
    }

    QList<RecordKey> keys;
    for (const SyncQueueItem &item : eligible) {
        keys.append(item.key);
    }

    SyncError error;
    if (!m_remote->fetchRemoteState(keys, m_params.timeoutMs, m_remoteState, error)) {
        if (!error.isError()) {
            error = SyncError::transient("Remote state query failed");
        }
        return error;
    }

    int processed = 0;
    for (SyncQueueItem item : eligible) {
        LocalRecord local;
        if (!m_store->read(item.key, local)) {
            qDebug() << "[SyncOrchestrator] Queued record no longer exists:" << item.key.toString();
            m_queue->discard(item.key);
            continue;
        }

        // The record may have been edited again since it was queued
        QString idempotencyKey = RetryQueue::makeIdempotencyKey(local);
        if (idempotencyKey != item.idempotencyKey) {
            m_queue->enqueue(item.key, idempotencyKey);
            item.idempotencyKey = idempotencyKey;
        }

        auto remoteIt = m_remoteState.constFind(item.key.toString());
        const RemoteRecord *remote = remoteIt != m_remoteState.constEnd() ? &remoteIt.value() : nullptr;

        ConflictType type = ConflictDetector::classify(local, remote);
        ResolvedAction action = ConflictDetector::defaultAction(type);

        if (type == ConflictType::BothModified) {
            m_session.conflicted++;
            ConflictRecord conflict = ConflictDetector::describe(local, remote, type);
            if (m_hasDefaultStrategy) {
                action = ConflictDetector::resolve(conflict, m_defaultStrategy);
            } else {
                QMutexLocker locker(&m_handoffMutex);
                m_pendingConflicts.append(conflict);
                m_conflictItems.insert(item.key.toString(), item);
                processed++;
                continue;
            }
        }

        applyAction(item, action);
        processed++;
        publishProgress(SessionState::DetectingConflicts, processed, eligible.size());
    }

    return SyncError();
}

void SyncOrchestrator::applyAction(const SyncQueueItem &item, ResolvedAction action)
{
    QString id = item.key.toString();

    switch (action) {
        case ResolvedAction::Upload:
            m_uploadList.append(item);
            break;

        case ResolvedAction::AcceptServer:
            if (m_remoteState.contains(id)) {
                acceptServerValue(m_remoteState.value(id));
            }
            m_queue->discard(item.key);
            break;

        case ResolvedAction::DiscardLocal:
            if (m_store->remove(item.key)) {
                emit logMessage(QString("Removed local record deleted on the server: %1").arg(id));
            }
            m_queue->discard(item.key);
            break;

        case ResolvedAction::Skip:
        case ResolvedAction::AwaitUser:
            // Left for the next session; no attempt is counted
            m_queue->release(item.key);
            m_session.skipped++;
            break;
    }
}

void SyncOrchestrator::acceptServerValue(const RemoteRecord &remote)
{
    if (!m_store->write(remote.key, remote.value) || !m_store->clearDirty(remote.key, remote.revision)) {
        emit errorOccurred(QString("Failed to store server value for %1").arg(remote.key.toString()));
        return;
    }
    m_session.downloaded++;
}

SyncSessionResult SyncOrchestrator::continueSession()
{
    if (m_cancel.isCancelled()) {
        return finish(SessionState::Cancelled);
    }

    // ---------- UPLOADING ----------
    setState(SessionState::Uploading);

    bool cancelled = false;
    SyncError uploadError = runUploads(cancelled);

    if (uploadError.kind == SyncError::Kind::RollbackFailure) {
        return fail(uploadError);
    }
    if (uploadError.kind == SyncError::Kind::Authentication
        || uploadError.kind == SyncError::Kind::Storage
        || uploadError.kind == SyncError::Kind::Configuration) {
        return fail(uploadError);
    }
    if (cancelled || m_cancel.isCancelled()) {
        return finish(SessionState::Cancelled);
    }
    if (uploadError.isError() && !m_session.error.isError()) {
        m_session.error = uploadError;
    }

    return downloadAndFinalize();
}

SyncSessionResult SyncOrchestrator::downloadAndFinalize()
{
    // ---------- DOWNLOADING ----------
    if (m_downloadEnabled || m_downloadOnly) {
        setState(SessionState::Downloading);

        SyncError downloadError = runDownload();
        if (downloadError.kind == SyncError::Kind::Authentication) {
            return fail(downloadError);
        }
        if (downloadError.isError() && !m_session.error.isError()) {
            m_session.error = downloadError;
        }

        if (m_cancel.isCancelled()) {
            return finish(SessionState::Cancelled);
        }
    }

    // ---------- FINALIZING ----------
    setState(SessionState::Finalizing);
    publishProgress(SessionState::Finalizing, 0, 0, "Finalizing");

    // Only a full session over every record proves the queue was worked off
    if (!m_session.error.isError() && !m_downloadOnly && m_filter.isEmpty()) {
        m_checkpoint->setLastSuccessfulSync(QDateTime::currentDateTimeUtc());
    }
    m_checkpoint->save();
    m_queue->save();

    return finish(SessionState::Completed);
}

SyncError SyncOrchestrator::runUploads(bool &cancelled)
{
    const int total = m_uploadList.size();
    publishProgress(SessionState::Uploading, 0, total, "Uploading");
    if (total == 0) {
        return SyncError();
    }

    TransactionalUploader uploader(m_store, m_remote, m_queue);

    int index = 0;
    while (index < total) {
        if (m_cancel.isCancelled()) {
            cancelled = true;
            return SyncError();
        }

        // Re-read the tier so batch size follows the network between batches
        TransferParameters params = AdaptiveTransferStrategy::parametersFor(m_monitor->currentQuality());
        if (!params.shouldAttempt()) {
            emit logMessage("Connection lost, remaining uploads stay queued");
            return SyncError::transient("Connection lost before upload finished");
        }
        m_params = params;

        QList<SyncQueueItem> batch = m_uploadList.mid(index, params.batchSize);
        const int offset = index;
        uploader.setProgressCallback([this, offset, total](int processed, int) {
            publishProgress(SessionState::Uploading, offset + processed, total);
        });

        TransactionalUploader::BatchResult batchResult = uploader.uploadBatch(batch, params);

        m_session.uploaded += batchResult.confirmed.size();
        m_session.rejectedItems += batchResult.rejected.size();
        m_session.failed += batchResult.failed.size() + batchResult.rejected.size()
                          + batchResult.deadLettered.size() + batchResult.needsReview.size();
        m_session.deadLettered += batchResult.deadLettered.size();
        m_session.failures.append(batchResult.failures);

        for (const RecordKey &key : batchResult.rejected) {
            emit logMessage(QString("Rejected by server: %1").arg(key.toString()));
        }

        index += batch.size();
        publishProgress(SessionState::Uploading, index, total);

        if (batchResult.error.kind == SyncError::Kind::RollbackFailure) {
            QStringList keys;
            for (const RecordKey &key : batchResult.needsReview) {
                keys << key.toString();
            }
            qCritical() << "[SyncOrchestrator] Rollback failed, records need review:" << keys;
            emit rollbackFailed(keys);
            return batchResult.error;
        }

        if (batchResult.aborted()) {
            emit logMessage(QString("Upload interrupted: %1").arg(batchResult.error.message));
            return batchResult.error;
        }
    }

    emit logMessage(QString("Uploaded %1 of %2 records").arg(m_session.uploaded).arg(total));
    return SyncError();
}

SyncError SyncOrchestrator::runDownload()
{
    publishProgress(SessionState::Downloading, 0, 0, "Downloading");

    QList<RemoteRecord> records;
    SyncError error;
    if (!m_remote->download(m_checkpoint->lastDownloadTime(), m_params.timeoutMs, records, error)) {
        if (!error.isError()) {
            error = SyncError::transient("Download failed");
        }
        qWarning() << "[SyncOrchestrator] Download failed:" << error.toString();
        emit logMessage(QString("Download failed: %1").arg(error.message));
        return error;
    }

    QDateTime newest = m_checkpoint->lastDownloadTime();
    int processed = 0;
    int applied = 0;

    for (const RemoteRecord &remote : records) {
        processed++;
        if (remote.lastModified.isValid() && (!newest.isValid() || remote.lastModified > newest)) {
            newest = remote.lastModified;
        }

        if (!m_filter.matches(remote.key)) {
            continue;
        }

        LocalRecord local;
        bool exists = m_store->read(remote.key, local);

        if (exists && local.dirty) {
            // Unsynced local edit; it goes through conflict screening next session
            qDebug() << "[SyncOrchestrator] Keeping dirty local record:" << remote.key.toString();
            continue;
        }

        if (remote.deleted) {
            if (exists && m_store->remove(remote.key)) {
                applied++;
            }
            continue;
        }

        if (exists && local.serverRevision == remote.revision) {
            continue;
        }

        if (m_store->write(remote.key, remote.value) && m_store->clearDirty(remote.key, remote.revision)) {
            applied++;
        } else {
            emit errorOccurred(QString("Failed to store downloaded record %1").arg(remote.key.toString()));
        }

        publishProgress(SessionState::Downloading, processed, records.size());
    }

    m_session.downloaded += applied;
    // A filtered pass skipped records the cursor would otherwise cover
    if (newest.isValid() && m_filter.isEmpty()) {
        m_checkpoint->setLastDownloadTime(newest);
    }

    emit logMessage(QString("Downloaded %1 records (%2 received)").arg(applied).arg(records.size()));
    return SyncError();
}

// ========== Session State ==========

void SyncOrchestrator::setState(SessionState state)
{
    m_state = state;
    qDebug() << "[SyncOrchestrator] State:" << toString(state);
    emit stateChanged(state);
}

void SyncOrchestrator::publishProgress(SessionState phase, int processed, int total, const QString &detail)
{
    SyncProgress progress;
    progress.phase = phase;
    progress.processedCount = processed;
    progress.totalCount = total;
    progress.detail = detail;

    m_progressChannel.publish(progress);
    emit progressUpdated(progress);

    if (m_progressCallback) {
        m_progressCallback(progress);
    }
}

SyncSessionResult SyncOrchestrator::fail(const SyncError &error)
{
    qWarning() << "[SyncOrchestrator] Session failed:" << error.toString();
    emit errorOccurred(error.toString());
    return finish(SessionState::Failed, error);
}

SyncSessionResult SyncOrchestrator::finish(SessionState state, const SyncError &error)
{
    m_session.state = state;
    if (error.isError()) {
        m_session.error = error;
    }
    m_session.endTime = QDateTime::currentDateTimeUtc();

    m_uploadList.clear();
    m_remoteState.clear();

    setState(state);
    publishProgress(state, 0, 0, m_session.summary());

    SyncSessionResult result = m_session;
    m_lastResult = result;
    m_active = false;

    emit syncFinished(result);
    emit logMessage(QString("Sync %1. %2. Duration: %3ms")
        .arg(toString(state))
        .arg(result.summary())
        .arg(result.durationMs()));

    return result;
}

} // namespace FieldSync
