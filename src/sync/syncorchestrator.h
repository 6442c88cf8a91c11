#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QMutex>
#include <atomic>
#include <functional>
#include "synctypes.h"
#include "syncerror.h"
#include "cancellationtoken.h"
#include "progresschannel.h"

namespace FieldSync {

class LocalStore;
class RemoteDataService;
class SessionProvider;
class ConnectivityMonitor;
class RetryQueue;
class SyncCheckpoint;

/**
 * @brief Runs sync sessions
 *
 * The SyncOrchestrator coordinates:
 *   - Session validity and connectivity checks
 *   - Conflict screening of queued local changes
 *   - Transactional batch upload through the retry queue
 *   - The download pass and the sync checkpoint
 *   - Progress reporting
 *
 * Usage:
 * @code
 * SyncOrchestrator orchestrator;
 * orchestrator.setLocalStore(&store);
 * orchestrator.setRemoteDataService(&remote);
 * orchestrator.setSessionProvider(&session);
 * orchestrator.setConnectivityMonitor(&monitor);
 * orchestrator.setStateDirectory(dataDir + "/.state");
 *
 * SyncSessionResult result = orchestrator.startSync();
 * if (result.state == SessionState::AwaitingResolution) {
 *     ResolutionAnswer answer;
 *     answer.setDefault(ResolutionStrategy::KeepLocal);
 *     result = orchestrator.supplyResolution(answer);
 * }
 * @endcode
 *
 * Collaborators are owned by the caller and must outlive the orchestrator.
 * The retry queue and checkpoint are owned by the orchestrator.
 *
 * Only one session is active at a time. A session paused in
 * AwaitingResolution stays active until supplyResolution() or cancel(),
 * whichever arrives first; the other one then has nothing left to do.
 *
 * Besides the full session there is a download-only session and a session
 * restricted to a RecordFilter. With setAutoSyncOnReconnect() a full session
 * starts by itself when the connection comes back while uploads are queued.
 */
class SyncOrchestrator : public QObject
{
    Q_OBJECT

public:
    using ResolutionHandler = std::function<bool(const ConflictResolutionRequest&, ResolutionAnswer&)>;
    using ProgressCallback = std::function<void(const SyncProgress&)>;

    explicit SyncOrchestrator(QObject *parent = nullptr);
    ~SyncOrchestrator() override;

    // ========== Collaborators ==========

    void setLocalStore(LocalStore *store) { m_store = store; }
    LocalStore* localStore() const { return m_store; }

    void setRemoteDataService(RemoteDataService *remote) { m_remote = remote; }
    RemoteDataService* remoteDataService() const { return m_remote; }

    void setSessionProvider(SessionProvider *provider) { m_sessionProvider = provider; }
    SessionProvider* sessionProvider() const { return m_sessionProvider; }

    void setConnectivityMonitor(ConnectivityMonitor *monitor);
    ConnectivityMonitor* connectivityMonitor() const { return m_monitor; }

    RetryQueue* retryQueue() const { return m_queue; }
    SyncCheckpoint* checkpoint() const { return m_checkpoint; }

    // ========== Configuration ==========

    /**
     * @brief Persist queue and checkpoint under this directory and load them
     */
    bool setStateDirectory(const QString &path);
    QString stateDirectory() const { return m_stateDirectory; }

    /**
     * @brief Strategy applied to BothModified conflicts without asking
     */
    void setDefaultStrategy(ResolutionStrategy strategy);
    void clearDefaultStrategy();
    bool hasDefaultStrategy() const { return m_hasDefaultStrategy; }
    ResolutionStrategy defaultStrategy() const { return m_defaultStrategy; }

    /**
     * @brief Synchronous answer path for conflict requests
     *
     * If the handler returns true its answer is applied in place and the
     * session never pauses. Returning false falls back to
     * conflictResolutionRequested() and AwaitingResolution.
     */
    void setResolutionHandler(ResolutionHandler handler) { m_resolutionHandler = handler; }

    void setProgressCallback(ProgressCallback callback) { m_progressCallback = callback; }
    ProgressChannel& progressChannel() { return m_progressChannel; }

    void setDownloadEnabled(bool enabled) { m_downloadEnabled = enabled; }
    bool isDownloadEnabled() const { return m_downloadEnabled; }

    /**
     * @brief Start a full session when connectivity changes to an online tier
     *
     * Needs a connectivity monitor. Nothing starts while a session is active
     * or while the queue holds no pending items. The session runs on the
     * orchestrator's thread, whichever thread fed the monitor.
     */
    void setAutoSyncOnReconnect(bool enabled);
    bool autoSyncOnReconnect() const { return m_autoSync; }

    // ========== Sync Operations ==========

    /**
     * @brief Run a sync session up to a terminal state or a conflict pause
     *
     * Returns immediately with rejected = true while another session is
     * active.
     */
    SyncSessionResult startSync();

    /**
     * @brief Run a session over the records matching a filter only
     *
     * Queued items outside the filter are left untouched. The download pass
     * applies matching records only and does not move the download cursor.
     */
    SyncSessionResult startSync(const RecordFilter &filter);

    /**
     * @brief Run a session that only downloads
     *
     * Skips conflict screening and uploads; the queue is left untouched.
     * Runs even when the download pass is disabled for full sessions.
     */
    SyncSessionResult startDownloadOnlySync();

    /**
     * @brief Resume a session paused in AwaitingResolution
     */
    SyncSessionResult supplyResolution(const ResolutionAnswer &answer);

    /**
     * @brief Request cooperative cancellation
     *
     * Honoured between phases and between batches. A session paused for
     * resolution is cancelled immediately.
     */
    void cancel();

    SessionState state() const { return m_state; }
    bool isActive() const { return m_active; }
    SyncSessionResult lastResult() const { return m_lastResult; }

    // ========== Queue Operations ==========

    /**
     * @brief A record was edited locally: mark it dirty and queue it
     */
    bool notifyRecordChanged(const RecordKey &key);

    bool retryDeadLetter(const RecordKey &key);

    /**
     * @brief Give up uploading a record's current edit
     *
     * Drops the queue item and marks the record clean at its current server
     * revision. The local value is kept; a later edit queues it again.
     */
    bool discardItem(const RecordKey &key);
    QList<SyncQueueItem> deadLetters() const;

signals:
    void stateChanged(FieldSync::SessionState state);
    void progressUpdated(const FieldSync::SyncProgress &progress);
    void conflictResolutionRequested(const FieldSync::ConflictResolutionRequest &request);
    void syncFinished(const FieldSync::SyncSessionResult &result);
    void rollbackFailed(const QStringList &keys);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    SyncSessionResult runSession(bool downloadOnly, const RecordFilter &filter);
    bool claimPendingConflicts(QList<ConflictRecord> &conflicts, QMap<QString, SyncQueueItem> &items);

    void subscribeMonitor();
    void unsubscribeMonitor();
    void autoSync();

    void setState(SessionState state);
    void publishProgress(SessionState phase, int processed, int total, const QString &detail = QString());

    void recoverDirtyRecords();
    SyncError detectConflicts();
    void applyAction(const SyncQueueItem &item, ResolvedAction action);
    void acceptServerValue(const RemoteRecord &remote);

    SyncSessionResult continueSession();
    SyncSessionResult downloadAndFinalize();
    SyncError runUploads(bool &cancelled);
    SyncError runDownload();

    SyncSessionResult finish(SessionState state, const SyncError &error = SyncError());
    SyncSessionResult fail(const SyncError &error);

    LocalStore *m_store = nullptr;
    RemoteDataService *m_remote = nullptr;
    SessionProvider *m_sessionProvider = nullptr;
    ConnectivityMonitor *m_monitor = nullptr;

    RetryQueue *m_queue = nullptr;
    SyncCheckpoint *m_checkpoint = nullptr;

    QString m_stateDirectory;
    bool m_hasDefaultStrategy = false;
    ResolutionStrategy m_defaultStrategy = ResolutionStrategy::Skip;
    bool m_downloadEnabled = true;
    bool m_autoSync = false;
    int m_monitorSubscription = -1;

    ResolutionHandler m_resolutionHandler;
    ProgressCallback m_progressCallback;
    ProgressChannel m_progressChannel;
    CancellationToken m_cancel;

    std::atomic<bool> m_active{false};
    std::atomic<SessionState> m_state{SessionState::Idle};

    // Guards the AwaitingResolution hand-off between supplyResolution() and cancel()
    QMutex m_handoffMutex;

    // Per-session state
    bool m_downloadOnly = false;
    RecordFilter m_filter;
    SyncSessionResult m_session;
    TransferParameters m_params;
    QList<SyncQueueItem> m_uploadList;
    QList<ConflictRecord> m_pendingConflicts;
    QMap<QString, SyncQueueItem> m_conflictItems;
    QMap<QString, RemoteRecord> m_remoteState;

    SyncSessionResult m_lastResult;
};

} // namespace FieldSync

#endif // SYNCORCHESTRATOR_H
