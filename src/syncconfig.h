#ifndef SYNCCONFIG_H
#define SYNCCONFIG_H

#include <QString>

namespace FieldSync {
class SyncOrchestrator;
class ConnectivityMonitor;
}

/**
 * @brief Engine settings for one data directory
 *
 * Settings are stored in the data directory itself as fieldsync.conf (INI),
 * next to the local record store and the .state/ directory, so the whole
 * directory can be moved and the settings travel with it.
 */
class SyncConfig
{
public:
    /**
     * @brief Create a config for the given data directory
     *
     * Existing settings are loaded if the config file exists.
     */
    explicit SyncConfig(const QString &dataDirectory = QString());

    QString dataDirectory() const { return m_dataDirectory; }
    void setDataDirectory(const QString &path);

    // Check if the data directory exists and is writable
    bool isValid() const;

    // Check if the config file exists
    bool exists() const;

    // ========== Retry Settings ==========

    int maxAttempts() const { return m_maxAttempts; }
    void setMaxAttempts(int attempts);

    qint64 jitterMs() const { return m_jitterMs; }
    void setJitterMs(qint64 jitterMs);

    // ========== Conflict Settings ==========

    // "ask", "keep-local", "keep-server" or "skip"
    QString defaultStrategy() const { return m_defaultStrategy; }
    void setDefaultStrategy(const QString &strategy);

    // ========== Connectivity Settings ==========

    int sampleIntervalMs() const { return m_sampleIntervalMs; }
    void setSampleIntervalMs(int intervalMs);

    int windowSize() const { return m_windowSize; }
    void setWindowSize(int size);

    // Empty = no HTTP probe
    QString probeUrl() const { return m_probeUrl; }
    void setProbeUrl(const QString &url);

    int probeTimeoutMs() const { return m_probeTimeoutMs; }
    void setProbeTimeoutMs(int timeoutMs);

    // ========== Session Settings ==========

    bool downloadEnabled() const { return m_downloadEnabled; }
    void setDownloadEnabled(bool enabled);

    // Start a sync when the connection returns with uploads queued
    bool autoSyncOnReconnect() const { return m_autoSyncOnReconnect; }
    void setAutoSyncOnReconnect(bool enabled);

    // ========== Persistence ==========

    bool load();
    bool save();

    // Create the data and state directories and write a default config
    bool initialize();

    QString configFilePath() const;

    // Configured state directory, <data>/.state unless overridden
    QString stateDirectoryPath() const;
    void setStateDirectoryPath(const QString &path);

    // ========== Wiring ==========

    /**
     * @brief Push retry, conflict and session settings into an orchestrator
     *
     * Also points it at the state directory, which loads its queue.
     */
    bool apply(FieldSync::SyncOrchestrator &orchestrator) const;

    /**
     * @brief Set window size and, if a probe URL is configured, the HTTP probe
     */
    void configureMonitor(FieldSync::ConnectivityMonitor &monitor) const;

private:
    QString m_dataDirectory;
    QString m_stateDirectory;   // Empty = default under the data directory

    int m_maxAttempts;
    qint64 m_jitterMs;
    QString m_defaultStrategy;
    int m_sampleIntervalMs;
    int m_windowSize;
    QString m_probeUrl;
    int m_probeTimeoutMs;
    bool m_downloadEnabled;
    bool m_autoSyncOnReconnect;

    // Default values
    static const int DEFAULT_MAX_ATTEMPTS;
    static const qint64 DEFAULT_JITTER_MS;
    static const QString DEFAULT_STRATEGY;
    static const int DEFAULT_SAMPLE_INTERVAL_MS;
    static const int DEFAULT_WINDOW_SIZE;
    static const int DEFAULT_PROBE_TIMEOUT_MS;
};

#endif // SYNCCONFIG_H
