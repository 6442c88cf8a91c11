#include "syncconfig.h"
#include "sync/syncorchestrator.h"
#include "sync/connectivitymonitor.h"
#include "sync/httpqualityprobe.h"
#include "sync/retryqueue.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QUrl>
#include <QDebug>

const int SyncConfig::DEFAULT_MAX_ATTEMPTS = 5;
const qint64 SyncConfig::DEFAULT_JITTER_MS = 250;
const QString SyncConfig::DEFAULT_STRATEGY = "ask";
const int SyncConfig::DEFAULT_SAMPLE_INTERVAL_MS = 15000;
const int SyncConfig::DEFAULT_WINDOW_SIZE = 5;
const int SyncConfig::DEFAULT_PROBE_TIMEOUT_MS = 15000;

SyncConfig::SyncConfig(const QString &dataDirectory)
    : m_dataDirectory(dataDirectory)
    , m_maxAttempts(DEFAULT_MAX_ATTEMPTS)
    , m_jitterMs(DEFAULT_JITTER_MS)
    , m_defaultStrategy(DEFAULT_STRATEGY)
    , m_sampleIntervalMs(DEFAULT_SAMPLE_INTERVAL_MS)
    , m_windowSize(DEFAULT_WINDOW_SIZE)
    , m_probeTimeoutMs(DEFAULT_PROBE_TIMEOUT_MS)
    , m_downloadEnabled(true)
    , m_autoSyncOnReconnect(false)
{
    if (!m_dataDirectory.isEmpty() && exists()) {
        load();
    }
}

void SyncConfig::setDataDirectory(const QString &path)
{
    m_dataDirectory = path;
}

bool SyncConfig::isValid() const
{
    if (m_dataDirectory.isEmpty()) {
        return false;
    }

    QFileInfo info(m_dataDirectory);
    return info.exists() && info.isDir() && info.isWritable();
}

bool SyncConfig::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Settings ==========

void SyncConfig::setMaxAttempts(int attempts)
{
    m_maxAttempts = qMax(1, attempts);
}

void SyncConfig::setJitterMs(qint64 jitterMs)
{
    m_jitterMs = qMax<qint64>(0, jitterMs);
}

void SyncConfig::setDefaultStrategy(const QString &strategy)
{
    m_defaultStrategy = strategy;
}

void SyncConfig::setSampleIntervalMs(int intervalMs)
{
    m_sampleIntervalMs = qMax(1, intervalMs);
}

void SyncConfig::setWindowSize(int size)
{
    m_windowSize = qMax(1, size);
}

void SyncConfig::setProbeUrl(const QString &url)
{
    m_probeUrl = url;
}

void SyncConfig::setProbeTimeoutMs(int timeoutMs)
{
    m_probeTimeoutMs = qMax(1, timeoutMs);
}

void SyncConfig::setDownloadEnabled(bool enabled)
{
    m_downloadEnabled = enabled;
}

void SyncConfig::setAutoSyncOnReconnect(bool enabled)
{
    m_autoSyncOnReconnect = enabled;
}

// ========== Persistence ==========

bool SyncConfig::load()
{
    QString configPath = configFilePath();
    if (configPath.isEmpty() || !QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    setMaxAttempts(settings.value("retry/maxAttempts", DEFAULT_MAX_ATTEMPTS).toInt());
    setJitterMs(settings.value("retry/jitterMs", DEFAULT_JITTER_MS).toLongLong());

    m_defaultStrategy = settings.value("conflicts/defaultStrategy", DEFAULT_STRATEGY).toString();

    setSampleIntervalMs(settings.value("connectivity/sampleIntervalMs", DEFAULT_SAMPLE_INTERVAL_MS).toInt());
    setWindowSize(settings.value("connectivity/windowSize", DEFAULT_WINDOW_SIZE).toInt());
    m_probeUrl = settings.value("connectivity/probeUrl", QString()).toString();
    setProbeTimeoutMs(settings.value("connectivity/probeTimeoutMs", DEFAULT_PROBE_TIMEOUT_MS).toInt());

    m_downloadEnabled = settings.value("session/downloadEnabled", true).toBool();
    m_autoSyncOnReconnect = settings.value("session/autoSyncOnReconnect", false).toBool();

    m_stateDirectory = settings.value("state/directory", QString()).toString();

    return settings.status() == QSettings::NoError;
}

bool SyncConfig::save()
{
    if (m_dataDirectory.isEmpty()) {
        return false;
    }

    QDir dir(m_dataDirectory);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    settings.setValue("retry/maxAttempts", m_maxAttempts);
    settings.setValue("retry/jitterMs", m_jitterMs);

    settings.setValue("conflicts/defaultStrategy", m_defaultStrategy);

    settings.setValue("connectivity/sampleIntervalMs", m_sampleIntervalMs);
    settings.setValue("connectivity/windowSize", m_windowSize);
    settings.setValue("connectivity/probeUrl", m_probeUrl);
    settings.setValue("connectivity/probeTimeoutMs", m_probeTimeoutMs);

    settings.setValue("session/downloadEnabled", m_downloadEnabled);
    settings.setValue("session/autoSyncOnReconnect", m_autoSyncOnReconnect);

    if (!m_stateDirectory.isEmpty()) {
        settings.setValue("state/directory", m_stateDirectory);
    } else {
        settings.remove("state/directory");
    }

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool SyncConfig::initialize()
{
    if (m_dataDirectory.isEmpty()) {
        return false;
    }

    QDir dir(m_dataDirectory);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    if (!QDir().mkpath(stateDirectoryPath())) {
        return false;
    }

    // Save default settings
    return save();
}

QString SyncConfig::configFilePath() const
{
    if (m_dataDirectory.isEmpty()) {
        return QString();
    }
    return QDir(m_dataDirectory).filePath("fieldsync.conf");
}

QString SyncConfig::stateDirectoryPath() const
{
    if (!m_stateDirectory.isEmpty()) {
        return m_stateDirectory;
    }
    if (m_dataDirectory.isEmpty()) {
        return QString();
    }
    return QDir(m_dataDirectory).filePath(".state");
}

void SyncConfig::setStateDirectoryPath(const QString &path)
{
    m_stateDirectory = path;
}

// ========== Wiring ==========

bool SyncConfig::apply(FieldSync::SyncOrchestrator &orchestrator) const
{
    FieldSync::RetryQueue *queue = orchestrator.retryQueue();
    queue->setMaxAttempts(m_maxAttempts);
    queue->setJitterMs(m_jitterMs);

    FieldSync::ResolutionStrategy strategy;
    if (FieldSync::resolutionStrategyFromString(m_defaultStrategy, strategy)) {
        orchestrator.setDefaultStrategy(strategy);
    } else {
        if (m_defaultStrategy.trimmed().toLower() != "ask") {
            qWarning() << "[SyncConfig] Unknown conflict strategy" << m_defaultStrategy << "- asking instead";
        }
        orchestrator.clearDefaultStrategy();
    }

    orchestrator.setDownloadEnabled(m_downloadEnabled);
    orchestrator.setAutoSyncOnReconnect(m_autoSyncOnReconnect);

    QString stateDir = stateDirectoryPath();
    if (stateDir.isEmpty()) {
        return true;  // In-memory queue
    }
    return orchestrator.setStateDirectory(stateDir);
}

void SyncConfig::configureMonitor(FieldSync::ConnectivityMonitor &monitor) const
{
    monitor.setWindowSize(m_windowSize);

    if (!m_probeUrl.isEmpty()) {
        QUrl url(m_probeUrl);
        if (url.isValid()) {
            monitor.setProbe(new FieldSync::HttpQualityProbe(url, m_probeTimeoutMs));
        } else {
            qWarning() << "[SyncConfig] Invalid probe URL:" << m_probeUrl;
        }
    }
}
