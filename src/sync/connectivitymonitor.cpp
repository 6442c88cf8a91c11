#include "connectivitymonitor.h"
#include "qualityprobe.h"

#include <QTimer>
#include <QMutexLocker>
#include <QDebug>

namespace FieldSync {

namespace {

// Tier thresholds over the window mean
const double EXCELLENT_MIN_KBPS = 5000.0;
const int EXCELLENT_MAX_LATENCY_MS = 100;
const double GOOD_MIN_KBPS = 1000.0;
const int GOOD_MAX_LATENCY_MS = 300;
const double FAIR_MIN_KBPS = 250.0;
const int FAIR_MAX_LATENCY_MS = 800;

} // namespace

ConnectivityMonitor::ConnectivityMonitor(QObject *parent)
    : QObject(parent)
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &ConnectivityMonitor::sampleNow);
}

ConnectivityMonitor::~ConnectivityMonitor()
{
    stop();
    delete m_probe;
}

void ConnectivityMonitor::setProbe(QualityProbe *probe)
{
    if (probe == m_probe) return;
    delete m_probe;
    m_probe = probe;
}

void ConnectivityMonitor::setWindowSize(int size)
{
    QMutexLocker locker(&m_mutex);
    m_windowSize = qMax(1, size);
    while (m_window.size() > m_windowSize) {
        m_window.removeFirst();
    }
}

int ConnectivityMonitor::windowSize() const
{
    QMutexLocker locker(&m_mutex);
    return m_windowSize;
}

QualityTier ConnectivityMonitor::currentQuality() const
{
    QMutexLocker locker(&m_mutex);
    return m_tier;
}

void ConnectivityMonitor::addSample(const NetworkQualitySample &sample)
{
    QualityTier newTier;
    bool changed = false;

    {
        QMutexLocker locker(&m_mutex);
        m_window.append(sample);
        while (m_window.size() > m_windowSize) {
            m_window.removeFirst();
        }

        newTier = classify(m_window);
        if (newTier != m_tier) {
            m_tier = newTier;
            changed = true;
        }
    }

    if (changed) {
        qDebug() << "[ConnectivityMonitor] Tier changed to" << toString(newTier);
        notify(newTier);
    }
}

int ConnectivityMonitor::subscribe(TierCallback callback)
{
    QMutexLocker locker(&m_mutex);
    int id = m_nextSubscriptionId++;
    m_subscribers[id] = callback;
    return id;
}

void ConnectivityMonitor::unsubscribe(int subscriptionId)
{
    QMutexLocker locker(&m_mutex);
    m_subscribers.remove(subscriptionId);
}

QualityTier ConnectivityMonitor::classify(const QList<NetworkQualitySample> &window)
{
    if (window.isEmpty() || !window.last().reachable) {
        return QualityTier::Offline;
    }

    double bandwidthSum = 0.0;
    qint64 latencySum = 0;
    int count = 0;

    for (const NetworkQualitySample &sample : window) {
        if (!sample.reachable) continue;
        bandwidthSum += sample.bandwidthKbps;
        latencySum += qMax(0, sample.latencyMs);
        count++;
    }

    // count >= 1 because the last sample is reachable
    double bandwidth = bandwidthSum / count;
    double latency = double(latencySum) / count;

    if (bandwidth >= EXCELLENT_MIN_KBPS && latency <= EXCELLENT_MAX_LATENCY_MS) {
        return QualityTier::Excellent;
    }
    if (bandwidth >= GOOD_MIN_KBPS && latency <= GOOD_MAX_LATENCY_MS) {
        return QualityTier::Good;
    }
    if (bandwidth >= FAIR_MIN_KBPS && latency <= FAIR_MAX_LATENCY_MS) {
        return QualityTier::Fair;
    }
    return QualityTier::Poor;
}

bool ConnectivityMonitor::isRunning() const
{
    return m_timer->isActive();
}

void ConnectivityMonitor::sampleNow()
{
    NetworkQualitySample sample;

    if (m_probe) {
        sample = m_probe->probe();
    } else {
        sample.reachable = false;
    }

    if (!sample.timestamp.isValid()) {
        sample.timestamp = QDateTime::currentDateTimeUtc();
    }

    addSample(sample);
}

void ConnectivityMonitor::start(int intervalMs)
{
    if (m_timer->isActive()) {
        m_timer->setInterval(intervalMs);
        return;
    }

    m_timer->start(intervalMs);
    qDebug() << "[ConnectivityMonitor] Started with interval:" << intervalMs << "ms";

    // First sample right away so the tier is not stale for a full interval
    sampleNow();
}

void ConnectivityMonitor::stop()
{
    if (!m_timer->isActive()) {
        return;
    }
    m_timer->stop();
    qDebug() << "[ConnectivityMonitor] Stopped";
}

void ConnectivityMonitor::notify(QualityTier tier)
{
    QList<TierCallback> callbacks;
    {
        QMutexLocker locker(&m_mutex);
        callbacks = m_subscribers.values();
    }

    for (const TierCallback &callback : callbacks) {
        if (callback) {
            callback(tier);
        }
    }

    emit qualityChanged(tier);
}

} // namespace FieldSync
