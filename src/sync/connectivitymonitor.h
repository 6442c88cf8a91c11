#ifndef CONNECTIVITYMONITOR_H
#define CONNECTIVITYMONITOR_H

#include <QObject>
#include <QList>
#include <QMap>
#include <QMutex>
#include <functional>
#include "synctypes.h"

class QTimer;

namespace FieldSync {

class QualityProbe;

/**
 * @brief Samples the network and classifies it into a quality tier
 *
 * The monitor keeps a short rolling window of NetworkQualitySamples and
 * derives the tier from the window mean. Subscribers are notified once per
 * actual tier change; samples that leave the tier unchanged produce no
 * notification.
 *
 * Sampling is driven by an internal QTimer, so the monitor can live on its
 * own thread (moveToThread) and keep sampling independently of a running
 * sync session. currentQuality() is safe to call from any thread.
 *
 * Usage:
 * @code
 * ConnectivityMonitor monitor;
 * monitor.setProbe(new HttpQualityProbe(QUrl("https://example.org/ping")));
 * monitor.subscribe([](QualityTier tier) { ... });
 * monitor.start(15000);
 * @endcode
 */
class ConnectivityMonitor : public QObject
{
    Q_OBJECT

public:
    using TierCallback = std::function<void(QualityTier)>;

    explicit ConnectivityMonitor(QObject *parent = nullptr);
    ~ConnectivityMonitor() override;

    /**
     * @brief Set the probe used by sampleNow()
     *
     * The monitor takes ownership of the probe.
     */
    void setProbe(QualityProbe *probe);

    /**
     * @brief Number of samples kept in the rolling window (minimum 1)
     */
    void setWindowSize(int size);
    int windowSize() const;

    /**
     * @brief Tier derived from the current window; Offline if empty
     */
    QualityTier currentQuality() const;

    /**
     * @brief Feed one sample into the window and re-evaluate the tier
     */
    void addSample(const NetworkQualitySample &sample);

    /**
     * @brief Register a tier-change callback
     * @return Subscription id for unsubscribe()
     */
    int subscribe(TierCallback callback);
    void unsubscribe(int subscriptionId);

    /**
     * @brief Classify a window of samples
     *
     * Deterministic: the same window always yields the same tier.
     */
    static QualityTier classify(const QList<NetworkQualitySample> &window);

    bool isRunning() const;

public slots:
    /**
     * @brief Take one sample with the probe (Offline sample if none is set)
     */
    void sampleNow();

    /**
     * @brief Start periodic sampling
     */
    void start(int intervalMs = 15000);
    void stop();

signals:
    void qualityChanged(FieldSync::QualityTier tier);

private:
    void notify(QualityTier tier);

    QualityProbe *m_probe = nullptr;
    QTimer *m_timer = nullptr;

    mutable QMutex m_mutex;
    QList<NetworkQualitySample> m_window;
    int m_windowSize = 5;
    QualityTier m_tier = QualityTier::Offline;

    QMap<int, TierCallback> m_subscribers;
    int m_nextSubscriptionId = 1;
};

} // namespace FieldSync

#endif // CONNECTIVITYMONITOR_H
