#ifndef HTTPQUALITYPROBE_H
#define HTTPQUALITYPROBE_H

#include <QUrl>
#include <QByteArray>
#include <QNetworkAccessManager>
#include "qualityprobe.h"

class QNetworkReply;

namespace FieldSync {

/**
 * @brief Quality probe backed by plain HTTP requests
 *
 * Latency is the round-trip of a HEAD request to the probe URL; bandwidth
 * is estimated from a GET of the same URL, which should serve a small
 * payload (a few KB). Both requests share one timeout. Any network error,
 * HTTP error status or timeout produces an unreachable sample.
 *
 * The probe blocks the calling thread in a local event loop; run it on the
 * monitor's thread, not the UI thread.
 */
class HttpQualityProbe : public QualityProbe
{
public:
    explicit HttpQualityProbe(const QUrl &url, int timeoutMs = 15000);
    ~HttpQualityProbe() override = default;

    NetworkQualitySample probe() override;

    QUrl url() const { return m_url; }
    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }

private:
    /**
     * @brief Run one request to completion or timeout
     * @return true if the request finished with a 2xx/3xx status
     */
    bool runRequest(bool headOnly, qint64 &elapsedMs, QByteArray &body);

    QUrl m_url;
    int m_timeoutMs;
    QNetworkAccessManager m_networkManager;
};

} // namespace FieldSync

#endif // HTTPQUALITYPROBE_H
