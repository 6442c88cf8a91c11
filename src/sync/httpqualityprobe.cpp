#include "httpqualityprobe.h"

#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QElapsedTimer>
#include <QTimer>
#include <QDebug>

namespace FieldSync {

HttpQualityProbe::HttpQualityProbe(const QUrl &url, int timeoutMs)
    : m_url(url)
    , m_timeoutMs(timeoutMs)
{
}

NetworkQualitySample HttpQualityProbe::probe()
{
    NetworkQualitySample sample;
    sample.timestamp = QDateTime::currentDateTimeUtc();
    sample.reachable = false;

    if (!m_url.isValid()) {
        qWarning() << "[HttpQualityProbe] Invalid probe URL:" << m_url.toString();
        return sample;
    }

    qint64 latencyMs = 0;
    QByteArray ignored;
    if (!runRequest(true, latencyMs, ignored)) {
        return sample;
    }

    qint64 transferMs = 0;
    QByteArray body;
    if (!runRequest(false, transferMs, body)) {
        return sample;
    }

    sample.reachable = true;
    sample.latencyMs = int(latencyMs);

    // Subtract one round-trip so the estimate reflects payload transfer time
    qint64 payloadMs = qMax<qint64>(1, transferMs - latencyMs);
    sample.bandwidthKbps = (double(body.size()) * 8.0) / double(payloadMs);

    qDebug() << "[HttpQualityProbe] latency:" << sample.latencyMs << "ms"
             << "bandwidth:" << sample.bandwidthKbps << "kbit/s"
             << "payload:" << body.size() << "bytes";
    return sample;
}

bool HttpQualityProbe::runRequest(bool headOnly, qint64 &elapsedMs, QByteArray &body)
{
    QNetworkRequest request(m_url);
    request.setHeader(QNetworkRequest::UserAgentHeader, "FieldSync/1.0");
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute,
                         QNetworkRequest::AlwaysNetwork);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    QElapsedTimer clock;
    clock.start();

    QNetworkReply *reply = headOnly ? m_networkManager.head(request)
                                    : m_networkManager.get(request);

    // Wait for completion with timeout
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    timeout.start(m_timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }
    elapsedMs = clock.elapsed();

    if (timeout.isActive()) {
        timeout.stop();
    } else if (!reply->isFinished()) {
        reply->abort();
        reply->deleteLater();
        qWarning() << "[HttpQualityProbe] Probe timed out after" << m_timeoutMs << "ms";
        return false;
    }

    if (reply->error() != QNetworkReply::NoError) {
        qWarning() << "[HttpQualityProbe] Probe failed:" << reply->errorString();
        reply->deleteLater();
        return false;
    }

    int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (SyncError::classifyHttpStatus(httpStatus) != SyncError::Kind::None) {
        qWarning() << "[HttpQualityProbe] Probe returned HTTP" << httpStatus;
        reply->deleteLater();
        return false;
    }

    if (!headOnly) {
        body = reply->readAll();
    }
    reply->deleteLater();
    return true;
}

} // namespace FieldSync
