#include "synccheckpoint.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace FieldSync {

SyncCheckpoint::SyncCheckpoint(QObject *parent)
    : QObject(parent)
{
}

void SyncCheckpoint::setLastDownloadTime(const QDateTime &time)
{
    m_lastDownloadTime = time;
    emit stateChanged();
}

void SyncCheckpoint::setLastSuccessfulSync(const QDateTime &time)
{
    m_lastSuccessfulSync = time;
    emit stateChanged();
}

QString SyncCheckpoint::checkpointFilePath() const
{
    if (m_stateDir.isEmpty()) {
        return QString();
    }
    return QDir(m_stateDir).filePath("checkpoint.json");
}

bool SyncCheckpoint::load()
{
    QString path = checkpointFilePath();
    if (path.isEmpty() || !QFile::exists(path)) {
        return true;  // First sync
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open checkpoint: %1").arg(path));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse checkpoint: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    m_lastDownloadTime = QDateTime::fromString(root["lastDownloadTime"].toString(), Qt::ISODateWithMs);
    m_lastSuccessfulSync = QDateTime::fromString(root["lastSuccessfulSync"].toString(), Qt::ISODateWithMs);

    qDebug() << "[SyncCheckpoint] Loaded, last sync:" << m_lastSuccessfulSync.toString(Qt::ISODate);
    return true;
}

bool SyncCheckpoint::save()
{
    if (m_stateDir.isEmpty()) {
        return true;
    }

    QDir dir(m_stateDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }

    QJsonObject root;
    root["version"] = 1;
    root["lastDownloadTime"] = m_lastDownloadTime.toString(Qt::ISODateWithMs);
    root["lastSuccessfulSync"] = m_lastSuccessfulSync.toString(Qt::ISODateWithMs);

    QSaveFile file(checkpointFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to write checkpoint: %1").arg(checkpointFilePath()));
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit checkpoint: %1").arg(file.errorString()));
        return false;
    }
    return true;
}

void SyncCheckpoint::clear()
{
    m_lastDownloadTime = QDateTime();
    m_lastSuccessfulSync = QDateTime();
    emit stateChanged();
}

} // namespace FieldSync
