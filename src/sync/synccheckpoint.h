#ifndef SYNCCHECKPOINT_H
#define SYNCCHECKPOINT_H

#include <QObject>
#include <QString>
#include <QDateTime>

namespace FieldSync {

/**
 * @brief Persistent per-installation sync cursor
 *
 * State is stored in:
 *   <stateDir>/
 *     └── checkpoint.json  - download cursor and last successful session
 */
class SyncCheckpoint : public QObject
{
    Q_OBJECT

public:
    explicit SyncCheckpoint(QObject *parent = nullptr);

    /**
     * @brief Remote time of the newest record seen by a download pass
     *
     * Passed as "since" to the next download; invalid means full download.
     */
    QDateTime lastDownloadTime() const { return m_lastDownloadTime; }
    void setLastDownloadTime(const QDateTime &time);

    QDateTime lastSuccessfulSync() const { return m_lastSuccessfulSync; }
    void setLastSuccessfulSync(const QDateTime &time);

    bool isFirstSync() const { return !m_lastSuccessfulSync.isValid(); }

    // ========== Persistence ==========

    /**
     * @brief Load from disk
     * @return true if loaded (or no previous checkpoint exists)
     */
    bool load();
    bool save();
    void clear();

    void setStateDirectory(const QString &dir) { m_stateDir = dir; }
    QString stateDirectory() const { return m_stateDir; }
    QString checkpointFilePath() const;

signals:
    void stateChanged();
    void errorOccurred(const QString &error);

private:
    QString m_stateDir;
    QDateTime m_lastDownloadTime;
    QDateTime m_lastSuccessfulSync;
};

} // namespace FieldSync

#endif // SYNCCHECKPOINT_H
