#include "retryqueue.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QMutexLocker>
#include <QCryptographicHash>
#include <QDebug>
#include <algorithm>

namespace FieldSync {

RetryQueue::RetryQueue(QObject *parent)
    : QObject(parent)
    , m_random(QRandomGenerator::global()->generate())
{
}

// ========== Queue Operations ==========

bool RetryQueue::enqueue(const RecordKey &key, const QString &idempotencyKey)
{
    QString id = key.toString();
    bool created = false;
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);

        auto it = m_items.find(id);
        if (it != m_items.end() && it->state == QueueItemState::NeedsReview) {
            qDebug() << "[RetryQueue] Item awaits review, not re-queued:" << id;
            return false;
        }

        if (it != m_items.end() && !it->isTerminal()) {
            it->idempotencyKey = idempotencyKey;
        } else {
            SyncQueueItem item;
            item.key = key;
            item.enqueuedAt = QDateTime::currentDateTimeUtc();
            item.nextEligibleAt = item.enqueuedAt;
            item.sequence = m_nextSequence++;
            item.idempotencyKey = idempotencyKey;
            m_items.insert(id, item);
            created = true;
        }
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist queue after enqueue of %1").arg(id));
    }
    emit queueChanged();
    return created;
}

QList<SyncQueueItem> RetryQueue::nextEligibleBatch(const QDateTime &now, int maxItems) const
{
    QMutexLocker locker(&m_mutex);

    QList<SyncQueueItem> eligible;
    for (const SyncQueueItem &item : m_items) {
        if (item.state != QueueItemState::Pending) {
            continue;
        }
        if (item.nextEligibleAt.isValid() && item.nextEligibleAt > now) {
            continue;
        }
        eligible.append(item);
    }

    std::sort(eligible.begin(), eligible.end(),
              [](const SyncQueueItem &a, const SyncQueueItem &b) {
                  return a.sequence < b.sequence;
              });

    if (maxItems >= 0 && eligible.size() > maxItems) {
        eligible = eligible.mid(0, maxItems);
    }
    return eligible;
}

void RetryQueue::markInFlight(const QList<RecordKey> &keys)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        for (const RecordKey &key : keys) {
            auto it = m_items.find(key.toString());
            if (it != m_items.end() && it->state == QueueItemState::Pending) {
                it->state = QueueItemState::InFlight;
            }
        }
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred("Failed to persist in-flight marks");
    }
    emit queueChanged();
}

void RetryQueue::recordSuccess(const RecordKey &key)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_items.remove(key.toString())) {
            return;
        }
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist queue after upload of %1").arg(key.toString()));
    }
    emit queueChanged();
}

QueueItemState RetryQueue::recordFailure(const RecordKey &key, const SyncError &error,
                                         const QDateTime &now)
{
    QString id = key.toString();
    QueueItemState result;
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(id);
        if (it == m_items.end()) {
            return QueueItemState::Pending;
        }

        it->attemptCount++;
        it->lastError = error.toString();

        if (it->attemptCount >= m_maxAttempts) {
            it->state = QueueItemState::DeadLetter;
            qWarning() << "[RetryQueue] Dead letter after" << it->attemptCount
                       << "attempts:" << id << "-" << error.message;
        } else {
            qint64 jitter = 0;
            qint64 bound = effectiveJitterLocked();
            if (bound > 0) {
                jitter = static_cast<qint64>(m_random.bounded(static_cast<quint32>(bound) + 1));
            }
            qint64 delay = backoffDelay(it->attemptCount - 1, m_baseBackoffMs, m_maxBackoffMs, jitter);
            it->state = QueueItemState::Pending;
            it->nextEligibleAt = now.addMSecs(delay);
            qDebug() << "[RetryQueue] Retry" << id << "in" << delay << "ms (attempt"
                     << it->attemptCount << "of" << m_maxAttempts << ")";
        }

        result = it->state;
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist failure of %1").arg(id));
    }
    if (result == QueueItemState::DeadLetter) {
        emit itemDeadLettered(id);
    }
    emit queueChanged();
    return result;
}

void RetryQueue::release(const RecordKey &key)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(key.toString());
        if (it == m_items.end() || it->state != QueueItemState::InFlight) {
            return;
        }
        it->state = QueueItemState::Pending;
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist release of %1").arg(key.toString()));
    }
    emit queueChanged();
}

void RetryQueue::recordRejection(const RecordKey &key, const QString &reason)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(key.toString());
        if (it == m_items.end()) {
            return;
        }
        it->state = QueueItemState::Rejected;
        it->lastError = reason;
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist rejection of %1").arg(key.toString()));
    }
    emit queueChanged();
}

void RetryQueue::markNeedsReview(const RecordKey &key, const QString &reason)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(key.toString());
        if (it == m_items.end()) {
            return;
        }
        it->state = QueueItemState::NeedsReview;
        it->lastError = reason;
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist review mark of %1").arg(key.toString()));
    }
    emit queueChanged();
}

QList<SyncQueueItem> RetryQueue::deadLetters() const
{
    return itemsInState(QueueItemState::DeadLetter);
}

QList<SyncQueueItem> RetryQueue::itemsInState(QueueItemState state) const
{
    QMutexLocker locker(&m_mutex);
    QList<SyncQueueItem> result;
    for (const SyncQueueItem &item : m_items) {
        if (item.state == state) {
            result.append(item);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const SyncQueueItem &a, const SyncQueueItem &b) {
                  return a.sequence < b.sequence;
              });
    return result;
}

bool RetryQueue::retryDeadLetter(const RecordKey &key)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_items.find(key.toString());
        if (it == m_items.end() || !it->isTerminal()) {
            return false;
        }
        it->state = QueueItemState::Pending;
        it->attemptCount = 0;
        it->nextEligibleAt = QDateTime::currentDateTimeUtc();
        it->lastError.clear();
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist retry of %1").arg(key.toString()));
    }
    emit queueChanged();
    return true;
}

bool RetryQueue::discard(const RecordKey &key)
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_items.remove(key.toString())) {
            return false;
        }
        persisted = persistLocked();
    }

    if (!persisted) {
        emit errorOccurred(QString("Failed to persist discard of %1").arg(key.toString()));
    }
    emit queueChanged();
    return true;
}

bool RetryQueue::contains(const RecordKey &key) const
{
    QMutexLocker locker(&m_mutex);
    return m_items.contains(key.toString());
}

bool RetryQueue::item(const RecordKey &key, SyncQueueItem &out) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_items.constFind(key.toString());
    if (it == m_items.constEnd()) {
        return false;
    }
    out = it.value();
    return true;
}

int RetryQueue::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    int count = 0;
    for (const SyncQueueItem &item : m_items) {
        if (!item.isTerminal()) {
            count++;
        }
    }
    return count;
}

int RetryQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_items.size();
}

// ========== Backoff ==========

void RetryQueue::setBackoff(qint64 baseMs, qint64 maxMs)
{
    QMutexLocker locker(&m_mutex);
    m_baseBackoffMs = qMax<qint64>(0, baseMs);
    m_maxBackoffMs = qMax(m_baseBackoffMs, maxMs);
}

void RetryQueue::setMaxAttempts(int attempts)
{
    QMutexLocker locker(&m_mutex);
    m_maxAttempts = qMax(1, attempts);
}

void RetryQueue::setJitterMs(qint64 jitterMs)
{
    QMutexLocker locker(&m_mutex);
    m_jitterMs = qMax<qint64>(0, jitterMs);
}

void RetryQueue::setRandomSeed(quint32 seed)
{
    QMutexLocker locker(&m_mutex);
    m_random.seed(seed);
}

qint64 RetryQueue::effectiveJitterLocked() const
{
    // Jitter below the base keeps delay(k) <= delay(k+1)
    if (m_baseBackoffMs <= 0) {
        return 0;
    }
    return qMin(m_jitterMs, m_baseBackoffMs - 1);
}

qint64 RetryQueue::backoffDelay(int attempt, qint64 baseMs, qint64 maxMs, qint64 jitterMs)
{
    if (baseMs <= 0) {
        return qMax<qint64>(0, qMin(jitterMs, maxMs));
    }

    qint64 delay = baseMs;
    for (int i = 0; i < attempt && delay < maxMs; ++i) {
        delay *= 2;
    }
    if (delay >= maxMs) {
        return maxMs;
    }
    return qMin(delay + qMax<qint64>(0, jitterMs), maxMs);
}

QString RetryQueue::makeIdempotencyKey(const LocalRecord &record)
{
    QCryptographicHash hash(QCryptographicHash::Sha256);
    hash.addData(record.key.toString().toUtf8());
    hash.addData(QByteArray(1, '\0'));
    hash.addData(record.serverRevision.toUtf8());
    hash.addData(QByteArray(1, '\0'));
    hash.addData(record.value.toUtf8());
    return QString::fromLatin1(hash.result().toHex());
}

// ========== Persistence ==========

void RetryQueue::setStateDirectory(const QString &dir)
{
    QMutexLocker locker(&m_mutex);
    m_stateDir = dir;
}

QString RetryQueue::queueFilePath() const
{
    if (m_stateDir.isEmpty()) {
        return QString();
    }
    return QDir(m_stateDir).filePath("queue.json");
}

bool RetryQueue::load()
{
    QString path;
    {
        QMutexLocker locker(&m_mutex);
        path = queueFilePath();
    }
    if (path.isEmpty()) {
        return true;
    }

    QFile file(path);
    if (!file.exists()) {
        return true;  // Empty queue
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open queue file: %1").arg(path));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse queue file: %1").arg(parseError.errorString()));
        return false;
    }

    int recovered = 0;
    bool persisted = true;
    {
        QMutexLocker locker(&m_mutex);
        m_items.clear();

        QJsonObject root = doc.object();
        m_nextSequence = root["nextSequence"].toVariant().toLongLong();

        const QJsonArray items = root["items"].toArray();
        for (const QJsonValue &val : items) {
            SyncQueueItem item = itemFromJson(val.toObject());
            if (!item.key.isValid()) {
                continue;
            }
            // An upload interrupted by a crash is retried; the idempotency
            // key lets the remote drop the duplicate.
            if (item.state == QueueItemState::InFlight) {
                item.state = QueueItemState::Pending;
                recovered++;
            }
            m_nextSequence = qMax(m_nextSequence, item.sequence + 1);
            m_items.insert(item.key.toString(), item);
        }
        if (m_nextSequence < 1) {
            m_nextSequence = 1;
        }

        if (recovered > 0) {
            persisted = persistLocked();
        }
        qDebug() << "[RetryQueue] Loaded" << m_items.size() << "items,"
                 << recovered << "recovered from in-flight";
    }

    if (!persisted) {
        emit errorOccurred("Failed to persist recovered queue");
    }
    emit queueChanged();
    return true;
}

bool RetryQueue::save()
{
    bool persisted;
    {
        QMutexLocker locker(&m_mutex);
        persisted = persistLocked();
    }
    if (!persisted) {
        emit errorOccurred(QString("Failed to save queue: %1").arg(queueFilePath()));
    }
    return persisted;
}

bool RetryQueue::persistLocked()
{
    if (m_stateDir.isEmpty()) {
        return true;
    }

    QDir dir(m_stateDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        qWarning() << "[RetryQueue] Cannot create state directory:" << m_stateDir;
        return false;
    }

    QJsonArray items;
    for (const SyncQueueItem &item : m_items) {
        items.append(itemToJson(item));
    }

    QJsonObject root;
    root["version"] = 1;
    root["nextSequence"] = m_nextSequence;
    root["items"] = items;

    QSaveFile file(queueFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[RetryQueue] Cannot write:" << queueFilePath();
        return false;
    }
    file.write(QJsonDocument(root).toJson());
    if (!file.commit()) {
        qWarning() << "[RetryQueue] Commit failed:" << file.errorString();
        return false;
    }
    return true;
}

QJsonObject RetryQueue::itemToJson(const SyncQueueItem &item)
{
    QJsonObject obj;
    obj["key"] = item.key.toString();
    obj["attemptCount"] = item.attemptCount;
    obj["nextEligibleAt"] = item.nextEligibleAt.toString(Qt::ISODateWithMs);
    obj["enqueuedAt"] = item.enqueuedAt.toString(Qt::ISODateWithMs);
    obj["sequence"] = item.sequence;
    obj["lastError"] = item.lastError;
    obj["idempotencyKey"] = item.idempotencyKey;
    obj["state"] = toString(item.state);
    return obj;
}

SyncQueueItem RetryQueue::itemFromJson(const QJsonObject &json)
{
    SyncQueueItem item;
    item.key = RecordKey::fromString(json["key"].toString());
    item.attemptCount = json["attemptCount"].toInt();
    item.nextEligibleAt = QDateTime::fromString(json["nextEligibleAt"].toString(), Qt::ISODateWithMs);
    item.enqueuedAt = QDateTime::fromString(json["enqueuedAt"].toString(), Qt::ISODateWithMs);
    item.sequence = json["sequence"].toVariant().toLongLong();
    item.lastError = json["lastError"].toString();
    item.idempotencyKey = json["idempotencyKey"].toString();
    item.state = queueItemStateFromString(json["state"].toString());
    return item;
}

} // namespace FieldSync
