#include "WaitList.h"

#include <QDebug>

namespace STC::Core::Queue
{
WaitList::WaitList(int maxConcurrent)
    : m_maxConcurrent(qMax(0, maxConcurrent))
{
}

void WaitList::setMaxConcurrent(int maxConcurrent)
{
    QMutexLocker locker(&m_mutex);
    m_maxConcurrent = qMax(0, maxConcurrent);
}

int WaitList::maxConcurrent() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxConcurrent;
}

bool WaitList::isReady(int activeCount) const
{
    QMutexLocker locker(&m_mutex);
    return m_maxConcurrent <= 0 || activeCount < m_maxConcurrent;
}

OperationResult WaitList::enqueue(const QString &infoHash, Descriptor::TaskKind kind)
{
    QMutexLocker locker(&m_mutex);

    for (const auto &entry : m_queue) {
        if (entry.infoHash == infoHash) {
            return OperationResult::failure(ErrorCode::AlreadyExists,
                                            QStringLiteral("Task already exists: %1").arg(infoHash));
        }
    }

    WaitEntry entry;
    entry.infoHash = infoHash;
    entry.kind = kind;
    m_queue.enqueue(entry);

    qInfo().noquote() << "[WaitList] queued" << infoHash << "position" << m_queue.size();
    return OperationResult::success();
}

OperationResult WaitList::dequeueNext(WaitEntry &outEntry)
{
    QMutexLocker locker(&m_mutex);

    if (m_queue.isEmpty()) {
        return OperationResult::failure(ErrorCode::WaitListEmpty, QStringLiteral("Wait list empty"));
    }

    outEntry = m_queue.dequeue();
    return OperationResult::success();
}

void WaitList::remove(const QString &infoHash)
{
    QMutexLocker locker(&m_mutex);

    for (auto it = m_queue.begin(); it != m_queue.end(); ++it) {
        if (it->infoHash == infoHash) {
            m_queue.erase(it);
            return;
        }
    }
}

bool WaitList::contains(const QString &infoHash) const
{
    QMutexLocker locker(&m_mutex);

    for (const auto &entry : m_queue) {
        if (entry.infoHash == infoHash) {
            return true;
        }
    }

    return false;
}

QVector<WaitEntry> WaitList::entries() const
{
    QMutexLocker locker(&m_mutex);
    return QVector<WaitEntry>(m_queue.cbegin(), m_queue.cend());
}

int WaitList::size() const
{
    QMutexLocker locker(&m_mutex);
    return int(m_queue.size());
}

void WaitList::clear()
{
    QMutexLocker locker(&m_mutex);
    m_queue.clear();
}
} // namespace STC::Core::Queue
