#include "Latch.h"

#include <QDeadlineTimer>

#include <algorithm>

namespace STC::Core
{
void Waker::wake()
{
    QMutexLocker locker(&m_mutex);
    m_pending = true;
    m_condition.wakeAll();
}

bool Waker::wait(qint64 timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    while (!m_pending) {
        if (!m_condition.wait(&m_mutex, deadline)) {
            break;
        }
    }

    const bool woken = m_pending;
    m_pending = false;
    return woken;
}

void Latch::fire()
{
    std::vector<std::weak_ptr<Waker>> wakers;
    {
        QMutexLocker locker(&m_mutex);
        if (m_fired.exchange(true)) {
            return;
        }
        wakers.swap(m_wakers);
        m_condition.wakeAll();
    }

    for (const auto &weak : wakers) {
        if (auto waker = weak.lock()) {
            waker->wake();
        }
    }
}

bool Latch::isFired() const
{
    return m_fired.load();
}

void Latch::subscribe(const std::shared_ptr<Waker> &waker)
{
    if (!waker) {
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        if (!m_fired.load()) {
            pruneExpiredLocked();
            m_wakers.push_back(waker);
            return;
        }
    }

    waker->wake();
}

int Latch::subscriberCount() const
{
    QMutexLocker locker(&m_mutex);
    return int(m_wakers.size());
}

void Latch::pruneExpiredLocked()
{
    m_wakers.erase(std::remove_if(m_wakers.begin(), m_wakers.end(),
                                  [](const std::weak_ptr<Waker> &weak) { return weak.expired(); }),
                   m_wakers.end());
}

bool Latch::wait(qint64 timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    while (!m_fired.load()) {
        if (!m_condition.wait(&m_mutex, deadline)) {
            break;
        }
    }

    return m_fired.load();
}
} // namespace STC::Core
