#include "ChangeNotifier.h"

#include <QDeadlineTimer>

namespace STC::Core
{
bool ChangeNotifier::notify()
{
    QMutexLocker locker(&m_mutex);
    if (m_pending) {
        return false;
    }

    m_pending = true;
    m_condition.wakeAll();
    return true;
}

bool ChangeNotifier::tryTake()
{
    QMutexLocker locker(&m_mutex);
    const bool pending = m_pending;
    m_pending = false;
    return pending;
}

bool ChangeNotifier::wait(qint64 timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    while (!m_pending) {
        if (!m_condition.wait(&m_mutex, deadline)) {
            break;
        }
    }

    const bool pending = m_pending;
    m_pending = false;
    return pending;
}

bool ChangeNotifier::isPending() const
{
    QMutexLocker locker(&m_mutex);
    return m_pending;
}
} // namespace STC::Core
