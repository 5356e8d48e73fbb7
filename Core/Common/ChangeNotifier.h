#pragma once

#include <QMutex>
#include <QWaitCondition>

namespace STC::Core
{
/**
 * @brief Single-slot, best-effort "state changed" signal.
 *
 * notify() fills the slot and returns false when it was already full; the
 * extra notification is dropped. Observers take the slot with wait() or
 * tryTake() and then re-read the state they care about.
 */
class ChangeNotifier
{
public:
    bool notify();
    bool tryTake();
    bool wait(qint64 timeoutMs = -1);
    bool isPending() const;

private:
    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_pending = false;
};
} // namespace STC::Core
