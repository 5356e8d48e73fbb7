#pragma once

#include <QMutex>
#include <QWaitCondition>

#include <atomic>
#include <memory>
#include <vector>

namespace STC::Core
{
/**
 * @brief Wake-up point shared by several latches.
 *
 * A waiter subscribes one Waker to every latch it cares about and then
 * blocks in wait(); any of the latches firing wakes it. A wake that
 * arrives while nobody waits is kept until the next wait().
 */
class Waker
{
public:
    void wake();

    // Returns true when woken, false on timeout. A negative timeout waits forever.
    bool wait(qint64 timeoutMs = -1);

private:
    QMutex m_mutex;
    QWaitCondition m_condition;
    bool m_pending = false;
};

/**
 * @brief One-shot broadcast signal.
 *
 * fire() is idempotent and is observed by any number of listeners without
 * being consumed.
 */
class Latch
{
public:
    Latch() = default;
    Latch(const Latch &) = delete;
    Latch &operator=(const Latch &) = delete;

    void fire();
    bool isFired() const;

    // Subscribing to an already fired latch wakes the waker immediately.
    // Wakers whose owners are gone are dropped on the next subscribe.
    void subscribe(const std::shared_ptr<Waker> &waker);

    // Wakers held by the latch, including expired ones not yet pruned.
    int subscriberCount() const;

    bool wait(qint64 timeoutMs = -1);

private:
    void pruneExpiredLocked();

    std::atomic<bool> m_fired { false };
    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    std::vector<std::weak_ptr<Waker>> m_wakers;
};
} // namespace STC::Core
