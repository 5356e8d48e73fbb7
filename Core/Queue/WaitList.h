#pragma once

#include <QMutex>
#include <QQueue>
#include <QString>
#include <QVector>

#include "../Common/Errors.h"
#include "../Descriptor/TaskDescriptor.h"

namespace STC::Core::Queue
{
struct WaitEntry
{
    QString infoHash;
    Descriptor::TaskKind kind = Descriptor::TaskKind::Magnet;
};

/**
 * @brief FIFO admission queue bounding concurrently active tasks.
 *
 * Holds its own mutex, never taken together with a task mutex.
 */
class WaitList
{
public:
    explicit WaitList(int maxConcurrent = 0);

    void setMaxConcurrent(int maxConcurrent);
    int maxConcurrent() const;

    // True when the limit is disabled or activeCount is below it.
    bool isReady(int activeCount) const;

    OperationResult enqueue(const QString &infoHash, Descriptor::TaskKind kind);
    OperationResult dequeueNext(WaitEntry &outEntry);
    void remove(const QString &infoHash);

    bool contains(const QString &infoHash) const;
    QVector<WaitEntry> entries() const;
    int size() const;
    void clear();

private:
    mutable QMutex m_mutex;
    QQueue<WaitEntry> m_queue;
    int m_maxConcurrent = 0;
};
} // namespace STC::Core::Queue
