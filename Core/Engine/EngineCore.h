#pragma once

#include <QHash>
#include <QMutex>
#include <QObject>
#include <QReadWriteLock>
#include <QSet>
#include <QThreadPool>
#include <QVector>

#include <functional>
#include <memory>
#include <vector>

#include "../Cache/ResumeCache.h"
#include "../Common/ChangeNotifier.h"
#include "../Common/Errors.h"
#include "../Common/Latch.h"
#include "../Descriptor/TaskDescriptor.h"
#include "../EngineConfig.h"
#include "../Protocol/ProtocolEngine.h"
#include "../Queue/WaitList.h"
#include "../Task/Task.h"
#include "../Task/TaskWorker.h"
#include "TaskDoneHandler.h"

namespace STC::Core::Engine
{
struct EngineTimings
{
    int tickIntervalMs = 3000;
    int settleDelayMs = 3000;
    int rebuildAttempts = 10;
    int rebuildDelayMs = 3000;
};

/**
 * @brief Orchestrates task admission, state and protocol engine reconfiguration.
 *
 * Lock order: admission mutex, engine lock, table mutex or wait list, task
 * mutex. Task workers never take the engine lock, which lets configure()
 * join them while holding it exclusively.
 */
class EngineCore : public QObject
{
    Q_OBJECT

public:
    explicit EngineCore(Protocol::IProtocolEngineFactory *factory,
                        ITaskDoneHandler *doneHandler = nullptr,
                        QObject *parent = nullptr);
    ~EngineCore() override;

    void setTimings(const EngineTimings &timings);
    EngineTimings timings() const;

    OperationResult configure(const EngineConfig &config);
    bool isConfigured() const;
    EngineConfig config() const;
    void shutdown();

    OperationResult addMagnet(const QString &magnetUri);
    OperationResult addMetainfo(const QByteArray &data);
    OperationResult addMetainfoFile(const QString &path);
    OperationResult addDescriptor(const Descriptor::TaskDescriptor &descriptor);
    int restoreFromCache();

    OperationResult startTask(const QString &infoHash);
    OperationResult manualStartTask(const QString &infoHash);
    OperationResult stopTask(const QString &infoHash);
    OperationResult deleteTask(const QString &infoHash);
    OperationResult startFile(const QString &infoHash, const QString &filePath);
    OperationResult stopFile(const QString &infoHash, const QString &filePath);
    bool removeCache(const QString &infoHash, QString *errorString = nullptr);

    QVector<Task::TaskInfo> tasks() const;
    bool taskInfo(const QString &infoHash, Task::TaskInfo &outInfo) const;
    QVector<Queue::WaitEntry> waitingTasks() const;
    int activeTaskCount() const;
    QString cacheDirectory() const;

    // Fired when the task is deleted or its protocol engine is torn down. Null for unknown tasks.
    std::shared_ptr<Latch> taskDropSignal(const QString &infoHash) const;

    ChangeNotifier *changes();

signals:
    void tasksChanged();

private:
    friend class Task::TaskWorker;

    OperationResult submit(const Descriptor::TaskDescriptor &descriptor, bool persist);
    OperationResult admitLocked(const Descriptor::TaskDescriptor &descriptor);
    void admitNextWaiting();

    // Called by a worker once a deleted task's protocol handle is dropped.
    void releaseSlot(const QString &infoHash);

    // Stops every worker and closes the protocol engine. With keepQueued the
    // wait list and its placeholders survive for the next engine.
    void teardownLocked(bool keepQueued);
    void spawnWorker(const std::shared_ptr<Task::Task> &task,
                     const std::shared_ptr<Protocol::IProtocolTask> &protocolTask);
    void joinWorkers();

    std::shared_ptr<Task::Task> findTask(const QString &infoHash) const;
    int activeCountLocked() const;

    void dispatch(std::function<void()> job);
    void dispatchTaskDone(const TaskDoneEvent &event);
    void notifyChanged();

    Protocol::IProtocolEngineFactory *m_factory;
    ITaskDoneHandler *m_doneHandler;

    QMutex m_admissionMutex;

    mutable QReadWriteLock m_engineLock;
    std::unique_ptr<Protocol::IProtocolEngine> m_protocol;
    std::shared_ptr<const EngineConfig> m_config;
    std::shared_ptr<Latch> m_shutdown;
    EngineTimings m_timings;

    mutable QMutex m_tableMutex;
    QHash<QString, std::shared_ptr<Task::Task>> m_tasks;
    QSet<QString> m_active;

    Queue::WaitList m_waitList;
    Cache::ResumeCache m_cache;
    ChangeNotifier m_changes;

    QMutex m_workersMutex;
    std::vector<std::unique_ptr<Task::TaskWorker>> m_workers;

    QThreadPool *m_asyncPool;
};
} // namespace STC::Core::Engine
