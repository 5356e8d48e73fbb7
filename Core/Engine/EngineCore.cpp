#include "EngineCore.h"

#include <QDebug>
#include <QDir>
#include <QProcess>
#include <QThread>

namespace STC::Core::Engine
{
EngineCore::EngineCore(Protocol::IProtocolEngineFactory *factory, ITaskDoneHandler *doneHandler, QObject *parent)
    : QObject(parent)
    , m_factory(factory)
    , m_doneHandler(doneHandler)
    , m_config(std::make_shared<const EngineConfig>())
    , m_shutdown(std::make_shared<Latch>())
    , m_asyncPool(new QThreadPool(this))
{
    m_asyncPool->setObjectName(QStringLiteral("EngineCore m_asyncPool"));
}

EngineCore::~EngineCore()
{
    shutdown();
    m_asyncPool->waitForDone();
}

void EngineCore::setTimings(const EngineTimings &timings)
{
    QWriteLocker locker(&m_engineLock);
    m_timings = timings;
}

EngineTimings EngineCore::timings() const
{
    QReadLocker locker(&m_engineLock);
    return m_timings;
}

// ==================== Reconfiguration ====================

OperationResult EngineCore::configure(const EngineConfig &config)
{
    QString error;
    if (!config.validate(&error)) {
        qWarning().noquote() << "[Engine] configure rejected:" << error;
        return OperationResult::failure(ErrorCode::InvalidConfig, error);
    }

    if (!m_factory) {
        return OperationResult::failure(ErrorCode::EngineConstructionFailed,
                                        QStringLiteral("No protocol engine factory"));
    }

    QWriteLocker locker(&m_engineLock);

    if (m_protocol) {
        teardownLocked(true);
        qInfo().noquote() << "[Engine] configure: old protocol engine closed";
        if (m_timings.settleDelayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_timings.settleDelayMs));
        }
    }

    // The listen port of the old engine may take a while to free up.
    std::unique_ptr<Protocol::IProtocolEngine> protocol;
    const int attempts = qMax(1, m_timings.rebuildAttempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        error.clear();
        protocol = m_factory->construct(config, &error);
        if (protocol) {
            break;
        }

        qWarning().noquote() << QStringLiteral("[Engine] configure attempt %1/%2 failed: %3")
                                    .arg(attempt)
                                    .arg(attempts)
                                    .arg(error);
        if (attempt < attempts && m_timings.rebuildDelayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_timings.rebuildDelayMs));
        }
    }

    if (!protocol) {
        return OperationResult::failure(ErrorCode::EngineConstructionFailed,
                                        QStringLiteral("Failed to construct protocol engine: %1").arg(error));
    }

    m_protocol = std::move(protocol);
    m_shutdown = std::make_shared<Latch>();

    m_cache.setDirectory(QDir(config.downloadDirectory).filePath(Cache::ResumeCache::defaultDirName()));
    if (!m_cache.ensureDirectory(&error)) {
        qWarning().noquote() << "[Engine] resume cache unavailable:" << error;
    }

    m_waitList.setMaxConcurrent(config.maxConcurrentTask);
    m_config = std::make_shared<const EngineConfig>(config);

    qInfo().noquote() << "[Engine] configured, port" << config.incomingPort << "dir" << config.downloadDirectory
                      << "max tasks" << config.maxConcurrentTask;
    notifyChanged();
    if (m_waitList.size() > 0) {
        dispatch([this]() { admitNextWaiting(); });
    }
    return OperationResult::success();
}

void EngineCore::teardownLocked(bool keepQueued)
{
    if (!m_protocol) {
        return;
    }

    m_shutdown->fire();

    // Queued tasks own no protocol handle, so they can outlive the engine.
    QList<std::shared_ptr<Task::Task>> tasks;
    {
        QMutexLocker table(&m_tableMutex);
        for (auto it = m_tasks.begin(); it != m_tasks.end();) {
            if (keepQueued && it.value()->isQueued()) {
                ++it;
                continue;
            }
            tasks.append(it.value());
            it = m_tasks.erase(it);
        }
        m_active.clear();
    }
    if (!keepQueued) {
        m_waitList.clear();
    }

    for (const auto &task : tasks) {
        task->dropSignal()->fire();
    }

    joinWorkers();

    m_protocol->close();
    m_protocol.reset();
}

void EngineCore::shutdown()
{
    QWriteLocker locker(&m_engineLock);
    if (!m_protocol) {
        return;
    }

    teardownLocked(false);
    qInfo().noquote() << "[Engine] shutdown complete";
    notifyChanged();
}

bool EngineCore::isConfigured() const
{
    QReadLocker locker(&m_engineLock);
    return m_protocol != nullptr;
}

EngineConfig EngineCore::config() const
{
    QReadLocker locker(&m_engineLock);
    return *m_config;
}

// ==================== Adding tasks ====================

OperationResult EngineCore::addMagnet(const QString &magnetUri)
{
    qInfo().noquote() << "[Engine] add magnet:" << magnetUri;

    Descriptor::TaskDescriptor descriptor;
    const OperationResult parsed = Descriptor::TaskDescriptor::fromMagnet(magnetUri, descriptor);
    if (!parsed.ok) {
        return parsed;
    }

    return submit(descriptor, true);
}

OperationResult EngineCore::addMetainfo(const QByteArray &data)
{
    Descriptor::TaskDescriptor descriptor;
    const OperationResult parsed = Descriptor::TaskDescriptor::fromMetainfo(data, descriptor);
    if (!parsed.ok) {
        return parsed;
    }

    return submit(descriptor, true);
}

OperationResult EngineCore::addMetainfoFile(const QString &path)
{
    Descriptor::TaskDescriptor descriptor;
    const OperationResult parsed = Descriptor::TaskDescriptor::fromMetainfoFile(path, descriptor);
    if (!parsed.ok) {
        qWarning().noquote() << "[Engine]" << parsed.error;
        return parsed;
    }

    return submit(descriptor, true);
}

OperationResult EngineCore::addDescriptor(const Descriptor::TaskDescriptor &descriptor)
{
    if (!Descriptor::TaskDescriptor::isValidInfoHash(descriptor.infoHash)) {
        return OperationResult::failure(ErrorCode::MalformedDescriptor,
                                        QStringLiteral("Invalid infohash: %1").arg(descriptor.infoHash));
    }

    return submit(descriptor, true);
}

int EngineCore::restoreFromCache()
{
    int restored = 0;
    const QStringList hashes = m_cache.infoHashes();
    for (const QString &hash : hashes) {
        Descriptor::TaskDescriptor descriptor;
        QString error;
        if (!m_cache.load(hash, descriptor, &error)) {
            qWarning().noquote() << "[Engine] skip resume record" << hash << error;
            continue;
        }

        const OperationResult result = submit(descriptor, false);
        if (result.ok || result.code == ErrorCode::MaxConcurrentReached) {
            ++restored;
        } else {
            qWarning().noquote() << "[Engine] restore failed" << hash << result.error;
        }
    }

    qInfo().noquote() << "[Engine] restored" << restored << "of" << hashes.size() << "cached tasks";
    return restored;
}

OperationResult EngineCore::submit(const Descriptor::TaskDescriptor &descriptor, bool persist)
{
    const QString &hash = descriptor.infoHash;

    QMutexLocker admission(&m_admissionMutex);
    QReadLocker locker(&m_engineLock);

    if (!m_protocol) {
        return OperationResult::failure(ErrorCode::NotConfigured, QStringLiteral("Engine is not configured"));
    }

    {
        QMutexLocker table(&m_tableMutex);
        if (m_active.contains(hash)) {
            return OperationResult::failure(ErrorCode::AlreadyExists,
                                            QStringLiteral("Task already exists: %1").arg(hash));
        }
    }

    if (m_waitList.contains(hash)) {
        qInfo().noquote() << "[Engine] task already in wait list:" << hash;
        return OperationResult::failure(ErrorCode::AlreadyExists,
                                        QStringLiteral("Task already exists: %1").arg(hash));
    }

    if (persist) {
        QString error;
        if (!m_cache.save(descriptor, &error)) {
            qWarning().noquote() << "[Engine] failed to write resume record" << hash << error;
        }
    }

    if (!m_waitList.isReady(activeCountLocked())) {
        const OperationResult queued = m_waitList.enqueue(hash, descriptor.kind);
        if (!queued.ok) {
            return queued;
        }

        {
            QMutexLocker table(&m_tableMutex);
            if (!m_tasks.contains(hash)) {
                m_tasks.insert(hash, std::make_shared<Task::Task>(hash, descriptor.displayName, descriptor.kind));
            }
        }

        qInfo().noquote() << QStringLiteral("[Engine] reached max task %1, add as pretask: %2 %3")
                                 .arg(m_config->maxConcurrentTask)
                                 .arg(hash, Descriptor::taskKindName(descriptor.kind));
        notifyChanged();
        return OperationResult::failure(ErrorCode::MaxConcurrentReached,
                                        QStringLiteral("Max concurrent task reached"));
    }

    return admitLocked(descriptor);
}

OperationResult EngineCore::admitLocked(const Descriptor::TaskDescriptor &descriptor)
{
    const QString &hash = descriptor.infoHash;

    std::shared_ptr<Task::Task> task;
    {
        QMutexLocker table(&m_tableMutex);
        task = m_tasks.value(hash);
        if (!task) {
            task = std::make_shared<Task::Task>(hash, descriptor.displayName, descriptor.kind);
            m_tasks.insert(hash, task);
        }
    }

    QString error;
    std::shared_ptr<Protocol::IProtocolTask> protocolTask = m_protocol->addTask(descriptor, &error);
    if (!protocolTask) {
        {
            QMutexLocker table(&m_tableMutex);
            m_tasks.remove(hash);
        }
        qWarning().noquote() << "[Engine] protocol engine rejected" << hash << error;
        notifyChanged();
        return OperationResult::failure(ErrorCode::ProtocolError,
                                        QStringLiteral("Failed to add task %1: %2").arg(hash, error));
    }

    const QStringList &publicTrackers = m_config->trackers;
    if (!publicTrackers.isEmpty() && (m_config->alwaysAddTrackers || descriptor.trackers.isEmpty())) {
        protocolTask->addTrackers(publicTrackers);
        qInfo().noquote() << "[Engine] added" << publicTrackers.size() << "public trackers to" << hash;
    }

    task->attach(protocolTask);
    {
        QMutexLocker table(&m_tableMutex);
        m_active.insert(hash);
    }

    spawnWorker(task, protocolTask);

    qInfo().noquote() << "[Engine] admitted" << hash << descriptor.displayName;
    notifyChanged();
    return OperationResult::success();
}

void EngineCore::admitNextWaiting()
{
    QMutexLocker admission(&m_admissionMutex);
    QReadLocker locker(&m_engineLock);

    if (!m_protocol) {
        return;
    }

    while (m_waitList.isReady(activeCountLocked())) {
        Queue::WaitEntry entry;
        if (!m_waitList.dequeueNext(entry).ok) {
            return;
        }

        Descriptor::TaskDescriptor descriptor;
        QString error;
        if (!m_cache.load(entry.infoHash, descriptor, &error)) {
            qWarning().noquote() << "[Engine] cannot admit queued task" << entry.infoHash << error;
            {
                QMutexLocker table(&m_tableMutex);
                m_tasks.remove(entry.infoHash);
            }
            notifyChanged();
            continue;
        }

        qInfo().noquote() << "[Engine] admitting queued task" << entry.infoHash;
        const OperationResult result = admitLocked(descriptor);
        if (!result.ok) {
            qWarning().noquote() << "[Engine] queued task admission failed:" << result.error;
        }
    }
}

// ==================== Workers ====================

void EngineCore::spawnWorker(const std::shared_ptr<Task::Task> &task,
                             const std::shared_ptr<Protocol::IProtocolTask> &protocolTask)
{
    auto worker = std::make_unique<Task::TaskWorker>(this, task, protocolTask, m_shutdown, m_config,
                                                     m_timings.tickIntervalMs);
    worker->start();

    QMutexLocker locker(&m_workersMutex);
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if ((*it)->isFinished()) {
            (*it)->wait();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
    m_workers.push_back(std::move(worker));
}

void EngineCore::joinWorkers()
{
    std::vector<std::unique_ptr<Task::TaskWorker>> workers;
    {
        QMutexLocker locker(&m_workersMutex);
        workers.swap(m_workers);
    }

    for (auto &worker : workers) {
        worker->wait();
    }
}

// ==================== Task operations ====================

std::shared_ptr<Task::Task> EngineCore::findTask(const QString &infoHash) const
{
    QMutexLocker table(&m_tableMutex);
    return m_tasks.value(infoHash);
}

std::shared_ptr<Latch> EngineCore::taskDropSignal(const QString &infoHash) const
{
    const std::shared_ptr<Task::Task> task = findTask(infoHash);
    return task ? task->dropSignal() : nullptr;
}

int EngineCore::activeCountLocked() const
{
    QMutexLocker table(&m_tableMutex);
    return int(m_active.size());
}

OperationResult EngineCore::startTask(const QString &infoHash)
{
    qInfo().noquote() << "[Engine] start task" << infoHash;

    const auto task = findTask(infoHash);
    if (!task) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task not found: %1").arg(infoHash));
    }

    const OperationResult result = task->start(false);
    if (result.ok) {
        notifyChanged();
    }
    return result;
}

OperationResult EngineCore::manualStartTask(const QString &infoHash)
{
    qInfo().noquote() << "[Engine] manual start task" << infoHash;

    const auto task = findTask(infoHash);
    if (!task) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task not found: %1").arg(infoHash));
    }

    const OperationResult result = task->start(true);
    if (result.ok) {
        notifyChanged();
    }
    return result;
}

OperationResult EngineCore::stopTask(const QString &infoHash)
{
    qInfo().noquote() << "[Engine] stop task" << infoHash;

    const auto task = findTask(infoHash);
    if (!task) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task not found: %1").arg(infoHash));
    }

    const OperationResult result = task->stop();
    if (result.ok) {
        notifyChanged();
    }
    return result;
}

OperationResult EngineCore::deleteTask(const QString &infoHash)
{
    qInfo().noquote() << "[Engine] delete task" << infoHash;

    QMutexLocker admission(&m_admissionMutex);

    // An active task keeps its slot until its worker has dropped the protocol handle.
    std::shared_ptr<Task::Task> task;
    {
        QMutexLocker table(&m_tableMutex);
        task = m_tasks.take(infoHash);
    }

    if (!task) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task not found: %1").arg(infoHash));
    }

    if (task->isQueued()) {
        m_waitList.remove(infoHash);
    }
    task->markDeleted();
    task->dropSignal()->fire();

    // Drop latch must be fired before the record is purged.
    QString error;
    if (!m_cache.remove(infoHash, &error)) {
        qWarning().noquote() << "[Engine] failed to purge resume record" << infoHash << error;
    }

    notifyChanged();
    return OperationResult::success();
}

void EngineCore::releaseSlot(const QString &infoHash)
{
    {
        QMutexLocker table(&m_tableMutex);
        m_active.remove(infoHash);
    }

    notifyChanged();
    dispatch([this]() { admitNextWaiting(); });
}

OperationResult EngineCore::startFile(const QString &infoHash, const QString &filePath)
{
    const auto task = findTask(infoHash);
    if (!task) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task not found: %1").arg(infoHash));
    }

    const OperationResult result = task->startFile(filePath);
    if (result.ok) {
        notifyChanged();
    }
    return result;
}

OperationResult EngineCore::stopFile(const QString &infoHash, const QString &filePath)
{
    const auto task = findTask(infoHash);
    if (!task) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task not found: %1").arg(infoHash));
    }

    bool allStopped = false;
    const OperationResult result = task->stopFile(filePath, &allStopped);
    if (!result.ok) {
        return result;
    }

    if (allStopped) {
        qInfo().noquote() << "[Engine] last file stopped, stopping task" << infoHash;
        dispatch([this, infoHash]() {
            const OperationResult stopped = stopTask(infoHash);
            if (!stopped.ok) {
                qDebug().noquote() << "[Engine] cascaded stop skipped" << infoHash << stopped.error;
            }
        });
    }

    notifyChanged();
    return result;
}

bool EngineCore::removeCache(const QString &infoHash, QString *errorString)
{
    return m_cache.remove(infoHash, errorString);
}

// ==================== Queries ====================

QVector<Task::TaskInfo> EngineCore::tasks() const
{
    QList<std::shared_ptr<Task::Task>> entries;
    {
        QMutexLocker table(&m_tableMutex);
        entries = m_tasks.values();
    }

    QVector<Task::TaskInfo> infos;
    infos.reserve(entries.size());
    for (const auto &task : entries) {
        infos.append(task->snapshot());
    }
    return infos;
}

bool EngineCore::taskInfo(const QString &infoHash, Task::TaskInfo &outInfo) const
{
    const auto task = findTask(infoHash);
    if (!task) {
        return false;
    }

    outInfo = task->snapshot();
    return true;
}

QVector<Queue::WaitEntry> EngineCore::waitingTasks() const
{
    return m_waitList.entries();
}

int EngineCore::activeTaskCount() const
{
    return activeCountLocked();
}

QString EngineCore::cacheDirectory() const
{
    return m_cache.directory();
}

ChangeNotifier *EngineCore::changes()
{
    return &m_changes;
}

// ==================== Async helpers ====================

void EngineCore::dispatch(std::function<void()> job)
{
    m_asyncPool->start(std::move(job));
}

void EngineCore::dispatchTaskDone(const TaskDoneEvent &event)
{
    if (!m_doneHandler) {
        return;
    }

    dispatch([handler = m_doneHandler, event]() {
        QStringList commands;
        QString error;
        if (!handler->onTaskDone(event, &commands, &error)) {
            qWarning().noquote() << "[Engine] done handler failed for" << event.infoHash << error;
            return;
        }

        for (const QString &command : commands) {
            QStringList args = QProcess::splitCommand(command);
            if (args.isEmpty()) {
                continue;
            }
            const QString program = args.takeFirst();
            if (!QProcess::startDetached(program, args)) {
                qWarning().noquote() << "[Engine] failed to launch done command:" << command;
            }
        }
    });
}

void EngineCore::notifyChanged()
{
    if (m_changes.notify()) {
        emit tasksChanged();
    }
}
} // namespace STC::Core::Engine
