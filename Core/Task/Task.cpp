#include "Task.h"

#include <QDebug>

namespace STC::Core::Task
{
QString taskStateName(TaskState state)
{
    switch (state) {
    case TaskState::Queued:
        return QStringLiteral("Queued");
    case TaskState::Pending:
        return QStringLiteral("Pending");
    case TaskState::Started:
        return QStringLiteral("Started");
    case TaskState::Stopped:
        return QStringLiteral("Stopped");
    case TaskState::Done:
        return QStringLiteral("Done");
    case TaskState::Deleted:
        return QStringLiteral("Deleted");
    }

    return QStringLiteral("Unknown");
}

Task::Task(const QString &infoHash, const QString &name, Descriptor::TaskKind kind)
    : m_infoHash(infoHash)
    , m_kind(kind)
    , m_dropSignal(std::make_shared<Latch>())
    , m_name(name.isEmpty() ? infoHash : name)
    , m_addedAt(QDateTime::currentDateTimeUtc())
{
}

void Task::attach(const std::shared_ptr<Protocol::IProtocolTask> &protocolTask)
{
    QMutexLocker locker(&m_mutex);
    m_protocolTask = protocolTask;
}

bool Task::isQueued() const
{
    QMutexLocker locker(&m_mutex);
    return !m_protocolTask;
}

TaskState Task::stateLocked() const
{
    if (m_deleted) {
        return TaskState::Deleted;
    }
    if (!m_protocolTask) {
        return TaskState::Queued;
    }
    if (!m_hasMetadata) {
        return TaskState::Pending;
    }
    if (m_started) {
        return TaskState::Started;
    }
    return m_done ? TaskState::Done : TaskState::Stopped;
}

Task::File *Task::findFileLocked(const QString &filePath)
{
    for (auto &file : m_files) {
        if (file.path == filePath) {
            return &file;
        }
    }
    return nullptr;
}

void Task::applyStartedLocked()
{
    m_protocolTask->allowUpload();
    m_protocolTask->allowDownload();

    for (const auto &file : m_files) {
        if (file.handle) {
            file.handle->setPriority(Protocol::FilePriority::Normal);
        }
    }
}

void Task::applyStoppedLocked()
{
    for (const auto &file : m_files) {
        if (file.handle) {
            file.handle->setPriority(Protocol::FilePriority::None);
        }
    }

    m_protocolTask->disallowUpload();
    m_protocolTask->disallowDownload();
}

void Task::updateOnMetadata()
{
    QMutexLocker locker(&m_mutex);
    if (m_deleted || !m_protocolTask) {
        return;
    }

    const QString protocolName = m_protocolTask->name();
    if (!protocolName.isEmpty()) {
        m_name = protocolName;
    }

    m_files.clear();
    const auto handles = m_protocolTask->files();
    for (const auto &handle : handles) {
        if (!handle) {
            continue;
        }
        File file;
        file.path = handle->path();
        file.length = handle->length();
        file.bytesCompleted = handle->bytesCompleted();
        file.done = file.bytesCompleted >= file.length;
        file.started = m_started;
        file.handle = handle;
        m_files.append(file);
    }

    m_hasMetadata = true;
    if (m_started) {
        applyStartedLocked();
    } else {
        applyStoppedLocked();
    }

    qInfo().noquote() << "[Task] metadata ready" << m_infoHash << m_name << "files:" << m_files.size();
}

OperationResult Task::start(bool manual)
{
    QMutexLocker locker(&m_mutex);

    if (m_deleted) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task deleted: %1").arg(m_infoHash));
    }
    if (!m_protocolTask) {
        return OperationResult::failure(ErrorCode::TaskQueued, QStringLiteral("Task is queued: %1").arg(m_infoHash));
    }
    if (m_started) {
        return OperationResult::failure(ErrorCode::AlreadyStarted, QStringLiteral("Already started"));
    }

    m_started = true;
    if (manual) {
        m_manualStarted = true;
    }
    m_startedAt = QDateTime::currentDateTimeUtc();
    for (auto &file : m_files) {
        file.started = true;
    }

    if (m_hasMetadata) {
        applyStartedLocked();
    }

    return OperationResult::success();
}

OperationResult Task::stop()
{
    QMutexLocker locker(&m_mutex);

    if (m_deleted) {
        return OperationResult::failure(ErrorCode::TaskNotFound, QStringLiteral("Task deleted: %1").arg(m_infoHash));
    }
    if (!m_protocolTask) {
        return OperationResult::failure(ErrorCode::TaskQueued, QStringLiteral("Task is queued: %1").arg(m_infoHash));
    }
    if (!m_started) {
        return OperationResult::failure(ErrorCode::AlreadyStopped, QStringLiteral("Already stopped"));
    }

    if (m_hasMetadata) {
        applyStoppedLocked();
    }

    m_started = false;
    m_stoppedAt = QDateTime::currentDateTimeUtc();
    for (auto &file : m_files) {
        file.started = false;
    }

    return OperationResult::success();
}

OperationResult Task::startFile(const QString &filePath)
{
    QMutexLocker locker(&m_mutex);

    File *file = findFileLocked(filePath);
    if (!file) {
        return OperationResult::failure(ErrorCode::MissingFile, QStringLiteral("Missing file %1").arg(filePath));
    }
    if (file->started) {
        return OperationResult::failure(ErrorCode::AlreadyStarted, QStringLiteral("already started"));
    }

    file->started = true;
    if (file->handle) {
        file->handle->setPriority(Protocol::FilePriority::Normal);
    }

    return OperationResult::success();
}

OperationResult Task::stopFile(const QString &filePath, bool *allFilesStopped)
{
    QMutexLocker locker(&m_mutex);

    File *file = findFileLocked(filePath);
    if (!file) {
        return OperationResult::failure(ErrorCode::MissingFile, QStringLiteral("Missing file %1").arg(filePath));
    }
    if (!file->started) {
        return OperationResult::failure(ErrorCode::AlreadyStopped, QStringLiteral("already stopped"));
    }

    file->started = false;
    if (file->handle) {
        file->handle->setPriority(Protocol::FilePriority::None);
    }

    if (allFilesStopped) {
        bool allStopped = true;
        for (const auto &other : m_files) {
            if (other.started) {
                allStopped = false;
                break;
            }
        }
        *allFilesStopped = allStopped;
    }

    return OperationResult::success();
}

void Task::updateFileStatusLocked()
{
    bool allDone = !m_files.isEmpty();
    for (auto &file : m_files) {
        if (!file.handle) {
            allDone = false;
            continue;
        }
        file.bytesCompleted = file.handle->bytesCompleted();
        file.done = file.bytesCompleted >= file.length;
        if (!file.done) {
            allDone = false;
        }
    }

    m_allFilesDone = allDone;
}

bool Task::updateTaskStatusLocked(const Protocol::TaskStats &stats)
{
    m_bytesCompleted = stats.bytesCompleted;
    m_totalLength = stats.totalLength;

    if (m_totalLength > 0 && m_bytesCompleted >= m_totalLength) {
        m_done = true;
        qInfo().noquote() << "[Task] done" << m_infoHash << m_name;
        return true;
    }

    return false;
}

void Task::updateConnStatLocked(const Protocol::TaskStats &stats, const QDateTime &now)
{
    if (m_lastConnStatAt.isValid()) {
        const qint64 elapsedMs = m_lastConnStatAt.msecsTo(now);
        if (elapsedMs > 0) {
            m_downloadRate = qMax<qint64>(0, (stats.bytesDownloaded - m_bytesDownloaded) * 1000 / elapsedMs);
            m_uploadRate = qMax<qint64>(0, (stats.bytesUploaded - m_bytesUploaded) * 1000 / elapsedMs);
        }
    }

    m_lastConnStatAt = now;
    m_bytesDownloaded = stats.bytesDownloaded;
    m_bytesUploaded = stats.bytesUploaded;
    m_activePeers = stats.activePeers;
    m_totalPeers = stats.totalPeers;
    m_connectedSeeders = stats.connectedSeeders;
    m_seedRatio = stats.seedRatio;
}

bool Task::refresh(const QDateTime &now)
{
    QMutexLocker locker(&m_mutex);
    if (m_deleted || !m_protocolTask || !m_hasMetadata) {
        return false;
    }

    const Protocol::TaskStats stats = m_protocolTask->stats();

    if (!m_allFilesDone) {
        updateFileStatusLocked();
    }

    bool becameDone = false;
    if (!m_done) {
        becameDone = updateTaskStatusLocked(stats);
    }

    updateConnStatLocked(stats, now);
    return becameDone;
}

void Task::markDeleted()
{
    QMutexLocker locker(&m_mutex);
    m_deleted = true;
}

TaskInfo Task::snapshot() const
{
    QMutexLocker locker(&m_mutex);

    TaskInfo info;
    info.infoHash = m_infoHash;
    info.name = m_name;
    info.kind = m_kind;
    info.state = stateLocked();
    info.hasMetadata = m_hasMetadata;
    info.started = m_started;
    info.manualStarted = m_manualStarted;
    info.done = m_done;
    info.allFilesDone = m_allFilesDone;
    info.addedAt = m_addedAt;
    info.startedAt = m_startedAt;
    info.stoppedAt = m_stoppedAt;
    info.seedRatio = m_seedRatio;
    info.bytesCompleted = m_bytesCompleted;
    info.totalLength = m_totalLength;
    info.percent = m_totalLength > 0 ? (m_bytesCompleted * 100.0) / m_totalLength : 0.0;
    info.bytesUploaded = m_bytesUploaded;
    info.bytesDownloaded = m_bytesDownloaded;
    info.downloadRate = m_downloadRate;
    info.uploadRate = m_uploadRate;
    info.activePeers = m_activePeers;
    info.totalPeers = m_totalPeers;
    info.connectedSeeders = m_connectedSeeders;

    for (const auto &file : m_files) {
        FileInfo fileInfo;
        fileInfo.path = file.path;
        fileInfo.length = file.length;
        fileInfo.bytesCompleted = file.bytesCompleted;
        fileInfo.percent = file.length > 0 ? (file.bytesCompleted * 100.0) / file.length : 100.0;
        fileInfo.started = file.started;
        fileInfo.done = file.done;
        info.files.append(fileInfo);
    }

    return info;
}
} // namespace STC::Core::Task
