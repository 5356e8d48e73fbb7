#pragma once

#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QVector>

#include <memory>

#include "../Common/Errors.h"
#include "../Common/Latch.h"
#include "../Descriptor/TaskDescriptor.h"
#include "../Protocol/ProtocolEngine.h"

namespace STC::Core::Task
{
enum class TaskState
{
    Queued,
    Pending,
    Started,
    Stopped,
    Done,
    Deleted
};

QString taskStateName(TaskState state);

struct FileInfo
{
    QString path;
    qint64 length = 0;
    qint64 bytesCompleted = 0;
    double percent = 0.0;
    bool started = false;
    bool done = false;
};

struct TaskInfo
{
    QString infoHash;
    QString name;
    Descriptor::TaskKind kind = Descriptor::TaskKind::Magnet;
    TaskState state = TaskState::Queued;

    bool hasMetadata = false;
    bool started = false;
    bool manualStarted = false;
    bool done = false;
    bool allFilesDone = false;

    QDateTime addedAt;
    QDateTime startedAt;
    QDateTime stoppedAt;

    double seedRatio = 0.0;
    double percent = 0.0;
    qint64 bytesCompleted = 0;
    qint64 totalLength = 0;
    qint64 bytesUploaded = 0;
    qint64 bytesDownloaded = 0;
    qint64 downloadRate = 0;
    qint64 uploadRate = 0;
    int activePeers = 0;
    int totalPeers = 0;
    int connectedSeeders = 0;

    QVector<FileInfo> files;
};

/**
 * @brief Per-task record and its state machine.
 *
 * Every mutation happens under the task's own mutex, which is always the
 * innermost lock taken. Protocol calls made from here never call back into
 * the engine.
 */
class Task
{
public:
    Task(const QString &infoHash, const QString &name, Descriptor::TaskKind kind);

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    QString infoHash() const { return m_infoHash; }
    Descriptor::TaskKind kind() const { return m_kind; }
    std::shared_ptr<Latch> dropSignal() const { return m_dropSignal; }

    // Queued -> Pending.
    void attach(const std::shared_ptr<Protocol::IProtocolTask> &protocolTask);

    // No protocol handle attached yet.
    bool isQueued() const;

    // Pending -> Started/Stopped, files mirror the protocol's file set.
    void updateOnMetadata();

    OperationResult start(bool manual = false);
    OperationResult stop();
    OperationResult startFile(const QString &filePath);
    OperationResult stopFile(const QString &filePath, bool *allFilesStopped = nullptr);

    // One tick of status refresh. Returns true when the task became done on this call.
    bool refresh(const QDateTime &now);

    void markDeleted();

    TaskInfo snapshot() const;

private:
    struct File
    {
        QString path;
        qint64 length = 0;
        qint64 bytesCompleted = 0;
        bool started = false;
        bool done = false;
        std::shared_ptr<Protocol::IProtocolFile> handle;
    };

    TaskState stateLocked() const;
    File *findFileLocked(const QString &filePath);
    void applyStartedLocked();
    void applyStoppedLocked();
    void updateFileStatusLocked();
    bool updateTaskStatusLocked(const Protocol::TaskStats &stats);
    void updateConnStatLocked(const Protocol::TaskStats &stats, const QDateTime &now);

    const QString m_infoHash;
    const Descriptor::TaskKind m_kind;
    const std::shared_ptr<Latch> m_dropSignal;

    mutable QMutex m_mutex;
    std::shared_ptr<Protocol::IProtocolTask> m_protocolTask;
    QString m_name;
    bool m_hasMetadata = false;
    bool m_deleted = false;
    bool m_started = false;
    bool m_manualStarted = false;
    bool m_done = false;
    bool m_allFilesDone = false;
    QDateTime m_addedAt;
    QDateTime m_startedAt;
    QDateTime m_stoppedAt;

    double m_seedRatio = 0.0;
    qint64 m_bytesCompleted = 0;
    qint64 m_totalLength = 0;
    qint64 m_bytesUploaded = 0;
    qint64 m_bytesDownloaded = 0;
    qint64 m_downloadRate = 0;
    qint64 m_uploadRate = 0;
    int m_activePeers = 0;
    int m_totalPeers = 0;
    int m_connectedSeeders = 0;
    QDateTime m_lastConnStatAt;

    QVector<File> m_files;
};
} // namespace STC::Core::Task
