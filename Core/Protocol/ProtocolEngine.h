#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVector>

#include <memory>

#include "../Common/Latch.h"
#include "../Descriptor/TaskDescriptor.h"
#include "../EngineConfig.h"

namespace STC::Core::Protocol
{
enum class FilePriority
{
    None,
    Normal
};

struct TaskStats
{
    qint64 bytesCompleted = 0;
    qint64 totalLength = 0;
    qint64 bytesUploaded = 0;
    qint64 bytesDownloaded = 0;
    int activePeers = 0;
    int totalPeers = 0;
    int connectedSeeders = 0;
    double seedRatio = 0.0;
};

class IProtocolFile
{
public:
    virtual ~IProtocolFile() = default;
    virtual QString path() const = 0;
    virtual qint64 length() const = 0;
    virtual qint64 bytesCompleted() const = 0;
    virtual void setPriority(FilePriority priority) = 0;
};

class IProtocolTask
{
public:
    virtual ~IProtocolTask() = default;

    virtual QString infoHash() const = 0;
    virtual QString name() const = 0;

    virtual std::shared_ptr<Latch> metadataReady() const = 0;
    virtual bool hasMetadata() const = 0;

    // Complete metainfo document; only meaningful once metadata is ready.
    virtual QByteArray metainfo() const = 0;
    virtual QVector<std::shared_ptr<IProtocolFile>> files() const = 0;
    virtual TaskStats stats() const = 0;

    virtual QStringList trackers() const = 0;
    virtual void addTrackers(const QStringList &trackers) = 0;

    virtual void allowUpload() = 0;
    virtual void disallowUpload() = 0;
    virtual void allowDownload() = 0;
    virtual void disallowDownload() = 0;

    virtual void drop() = 0;
};

class IProtocolEngine
{
public:
    virtual ~IProtocolEngine() = default;

    virtual std::shared_ptr<IProtocolTask> addTask(const Descriptor::TaskDescriptor &descriptor,
                                                   QString *errorString = nullptr) = 0;
    virtual void close() = 0;
};

class IProtocolEngineFactory
{
public:
    virtual ~IProtocolEngineFactory() = default;
    virtual std::unique_ptr<IProtocolEngine> construct(const EngineConfig &config,
                                                       QString *errorString = nullptr) = 0;
};
} // namespace STC::Core::Protocol
