#include "TaskWorker.h"

#include "../Engine/EngineCore.h"
#include "SeedPolicy.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>

namespace STC::Core::Task
{
TaskWorker::TaskWorker(Engine::EngineCore *engine,
                       std::shared_ptr<Task> task,
                       std::shared_ptr<Protocol::IProtocolTask> protocolTask,
                       std::shared_ptr<Latch> shutdownSignal,
                       std::shared_ptr<const EngineConfig> config,
                       int tickIntervalMs,
                       QObject *parent)
    : QThread(parent)
    , m_engine(engine)
    , m_task(std::move(task))
    , m_protocolTask(std::move(protocolTask))
    , m_shutdown(std::move(shutdownSignal))
    , m_config(std::move(config))
    , m_tickIntervalMs(qMax(1, tickIntervalMs))
{
    setObjectName(QStringLiteral("TaskWorker %1").arg(m_task->infoHash().left(8)));
}

QString TaskWorker::infoHash() const
{
    return m_task->infoHash();
}

WorkerWake TaskWorker::resolveWake(bool shutdown, bool dropped, bool metadataReady)
{
    if (shutdown) {
        return WorkerWake::Shutdown;
    }
    if (dropped) {
        return WorkerWake::Dropped;
    }
    if (metadataReady) {
        return WorkerWake::MetadataReady;
    }
    return WorkerWake::None;
}

void TaskWorker::run()
{
    const QString hash = m_task->infoHash();
    const std::shared_ptr<Latch> dropSignal = m_task->dropSignal();
    const std::shared_ptr<Latch> metadataSignal = m_protocolTask->metadataReady();

    auto waker = std::make_shared<Waker>();
    m_shutdown->subscribe(waker);
    dropSignal->subscribe(waker);
    if (metadataSignal) {
        metadataSignal->subscribe(waker);
    }

    bool gotInfo = false;
    QElapsedTimer tickTimer;

    forever {
        const bool metadataReady = !gotInfo
            && (metadataSignal ? metadataSignal->isFired() : m_protocolTask->hasMetadata());

        switch (resolveWake(m_shutdown->isFired(), dropSignal->isFired(), metadataReady)) {
        case WorkerWake::Shutdown:
            qInfo().noquote() << "[TaskWorker] engine shutdown while"
                              << (gotInfo ? "downloading" : "waiting info") << hash;
            releaseHandle();
            return;
        case WorkerWake::Dropped:
            qInfo().noquote() << "[TaskWorker] task dropped while"
                              << (gotInfo ? "downloading" : "waiting info") << hash;
            releaseHandle();
            m_engine->releaseSlot(hash);
            return;
        case WorkerWake::MetadataReady:
            onMetadataReady();
            gotInfo = true;
            tickTimer.start();
            continue;
        case WorkerWake::None:
            break;
        }

        if (!gotInfo) {
            waker->wait();
            continue;
        }

        const qint64 remaining = m_tickIntervalMs - tickTimer.elapsed();
        if (remaining <= 0) {
            tick();
            tickTimer.restart();
            continue;
        }

        waker->wait(remaining);
    }
}

void TaskWorker::onMetadataReady()
{
    const QString hash = m_task->infoHash();

    QString error;
    if (!m_engine->m_cache.promote(hash, m_protocolTask->metainfo(), m_task->dropSignal().get(), &error)) {
        qWarning().noquote() << "[TaskWorker] resume record not promoted:" << error;
    }

    m_task->updateOnMetadata();
    m_engine->notifyChanged();

    if (m_config->autoStart) {
        m_engine->dispatch([engine = m_engine, hash]() {
            const OperationResult result = engine->startTask(hash);
            if (!result.ok) {
                qDebug().noquote() << "[TaskWorker] auto start skipped" << hash << result.error;
            }
        });
    }
}

void TaskWorker::tick()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    const bool becameDone = m_task->refresh(now);
    const TaskInfo info = m_task->snapshot();

    if (becameDone) {
        Engine::TaskDoneEvent event;
        event.path = QDir(m_config->downloadDirectory).filePath(info.name);
        event.infoHash = info.infoHash;
        event.kind = info.kind;
        event.size = info.totalLength;
        event.timestamp = now.toSecsSinceEpoch();
        m_engine->notifyChanged();
        m_engine->dispatchTaskDone(event);
    }

    const PolicyDecision decision = SeedPolicy::evaluate(info, *m_config, now);
    if (decision.stop) {
        qInfo().noquote() << "[TaskWorker] stopped due to reaching seed ratio" << info.seedRatio << info.infoHash;
        m_engine->dispatch([engine = m_engine, hash = info.infoHash]() {
            const OperationResult result = engine->stopTask(hash);
            if (!result.ok) {
                qDebug().noquote() << "[TaskWorker] ratio stop skipped" << hash << result.error;
            }
        });
    }

    if (decision.remove && !m_removeScheduled) {
        m_removeScheduled = true;
        qInfo().noquote() << "[TaskWorker] delete due to reaching seed ratio" << info.seedRatio << info.infoHash;
        m_engine->dispatch([engine = m_engine, hash = info.infoHash]() {
            const OperationResult result = engine->deleteTask(hash);
            if (!result.ok) {
                qWarning().noquote() << "[TaskWorker] ratio delete failed" << hash << result.error;
            }
            QString error;
            if (!engine->removeCache(hash, &error)) {
                qWarning().noquote() << "[TaskWorker] cache purge failed" << hash << error;
            }
        });
    }
}

void TaskWorker::releaseHandle()
{
    if (m_handleReleased) {
        return;
    }

    m_handleReleased = true;
    m_protocolTask->drop();
}
} // namespace STC::Core::Task
