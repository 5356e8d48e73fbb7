#pragma once

#include <QThread>

#include <memory>

#include "../Common/Latch.h"
#include "../EngineConfig.h"
#include "../Protocol/ProtocolEngine.h"
#include "Task.h"

namespace STC::Core::Engine
{
class EngineCore;
}

namespace STC::Core::Task
{
enum class WorkerWake
{
    None,
    Shutdown,
    Dropped,
    MetadataReady
};

/**
 * @brief Event loop of one active task.
 *
 * Waits for the first of engine shutdown, task drop and protocol
 * metadata-ready, then ticks at a fixed interval refreshing status and
 * evaluating the seed policy. Never takes the engine-wide lock; anything
 * that would is dispatched to the engine's async pool instead.
 */
class TaskWorker : public QThread
{
    Q_OBJECT

public:
    TaskWorker(Engine::EngineCore *engine,
               std::shared_ptr<Task> task,
               std::shared_ptr<Protocol::IProtocolTask> protocolTask,
               std::shared_ptr<Latch> shutdownSignal,
               std::shared_ptr<const EngineConfig> config,
               int tickIntervalMs,
               QObject *parent = nullptr);

    QString infoHash() const;

    // Shutdown wins over drop, drop wins over metadata-ready.
    static WorkerWake resolveWake(bool shutdown, bool dropped, bool metadataReady);

protected:
    void run() override;

private:
    void onMetadataReady();
    void tick();
    void releaseHandle();

    Engine::EngineCore *m_engine;
    const std::shared_ptr<Task> m_task;
    const std::shared_ptr<Protocol::IProtocolTask> m_protocolTask;
    const std::shared_ptr<Latch> m_shutdown;
    const std::shared_ptr<const EngineConfig> m_config;
    const int m_tickIntervalMs;
    bool m_handleReleased = false;
    bool m_removeScheduled = false;
};
} // namespace STC::Core::Task
