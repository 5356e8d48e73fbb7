#include <QCoreApplication>
#include <QDebug>
#include <QTemporaryDir>

#include "FakeProtocolEngine.h"

using namespace STC::Core;
using STC::Core::Cache::ResumeCache;
using STC::Core::Descriptor::TaskDescriptor;
using STC::Core::Engine::EngineCore;
using STC::Core::Task::TaskInfo;
using namespace STC::Testing;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    qInfo() << "=== Engine Seeding Test ===";

    QTemporaryDir root;
    if (!root.isValid()) {
        qCritical() << "Failed to create temp dir";
        return 1;
    }

    FakeState state;
    FakeEngineFactory factory(&state);
    EngineCore engine(&factory);
    engine.setTimings(fastTimings());

    EngineConfig config;
    config.downloadDirectory = root.filePath("seeding");
    config.seedRatio = 1.0;
    config.removeTaskAfterStopped = 1;
    if (!engine.configure(config).ok) {
        qCritical() << "Configure failed";
        return 1;
    }

    const QByteArray doc = makeMetainfo("iso.img", 8192);
    TaskDescriptor descriptor;
    TaskDescriptor::fromMetainfo(doc, descriptor);
    const QString hash = descriptor.infoHash;

    ResumeCache records;
    records.setDirectory(engine.cacheDirectory());

    auto started = [&]() {
        TaskInfo info;
        return engine.taskInfo(hash, info) && info.started;
    };

    {
        qInfo() << "\n--- Test 1: ratio reached stops the task ---";

        if (!engine.addMetainfo(doc).ok || !waitUntil(started)) {
            qCritical() << "Task did not start";
            return 1;
        }

        state.task(hash)->finish(2.0);
        if (!waitUntil([&]() { return !started(); })) {
            qCritical() << "Task kept seeding past the ratio";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 2: stopped task is removed after the grace period ---";

        const bool removed = waitUntil([&]() {
            TaskInfo info;
            return !engine.taskInfo(hash, info);
        }, 10000);
        if (!removed) {
            qCritical() << "Task was not removed after the grace period";
            return 1;
        }
        if (records.recordKind(hash) != ResumeCache::RecordKind::Missing) {
            qCritical() << "Removed task left its resume record behind";
            return 1;
        }
        if (!waitUntil([&]() { return state.task(hash)->isDropped(); })) {
            qCritical() << "Removed task's protocol handle was not dropped";
            return 1;
        }
    }

    qInfo() << "\nAll seeding tests PASSED";
    return 0;
}
