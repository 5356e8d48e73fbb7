#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QTemporaryDir>

#include <atomic>

#include "FakeProtocolEngine.h"

using namespace STC::Core;
using STC::Core::Cache::ResumeCache;
using STC::Core::Descriptor::TaskDescriptor;
using STC::Core::Engine::EngineCore;
using STC::Core::Engine::TaskDoneEvent;
using STC::Core::Task::TaskInfo;
using STC::Core::Task::TaskState;
using namespace STC::Testing;

namespace
{
class RecordingDoneHandler : public Engine::ITaskDoneHandler
{
public:
    bool onTaskDone(const TaskDoneEvent &event, QStringList *commands, QString *errorString = nullptr) override
    {
        Q_UNUSED(commands);
        Q_UNUSED(errorString);
        QMutexLocker locker(&m_mutex);
        m_events.append(event);
        return true;
    }

    QVector<TaskDoneEvent> events() const
    {
        QMutexLocker locker(&m_mutex);
        return m_events;
    }

private:
    mutable QMutex m_mutex;
    QVector<TaskDoneEvent> m_events;
};

TaskInfo infoOf(const EngineCore &engine, const QString &infoHash)
{
    TaskInfo info;
    engine.taskInfo(infoHash, info);
    return info;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    qInfo() << "=== Engine Task State Test ===";

    QTemporaryDir root;
    if (!root.isValid()) {
        qCritical() << "Failed to create temp dir";
        return 1;
    }

    const QString publicTracker = QStringLiteral("udp://public.example:6969");

    FakeState state;
    FakeEngineFactory factory(&state);
    RecordingDoneHandler doneHandler;
    EngineCore engine(&factory, &doneHandler);
    engine.setTimings(fastTimings());

    std::atomic<int> changedSignals { 0 };
    QObject::connect(&engine, &EngineCore::tasksChanged, [&changedSignals]() { changedSignals++; });

    EngineConfig config;
    config.downloadDirectory = root.filePath("downloads");
    config.trackers = QStringList({ publicTracker });
    if (!engine.configure(config).ok) {
        qCritical() << "Configure failed";
        return 1;
    }

    ResumeCache records;
    records.setDirectory(engine.cacheDirectory());

    const QByteArray doc = makeMetainfo("movie.mkv", 2048, "http://private.example/announce");
    TaskDescriptor descriptor;
    if (!TaskDescriptor::fromMetainfo(doc, descriptor).ok) {
        qCritical() << "Failed to build metainfo";
        return 1;
    }
    const QString hash = descriptor.infoHash;

    {
        qInfo() << "\n--- Test 1: metainfo task auto starts ---";

        if (!engine.addMetainfo(doc).ok) {
            qCritical() << "addMetainfo failed";
            return 1;
        }
        if (!waitUntil([&]() { return infoOf(engine, hash).state == TaskState::Started; })) {
            qCritical() << "Task never reached Started:" << Task::taskStateName(infoOf(engine, hash).state);
            return 1;
        }

        const auto fake = state.task(hash);
        if (!fake->uploadAllowed() || !fake->downloadAllowed()
            || fake->fakeFiles().first()->priority() != Protocol::FilePriority::Normal) {
            qCritical() << "Started task should allow transfer at normal priority";
            return 1;
        }
        if (records.recordKind(hash) != ResumeCache::RecordKind::Complete) {
            qCritical() << "Metainfo task should have a complete record";
            return 1;
        }
        if (fake->trackers().contains(publicTracker)) {
            qCritical() << "Public trackers must not be injected into a task that has its own";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 2: start and stop guards ---";

        const OperationResult again = engine.startTask(hash);
        if (again.code != ErrorCode::AlreadyStarted || again.error != "Already started") {
            qCritical() << "Expected 'Already started', got" << again.error;
            return 1;
        }

        if (!engine.stopTask(hash).ok) {
            qCritical() << "Stop failed";
            return 1;
        }
        const auto fake = state.task(hash);
        if (fake->uploadAllowed() || fake->downloadAllowed()
            || fake->fakeFiles().first()->priority() != Protocol::FilePriority::None) {
            qCritical() << "Stopped task should disallow transfer";
            return 1;
        }
        const TaskInfo stopped = infoOf(engine, hash);
        if (stopped.state != TaskState::Stopped || !stopped.stoppedAt.isValid()) {
            qCritical() << "Expected Stopped with a stop time";
            return 1;
        }

        const OperationResult stopAgain = engine.stopTask(hash);
        if (stopAgain.code != ErrorCode::AlreadyStopped || stopAgain.error != "Already stopped") {
            qCritical() << "Expected 'Already stopped', got" << stopAgain.error;
            return 1;
        }

        if (!engine.manualStartTask(hash).ok || !infoOf(engine, hash).manualStarted) {
            qCritical() << "Manual start should mark the task";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 3: stopping the last file stops the task ---";

        const QString file = infoOf(engine, hash).files.first().path;
        if (!engine.stopFile(hash, file).ok) {
            qCritical() << "stopFile failed";
            return 1;
        }
        if (!waitUntil([&]() { return !infoOf(engine, hash).started; })) {
            qCritical() << "Task kept running after its only file stopped";
            return 1;
        }

        if (engine.stopFile(hash, file).code != ErrorCode::AlreadyStopped) {
            qCritical() << "Stopping a stopped file should report AlreadyStopped";
            return 1;
        }

        const OperationResult missing = engine.startFile(hash, "nope.txt");
        if (missing.code != ErrorCode::MissingFile || missing.error != "Missing file nope.txt") {
            qCritical() << "Unexpected missing file error:" << missing.error;
            return 1;
        }

        if (!engine.startFile(hash, file).ok) {
            qCritical() << "startFile failed";
            return 1;
        }
        const TaskInfo info = infoOf(engine, hash);
        if (info.started || !info.files.first().started) {
            qCritical() << "Starting a file must not start the task";
            return 1;
        }
        if (engine.startFile(hash, file).error != "already started") {
            qCritical() << "Starting a started file should report 'already started'";
            return 1;
        }
    }

    const QByteArray magnetDoc = makeMetainfo("show.mp4", 4096);
    TaskDescriptor magnetTarget;
    TaskDescriptor::fromMetainfo(magnetDoc, magnetTarget);
    const QString magnetHash = magnetTarget.infoHash;

    {
        qInfo() << "\n--- Test 4: magnet metadata promotes the resume record ---";

        if (!engine.addMagnet(makeMagnet(magnetHash, "placeholder")).ok) {
            qCritical() << "addMagnet failed";
            return 1;
        }
        if (records.recordKind(magnetHash) != ResumeCache::RecordKind::Minimal) {
            qCritical() << "Magnet task should start with a minimal record";
            return 1;
        }
        if (infoOf(engine, magnetHash).state != TaskState::Pending) {
            qCritical() << "Magnet task should be Pending before metadata";
            return 1;
        }

        const auto fake = state.task(magnetHash);
        if (!fake->trackers().contains(publicTracker)) {
            qCritical() << "Public trackers should be injected into a tracker-less magnet";
            return 1;
        }

        fake->provideMetadata(magnetDoc, "show.mp4", { std::make_shared<FakeFile>("show.mp4", 4096) });

        const bool promoted = waitUntil([&]() {
            return records.recordKind(magnetHash) == ResumeCache::RecordKind::Complete
                && infoOf(engine, magnetHash).state == TaskState::Started;
        });
        if (!promoted) {
            qCritical() << "Metadata did not promote and start the task";
            return 1;
        }
        if (infoOf(engine, magnetHash).name != "show.mp4") {
            qCritical() << "Task name should follow the metadata";
            return 1;
        }

        if (engine.addMagnet(makeMagnet(magnetHash)).code != ErrorCode::AlreadyExists
            || records.recordKind(magnetHash) != ResumeCache::RecordKind::Complete) {
            qCritical() << "Duplicate add must not touch the complete record";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 5: completion reaches the done handler ---";

        state.task(magnetHash)->finish(0.5);

        if (!waitUntil([&]() { return !doneHandler.events().isEmpty(); })) {
            qCritical() << "Done handler was never called";
            return 1;
        }

        const TaskDoneEvent event = doneHandler.events().first();
        if (event.infoHash != magnetHash || event.size != 4096
            || event.path != QDir(config.downloadDirectory).filePath("show.mp4")) {
            qCritical() << "Unexpected done event:" << event.infoHash << event.size << event.path;
            return 1;
        }

        QThread::msleep(200);
        if (doneHandler.events().size() != 1) {
            qCritical() << "Done handler should fire once per task";
            return 1;
        }

        if (!engine.stopTask(magnetHash).ok || infoOf(engine, magnetHash).state != TaskState::Done) {
            qCritical() << "A finished, stopped task should report Done";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 6: change notifications ---";

        engine.changes()->tryTake();
        const int before = changedSignals.load();
        if (!engine.startTask(magnetHash).ok) {
            qCritical() << "Restart failed";
            return 1;
        }
        if (!engine.changes()->isPending() || changedSignals.load() <= before) {
            qCritical() << "State change was not announced";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 7: metadata after delete does not resurrect the record ---";

        const QByteArray lateDoc = makeMetainfo("late.bin", 512);
        TaskDescriptor late;
        TaskDescriptor::fromMetainfo(lateDoc, late);

        if (!engine.addMagnet(makeMagnet(late.infoHash)).ok) {
            qCritical() << "addMagnet failed";
            return 1;
        }
        const auto fake = state.task(late.infoHash);

        if (!engine.deleteTask(late.infoHash).ok) {
            qCritical() << "Delete failed";
            return 1;
        }
        fake->provideMetadata(lateDoc, "late.bin", { std::make_shared<FakeFile>("late.bin", 512) });

        if (!waitUntil([&]() { return fake->isDropped(); })) {
            qCritical() << "Deleted task's protocol handle was not dropped";
            return 1;
        }
        QThread::msleep(200);
        if (records.recordKind(late.infoHash) != ResumeCache::RecordKind::Missing) {
            qCritical() << "Late metadata rewrote the record of a deleted task";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 8: drop observed together with metadata wins ---";

        const QByteArray raceDoc = makeMetainfo("race.bin", 256);
        TaskDescriptor race;
        TaskDescriptor::fromMetainfo(raceDoc, race);

        auto gate = std::make_shared<Latch>();
        {
            QMutexLocker locker(&state.mutex);
            state.metadataGate = gate;
        }
        const OperationResult added = engine.addMagnet(makeMagnet(race.infoHash));
        {
            QMutexLocker locker(&state.mutex);
            state.metadataGate.reset();
        }
        if (!added.ok) {
            qCritical() << "addMagnet failed";
            gate->fire();
            return 1;
        }
        const auto fake = state.task(race.infoHash);

        // Both signals are fired before the worker gets to look at either.
        fake->provideMetadata(raceDoc, "race.bin", { std::make_shared<FakeFile>("race.bin", 256) });
        if (!engine.deleteTask(race.infoHash).ok) {
            qCritical() << "Delete failed";
            gate->fire();
            return 1;
        }
        fake->resetMetadataReads();
        gate->fire();

        if (!waitUntil([&]() { return fake->isDropped(); })) {
            qCritical() << "Deleted task's protocol handle was not dropped";
            return 1;
        }
        if (fake->metadataReads() != 0) {
            qCritical() << "Worker handled metadata for a dropped task:" << fake->metadataReads();
            return 1;
        }
        if (records.recordKind(race.infoHash) != ResumeCache::RecordKind::Missing) {
            qCritical() << "Dropped task left a resume record";
            return 1;
        }
    }

    qInfo() << "\nAll task state tests PASSED";
    return 0;
}
