#include <QCoreApplication>
#include <QDebug>

#include "../Core/Task/SeedPolicy.h"

using namespace STC::Core;
using STC::Core::Task::PolicyDecision;
using STC::Core::Task::SeedPolicy;
using STC::Core::Task::TaskInfo;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    qInfo() << "=== Seed Policy Test ===";

    const QDateTime now = QDateTime::currentDateTimeUtc();

    EngineConfig config;
    config.downloadDirectory = "/tmp";
    config.seedRatio = 1.5;
    config.removeTaskAfterStopped = 60;

    TaskInfo seeding;
    seeding.done = true;
    seeding.started = true;
    seeding.seedRatio = 2.0;

    {
        qInfo() << "\n--- Test 1: stop once the ratio is exceeded ---";

        if (!SeedPolicy::shouldStop(seeding, config)) {
            qCritical() << "Expected stop for a done, started task above the ratio";
            return 1;
        }

        TaskInfo equal = seeding;
        equal.seedRatio = 1.5;
        if (SeedPolicy::shouldStop(equal, config)) {
            qCritical() << "Stop requires strictly exceeding the ratio";
            return 1;
        }

        TaskInfo manual = seeding;
        manual.manualStarted = true;
        if (SeedPolicy::shouldStop(manual, config)) {
            qCritical() << "Manually started tasks are exempt";
            return 1;
        }

        TaskInfo unfinished = seeding;
        unfinished.done = false;
        if (SeedPolicy::shouldStop(unfinished, config)) {
            qCritical() << "Unfinished tasks must keep running";
            return 1;
        }

        EngineConfig disabled = config;
        disabled.seedRatio = 0;
        if (SeedPolicy::shouldStop(seeding, disabled)) {
            qCritical() << "Zero ratio disables the policy";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 2: remove after the stopped grace period ---";

        TaskInfo stopped = seeding;
        stopped.started = false;
        stopped.seedRatio = 1.5;
        stopped.stoppedAt = now.addSecs(-61);

        if (!SeedPolicy::shouldRemove(stopped, config, now)) {
            qCritical() << "Expected removal after the grace period";
            return 1;
        }

        TaskInfo recent = stopped;
        recent.stoppedAt = now.addSecs(-60);
        if (SeedPolicy::shouldRemove(recent, config, now)) {
            qCritical() << "Grace period must be strictly exceeded";
            return 1;
        }

        TaskInfo neverStopped = stopped;
        neverStopped.stoppedAt = QDateTime();
        if (SeedPolicy::shouldRemove(neverStopped, config, now)) {
            qCritical() << "A task without a stop time is never removed";
            return 1;
        }

        EngineConfig noRemoval = config;
        noRemoval.removeTaskAfterStopped = 0;
        if (SeedPolicy::shouldRemove(stopped, noRemoval, now)) {
            qCritical() << "Zero duration disables removal";
            return 1;
        }

        TaskInfo lowRatio = stopped;
        lowRatio.seedRatio = 1.0;
        if (SeedPolicy::shouldRemove(lowRatio, config, now)) {
            qCritical() << "Ratio below threshold must not be removed";
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 3: stop and remove are exclusive in one evaluation ---";

        const PolicyDecision running = SeedPolicy::evaluate(seeding, config, now);
        if (!running.stop || running.remove) {
            qCritical() << "Running task should only be stopped";
            return 1;
        }

        TaskInfo stopped = seeding;
        stopped.started = false;
        stopped.stoppedAt = now.addSecs(-3600);
        const PolicyDecision idle = SeedPolicy::evaluate(stopped, config, now);
        if (idle.stop || !idle.remove) {
            qCritical() << "Stopped task past its grace period should only be removed";
            return 1;
        }
    }

    qInfo() << "\nAll seed policy tests PASSED";
    return 0;
}
