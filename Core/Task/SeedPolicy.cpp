#include "SeedPolicy.h"

namespace STC::Core::Task
{
bool SeedPolicy::shouldStop(const TaskInfo &task, const EngineConfig &config)
{
    return config.seedRatio > 0
        && task.seedRatio > config.seedRatio
        && task.started
        && !task.manualStarted
        && task.done;
}

bool SeedPolicy::shouldRemove(const TaskInfo &task, const EngineConfig &config, const QDateTime &now)
{
    if (config.removeTaskAfterStopped <= 0 || config.seedRatio <= 0) {
        return false;
    }
    if (task.seedRatio < config.seedRatio || task.started || !task.done) {
        return false;
    }
    if (!task.stoppedAt.isValid()) {
        return false;
    }

    return task.stoppedAt.secsTo(now) > config.removeTaskAfterStopped;
}

PolicyDecision SeedPolicy::evaluate(const TaskInfo &task, const EngineConfig &config, const QDateTime &now)
{
    PolicyDecision decision;
    decision.stop = shouldStop(task, config);
    decision.remove = !decision.stop && shouldRemove(task, config, now);
    return decision;
}
} // namespace STC::Core::Task
