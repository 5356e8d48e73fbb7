#pragma once

#include <QDateTime>

#include "../EngineConfig.h"
#include "Task.h"

namespace STC::Core::Task
{
struct PolicyDecision
{
    bool stop = false;
    bool remove = false;
};

// Seed-ratio governance, evaluated once per tick on a task snapshot.
class SeedPolicy
{
public:
    static PolicyDecision evaluate(const TaskInfo &task, const EngineConfig &config, const QDateTime &now);

    static bool shouldStop(const TaskInfo &task, const EngineConfig &config);
    static bool shouldRemove(const TaskInfo &task, const EngineConfig &config, const QDateTime &now);
};
} // namespace STC::Core::Task
