#pragma once

#include <QString>
#include <QStringList>

#include "../Descriptor/TaskDescriptor.h"

namespace STC::Core::Engine
{
struct TaskDoneEvent
{
    QString path;
    QString infoHash;
    Descriptor::TaskKind kind = Descriptor::TaskKind::Magnet;
    qint64 size = 0;
    qint64 timestamp = 0;
};

// Parent controller callback. Returned commands are launched detached.
class ITaskDoneHandler
{
public:
    virtual ~ITaskDoneHandler() = default;
    virtual bool onTaskDone(const TaskDoneEvent &event, QStringList *commands,
                            QString *errorString = nullptr) = 0;
};
} // namespace STC::Core::Engine
