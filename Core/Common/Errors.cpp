#include "Errors.h"

namespace STC::Core
{
QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::AlreadyExists:
        return QStringLiteral("AlreadyExists");
    case ErrorCode::WaitListEmpty:
        return QStringLiteral("WaitListEmpty");
    case ErrorCode::MaxConcurrentReached:
        return QStringLiteral("MaxConcurrentReached");
    case ErrorCode::AlreadyStarted:
        return QStringLiteral("AlreadyStarted");
    case ErrorCode::AlreadyStopped:
        return QStringLiteral("AlreadyStopped");
    case ErrorCode::MissingFile:
        return QStringLiteral("MissingFile");
    case ErrorCode::TaskNotFound:
        return QStringLiteral("TaskNotFound");
    case ErrorCode::TaskQueued:
        return QStringLiteral("TaskQueued");
    case ErrorCode::NotConfigured:
        return QStringLiteral("NotConfigured");
    case ErrorCode::InvalidConfig:
        return QStringLiteral("InvalidConfig");
    case ErrorCode::EngineConstructionFailed:
        return QStringLiteral("EngineConstructionFailed");
    case ErrorCode::MalformedDescriptor:
        return QStringLiteral("MalformedDescriptor");
    case ErrorCode::ProtocolError:
        return QStringLiteral("ProtocolError");
    case ErrorCode::CacheError:
        return QStringLiteral("CacheError");
    }

    return QStringLiteral("Unknown");
}
} // namespace STC::Core
