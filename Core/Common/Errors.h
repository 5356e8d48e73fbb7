#pragma once

#include <QString>

namespace STC::Core
{
enum class ErrorCode
{
    None,
    AlreadyExists,
    WaitListEmpty,
    MaxConcurrentReached,
    AlreadyStarted,
    AlreadyStopped,
    MissingFile,
    TaskNotFound,
    TaskQueued,
    NotConfigured,
    InvalidConfig,
    EngineConstructionFailed,
    MalformedDescriptor,
    ProtocolError,
    CacheError
};

QString errorCodeName(ErrorCode code);

struct OperationResult
{
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    QString error;

    static OperationResult success()
    {
        OperationResult result;
        result.ok = true;
        return result;
    }

    static OperationResult failure(ErrorCode code, const QString &error)
    {
        OperationResult result;
        result.code = code;
        result.error = error;
        return result;
    }
};
} // namespace STC::Core
