#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "../Common/Errors.h"

namespace STC::Core::Descriptor
{
enum class TaskKind
{
    Magnet,
    Metainfo
};

QString taskKindName(TaskKind kind);

/**
 * @brief What to fetch: a reference-only magnet link or a full metainfo document.
 *
 * raw holds the bytes the descriptor was parsed from; they are what the
 * resume cache stores.
 */
struct TaskDescriptor
{
    QString infoHash;
    QString displayName;
    TaskKind kind = TaskKind::Magnet;
    QByteArray raw;
    QStringList trackers;
    qint64 totalLength = 0;

    bool isComplete() const { return kind == TaskKind::Metainfo; }

    static OperationResult fromMagnet(const QString &uri, TaskDescriptor &outDescriptor);
    static OperationResult fromMetainfo(const QByteArray &data, TaskDescriptor &outDescriptor);
    static OperationResult fromMetainfoFile(const QString &path, TaskDescriptor &outDescriptor);

    // Accepts either form, as written by the resume cache.
    static OperationResult fromRecord(const QByteArray &record, TaskDescriptor &outDescriptor);

    static bool isValidInfoHash(const QString &infoHash);
};
} // namespace STC::Core::Descriptor
