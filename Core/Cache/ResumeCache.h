#pragma once

#include <QByteArray>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "../Common/Latch.h"
#include "../Descriptor/TaskDescriptor.h"

namespace STC::Core::Cache
{
/**
 * @brief Resume records, one file per task identity.
 *
 * Records live in a reserved subdirectory of the download root as
 * <infohash>.resume. The content is the descriptor's raw bytes: a magnet
 * uri (minimal) or a bencoded metainfo (complete). Writes go through
 * QSaveFile, so a record is replaced atomically and never duplicated.
 */
class ResumeCache
{
public:
    enum class RecordKind
    {
        Missing,
        Minimal,
        Complete
    };

    static QString defaultDirName();
    static QString recordSuffix();

    QString directory() const;
    void setDirectory(const QString &dirPath);
    bool ensureDirectory(QString *errorString = nullptr);

    QString recordPath(const QString &infoHash) const;

    bool save(const Descriptor::TaskDescriptor &descriptor, QString *errorString = nullptr);

    // Replaces the record with the complete metainfo unless guard has fired.
    bool promote(const QString &infoHash, const QByteArray &metainfo, const Latch *guard = nullptr,
                 QString *errorString = nullptr);

    bool remove(const QString &infoHash, QString *errorString = nullptr);

    RecordKind recordKind(const QString &infoHash) const;
    bool load(const QString &infoHash, Descriptor::TaskDescriptor &outDescriptor,
              QString *errorString = nullptr) const;
    QStringList infoHashes() const;

private:
    bool writeRecordLocked(const QString &infoHash, const QByteArray &content, QString *errorString);

    mutable QMutex m_mutex;
    QString m_dir;
};
} // namespace STC::Core::Cache
