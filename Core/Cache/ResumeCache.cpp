#include "ResumeCache.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace STC::Core::Cache
{
QString ResumeCache::defaultDirName()
{
    return QStringLiteral(".cachedTorrents");
}

QString ResumeCache::recordSuffix()
{
    return QStringLiteral(".resume");
}

QString ResumeCache::directory() const
{
    QMutexLocker locker(&m_mutex);
    return m_dir;
}

void ResumeCache::setDirectory(const QString &dirPath)
{
    QMutexLocker locker(&m_mutex);
    m_dir = dirPath.isEmpty() ? QString() : QDir(dirPath).absolutePath();
}

bool ResumeCache::ensureDirectory(QString *errorString)
{
    QMutexLocker locker(&m_mutex);
    if (m_dir.isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("Cache directory is empty");
        }
        return false;
    }

    const QFileInfo info(m_dir);
    if (info.exists() && info.isDir()) {
        return true;
    }

    if (!QDir().mkpath(m_dir)) {
        if (errorString) {
            *errorString = QStringLiteral("Failed to create dir: %1").arg(m_dir);
        }
        return false;
    }

    return true;
}

QString ResumeCache::recordPath(const QString &infoHash) const
{
    QMutexLocker locker(&m_mutex);
    if (m_dir.isEmpty() || infoHash.isEmpty()) {
        return QString();
    }

    return QDir(m_dir).absoluteFilePath(infoHash + recordSuffix());
}

bool ResumeCache::writeRecordLocked(const QString &infoHash, const QByteArray &content, QString *errorString)
{
    if (m_dir.isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("Cache directory is not set");
        }
        return false;
    }

    if (!Descriptor::TaskDescriptor::isValidInfoHash(infoHash)) {
        if (errorString) {
            *errorString = QStringLiteral("Invalid infohash: %1").arg(infoHash);
        }
        return false;
    }

    const QString filePath = QDir(m_dir).absoluteFilePath(infoHash + recordSuffix());
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) {
            *errorString = QStringLiteral("Failed to open %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    if (file.write(content) != content.size() || !file.commit()) {
        if (errorString) {
            *errorString = QStringLiteral("Failed to write %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    return true;
}

bool ResumeCache::save(const Descriptor::TaskDescriptor &descriptor, QString *errorString)
{
    QMutexLocker locker(&m_mutex);

    // A complete record is never downgraded to a minimal one.
    if (!descriptor.isComplete() && !m_dir.isEmpty()) {
        QFile existing(QDir(m_dir).absoluteFilePath(descriptor.infoHash + recordSuffix()));
        if (existing.open(QIODevice::ReadOnly) && !existing.peek(7).startsWith("magnet:")
            && existing.size() > 0) {
            return true;
        }
    }

    if (!writeRecordLocked(descriptor.infoHash, descriptor.raw, errorString)) {
        return false;
    }

    qDebug().noquote() << "[ResumeCache] saved" << (descriptor.isComplete() ? "complete" : "minimal")
                       << "record" << descriptor.infoHash;
    return true;
}

bool ResumeCache::promote(const QString &infoHash, const QByteArray &metainfo, const Latch *guard,
                          QString *errorString)
{
    QMutexLocker locker(&m_mutex);

    if (guard && guard->isFired()) {
        if (errorString) {
            *errorString = QStringLiteral("Task %1 was dropped").arg(infoHash);
        }
        return false;
    }

    if (metainfo.isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("Empty metainfo for %1").arg(infoHash);
        }
        return false;
    }

    if (!writeRecordLocked(infoHash, metainfo, errorString)) {
        return false;
    }

    qDebug().noquote() << "[ResumeCache] promoted record" << infoHash;
    return true;
}

bool ResumeCache::remove(const QString &infoHash, QString *errorString)
{
    QMutexLocker locker(&m_mutex);
    if (m_dir.isEmpty() || infoHash.isEmpty()) {
        return true;
    }

    const QString filePath = QDir(m_dir).absoluteFilePath(infoHash + recordSuffix());
    if (!QFileInfo::exists(filePath)) {
        return true;
    }

    if (!QFile::remove(filePath)) {
        if (errorString) {
            *errorString = QStringLiteral("Failed to remove %1").arg(filePath);
        }
        return false;
    }

    qDebug().noquote() << "[ResumeCache] removed record" << infoHash;
    return true;
}

ResumeCache::RecordKind ResumeCache::recordKind(const QString &infoHash) const
{
    const QString filePath = recordPath(infoHash);
    if (filePath.isEmpty()) {
        return RecordKind::Missing;
    }

    QMutexLocker locker(&m_mutex);
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return RecordKind::Missing;
    }

    return file.peek(7).startsWith("magnet:") ? RecordKind::Minimal : RecordKind::Complete;
}

bool ResumeCache::load(const QString &infoHash, Descriptor::TaskDescriptor &outDescriptor,
                       QString *errorString) const
{
    const QString filePath = recordPath(infoHash);
    if (filePath.isEmpty()) {
        if (errorString) {
            *errorString = QStringLiteral("Cache directory is not set");
        }
        return false;
    }

    QByteArray content;
    {
        QMutexLocker locker(&m_mutex);
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            if (errorString) {
                *errorString = QStringLiteral("Failed to open %1: %2").arg(filePath, file.errorString());
            }
            return false;
        }
        content = file.readAll();
    }

    Descriptor::TaskDescriptor descriptor;
    const OperationResult result = Descriptor::TaskDescriptor::fromRecord(content, descriptor);
    if (!result.ok) {
        if (errorString) {
            *errorString = result.error;
        }
        return false;
    }

    if (descriptor.infoHash != infoHash) {
        if (errorString) {
            *errorString = QStringLiteral("Record %1 holds descriptor for %2").arg(infoHash, descriptor.infoHash);
        }
        return false;
    }

    outDescriptor = descriptor;
    return true;
}

QStringList ResumeCache::infoHashes() const
{
    QMutexLocker locker(&m_mutex);
    if (m_dir.isEmpty()) {
        return QStringList();
    }

    QStringList hashes;
    const QStringList entries = QDir(m_dir).entryList({ QStringLiteral("*") + recordSuffix() },
                                                      QDir::Files, QDir::Name);
    for (const QString &entry : entries) {
        const QString infoHash = entry.left(entry.size() - recordSuffix().size());
        if (Descriptor::TaskDescriptor::isValidInfoHash(infoHash)) {
            hashes.append(infoHash);
        }
    }

    return hashes;
}
} // namespace STC::Core::Cache
