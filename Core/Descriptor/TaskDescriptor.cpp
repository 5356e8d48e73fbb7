#include "TaskDescriptor.h"

#include "Bencode.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QFile>
#include <QUrl>
#include <QUrlQuery>

#include <exception>

namespace STC::Core::Descriptor
{
namespace
{
const QString kBtihPrefix = QStringLiteral("urn:btih:");

bool decodeBase32(const QString &input, QByteArray &out)
{
    static const QByteArray alphabet("ABCDEFGHIJKLMNOPQRSTUVWXYZ234567");

    out.clear();
    quint32 buffer = 0;
    int bits = 0;
    for (const QChar ch : input) {
        const int index = alphabet.indexOf(char(ch.toUpper().toLatin1()));
        if (index < 0) {
            return false;
        }
        buffer = (buffer << 5) | quint32(index);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.append(char((buffer >> bits) & 0xFF));
        }
    }

    return true;
}

QString stringValue(const BencodeValue *value)
{
    if (!value || !value->isString()) {
        return QString();
    }
    return QString::fromUtf8(value->string);
}

OperationResult malformed(const QString &error)
{
    return OperationResult::failure(ErrorCode::MalformedDescriptor, error);
}

OperationResult parseMetainfo(const QByteArray &data, TaskDescriptor &out)
{
    BencodeValue root;
    QString error;
    if (!BencodeParser::parse(data, root, &error)) {
        return malformed(QStringLiteral("Invalid metainfo: %1").arg(error));
    }
    if (!root.isDictionary()) {
        return malformed(QStringLiteral("Metainfo root is not a dictionary"));
    }

    const BencodeValue *info = root.find("info");
    if (!info || !info->isDictionary()) {
        return malformed(QStringLiteral("Metainfo has no info dictionary"));
    }

    const BencodeValue *pieceLength = info->find("piece length");
    if (!pieceLength || !pieceLength->isInteger() || pieceLength->integer <= 0) {
        return malformed(QStringLiteral("Metainfo has no valid piece length"));
    }

    const BencodeValue *pieces = info->find("pieces");
    if (!pieces || !pieces->isString() || pieces->string.size() % 20 != 0) {
        return malformed(QStringLiteral("Metainfo pieces field is invalid"));
    }

    QString name = stringValue(info->find("name.utf-8"));
    if (name.isEmpty()) {
        name = stringValue(info->find("name"));
    }

    qint64 totalLength = 0;
    const BencodeValue *length = info->find("length");
    const BencodeValue *files = info->find("files");
    if (length && length->isInteger() && length->integer >= 0) {
        totalLength = length->integer;
    } else if (files && files->isList()) {
        for (const auto &file : files->list) {
            const BencodeValue *fileLength = file.find("length");
            const BencodeValue *path = file.find("path");
            if (!fileLength || !fileLength->isInteger() || fileLength->integer < 0
                || !path || !path->isList() || path->list.empty()) {
                return malformed(QStringLiteral("Metainfo file entry is invalid"));
            }
            totalLength += fileLength->integer;
        }
    } else {
        return malformed(QStringLiteral("Metainfo has neither length nor files"));
    }

    QStringList trackers;
    const QString announce = stringValue(root.find("announce"));
    if (!announce.isEmpty()) {
        trackers.append(announce);
    }
    const BencodeValue *announceList = root.find("announce-list");
    if (announceList && announceList->isList()) {
        for (const auto &tier : announceList->list) {
            if (!tier.isList()) {
                continue;
            }
            for (const auto &tracker : tier.list) {
                const QString url = stringValue(&tracker);
                if (!url.isEmpty() && !trackers.contains(url)) {
                    trackers.append(url);
                }
            }
        }
    }

    const QByteArray infoBytes = data.mid(info->rawBegin, info->rawEnd - info->rawBegin);

    TaskDescriptor descriptor;
    descriptor.infoHash = QString::fromLatin1(
        QCryptographicHash::hash(infoBytes, QCryptographicHash::Sha1).toHex());
    descriptor.displayName = name.isEmpty() ? descriptor.infoHash : name;
    descriptor.kind = TaskKind::Metainfo;
    descriptor.raw = data;
    descriptor.trackers = trackers;
    descriptor.totalLength = totalLength;

    out = descriptor;
    return OperationResult::success();
}
} // namespace

QString taskKindName(TaskKind kind)
{
    return kind == TaskKind::Magnet ? QStringLiteral("magnet") : QStringLiteral("torrent");
}

bool TaskDescriptor::isValidInfoHash(const QString &infoHash)
{
    if (infoHash.size() != 40) {
        return false;
    }

    for (const QChar ch : infoHash) {
        const bool digit = ch >= QLatin1Char('0') && ch <= QLatin1Char('9');
        const bool hexLower = ch >= QLatin1Char('a') && ch <= QLatin1Char('f');
        if (!digit && !hexLower) {
            return false;
        }
    }

    return true;
}

OperationResult TaskDescriptor::fromMagnet(const QString &uri, TaskDescriptor &outDescriptor)
{
    const QUrl url(uri.trimmed());
    if (!url.isValid() || url.scheme().compare(QLatin1String("magnet"), Qt::CaseInsensitive) != 0) {
        return malformed(QStringLiteral("Not a magnet uri: %1").arg(uri));
    }

    const QUrlQuery query(url);
    QString infoHash;
    for (const QString &xt : query.allQueryItemValues(QStringLiteral("xt"), QUrl::FullyDecoded)) {
        if (!xt.startsWith(kBtihPrefix, Qt::CaseInsensitive)) {
            continue;
        }

        const QString encoded = xt.mid(kBtihPrefix.size());
        if (encoded.size() == 40) {
            infoHash = encoded.toLower();
        } else if (encoded.size() == 32) {
            QByteArray decoded;
            if (decodeBase32(encoded, decoded) && decoded.size() == 20) {
                infoHash = QString::fromLatin1(decoded.toHex());
            }
        }
        break;
    }

    if (!isValidInfoHash(infoHash)) {
        return malformed(QStringLiteral("Magnet uri has no valid btih: %1").arg(uri));
    }

    TaskDescriptor descriptor;
    descriptor.infoHash = infoHash;
    descriptor.kind = TaskKind::Magnet;
    descriptor.raw = uri.trimmed().toUtf8();

    QString displayName = query.queryItemValue(QStringLiteral("dn"), QUrl::FullyDecoded);
    displayName.replace(QLatin1Char('+'), QLatin1Char(' '));
    descriptor.displayName = displayName.isEmpty() ? infoHash : displayName;

    for (const QString &tracker : query.allQueryItemValues(QStringLiteral("tr"), QUrl::FullyDecoded)) {
        if (!tracker.isEmpty() && !descriptor.trackers.contains(tracker)) {
            descriptor.trackers.append(tracker);
        }
    }

    outDescriptor = descriptor;
    return OperationResult::success();
}

OperationResult TaskDescriptor::fromMetainfo(const QByteArray &data, TaskDescriptor &outDescriptor)
{
    // Hostile input must never take the process down; any fault is a bad descriptor.
    try {
        return parseMetainfo(data, outDescriptor);
    } catch (const std::exception &e) {
        const QString error = QStringLiteral("Error loading metainfo: %1").arg(QString::fromLocal8Bit(e.what()));
        qWarning().noquote() << "[Descriptor]" << error;
        return malformed(error);
    }
}

OperationResult TaskDescriptor::fromMetainfoFile(const QString &path, TaskDescriptor &outDescriptor)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return malformed(QStringLiteral("Failed to open metainfo file %1: %2").arg(path, file.errorString()));
    }

    const OperationResult result = fromMetainfo(file.readAll(), outDescriptor);
    if (!result.ok) {
        return malformed(QStringLiteral("Error loading new torrent from file %1: %2").arg(path, result.error));
    }

    return result;
}

OperationResult TaskDescriptor::fromRecord(const QByteArray &record, TaskDescriptor &outDescriptor)
{
    if (record.startsWith("magnet:")) {
        return fromMagnet(QString::fromUtf8(record), outDescriptor);
    }

    return fromMetainfo(record, outDescriptor);
}
} // namespace STC::Core::Descriptor
