#include "EngineConfig.h"

#include <QJsonArray>
#include <QUrl>

namespace STC::Core
{
bool EngineConfig::validate(QString *errorString) const
{
    QString error;

    if (incomingPort <= 0 || incomingPort > 65535) {
        error = QStringLiteral("Invalid incoming port (%1)").arg(incomingPort);
    } else if (downloadDirectory.isEmpty()) {
        error = QStringLiteral("Download directory is empty");
    } else if (maxConcurrentTask < 0) {
        error = QStringLiteral("Invalid max concurrent task (%1)").arg(maxConcurrentTask);
    } else if (seedRatio < 0.0) {
        error = QStringLiteral("Invalid seed ratio (%1)").arg(seedRatio);
    } else if (removeTaskAfterStopped < 0) {
        error = QStringLiteral("Invalid remove-after-stopped duration (%1)").arg(removeTaskAfterStopped);
    } else if (uploadRateLimit < 0 || downloadRateLimit < 0) {
        error = QStringLiteral("Rate limits must not be negative");
    } else if (!proxyUrl.isEmpty()) {
        const QUrl url(proxyUrl, QUrl::StrictMode);
        if (!url.isValid() || url.scheme().isEmpty() || url.host().isEmpty()) {
            error = QStringLiteral("Invalid proxy url: %1").arg(proxyUrl);
        }
    }

    if (error.isEmpty()) {
        return true;
    }

    if (errorString) {
        *errorString = error;
    }
    return false;
}

QJsonObject EngineConfig::toJson() const
{
    QJsonObject obj;
    obj.insert("incomingPort", incomingPort);
    obj.insert("downloadDirectory", downloadDirectory);
    obj.insert("maxConcurrentTask", maxConcurrentTask);
    obj.insert("seedRatio", seedRatio);
    obj.insert("removeTaskAfterStopped", removeTaskAfterStopped);
    obj.insert("autoStart", autoStart);
    obj.insert("trackers", QJsonArray::fromStringList(trackers));
    obj.insert("alwaysAddTrackers", alwaysAddTrackers);
    obj.insert("enableUpload", enableUpload);
    obj.insert("enableSeeding", enableSeeding);
    obj.insert("uploadRateLimit", uploadRateLimit);
    obj.insert("downloadRateLimit", downloadRateLimit);
    obj.insert("proxyUrl", proxyUrl);
    obj.insert("obfsPreferred", obfsPreferred);
    obj.insert("obfsRequirePreferred", obfsRequirePreferred);
    obj.insert("useMmap", useMmap);
    obj.insert("disableUtp", disableUtp);
    obj.insert("disableIPv6", disableIPv6);
    obj.insert("disableTrackers", disableTrackers);
    obj.insert("noDefaultPortForwarding", noDefaultPortForwarding);
    obj.insert("establishedConnsPerTorrent", establishedConnsPerTorrent);
    obj.insert("halfOpenConnsPerTorrent", halfOpenConnsPerTorrent);
    obj.insert("totalHalfOpenConns", totalHalfOpenConns);
    obj.insert("muteEngineLog", muteEngineLog);
    obj.insert("engineDebug", engineDebug);
    return obj;
}

bool EngineConfig::fromJson(const QJsonObject &obj, QString *errorString)
{
    // Missing keys keep their current value.
    EngineConfig parsed = *this;

    auto readInt = [&obj](const char *key, int &target) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isDouble()) {
            target = value.toInt(target);
        }
        return value.isUndefined() || value.isDouble();
    };
    auto readInt64 = [&obj](const char *key, qint64 &target) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isDouble()) {
            target = value.toInteger(target);
        }
        return value.isUndefined() || value.isDouble();
    };
    auto readBool = [&obj](const char *key, bool &target) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isBool()) {
            target = value.toBool();
        }
        return value.isUndefined() || value.isBool();
    };
    auto readString = [&obj](const char *key, QString &target) {
        const QJsonValue value = obj.value(QLatin1String(key));
        if (value.isString()) {
            target = value.toString();
        }
        return value.isUndefined() || value.isString();
    };

    const bool typesOk = readInt("incomingPort", parsed.incomingPort)
        && readString("downloadDirectory", parsed.downloadDirectory)
        && readInt("maxConcurrentTask", parsed.maxConcurrentTask)
        && readInt("removeTaskAfterStopped", parsed.removeTaskAfterStopped)
        && readBool("autoStart", parsed.autoStart)
        && readBool("alwaysAddTrackers", parsed.alwaysAddTrackers)
        && readBool("enableUpload", parsed.enableUpload)
        && readBool("enableSeeding", parsed.enableSeeding)
        && readInt64("uploadRateLimit", parsed.uploadRateLimit)
        && readInt64("downloadRateLimit", parsed.downloadRateLimit)
        && readString("proxyUrl", parsed.proxyUrl)
        && readBool("obfsPreferred", parsed.obfsPreferred)
        && readBool("obfsRequirePreferred", parsed.obfsRequirePreferred)
        && readBool("useMmap", parsed.useMmap)
        && readBool("disableUtp", parsed.disableUtp)
        && readBool("disableIPv6", parsed.disableIPv6)
        && readBool("disableTrackers", parsed.disableTrackers)
        && readBool("noDefaultPortForwarding", parsed.noDefaultPortForwarding)
        && readInt("establishedConnsPerTorrent", parsed.establishedConnsPerTorrent)
        && readInt("halfOpenConnsPerTorrent", parsed.halfOpenConnsPerTorrent)
        && readInt("totalHalfOpenConns", parsed.totalHalfOpenConns)
        && readBool("muteEngineLog", parsed.muteEngineLog)
        && readBool("engineDebug", parsed.engineDebug);

    if (!typesOk) {
        if (errorString) {
            *errorString = QStringLiteral("Config json has a field of the wrong type");
        }
        return false;
    }

    const QJsonValue ratio = obj.value("seedRatio");
    if (ratio.isDouble()) {
        parsed.seedRatio = ratio.toDouble();
    } else if (!ratio.isUndefined()) {
        if (errorString) {
            *errorString = QStringLiteral("Config field seedRatio must be a number");
        }
        return false;
    }

    const QJsonValue trackerValue = obj.value("trackers");
    if (trackerValue.isArray()) {
        parsed.trackers.clear();
        for (const auto &item : trackerValue.toArray()) {
            const QString tracker = item.toString().trimmed();
            if (!tracker.isEmpty()) {
                parsed.trackers.append(tracker);
            }
        }
    } else if (!trackerValue.isUndefined()) {
        if (errorString) {
            *errorString = QStringLiteral("Config field trackers must be an array");
        }
        return false;
    }

    *this = parsed;
    return true;
}
} // namespace STC::Core
