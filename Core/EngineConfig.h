#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace STC::Core
{
struct EngineConfig
{
    int incomingPort = 50007;
    QString downloadDirectory;
    int maxConcurrentTask = 0;
    double seedRatio = 0.0;
    int removeTaskAfterStopped = 0;
    bool autoStart = true;

    QStringList trackers;
    bool alwaysAddTrackers = false;

    bool enableUpload = true;
    bool enableSeeding = true;
    qint64 uploadRateLimit = 0;
    qint64 downloadRateLimit = 0;

    QString proxyUrl;
    bool obfsPreferred = true;
    bool obfsRequirePreferred = false;
    bool useMmap = false;

    bool disableUtp = false;
    bool disableIPv6 = false;
    bool disableTrackers = false;
    bool noDefaultPortForwarding = true;
    int establishedConnsPerTorrent = 30;
    int halfOpenConnsPerTorrent = 25;
    int totalHalfOpenConns = 100;
    bool muteEngineLog = true;
    bool engineDebug = false;

    bool validate(QString *errorString = nullptr) const;

    QJsonObject toJson() const;
    bool fromJson(const QJsonObject &obj, QString *errorString = nullptr);

    friend bool operator==(const EngineConfig &lhs, const EngineConfig &rhs)
    {
        return lhs.incomingPort == rhs.incomingPort
            && lhs.downloadDirectory == rhs.downloadDirectory
            && lhs.maxConcurrentTask == rhs.maxConcurrentTask
            && lhs.seedRatio == rhs.seedRatio
            && lhs.removeTaskAfterStopped == rhs.removeTaskAfterStopped
            && lhs.autoStart == rhs.autoStart
            && lhs.trackers == rhs.trackers
            && lhs.alwaysAddTrackers == rhs.alwaysAddTrackers
            && lhs.enableUpload == rhs.enableUpload
            && lhs.enableSeeding == rhs.enableSeeding
            && lhs.uploadRateLimit == rhs.uploadRateLimit
            && lhs.downloadRateLimit == rhs.downloadRateLimit
            && lhs.proxyUrl == rhs.proxyUrl
            && lhs.obfsPreferred == rhs.obfsPreferred
            && lhs.obfsRequirePreferred == rhs.obfsRequirePreferred
            && lhs.useMmap == rhs.useMmap
            && lhs.disableUtp == rhs.disableUtp
            && lhs.disableIPv6 == rhs.disableIPv6
            && lhs.disableTrackers == rhs.disableTrackers
            && lhs.noDefaultPortForwarding == rhs.noDefaultPortForwarding
            && lhs.establishedConnsPerTorrent == rhs.establishedConnsPerTorrent
            && lhs.halfOpenConnsPerTorrent == rhs.halfOpenConnsPerTorrent
            && lhs.totalHalfOpenConns == rhs.totalHalfOpenConns
            && lhs.muteEngineLog == rhs.muteEngineLog
            && lhs.engineDebug == rhs.engineDebug;
    }

    friend bool operator!=(const EngineConfig &lhs, const EngineConfig &rhs)
    {
        return !(lhs == rhs);
    }
};
} // namespace STC::Core
