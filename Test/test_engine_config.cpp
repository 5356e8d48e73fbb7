#include <QCoreApplication>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>

#include "../Core/EngineConfig.h"

using STC::Core::EngineConfig;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    qInfo() << "=== Engine Config Test ===";

    {
        qInfo() << "\n--- Test 1: validation ---";

        EngineConfig config;
        QString error;
        if (config.validate(&error)) {
            qCritical() << "Config without download directory must be invalid";
            return 1;
        }

        config.downloadDirectory = "/tmp/downloads";
        if (!config.validate(&error)) {
            qCritical() << "Default config with a directory should be valid:" << error;
            return 1;
        }

        EngineConfig badPort = config;
        badPort.incomingPort = 70000;
        if (badPort.validate(&error) || error != "Invalid incoming port (70000)") {
            qCritical() << "Unexpected port error:" << error;
            return 1;
        }

        EngineConfig negative = config;
        negative.maxConcurrentTask = -1;
        if (negative.validate(&error)) {
            qCritical() << "Negative max concurrent task must be rejected";
            return 1;
        }

        EngineConfig proxy = config;
        proxy.proxyUrl = "not a url";
        if (proxy.validate(&error)) {
            qCritical() << "Malformed proxy url must be rejected";
            return 1;
        }
        proxy.proxyUrl = "socks5://127.0.0.1:1080";
        if (!proxy.validate(&error)) {
            qCritical() << "Valid proxy url rejected:" << error;
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 2: json round trip ---";

        EngineConfig original;
        original.incomingPort = 6881;
        original.downloadDirectory = "/data/torrents";
        original.maxConcurrentTask = 3;
        original.seedRatio = 1.25;
        original.removeTaskAfterStopped = 600;
        original.autoStart = false;
        original.trackers = QStringList({ "udp://a.example:80", "http://b.example/announce" });
        original.alwaysAddTrackers = true;
        original.uploadRateLimit = 1024 * 1024;

        const QByteArray bytes = QJsonDocument(original.toJson()).toJson();
        EngineConfig restored;
        QString error;
        if (!restored.fromJson(QJsonDocument::fromJson(bytes).object(), &error)) {
            qCritical() << "fromJson failed:" << error;
            return 1;
        }
        if (restored != original) {
            qCritical() << "Round trip changed the config:" << bytes;
            return 1;
        }
    }

    {
        qInfo() << "\n--- Test 3: partial and malformed json ---";

        EngineConfig config;
        config.downloadDirectory = "/keep";
        QJsonObject partial;
        partial.insert("incomingPort", 12345);
        partial.insert("trackers", QJsonArray({ " udp://t.example:1 ", "" }));

        QString error;
        if (!config.fromJson(partial, &error)) {
            qCritical() << "Partial json rejected:" << error;
            return 1;
        }
        if (config.incomingPort != 12345 || config.downloadDirectory != "/keep"
            || config.trackers != QStringList({ "udp://t.example:1" })) {
            qCritical() << "Partial json applied incorrectly";
            return 1;
        }

        QJsonObject wrongType;
        wrongType.insert("autoStart", "yes");
        const EngineConfig before = config;
        if (config.fromJson(wrongType, &error)) {
            qCritical() << "Wrong field type should fail";
            return 1;
        }
        if (config != before) {
            qCritical() << "Failed parse must leave the config untouched";
            return 1;
        }
    }

    qInfo() << "\nAll engine config tests PASSED";
    return 0;
}
