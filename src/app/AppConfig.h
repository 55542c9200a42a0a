#pragma once

#include <QHostAddress>
#include <QString>

#include "network/DiscoveryTimings.h"

class QSettings;
class QCommandLineParser;

struct AppConfig {
    static const int kMinIntervalMs = 100;
    static const int kMaxReconnectDelayMs = 60000;
    static const int kMaxReconnectAttempts = 16;

    QHostAddress discoveryGroup;
    quint16 discoveryPort = 0;
    DiscoveryTimings timings;

    quint16 relayPort = 0;
    int reconnectDelayMs = 2000;
    int maxReconnectAttempts = 5;

    bool cryptoEnabled = true;

    QString peerId;
    QString displayName;

    AppConfig();

    // reconnectDelayMs doubled per attempt, capped at kMaxReconnectDelayMs.
    int reconnectDelayFor(int attempt) const;

    // Generates and stores identity/peerId when the settings have none.
    // Out-of-range timings and reconnect limits are clamped.
    static AppConfig load(QSettings& settings);
    void save(QSettings& settings) const;

    // --port, --group, --name, --no-crypto. --room and --config are read by the caller.
    static void addOptions(QCommandLineParser& parser);
    bool applyOptions(const QCommandLineParser& parser, QString* error = nullptr);

    static QString defaultDisplayName();
};
