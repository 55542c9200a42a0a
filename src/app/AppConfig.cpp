#include "app/AppConfig.h"

#include "network/DiscoveryChannel.h"
#include "server/RelayServer.h"

#include <QCommandLineParser>
#include <QHostInfo>
#include <QSettings>
#include <QUuid>
#include <QDebug>

const int AppConfig::kMinIntervalMs;
const int AppConfig::kMaxReconnectDelayMs;
const int AppConfig::kMaxReconnectAttempts;

namespace {

int boundedInt(QSettings& settings, const QString& key, int fallback, int low, int high) {
    bool ok = false;
    int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        qWarning() << "[SESSION] invalid" << key << "in settings, using" << fallback;
        return fallback;
    }
    int bounded = qBound(low, value, high);
    if (bounded != value) {
        qWarning() << "[SESSION]" << key << value << "out of range, using" << bounded;
    }
    return bounded;
}

}

AppConfig::AppConfig()
    : discoveryGroup(QString(DiscoveryChannel::kDefaultGroup))
    , discoveryPort(DiscoveryChannel::kDefaultPort)
    , relayPort(RelayServer::kDefaultPort)
{
}

QString AppConfig::defaultDisplayName() {
    QString name = QHostInfo::localHostName();
    return name.isEmpty() ? QString("Host-PC") : name;
}

AppConfig AppConfig::load(QSettings& settings) {
    AppConfig config;
    const AppConfig defaults;

    QHostAddress group(settings.value("discovery/group", defaults.discoveryGroup.toString()).toString());
    if (group.isNull()) {
        qWarning() << "[SESSION] invalid discovery/group in settings, using" << defaults.discoveryGroup.toString();
        group = defaults.discoveryGroup;
    }
    config.discoveryGroup = group;
    config.discoveryPort = static_cast<quint16>(settings.value("discovery/port", int(defaults.discoveryPort)).toUInt());

    const int maxIntervalMs = 60 * 60 * 1000;
    config.timings.roomIntervalMs = boundedInt(settings, "discovery/roomIntervalMs",
                                               defaults.timings.roomIntervalMs, kMinIntervalMs, maxIntervalMs);
    config.timings.peerIntervalMs = boundedInt(settings, "discovery/peerIntervalMs",
                                               defaults.timings.peerIntervalMs, kMinIntervalMs, maxIntervalMs);
    config.timings.sweepIntervalMs = boundedInt(settings, "discovery/sweepIntervalMs",
                                                defaults.timings.sweepIntervalMs, kMinIntervalMs, maxIntervalMs);

    // An entry must survive at least one missed broadcast.
    const qint64 longestInterval = qMax(config.timings.roomIntervalMs, config.timings.peerIntervalMs);
    config.timings.ttlMs = settings.value("discovery/ttlMs", defaults.timings.ttlMs).toLongLong();
    if (config.timings.ttlMs <= longestInterval) {
        qWarning() << "[SESSION] discovery/ttlMs" << config.timings.ttlMs << "not above the broadcast interval, using"
                   << 2 * longestInterval;
        config.timings.ttlMs = 2 * longestInterval;
    }

    config.relayPort = static_cast<quint16>(settings.value("relay/port", int(defaults.relayPort)).toUInt());
    config.reconnectDelayMs = boundedInt(settings, "relay/reconnectDelayMs",
                                         defaults.reconnectDelayMs, kMinIntervalMs, kMaxReconnectDelayMs);
    config.maxReconnectAttempts = boundedInt(settings, "relay/maxReconnectAttempts",
                                             defaults.maxReconnectAttempts, 0, kMaxReconnectAttempts);

    config.cryptoEnabled = settings.value("crypto/enabled", defaults.cryptoEnabled).toBool();

    config.peerId = settings.value("identity/peerId").toString();
    if (config.peerId.isEmpty()) {
        config.peerId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        settings.setValue("identity/peerId", config.peerId);
        qInfo() << "[SESSION] generated peer id" << config.peerId;
    }

    config.displayName = settings.value("identity/displayName").toString();
    if (config.displayName.isEmpty()) {
        config.displayName = defaultDisplayName();
    }

    return config;
}

int AppConfig::reconnectDelayFor(int attempt) const {
    const qint64 base = qMax(0, reconnectDelayMs);
    const int shift = qBound(0, attempt, 30);
    return int(qMin<qint64>(base << shift, kMaxReconnectDelayMs));
}

void AppConfig::save(QSettings& settings) const {
    settings.setValue("discovery/group", discoveryGroup.toString());
    settings.setValue("discovery/port", int(discoveryPort));
    settings.setValue("discovery/roomIntervalMs", timings.roomIntervalMs);
    settings.setValue("discovery/peerIntervalMs", timings.peerIntervalMs);
    settings.setValue("discovery/sweepIntervalMs", timings.sweepIntervalMs);
    settings.setValue("discovery/ttlMs", timings.ttlMs);
    settings.setValue("relay/port", int(relayPort));
    settings.setValue("relay/reconnectDelayMs", reconnectDelayMs);
    settings.setValue("relay/maxReconnectAttempts", maxReconnectAttempts);
    settings.setValue("crypto/enabled", cryptoEnabled);
    settings.setValue("identity/peerId", peerId);
    settings.setValue("identity/displayName", displayName);
}

void AppConfig::addOptions(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption("port", "Relay port (default: 57788)", "port"));
    parser.addOption(QCommandLineOption("group", "Discovery multicast group (default: 239.255.255.250)", "address"));
    parser.addOption(QCommandLineOption("name", "Display name announced to other peers", "name"));
    parser.addOption(QCommandLineOption("no-crypto", "Send negotiation payloads unencrypted"));
}

bool AppConfig::applyOptions(const QCommandLineParser& parser, QString* error) {
    if (parser.isSet("port")) {
        bool ok = false;
        uint port = parser.value("port").toUInt(&ok);
        if (!ok || port > 65535) {
            if (error) *error = QString("invalid port '%1'").arg(parser.value("port"));
            return false;
        }
        relayPort = static_cast<quint16>(port);
    }
    if (parser.isSet("group")) {
        QHostAddress group(parser.value("group"));
        if (group.isNull() || !group.isMulticast()) {
            if (error) *error = QString("invalid multicast group '%1'").arg(parser.value("group"));
            return false;
        }
        discoveryGroup = group;
    }
    if (parser.isSet("name") && !parser.value("name").isEmpty()) {
        displayName = parser.value("name");
    }
    if (parser.isSet("no-crypto")) {
        cryptoEnabled = false;
    }
    return true;
}
