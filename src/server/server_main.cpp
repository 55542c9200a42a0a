#include <QCoreApplication>
#include <QCommandLineParser>
#include <QScopedPointer>
#include <QSettings>
#include <QUuid>
#include <QDebug>

#include "app/AppConfig.h"
#include "network/DiscoveryChannel.h"
#include "network/DiscoveryService.h"
#include "server/RelayServer.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanmeet-relay");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("LanMeet");
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Hosts one LAN meeting room relay and announces it.");
    parser.addHelpOption();
    parser.addVersionOption();
    AppConfig::addOptions(parser);
    QCommandLineOption roomOption("room", "Room name to announce", "name", AppConfig::defaultDisplayName());
    QCommandLineOption configOption("config", "Settings file (ini)", "file");
    parser.addOption(roomOption);
    parser.addOption(configOption);
    parser.process(app);

    QScopedPointer<QSettings> settings(parser.isSet(configOption)
        ? new QSettings(parser.value(configOption), QSettings::IniFormat)
        : new QSettings("LanMeet", "LanMeet"));
    AppConfig config = AppConfig::load(*settings);

    QString error;
    if (!config.applyOptions(parser, &error)) {
        qCritical() << "Invalid arguments:" << error;
        return 1;
    }

    DiscoveryChannel channel;
    if (!channel.open(config.discoveryGroup, config.discoveryPort, &error)) {
        qCritical() << "Failed to open discovery channel:" << error;
        return 1;
    }

    DiscoveryService discovery(&channel, config.timings);
    discovery.start();

    RelayServer relay;
    if (!relay.start(config.relayPort, &error)) {
        qCritical() << "Failed to start relay:" << error;
        return 1;
    }
    QObject::connect(&relay, &RelayServer::participantCountChanged,
                     &discovery, &DiscoveryService::setParticipantCount);

    const QString roomId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    RoomDescriptor room = discovery.startHosting(roomId, parser.value(roomOption), relay.port(),
                                                 DiscoveryChannel::preferredLocalAddress());

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        discovery.stopHosting();
        relay.stop(true);
        discovery.stop();
        channel.close();
    });

    qInfo() << "Room" << room.roomName << "(" << room.roomId << ") at" << room.relayUrl();
    return app.exec();
}
