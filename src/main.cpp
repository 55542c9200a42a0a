#include <QCoreApplication>
#include <QCommandLineParser>
#include <QScopedPointer>
#include <QSettings>
#include <QDebug>

#include "app/AppConfig.h"
#include "network/DiscoveryChannel.h"
#include "network/DiscoveryService.h"
#include "network/PresenceService.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanmeet-scan");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("LanMeet");
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{message}");

    QCommandLineParser parser;
    parser.setApplicationDescription("Announces presence and lists rooms and peers on the LAN.");
    parser.addHelpOption();
    parser.addVersionOption();
    AppConfig::addOptions(parser);
    QCommandLineOption configOption("config", "Settings file (ini)", "file");
    QCommandLineOption inviteOption("invite", "Invite a peer id (repeatable)", "peerId");
    QCommandLineOption hostOption("host", "Relay host address of the room to invite to", "address");
    QCommandLineOption roomIdOption("room-id", "Id of the room to invite to", "id");
    QCommandLineOption roomOption("room", "Name of the room to invite to", "name", AppConfig::defaultDisplayName());
    parser.addOption(configOption);
    parser.addOption(inviteOption);
    parser.addOption(hostOption);
    parser.addOption(roomIdOption);
    parser.addOption(roomOption);
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
    PresenceService presence(&channel, config.timings);
    discovery.start();
    presence.start();
    presence.announceSelf(config.peerId, config.displayName, DiscoveryChannel::preferredLocalAddress());

    discovery.observe(&app, [](const QList<RoomDescriptor>& rooms) {
        qInfo() << "Rooms:" << rooms.size();
        for (const RoomDescriptor& r : rooms) {
            qInfo().noquote() << QString("  %1  %2  %3 participant(s)  [%4]")
                                 .arg(r.roomName, r.relayUrl()).arg(r.participantCount).arg(r.roomId);
        }
    });
    presence.observePeers(&app, [](const QList<PeerDescriptor>& peers) {
        qInfo() << "Peers:" << peers.size();
        for (const PeerDescriptor& p : peers) {
            qInfo().noquote() << QString("  %1%2  %3  %4  [%5]")
                                 .arg(p.peerName, p.isSelf ? QString(" (you)") : QString())
                                 .arg(p.peerAddress)
                                 .arg(p.isInRoom() ? p.currentRoomName : QString("-"))
                                 .arg(p.peerId);
        }
    });
    presence.observeInvitations(&app, [](const Invitation& inv) {
        qInfo().noquote() << QString("Invitation from %1 to %2 at ws://%3:%4 [%5]")
                             .arg(inv.fromPeerName, inv.roomName, inv.hostAddress)
                             .arg(inv.relayPort).arg(inv.roomId);
    });

    if (parser.isSet(inviteOption)) {
        if (!parser.isSet(hostOption) || !parser.isSet(roomIdOption)) {
            qCritical() << "--invite needs --host and --room-id";
            return 1;
        }
        if (!presence.sendInvitation(parser.value(roomIdOption), parser.value(roomOption),
                                     parser.value(hostOption), config.relayPort,
                                     parser.values(inviteOption), &error)) {
            qCritical() << "Failed to send invitation:" << error;
            return 1;
        }
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        presence.stop();
        discovery.stop();
        channel.close();
    });

    return app.exec();
}
