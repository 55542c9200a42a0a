#pragma once

#include <QObject>
#include <QMap>
#include <QSharedPointer>
#include <QTimer>
#include <QUrl>

#include "app/AppConfig.h"
#include "models/Invitation.h"
#include "models/PeerDescriptor.h"
#include "models/PeerLink.h"
#include "models/RoomDescriptor.h"

class ChannelCrypto;
class DiscoveryChannel;
class DiscoveryService;
class MediaEngine;
class NegotiationCoordinator;
class PresenceService;
class RelayClient;
class RelayServer;
struct RelayEnvelope;

struct OperationResult {
    bool ok = true;
    QString error;

    static OperationResult success() { return OperationResult(); }
    static OperationResult failure(const QString& error) {
        OperationResult r;
        r.ok = false;
        r.error = error;
        return r;
    }
};

// Everything one instance does on the LAN: presence, the room directory,
// hosting a relay and taking part in one meeting at a time. Hosting always
// joins the own relay as an ordinary participant.
class MeetingSession : public QObject {
    Q_OBJECT

public:
    MeetingSession(const AppConfig& config, MediaEngine* engine, QObject* parent = nullptr);
    ~MeetingSession();

    OperationResult start();
    void stop();
    bool isStarted() const { return m_started; }

    OperationResult startHosting(const QString& roomName);
    void stopHosting();
    bool isHosting() const { return m_hosting; }

    // Asynchronous: inMeetingChanged(true) on welcome, sessionFailed otherwise.
    OperationResult joinRoom(const RoomDescriptor& room);
    OperationResult joinRoom(const QString& hostAddress, quint16 port,
                             const QString& roomId, const QString& roomName);
    void leaveRoom();

    OperationResult sendInvitation(const QStringList& targetPeerIds);

    bool isInRoom() const { return m_joining || m_inMeeting; }
    bool isInMeeting() const { return m_inMeeting; }
    RoomDescriptor currentRoom() const { return m_currentRoom; }

    const AppConfig& config() const { return m_config; }
    QList<RoomDescriptor> rooms() const;
    QList<PeerDescriptor> peers() const;

    DiscoveryService* discovery() const { return m_discovery; }
    PresenceService* presence() const { return m_presence; }
    RelayServer* relayServer() const { return m_relayServer; }
    NegotiationCoordinator* coordinator() const { return m_coordinator; }

signals:
    void roomsChanged(const QList<RoomDescriptor>& rooms);
    void peersChanged(const QList<PeerDescriptor>& peers);
    void invitationReceived(const Invitation& invitation);
    void inMeetingChanged(bool inMeeting);
    void sessionFailed(const QString& error);

    void linkStateChanged(const QString& peerId, NegotiationState state);
    void peerRemoved(const QString& peerId);
    void remoteMediaReady(const QString& peerId);
    void negotiationFailed(const QString& peerId, const QString& error);
    void meetingEnded();

private slots:
    void onWelcomed();
    void onEnvelopeReceived(const RelayEnvelope& env);
    void onEnvelopeReady(const RelayEnvelope& env);
    void onConnectFailed(const QString& error);
    void onConnectionClosed();
    void onMeetingEnded();
    void onReconnectTimer();

private:
    OperationResult beginJoin(const RoomDescriptor& room, const QUrl& relayUrl);
    ChannelCrypto* cryptoForRoom(const QString& roomId, QString* error);
    void leaveRelay();
    void shutdownRelayServer(bool broadcastEnd);
    void scheduleReconnect();
    void failSession(const QString& error);

    AppConfig m_config;
    MediaEngine* m_engine;

    DiscoveryChannel* m_channel;
    DiscoveryService* m_discovery;
    PresenceService* m_presence;
    RelayClient* m_relayClient;
    RelayServer* m_relayServer = nullptr;
    NegotiationCoordinator* m_coordinator = nullptr;
    QTimer* m_reconnectTimer;

    QMap<QString, QSharedPointer<ChannelCrypto>> m_cryptoByRoom;

    bool m_started = false;
    bool m_hosting = false;
    bool m_joining = false;
    bool m_inMeeting = false;
    int m_reconnectAttempts = 0;
    RoomDescriptor m_currentRoom;
    QUrl m_relayUrl;
};
