#include "app/MeetingSession.h"

#include "negotiation/MediaEngine.h"
#include "negotiation/NegotiationCoordinator.h"
#include "network/DiscoveryChannel.h"
#include "network/DiscoveryService.h"
#include "network/PresenceService.h"
#include "network/RelayClient.h"
#include "protocol/RelayEnvelope.h"
#include "server/RelayServer.h"
#include "utils/ChannelCrypto.h"

#include <QUuid>
#include <QDebug>

MeetingSession::MeetingSession(const AppConfig& config, MediaEngine* engine, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_engine(engine)
    , m_channel(new DiscoveryChannel(this))
    , m_discovery(new DiscoveryService(m_channel, config.timings, this))
    , m_presence(new PresenceService(m_channel, config.timings, this))
    , m_relayClient(new RelayClient(this))
    , m_reconnectTimer(new QTimer(this))
{
    m_reconnectTimer->setSingleShot(true);
    connect(m_reconnectTimer, &QTimer::timeout, this, &MeetingSession::onReconnectTimer);

    connect(m_discovery, &DiscoveryService::roomsChanged, this, &MeetingSession::roomsChanged);
    connect(m_presence, &PresenceService::peersChanged, this, &MeetingSession::peersChanged);
    connect(m_presence, &PresenceService::invitationReceived, this, &MeetingSession::invitationReceived);

    connect(m_relayClient, &RelayClient::welcomed, this, &MeetingSession::onWelcomed);
    connect(m_relayClient, &RelayClient::envelopeReceived, this, &MeetingSession::onEnvelopeReceived);
    connect(m_relayClient, &RelayClient::connectFailed, this, &MeetingSession::onConnectFailed);
    connect(m_relayClient, &RelayClient::connectionClosed, this, &MeetingSession::onConnectionClosed);
}

MeetingSession::~MeetingSession() {
    stop();
}

OperationResult MeetingSession::start() {
    if (m_started) return OperationResult::success();

    QString error;
    if (!m_channel->open(m_config.discoveryGroup, m_config.discoveryPort, &error)) {
        return OperationResult::failure(error);
    }

    m_discovery->start();
    m_presence->start();
    m_presence->announceSelf(m_config.peerId, m_config.displayName,
                             DiscoveryChannel::preferredLocalAddress());
    m_started = true;

    qInfo() << "[SESSION] started as" << m_config.displayName << m_config.peerId;
    return OperationResult::success();
}

void MeetingSession::stop() {
    if (!m_started) return;

    if (m_hosting) stopHosting();
    else leaveRoom();

    // Timers stop before the shared socket is released.
    m_presence->stop();
    m_discovery->stop();
    m_channel->close();
    m_started = false;

    qInfo() << "[SESSION] stopped";
}

QList<RoomDescriptor> MeetingSession::rooms() const {
    return m_discovery->rooms();
}

QList<PeerDescriptor> MeetingSession::peers() const {
    return m_presence->peers();
}

// --- Hosting ---

OperationResult MeetingSession::startHosting(const QString& roomName) {
    if (!m_started) return OperationResult::failure("session not started");
    if (isInRoom() || m_hosting) return OperationResult::failure("already-in-room");
    const QString name = roomName.trimmed().isEmpty()
        ? AppConfig::defaultDisplayName() : roomName.trimmed();

    m_relayServer = new RelayServer(this);
    QString error;
    if (!m_relayServer->start(m_config.relayPort, &error)) {
        delete m_relayServer;
        m_relayServer = nullptr;
        return OperationResult::failure(error);
    }
    connect(m_relayServer, &RelayServer::participantCountChanged,
            m_discovery, &DiscoveryService::setParticipantCount);

    const QString roomId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    RoomDescriptor room = m_discovery->startHosting(roomId, name, m_relayServer->port(),
                                                    DiscoveryChannel::preferredLocalAddress());
    m_hosting = true;
    m_reconnectAttempts = 0;
    qInfo() << "[SESSION] hosting" << room.roomName << "on port" << room.relayPort;

    QUrl localUrl(QString("ws://127.0.0.1:%1").arg(room.relayPort));
    OperationResult result = beginJoin(room, localUrl);
    if (!result.ok) {
        m_discovery->stopHosting();
        shutdownRelayServer(false);
        m_hosting = false;
    }
    return result;
}

void MeetingSession::stopHosting() {
    if (!m_hosting) return;
    qInfo() << "[SESSION] stop hosting" << m_currentRoom.roomName;

    m_reconnectTimer->stop();
    m_discovery->stopHosting();
    shutdownRelayServer(true);
    m_hosting = false;
    leaveRelay();
}

void MeetingSession::shutdownRelayServer(bool broadcastEnd) {
    if (!m_relayServer) return;
    m_relayServer->disconnect(this);
    m_relayServer->disconnect(m_discovery);
    m_relayServer->stop(broadcastEnd);
    m_relayServer->deleteLater();
    m_relayServer = nullptr;
}

// --- Joining ---

OperationResult MeetingSession::joinRoom(const RoomDescriptor& room) {
    if (!m_started) return OperationResult::failure("session not started");
    if (isInRoom() || m_hosting) return OperationResult::failure("already-in-room");
    if (room.roomId.isEmpty() || room.hostAddress.isEmpty() || room.relayPort == 0) {
        return OperationResult::failure("incomplete room descriptor");
    }
    return beginJoin(room, QUrl(room.relayUrl()));
}

OperationResult MeetingSession::joinRoom(const QString& hostAddress, quint16 port,
                                         const QString& roomId, const QString& roomName) {
    RoomDescriptor room;
    room.roomId = roomId;
    room.roomName = roomName;
    room.hostAddress = hostAddress;
    room.relayPort = port;
    return joinRoom(room);
}

ChannelCrypto* MeetingSession::cryptoForRoom(const QString& roomId, QString* error) {
    auto it = m_cryptoByRoom.find(roomId);
    if (it == m_cryptoByRoom.end()) {
        it = m_cryptoByRoom.insert(roomId, QSharedPointer<ChannelCrypto>::create(roomId));
    }
    if (!(*it)->deriveKey(error)) return nullptr;
    return it->data();
}

OperationResult MeetingSession::beginJoin(const RoomDescriptor& room, const QUrl& relayUrl) {
    ChannelCrypto* crypto = nullptr;
    if (m_config.cryptoEnabled) {
        QString error;
        crypto = cryptoForRoom(room.roomId, &error);
        if (!crypto) return OperationResult::failure(QString("key derivation failed: %1").arg(error));
    }

    m_coordinator = new NegotiationCoordinator(m_config.peerId, m_engine, this);
    m_coordinator->setFrameCrypto(crypto);
    connect(m_coordinator, &NegotiationCoordinator::envelopeReady, this, &MeetingSession::onEnvelopeReady);
    connect(m_coordinator, &NegotiationCoordinator::linkStateChanged, this, &MeetingSession::linkStateChanged);
    connect(m_coordinator, &NegotiationCoordinator::peerRemoved, this, &MeetingSession::peerRemoved);
    connect(m_coordinator, &NegotiationCoordinator::remoteMediaReady, this, &MeetingSession::remoteMediaReady);
    connect(m_coordinator, &NegotiationCoordinator::negotiationFailed, this, &MeetingSession::negotiationFailed);
    connect(m_coordinator, &NegotiationCoordinator::meetingEnded, this, &MeetingSession::onMeetingEnded);

    m_relayClient->setCrypto(crypto);

    QString error;
    if (!m_relayClient->connectToRelay(relayUrl, m_config.peerId, m_config.displayName, &error)) {
        m_coordinator->deleteLater();
        m_coordinator = nullptr;
        return OperationResult::failure(error);
    }

    m_currentRoom = room;
    m_relayUrl = relayUrl;
    m_joining = true;
    qInfo() << "[SESSION] joining" << room.roomName << "at" << relayUrl.toString();
    return OperationResult::success();
}

void MeetingSession::leaveRoom() {
    if (m_hosting) {
        stopHosting();
        return;
    }
    leaveRelay();
}

void MeetingSession::leaveRelay() {
    if (!isInRoom()) return;
    const bool wasInMeeting = m_inMeeting;

    m_reconnectTimer->stop();
    m_relayClient->leave();
    m_relayClient->close();
    m_relayClient->setCrypto(nullptr);

    if (m_coordinator) {
        m_coordinator->removeAllPeers();
        m_coordinator->disconnect(this);
        m_coordinator->deleteLater();
        m_coordinator = nullptr;
    }

    qInfo() << "[SESSION] left" << m_currentRoom.roomName;
    m_joining = false;
    m_inMeeting = false;
    m_currentRoom = RoomDescriptor();
    m_relayUrl = QUrl();
    m_presence->setCurrentRoomName(QString());

    if (wasInMeeting) emit inMeetingChanged(false);
}

OperationResult MeetingSession::sendInvitation(const QStringList& targetPeerIds) {
    if (!isInRoom()) return OperationResult::failure("not in a room");
    if (targetPeerIds.isEmpty()) return OperationResult::failure("no invitees");

    QString error;
    if (!m_presence->sendInvitation(m_currentRoom.roomId, m_currentRoom.roomName,
                                    m_currentRoom.hostAddress, m_currentRoom.relayPort,
                                    targetPeerIds, &error)) {
        return OperationResult::failure(error);
    }
    return OperationResult::success();
}

// --- Relay client events ---

void MeetingSession::onWelcomed() {
    m_joining = false;
    m_reconnectAttempts = 0;
    m_presence->setCurrentRoomName(m_currentRoom.roomName);
    if (!m_inMeeting) {
        m_inMeeting = true;
        qInfo() << "[SESSION] in meeting" << m_currentRoom.roomName;
        emit inMeetingChanged(true);
    }
}

void MeetingSession::onEnvelopeReceived(const RelayEnvelope& env) {
    if (m_coordinator) m_coordinator->handleEnvelope(env);
}

void MeetingSession::onEnvelopeReady(const RelayEnvelope& env) {
    if (!m_relayClient->send(env)) {
        qWarning() << "[SESSION] could not send" << relayTypeTag(env.type) << "to" << env.to;
    }
}

void MeetingSession::onConnectFailed(const QString& error) {
    if (m_hosting && m_inMeeting && m_relayServer && m_relayServer->isRunning()) {
        scheduleReconnect();
        return;
    }
    failSession(error);
}

void MeetingSession::onConnectionClosed() {
    if (m_hosting && m_relayServer && m_relayServer->isRunning()) {
        qWarning() << "[SESSION] lost connection to own relay";
        if (m_coordinator) m_coordinator->removeAllPeers();
        scheduleReconnect();
        return;
    }
    failSession("relay-closed");
}

void MeetingSession::onMeetingEnded() {
    qInfo() << "[SESSION] meeting ended by host";
    leaveRoom();
    emit meetingEnded();
}

// --- Host self-reconnect ---

void MeetingSession::scheduleReconnect() {
    if (m_reconnectAttempts >= m_config.maxReconnectAttempts) {
        failSession(QString("relay reconnect failed after %1 attempts").arg(m_reconnectAttempts));
        return;
    }
    const int delay = m_config.reconnectDelayFor(m_reconnectAttempts);
    ++m_reconnectAttempts;
    qInfo() << "[SESSION] reconnecting to own relay in" << delay << "ms, attempt" << m_reconnectAttempts;
    m_reconnectTimer->start(delay);
}

void MeetingSession::onReconnectTimer() {
    if (!m_hosting || !m_relayServer) return;
    QString error;
    if (!m_relayClient->connectToRelay(m_relayUrl, m_config.peerId, m_config.displayName, &error)) {
        qWarning() << "[SESSION] reconnect failed:" << error;
        scheduleReconnect();
    }
}

void MeetingSession::failSession(const QString& error) {
    qWarning() << "[SESSION] session failed:" << error;
    if (m_hosting) stopHosting();
    else leaveRelay();
    emit sessionFailed(error);
}
