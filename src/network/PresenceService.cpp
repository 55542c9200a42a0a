#include "network/PresenceService.h"
#include "network/DiscoveryChannel.h"

#include <QDateTime>
#include <QDebug>

PresenceService::PresenceService(DiscoveryChannel* channel, const DiscoveryTimings& timings,
                                 QObject* parent)
    : QObject(parent)
    , m_channel(channel)
    , m_timings(timings)
    , m_announceTimer(new QTimer(this))
    , m_sweepTimer(new QTimer(this))
{
    connect(m_announceTimer, &QTimer::timeout, this, &PresenceService::onAnnounceTimer);
    connect(m_sweepTimer, &QTimer::timeout, this, &PresenceService::onSweepTimer);
}

PresenceService::~PresenceService() {
    stop();
}

void PresenceService::start() {
    if (m_running) return;
    m_running = true;

    if (m_channel) {
        connect(m_channel, &DiscoveryChannel::messageReceived,
                this, &PresenceService::onMessageReceived);
    }
    m_sweepTimer->start(m_timings.sweepIntervalMs);
}

void PresenceService::stop() {
    if (!m_running) return;

    const bool wasAnnouncing = m_announcing;
    m_announceTimer->stop();
    m_announcing = false;
    m_sweepTimer->stop();
    m_running = false;

    if (m_channel) {
        disconnect(m_channel, &DiscoveryChannel::messageReceived,
                   this, &PresenceService::onMessageReceived);
    }

    const bool hadPeers = !m_peers.isEmpty();
    m_peers.clear();
    qInfo() << "[PRESENCE] stopped";
    if (wasAnnouncing || hadPeers) {
        emit peersChanged(peers());
    }
}

void PresenceService::announceSelf(const QString& peerId, const QString& peerName,
                                   const QString& peerAddress) {
    m_self.peerId = peerId;
    m_self.peerName = peerName;
    m_self.peerAddress = peerAddress.isEmpty()
        ? DiscoveryChannel::preferredLocalAddress() : peerAddress;
    m_self.isSelf = true;
    m_announcing = true;

    // We may have heard ourselves before the id was known.
    m_peers.remove(peerId);

    qInfo() << "[PRESENCE] announcing peer" << peerId << peerName;

    broadcastPresence();
    m_announceTimer->start(m_timings.peerIntervalMs);
    emit peersChanged(peers());
}

void PresenceService::stopAnnouncing() {
    if (!m_announcing) return;
    m_announceTimer->stop();
    m_announcing = false;
    qInfo() << "[PRESENCE] stopped announcing peer" << m_self.peerId;
    emit peersChanged(peers());
}

void PresenceService::setCurrentRoomName(const QString& roomName) {
    if (m_self.currentRoomName == roomName
        && m_self.currentRoomName.isNull() == roomName.isNull()) {
        return;
    }
    m_self.currentRoomName = roomName;
    if (!m_announcing) return;

    broadcastPresence();
    emit peersChanged(peers());
}

bool PresenceService::sendInvitation(const QString& roomId, const QString& roomName,
                                     const QString& hostAddress, quint16 port,
                                     const QStringList& targetPeerIds, QString* error) {
    if (!m_announcing) {
        if (error) *error = "presence not initialised";
        return false;
    }
    if (targetPeerIds.isEmpty()) {
        if (error) *error = "no invitation targets";
        return false;
    }
    if (!m_channel) {
        if (error) *error = "discovery channel unavailable";
        return false;
    }

    Invitation inv;
    inv.roomId = roomId;
    inv.roomName = roomName;
    inv.hostAddress = hostAddress;
    inv.relayPort = port;
    inv.fromPeerId = m_self.peerId;
    inv.fromPeerName = m_self.peerName;
    inv.targetPeerIds = targetPeerIds;
    inv.timestamp = QDateTime::currentMSecsSinceEpoch();

    if (!m_channel->send(DiscoveryMessage::fromInvitation(inv))) {
        if (error) *error = "invitation send failed";
        return false;
    }

    qInfo() << "[PRESENCE] sent invitation for room" << roomName << "to" << targetPeerIds.size() << "peers";
    return true;
}

QMetaObject::Connection PresenceService::observePeers(QObject* context, const PeersCallback& callback) {
    callback(peers());
    return connect(this, &PresenceService::peersChanged, context, callback);
}

QMetaObject::Connection PresenceService::observeInvitations(QObject* context,
                                                            const InvitationCallback& callback) {
    return connect(this, &PresenceService::invitationReceived, context, callback);
}

QList<PeerDescriptor> PresenceService::peers() const {
    QList<PeerDescriptor> list = m_peers.values();
    if (m_announcing) {
        PeerDescriptor self = m_self;
        self.isSelf = true;
        self.lastSeenAt = QDateTime::currentMSecsSinceEpoch();
        list.append(self);
    }
    return list;
}

void PresenceService::handleMessage(const DiscoveryMessage& message, qint64 nowMs,
                                    const QHostAddress& sender) {
    switch (message.type) {
        case DiscoveryMessage::Type::PeerPresence:
            handlePresence(message.peer, nowMs, sender);
            break;
        case DiscoveryMessage::Type::Invitation:
            handleInvitation(message.invitation);
            break;
        case DiscoveryMessage::Type::Announce:
            break;
    }
}

void PresenceService::handlePresence(const PeerDescriptor& incoming, qint64 nowMs,
                                     const QHostAddress& sender) {
    // Ignore our own broadcasts
    if (!m_self.peerId.isEmpty() && incoming.peerId == m_self.peerId) return;

    PeerDescriptor peer = incoming;
    peer.isSelf = false;
    peer.lastSeenAt = nowMs;
    if (peer.peerAddress.isEmpty() && !sender.isNull()) {
        peer.peerAddress = sender.toString();
    }

    auto it = m_peers.find(peer.peerId);
    if (it == m_peers.end()) {
        m_peers.insert(peer.peerId, peer);
        qDebug() << "[PRESENCE] discovered peer" << peer.peerName << "(" << peer.peerId << ")"
                 << "- total peers:" << m_peers.size();
        emit peersChanged(peers());
        return;
    }

    bool changed = !it->sameAnnouncement(peer);
    *it = peer;
    if (changed) {
        emit peersChanged(peers());
    }
}

void PresenceService::handleInvitation(const Invitation& invitation) {
    if (!invitation.isAddressedTo(m_self.peerId)) return;
    if (invitation.fromPeerId == m_self.peerId) return;

    const QString key = invitation.dedupKey();
    if (m_seenInvitations.contains(key)) {
        qDebug() << "[PRESENCE] duplicate invitation for room" << invitation.roomName << "ignored";
        return;
    }
    m_seenInvitations.insert(key);

    qInfo() << "[PRESENCE] invitation to room" << invitation.roomName << "from" << invitation.fromPeerName;
    emit invitationReceived(invitation);
}

void PresenceService::pruneExpired(qint64 nowMs) {
    QStringList expired;
    for (auto it = m_peers.constBegin(); it != m_peers.constEnd(); ++it) {
        if (nowMs - it->lastSeenAt > m_timings.ttlMs) {
            expired.append(it.key());
        }
    }

    for (const QString& peerId : expired) {
        qDebug() << "[PRESENCE] peer timed out:" << peerId << m_peers.value(peerId).peerName;
        m_peers.remove(peerId);
    }

    if (!expired.isEmpty()) {
        emit peersChanged(peers());
    }
}

void PresenceService::onMessageReceived(const DiscoveryMessage& message, const QHostAddress& sender) {
    handleMessage(message, QDateTime::currentMSecsSinceEpoch(), sender);
}

void PresenceService::onAnnounceTimer() {
    broadcastPresence();
}

void PresenceService::onSweepTimer() {
    pruneExpired(QDateTime::currentMSecsSinceEpoch());
}

void PresenceService::broadcastPresence() {
    if (!m_announcing || !m_channel) return;

    qint64 now = QDateTime::currentMSecsSinceEpoch();
    if (!m_channel->send(DiscoveryMessage::peerPresence(m_self, now))) {
        qWarning() << "[PRESENCE] presence for" << m_self.peerId << "not sent";
    }
}
