#include "network/DiscoveryService.h"
#include "network/DiscoveryChannel.h"

#include <QDateTime>
#include <QDebug>

DiscoveryService::DiscoveryService(DiscoveryChannel* channel, const DiscoveryTimings& timings,
                                   QObject* parent)
    : QObject(parent)
    , m_channel(channel)
    , m_timings(timings)
    , m_broadcastTimer(new QTimer(this))
    , m_sweepTimer(new QTimer(this))
{
    connect(m_broadcastTimer, &QTimer::timeout, this, &DiscoveryService::onBroadcastTimer);
    connect(m_sweepTimer, &QTimer::timeout, this, &DiscoveryService::onSweepTimer);
}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::start() {
    if (m_running) return;
    m_running = true;

    if (m_channel) {
        connect(m_channel, &DiscoveryChannel::messageReceived,
                this, &DiscoveryService::onMessageReceived);
    }
    m_sweepTimer->start(m_timings.sweepIntervalMs);
}

void DiscoveryService::stop() {
    if (!m_running) return;

    // Timers first, so nothing fires once shutdown has begun.
    stopHosting();
    m_sweepTimer->stop();
    m_running = false;

    if (m_channel) {
        disconnect(m_channel, &DiscoveryChannel::messageReceived,
                   this, &DiscoveryService::onMessageReceived);
    }

    if (!m_rooms.isEmpty()) {
        m_rooms.clear();
        emit roomsChanged(rooms());
    }
}

RoomDescriptor DiscoveryService::startHosting(const QString& roomId, const QString& roomName,
                                              quint16 port, const QString& hostAddress) {
    if (m_hosting) {
        qWarning() << "[DISCOVERY] already hosting" << m_hostedRoom.roomId;
        return m_hostedRoom;
    }

    m_hostedRoom = RoomDescriptor();
    m_hostedRoom.roomId = roomId;
    m_hostedRoom.roomName = roomName;
    m_hostedRoom.hostAddress = hostAddress.isEmpty()
        ? DiscoveryChannel::preferredLocalAddress() : hostAddress;
    m_hostedRoom.relayPort = port;
    m_hostedRoom.participantCount = 0;
    m_hostedRoom.lastSeenAt = QDateTime::currentMSecsSinceEpoch();
    m_hosting = true;

    // Our own announcement may already be in the directory from a previous run.
    if (m_rooms.remove(roomId) > 0) {
        emit roomsChanged(rooms());
    }

    qInfo() << "[DISCOVERY] hosting room" << roomId << "name:" << roomName
            << "at" << m_hostedRoom.hostAddress << ":" << port;

    // Announce immediately, then every interval
    broadcastAnnouncement();
    m_broadcastTimer->start(m_timings.roomIntervalMs);

    return m_hostedRoom;
}

void DiscoveryService::stopHosting() {
    if (!m_hosting) return;
    m_broadcastTimer->stop();
    m_hosting = false;
    qInfo() << "[DISCOVERY] stopped hosting room" << m_hostedRoom.roomId;
    m_hostedRoom = RoomDescriptor();
}

void DiscoveryService::setParticipantCount(int count) {
    if (!m_hosting) return;
    m_hostedRoom.participantCount = qMax(0, count);
}

QMetaObject::Connection DiscoveryService::observe(QObject* context, const RoomsCallback& callback) {
    callback(rooms());
    return connect(this, &DiscoveryService::roomsChanged, context, callback);
}

QList<RoomDescriptor> DiscoveryService::rooms() const {
    return m_rooms.values();
}

void DiscoveryService::handleMessage(const DiscoveryMessage& message, qint64 nowMs,
                                     const QHostAddress& sender) {
    if (message.type != DiscoveryMessage::Type::Announce) return;

    RoomDescriptor incoming = message.room;

    // Filter out our own announcement
    if (m_hosting && incoming.roomId == m_hostedRoom.roomId) return;

    if (incoming.hostAddress.isEmpty() && !sender.isNull()) {
        incoming.hostAddress = sender.toString();
    }
    incoming.lastSeenAt = nowMs;

    auto it = m_rooms.find(incoming.roomId);
    if (it == m_rooms.end()) {
        m_rooms.insert(incoming.roomId, incoming);
        qDebug() << "[DISCOVERY] discovered room" << incoming.roomId << incoming.roomName
                 << "at" << incoming.hostAddress << ":" << incoming.relayPort;
        emit roomsChanged(rooms());
        return;
    }

    bool changed = !it->sameAnnouncement(incoming);
    *it = incoming;
    if (changed) {
        emit roomsChanged(rooms());
    }
}

void DiscoveryService::pruneExpired(qint64 nowMs) {
    QStringList expired;
    for (auto it = m_rooms.constBegin(); it != m_rooms.constEnd(); ++it) {
        if (nowMs - it->lastSeenAt > m_timings.ttlMs) {
            expired.append(it.key());
        }
    }

    for (const QString& roomId : expired) {
        qDebug() << "[DISCOVERY] pruning stale room" << roomId;
        m_rooms.remove(roomId);
    }

    if (!expired.isEmpty()) {
        emit roomsChanged(rooms());
    }
}

void DiscoveryService::onMessageReceived(const DiscoveryMessage& message, const QHostAddress& sender) {
    handleMessage(message, QDateTime::currentMSecsSinceEpoch(), sender);
}

void DiscoveryService::onBroadcastTimer() {
    broadcastAnnouncement();
}

void DiscoveryService::onSweepTimer() {
    pruneExpired(QDateTime::currentMSecsSinceEpoch());
}

void DiscoveryService::broadcastAnnouncement() {
    if (!m_hosting) return;
    if (!m_channel) return;

    qint64 now = QDateTime::currentMSecsSinceEpoch();
    m_hostedRoom.lastSeenAt = now;
    // A failed send is retried on the next tick.
    if (!m_channel->send(DiscoveryMessage::announce(m_hostedRoom, now))) {
        qWarning() << "[DISCOVERY] announcement for" << m_hostedRoom.roomId << "not sent";
    }
}
