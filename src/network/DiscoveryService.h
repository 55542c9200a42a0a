#pragma once

#include <QObject>
#include <QHostAddress>
#include <QList>
#include <QMap>
#include <QTimer>

#include <functional>

#include "models/RoomDescriptor.h"
#include "network/DiscoveryTimings.h"
#include "protocol/DiscoveryMessage.h"

class DiscoveryChannel;

// Room announcements. While hosting, broadcasts the hosted room every
// roomIntervalMs; always listens and keeps a directory of other rooms that
// expires entries after ttlMs of silence.
class DiscoveryService : public QObject {
    Q_OBJECT

public:
    using RoomsCallback = std::function<void(const QList<RoomDescriptor>&)>;

    explicit DiscoveryService(DiscoveryChannel* channel,
                              const DiscoveryTimings& timings = DiscoveryTimings(),
                              QObject* parent = nullptr);
    ~DiscoveryService();

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    RoomDescriptor startHosting(const QString& roomId, const QString& roomName,
                                quint16 port, const QString& hostAddress = QString());
    void stopHosting();
    bool isHosting() const { return m_hosting; }
    RoomDescriptor hostedRoom() const { return m_hostedRoom; }
    void setParticipantCount(int count);

    // Delivers the current directory right away, then on every change until
    // the returned connection is disconnected or context is destroyed.
    QMetaObject::Connection observe(QObject* context, const RoomsCallback& callback);

    QList<RoomDescriptor> rooms() const;

    void handleMessage(const DiscoveryMessage& message, qint64 nowMs,
                       const QHostAddress& sender = QHostAddress());
    void pruneExpired(qint64 nowMs);

signals:
    void roomsChanged(const QList<RoomDescriptor>& rooms);

private slots:
    void onMessageReceived(const DiscoveryMessage& message, const QHostAddress& sender);
    void onBroadcastTimer();
    void onSweepTimer();

private:
    void broadcastAnnouncement();

    DiscoveryChannel* m_channel;
    DiscoveryTimings m_timings;
    bool m_running = false;

    bool m_hosting = false;
    RoomDescriptor m_hostedRoom;

    QTimer* m_broadcastTimer;
    QTimer* m_sweepTimer;

    QMap<QString, RoomDescriptor> m_rooms;
};
