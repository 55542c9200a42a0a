#pragma once

#include <QObject>
#include <QHostAddress>
#include <QList>
#include <QMap>
#include <QSet>
#include <QTimer>

#include <functional>

#include "models/Invitation.h"
#include "models/PeerDescriptor.h"
#include "network/DiscoveryTimings.h"
#include "protocol/DiscoveryMessage.h"

class DiscoveryChannel;

// Who is on the LAN. Every instance announces itself every peerIntervalMs,
// hosting or not, and keeps a TTL-bounded directory of the others. Also
// carries room invitations on the same channel.
class PresenceService : public QObject {
    Q_OBJECT

public:
    using PeersCallback = std::function<void(const QList<PeerDescriptor>&)>;
    using InvitationCallback = std::function<void(const Invitation&)>;

    explicit PresenceService(DiscoveryChannel* channel,
                             const DiscoveryTimings& timings = DiscoveryTimings(),
                             QObject* parent = nullptr);
    ~PresenceService();

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    void announceSelf(const QString& peerId, const QString& peerName,
                      const QString& peerAddress = QString());
    void stopAnnouncing();
    bool isAnnouncing() const { return m_announcing; }
    QString localPeerId() const { return m_self.peerId; }

    // Null clears. Re-announces right away so others see the change.
    void setCurrentRoomName(const QString& roomName);

    bool sendInvitation(const QString& roomId, const QString& roomName,
                        const QString& hostAddress, quint16 port,
                        const QStringList& targetPeerIds, QString* error = nullptr);

    QMetaObject::Connection observePeers(QObject* context, const PeersCallback& callback);
    QMetaObject::Connection observeInvitations(QObject* context, const InvitationCallback& callback);

    // Remote peers plus a synthesized isSelf entry while announcing.
    QList<PeerDescriptor> peers() const;

    void handleMessage(const DiscoveryMessage& message, qint64 nowMs,
                       const QHostAddress& sender = QHostAddress());
    void pruneExpired(qint64 nowMs);

signals:
    void peersChanged(const QList<PeerDescriptor>& peers);
    void invitationReceived(const Invitation& invitation);

private slots:
    void onMessageReceived(const DiscoveryMessage& message, const QHostAddress& sender);
    void onAnnounceTimer();
    void onSweepTimer();

private:
    void broadcastPresence();
    void handlePresence(const PeerDescriptor& incoming, qint64 nowMs, const QHostAddress& sender);
    void handleInvitation(const Invitation& invitation);

    DiscoveryChannel* m_channel;
    DiscoveryTimings m_timings;
    bool m_running = false;

    bool m_announcing = false;
    PeerDescriptor m_self;

    QTimer* m_announceTimer;
    QTimer* m_sweepTimer;

    QMap<QString, PeerDescriptor> m_peers;

    // Session lifetime; invitations are rare.
    QSet<QString> m_seenInvitations;
};
