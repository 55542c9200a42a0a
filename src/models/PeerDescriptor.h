#pragma once

#include <QString>

struct PeerDescriptor {
    QString peerId;
    QString peerName;
    QString peerAddress;
    QString currentRoomName;  // null when not in a room
    qint64 lastSeenAt = 0;
    bool isSelf = false;      // synthesized locally, never sent

    bool isInRoom() const { return !currentRoomName.isNull(); }
    bool sameAnnouncement(const PeerDescriptor& other) const;
};
