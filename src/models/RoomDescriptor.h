#pragma once

#include <QString>

struct RoomDescriptor {
    QString roomId;
    QString roomName;
    QString hostAddress;
    quint16 relayPort = 0;
    int participantCount = 0;
    qint64 lastSeenAt = 0;

    // Everything except lastSeenAt; a refresh with identical content is not a change.
    bool sameAnnouncement(const RoomDescriptor& other) const;

    QString relayUrl() const;
};
