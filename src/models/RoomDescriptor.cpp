#include "models/RoomDescriptor.h"

bool RoomDescriptor::sameAnnouncement(const RoomDescriptor& other) const {
    return roomId == other.roomId
        && roomName == other.roomName
        && hostAddress == other.hostAddress
        && relayPort == other.relayPort
        && participantCount == other.participantCount;
}

QString RoomDescriptor::relayUrl() const {
    return QString("ws://%1:%2").arg(hostAddress).arg(relayPort);
}
