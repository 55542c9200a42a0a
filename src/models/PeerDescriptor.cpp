#include "models/PeerDescriptor.h"

bool PeerDescriptor::sameAnnouncement(const PeerDescriptor& other) const {
    return peerId == other.peerId
        && peerName == other.peerName
        && peerAddress == other.peerAddress
        && currentRoomName.isNull() == other.currentRoomName.isNull()
        && currentRoomName == other.currentRoomName
        && isSelf == other.isSelf;
}
