#include "models/Invitation.h"

bool Invitation::isAddressedTo(const QString& peerId) const {
    return !peerId.isEmpty() && targetPeerIds.contains(peerId);
}

QString Invitation::dedupKey() const {
    return QString("%1|%2|%3").arg(roomId, hostAddress).arg(relayPort);
}
