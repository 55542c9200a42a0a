#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "models/Invitation.h"
#include "models/PeerDescriptor.h"
#include "models/RoomDescriptor.h"

// One datagram on the shared discovery channel. The "t" field selects which of
// the payload members is meaningful.
struct DiscoveryMessage {
    enum class Type {
        Announce,
        PeerPresence,
        Invitation
    };

    Type type = Type::Announce;
    RoomDescriptor room;        // Announce
    PeerDescriptor peer;        // PeerPresence
    ::Invitation invitation;    // Invitation
    qint64 timestamp = 0;

    static DiscoveryMessage announce(const RoomDescriptor& room, qint64 timestamp);
    static DiscoveryMessage peerPresence(const PeerDescriptor& peer, qint64 timestamp);
    static DiscoveryMessage fromInvitation(const ::Invitation& invitation);

    QJsonObject toJson() const;
    QByteArray toDatagram() const;

    // Returns false for anything that is not a well-formed known variant.
    static bool parse(const QByteArray& datagram, DiscoveryMessage* out, QString* error = nullptr);
    static bool fromJson(const QJsonObject& obj, DiscoveryMessage* out, QString* error = nullptr);
};

QString discoveryTypeTag(DiscoveryMessage::Type type);
