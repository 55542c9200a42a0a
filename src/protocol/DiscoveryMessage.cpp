#include "protocol/DiscoveryMessage.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace {

void setError(QString* error, const QString& text) {
    if (error) *error = text;
}

quint16 toPort(const QJsonValue& value) {
    int port = value.toInt();
    if (port < 0 || port > 65535) return 0;
    return static_cast<quint16>(port);
}

}

QString discoveryTypeTag(DiscoveryMessage::Type type) {
    switch (type) {
        case DiscoveryMessage::Type::Announce:     return "announce";
        case DiscoveryMessage::Type::PeerPresence: return "peer-presence";
        case DiscoveryMessage::Type::Invitation:   return "invitation";
    }
    return QString();
}

DiscoveryMessage DiscoveryMessage::announce(const RoomDescriptor& room, qint64 timestamp) {
    DiscoveryMessage msg;
    msg.type = Type::Announce;
    msg.room = room;
    msg.timestamp = timestamp;
    return msg;
}

DiscoveryMessage DiscoveryMessage::peerPresence(const PeerDescriptor& peer, qint64 timestamp) {
    DiscoveryMessage msg;
    msg.type = Type::PeerPresence;
    msg.peer = peer;
    msg.peer.isSelf = false;
    msg.timestamp = timestamp;
    return msg;
}

DiscoveryMessage DiscoveryMessage::fromInvitation(const ::Invitation& invitation) {
    DiscoveryMessage msg;
    msg.type = Type::Invitation;
    msg.invitation = invitation;
    msg.timestamp = invitation.timestamp;
    return msg;
}

QJsonObject DiscoveryMessage::toJson() const {
    QJsonObject obj;
    obj["t"] = discoveryTypeTag(type);
    obj["ts"] = static_cast<double>(timestamp);

    switch (type) {
        case Type::Announce:
            obj["roomId"] = room.roomId;
            obj["roomName"] = room.roomName;
            obj["hostAddress"] = room.hostAddress;
            obj["relayPort"] = static_cast<int>(room.relayPort);
            obj["participantCount"] = room.participantCount;
            break;
        case Type::PeerPresence:
            obj["peerId"] = peer.peerId;
            obj["peerName"] = peer.peerName;
            obj["peerAddress"] = peer.peerAddress;
            obj["roomName"] = peer.currentRoomName.isNull()
                ? QJsonValue(QJsonValue::Null) : QJsonValue(peer.currentRoomName);
            break;
        case Type::Invitation: {
            obj["roomId"] = invitation.roomId;
            obj["roomName"] = invitation.roomName;
            obj["hostAddress"] = invitation.hostAddress;
            obj["relayPort"] = static_cast<int>(invitation.relayPort);
            obj["fromPeerId"] = invitation.fromPeerId;
            obj["fromPeerName"] = invitation.fromPeerName;
            QJsonArray targets;
            for (const QString& id : invitation.targetPeerIds) targets.append(id);
            obj["targetPeerIds"] = targets;
            break;
        }
    }
    return obj;
}

QByteArray DiscoveryMessage::toDatagram() const {
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

bool DiscoveryMessage::parse(const QByteArray& datagram, DiscoveryMessage* out, QString* error) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(datagram, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QString("invalid json: %1").arg(parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(error, "datagram is not a json object");
        return false;
    }
    return fromJson(doc.object(), out, error);
}

bool DiscoveryMessage::fromJson(const QJsonObject& obj, DiscoveryMessage* out, QString* error) {
    if (!out) return false;

    const QString tag = obj["t"].toString();
    if (tag.isEmpty()) {
        setError(error, "missing discriminator");
        return false;
    }

    DiscoveryMessage msg;
    msg.timestamp = static_cast<qint64>(obj["ts"].toDouble());

    if (tag == "announce") {
        msg.type = Type::Announce;
        msg.room.roomId = obj["roomId"].toString();
        if (msg.room.roomId.isEmpty()) {
            setError(error, "announce without roomId");
            return false;
        }
        msg.room.roomName = obj["roomName"].toString();
        msg.room.hostAddress = obj["hostAddress"].toString();
        msg.room.relayPort = toPort(obj["relayPort"]);
        msg.room.participantCount = qMax(0, obj["participantCount"].toInt());
    } else if (tag == "peer-presence") {
        msg.type = Type::PeerPresence;
        msg.peer.peerId = obj["peerId"].toString();
        if (msg.peer.peerId.isEmpty()) {
            setError(error, "peer-presence without peerId");
            return false;
        }
        msg.peer.peerName = obj["peerName"].toString();
        msg.peer.peerAddress = obj["peerAddress"].toString();
        const QJsonValue roomName = obj["roomName"];
        if (roomName.isString()) {
            msg.peer.currentRoomName = roomName.toString();
        }
    } else if (tag == "invitation") {
        msg.type = Type::Invitation;
        Invitation& inv = msg.invitation;
        inv.roomId = obj["roomId"].toString();
        inv.roomName = obj["roomName"].toString();
        if (inv.roomId.isEmpty() || inv.roomName.isEmpty()) {
            setError(error, "invitation without roomId or roomName");
            return false;
        }
        inv.hostAddress = obj["hostAddress"].toString();
        inv.relayPort = toPort(obj["relayPort"]);
        inv.fromPeerId = obj["fromPeerId"].toString();
        inv.fromPeerName = obj["fromPeerName"].toString();
        for (const QJsonValue& v : obj["targetPeerIds"].toArray()) {
            if (v.isString()) inv.targetPeerIds.append(v.toString());
        }
        inv.timestamp = msg.timestamp;
    } else {
        setError(error, QString("unknown message type '%1'").arg(tag));
        return false;
    }

    *out = msg;
    return true;
}
