#pragma once

#include <QString>
#include <QStringList>

struct Invitation {
    QString roomId;
    QString roomName;
    QString hostAddress;
    quint16 relayPort = 0;
    QString fromPeerId;
    QString fromPeerName;
    QStringList targetPeerIds;
    qint64 timestamp = 0;

    bool isAddressedTo(const QString& peerId) const;

    // Receivers surface one invitation per (roomId, hostAddress, relayPort).
    QString dedupKey() const;
};
