#pragma once

#include <QString>
#include <QSharedPointer>

class FrameCryptor;

enum class NegotiationState {
    Idle,
    OfferSent,
    AnswerPending,
    Connected,
    Closed
};

QString negotiationStateName(NegotiationState state);

// One per remote peer contacted in the current room. The media engine keys its
// connection by remotePeerId, so the id doubles as the connection handle.
struct PeerLink {
    QString remotePeerId;
    NegotiationState state = NegotiationState::Idle;
    quint64 generation = 0;
    bool remoteMediaReady = false;
    QSharedPointer<FrameCryptor> frameCryptor;
};
