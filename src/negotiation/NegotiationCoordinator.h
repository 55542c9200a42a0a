#pragma once

#include <QObject>
#include <QMap>
#include <QPointer>
#include <QSet>
#include <QStringList>

#include "models/PeerLink.h"
#include "protocol/RelayEnvelope.h"
#include "negotiation/MediaEngine.h"

class ChannelCrypto;

// Full-mesh negotiation for one room. The smaller peer id of every pair makes
// the offer; the other side only ever answers.
class NegotiationCoordinator : public QObject {
    Q_OBJECT

public:
    NegotiationCoordinator(const QString& localId, MediaEngine* engine, QObject* parent = nullptr);
    ~NegotiationCoordinator();

    static bool shouldInitiate(const QString& localId, const QString& remoteId);

    const QString& localId() const { return m_localId; }

    // Must already have a derived key. Null turns frame encryption off for
    // links created afterwards.
    void setFrameCrypto(ChannelCrypto* crypto);

    void handleEnvelope(const RelayEnvelope& env);
    void handleWelcome(const QList<ParticipantInfo>& participants);
    void handlePeerJoined(const QString& peerId);
    void handlePeerLeft(const QString& peerId);
    void handleSignal(const RelayEnvelope& env);
    void handleEnd();

    void removePeer(const QString& peerId);
    void removeAllPeers();

    bool hasLink(const QString& peerId) const { return m_links.contains(peerId); }
    NegotiationState linkState(const QString& peerId) const;
    int linkCount() const { return m_links.size(); }
    QStringList linkedPeers() const { return m_links.keys(); }

signals:
    void envelopeReady(const RelayEnvelope& env);
    void linkStateChanged(const QString& peerId, NegotiationState state);
    void peerRemoved(const QString& peerId);
    void remoteMediaReady(const QString& peerId);
    void negotiationFailed(const QString& peerId, const QString& error);
    void meetingEnded();

private slots:
    void onIceCandidateGathered(const QString& peerId, const QJsonObject& candidate);
    void onConnectionStateChanged(const QString& peerId, MediaConnectionState state);
    void onRemoteMediaReady(const QString& peerId);

private:
    PeerLink* createLink(const QString& peerId);
    PeerLink* currentLink(const QString& peerId, quint64 generation);
    void setState(PeerLink* link, NegotiationState state);
    void failLink(const QString& peerId, const QString& error);

    void startOffer(const QString& peerId);
    void handleOffer(const RelayEnvelope& env);
    void handleAnswer(const RelayEnvelope& env);
    void handleIce(const RelayEnvelope& env);

    QString m_localId;
    QPointer<MediaEngine> m_engine;
    ChannelCrypto* m_frameCrypto = nullptr;
    QMap<QString, PeerLink> m_links;
    QSet<QString> m_removing;
    quint64 m_nextGeneration = 0;
};
