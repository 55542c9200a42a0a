#include "negotiation/NegotiationCoordinator.h"

#include "utils/ChannelCrypto.h"
#include "utils/FrameCryptor.h"

#include <QPointer>
#include <QDebug>

NegotiationCoordinator::NegotiationCoordinator(const QString& localId, MediaEngine* engine, QObject* parent)
    : QObject(parent)
    , m_localId(localId)
    , m_engine(engine)
{
    connect(m_engine, &MediaEngine::iceCandidateGathered, this, &NegotiationCoordinator::onIceCandidateGathered);
    connect(m_engine, &MediaEngine::connectionStateChanged, this, &NegotiationCoordinator::onConnectionStateChanged);
    connect(m_engine, &MediaEngine::remoteMediaReady, this, &NegotiationCoordinator::onRemoteMediaReady);
}

NegotiationCoordinator::~NegotiationCoordinator() {
    if (m_engine) {
        m_engine->disconnect(this);
        for (const QString& peerId : m_links.keys()) {
            m_engine->closeConnection(peerId);
        }
    }
    m_links.clear();
}

bool NegotiationCoordinator::shouldInitiate(const QString& localId, const QString& remoteId) {
    return QString::compare(localId, remoteId, Qt::CaseSensitive) < 0;
}

void NegotiationCoordinator::setFrameCrypto(ChannelCrypto* crypto) {
    m_frameCrypto = crypto;
}

NegotiationState NegotiationCoordinator::linkState(const QString& peerId) const {
    auto it = m_links.constFind(peerId);
    return it == m_links.constEnd() ? NegotiationState::Closed : it->state;
}

// --- Relay input ---

void NegotiationCoordinator::handleEnvelope(const RelayEnvelope& env) {
    switch (env.type) {
        case RelayEnvelope::Type::Welcome:
            handleWelcome(env.participants);
            break;
        case RelayEnvelope::Type::PeerJoined:
            handlePeerJoined(env.clientId);
            break;
        case RelayEnvelope::Type::PeerLeft:
            handlePeerLeft(env.clientId);
            break;
        case RelayEnvelope::Type::Offer:
        case RelayEnvelope::Type::Answer:
        case RelayEnvelope::Type::Ice:
            handleSignal(env);
            break;
        case RelayEnvelope::Type::End:
            handleEnd();
            break;
        case RelayEnvelope::Type::Join:
        case RelayEnvelope::Type::Leave:
            break;
    }
}

void NegotiationCoordinator::handleWelcome(const QList<ParticipantInfo>& participants) {
    qInfo() << "[NEGOTIATE] welcome with" << participants.size() << "other participant(s)";
    for (const ParticipantInfo& p : participants) {
        handlePeerJoined(p.clientId);
    }
}

void NegotiationCoordinator::handlePeerJoined(const QString& peerId) {
    if (peerId.isEmpty() || peerId == m_localId) return;
    if (m_links.contains(peerId)) {
        qDebug() << "[NEGOTIATE] already linked with" << peerId;
        return;
    }
    if (!shouldInitiate(m_localId, peerId)) {
        qDebug() << "[NEGOTIATE] waiting for offer from" << peerId;
        return;
    }
    startOffer(peerId);
}

void NegotiationCoordinator::handlePeerLeft(const QString& peerId) {
    qInfo() << "[NEGOTIATE] peer left:" << peerId;
    removePeer(peerId);
}

void NegotiationCoordinator::handleSignal(const RelayEnvelope& env) {
    if (env.from.isEmpty() || env.from == m_localId) {
        qDebug() << "[NEGOTIATE] ignoring" << relayTypeTag(env.type) << "without a usable sender";
        return;
    }
    if (env.to != m_localId) {
        qDebug() << "[NEGOTIATE] ignoring" << relayTypeTag(env.type) << "addressed to" << env.to;
        return;
    }

    switch (env.type) {
        case RelayEnvelope::Type::Offer:  handleOffer(env); break;
        case RelayEnvelope::Type::Answer: handleAnswer(env); break;
        case RelayEnvelope::Type::Ice:    handleIce(env); break;
        default: break;
    }
}

void NegotiationCoordinator::handleEnd() {
    qInfo() << "[NEGOTIATE] host ended the meeting";
    removeAllPeers();
    emit meetingEnded();
}

// --- Link lifecycle ---

PeerLink* NegotiationCoordinator::createLink(const QString& peerId) {
    if (!m_engine) {
        emit negotiationFailed(peerId, "media engine unavailable");
        return nullptr;
    }

    QString error;
    if (!m_engine->openConnection(peerId, &error)) {
        qWarning() << "[NEGOTIATE] media engine refused connection for" << peerId << error;
        emit negotiationFailed(peerId, error);
        return nullptr;
    }

    PeerLink link;
    link.remotePeerId = peerId;
    link.state = NegotiationState::Idle;
    link.generation = ++m_nextGeneration;

    if (m_frameCrypto && m_frameCrypto->isReady()) {
        auto cryptor = QSharedPointer<FrameCryptor>::create(m_frameCrypto);
        if (m_engine->attachFrameTransform(peerId, cryptor.data())) {
            link.frameCryptor = cryptor;
            qDebug() << "[CRYPTO] frame encryption attached for" << peerId;
        } else {
            qDebug() << "[CRYPTO] no encoded-frame path for" << peerId << "- envelopes only";
        }
    }

    auto it = m_links.insert(peerId, link);
    return &it.value();
}

PeerLink* NegotiationCoordinator::currentLink(const QString& peerId, quint64 generation) {
    auto it = m_links.find(peerId);
    if (it == m_links.end() || it->generation != generation) return nullptr;
    return &it.value();
}

void NegotiationCoordinator::setState(PeerLink* link, NegotiationState state) {
    if (link->state == state) return;
    qDebug() << "[NEGOTIATE]" << link->remotePeerId << negotiationStateName(link->state)
             << "->" << negotiationStateName(state);
    link->state = state;
    emit linkStateChanged(link->remotePeerId, state);
}

void NegotiationCoordinator::failLink(const QString& peerId, const QString& error) {
    qWarning() << "[NEGOTIATE] negotiation with" << peerId << "failed:" << error;
    removePeer(peerId);
    emit negotiationFailed(peerId, error);
}

void NegotiationCoordinator::removePeer(const QString& peerId) {
    if (m_removing.contains(peerId)) return;
    auto it = m_links.find(peerId);
    if (it == m_links.end()) return;

    m_removing.insert(peerId);
    if (it->state != NegotiationState::Closed) {
        it->state = NegotiationState::Closed;
        emit linkStateChanged(peerId, NegotiationState::Closed);
    }

    // Engine resources go first so a late callback finds neither.
    if (m_engine) m_engine->closeConnection(peerId);
    m_links.remove(peerId);
    m_removing.remove(peerId);

    qInfo() << "[NEGOTIATE] link to" << peerId << "removed," << m_links.size() << "remaining";
    emit peerRemoved(peerId);
}

void NegotiationCoordinator::removeAllPeers() {
    for (const QString& peerId : m_links.keys()) {
        removePeer(peerId);
    }
}

// --- Offer / answer ---

void NegotiationCoordinator::startOffer(const QString& peerId) {
    PeerLink* link = createLink(peerId);
    if (!link) return;

    const quint64 generation = link->generation;
    setState(link, NegotiationState::OfferSent);
    qInfo() << "[NEGOTIATE] offering to" << peerId;

    QPointer<NegotiationCoordinator> self(this);
    m_engine->createOffer(peerId, [self, peerId, generation](bool ok, const QJsonObject& offer, const QString& error) {
        if (!self || !self->currentLink(peerId, generation)) return;
        if (!ok) {
            self->failLink(peerId, QString("create offer: %1").arg(error));
            return;
        }
        self->m_engine->setLocalDescription(peerId, offer, [self, peerId, generation, offer](bool ok, const QString& error) {
            if (!self || !self->currentLink(peerId, generation)) return;
            if (!ok) {
                self->failLink(peerId, QString("set local offer: %1").arg(error));
                return;
            }
            emit self->envelopeReady(RelayEnvelope::offer(self->m_localId, peerId, offer));
        });
    });
}

void NegotiationCoordinator::handleOffer(const RelayEnvelope& env) {
    const QString peerId = env.from;
    if (!env.payload.isObject()) {
        qWarning() << "[NEGOTIATE] offer from" << peerId << "has no description";
        return;
    }

    PeerLink* link = nullptr;
    auto it = m_links.find(peerId);
    if (it != m_links.end()) {
        if (it->state != NegotiationState::Idle) {
            qWarning() << "[NEGOTIATE] discarding offer from" << peerId
                       << "in state" << negotiationStateName(it->state);
            return;
        }
        link = &it.value();
    } else {
        link = createLink(peerId);
        if (!link) return;
    }

    const quint64 generation = link->generation;
    const QJsonObject offer = env.payload.toObject();
    setState(link, NegotiationState::AnswerPending);
    qInfo() << "[NEGOTIATE] answering offer from" << peerId;

    QPointer<NegotiationCoordinator> self(this);
    m_engine->setRemoteDescription(peerId, offer, [self, peerId, generation](bool ok, const QString& error) {
        if (!self || !self->currentLink(peerId, generation)) return;
        if (!ok) {
            self->failLink(peerId, QString("set remote offer: %1").arg(error));
            return;
        }
        self->m_engine->createAnswer(peerId, [self, peerId, generation](bool ok, const QJsonObject& answer, const QString& error) {
            if (!self || !self->currentLink(peerId, generation)) return;
            if (!ok) {
                self->failLink(peerId, QString("create answer: %1").arg(error));
                return;
            }
            self->m_engine->setLocalDescription(peerId, answer, [self, peerId, generation, answer](bool ok, const QString& error) {
                if (!self) return;
                PeerLink* link = self->currentLink(peerId, generation);
                if (!link) return;
                if (!ok) {
                    self->failLink(peerId, QString("set local answer: %1").arg(error));
                    return;
                }
                emit self->envelopeReady(RelayEnvelope::answer(self->m_localId, peerId, answer));
                link = self->currentLink(peerId, generation);
                if (link) self->setState(link, NegotiationState::Connected);
            });
        });
    });
}

void NegotiationCoordinator::handleAnswer(const RelayEnvelope& env) {
    const QString peerId = env.from;
    auto it = m_links.find(peerId);
    if (it == m_links.end() || it->state != NegotiationState::OfferSent) {
        qWarning() << "[NEGOTIATE] ignoring answer from" << peerId << "in state"
                   << (it == m_links.end() ? QString("none") : negotiationStateName(it->state));
        return;
    }
    if (!env.payload.isObject()) {
        qWarning() << "[NEGOTIATE] answer from" << peerId << "has no description";
        return;
    }

    if (!m_engine) return;

    const quint64 generation = it->generation;
    QPointer<NegotiationCoordinator> self(this);
    m_engine->setRemoteDescription(peerId, env.payload.toObject(), [self, peerId, generation](bool ok, const QString& error) {
        if (!self) return;
        PeerLink* link = self->currentLink(peerId, generation);
        if (!link) return;
        if (!ok) {
            self->failLink(peerId, QString("set remote answer: %1").arg(error));
            return;
        }
        self->setState(link, NegotiationState::Connected);
    });
}

void NegotiationCoordinator::handleIce(const RelayEnvelope& env) {
    const QString peerId = env.from;
    auto it = m_links.find(peerId);
    if (it == m_links.end()) {
        qDebug() << "[NEGOTIATE] no link for ice from" << peerId;
        return;
    }

    // End-of-gathering marker.
    if (!env.payload.isObject() || env.payload.toObject().isEmpty()) return;
    if (!m_engine) return;

    m_engine->addIceCandidate(peerId, env.payload.toObject(), [peerId](bool ok, const QString& error) {
        if (!ok) qWarning() << "[NEGOTIATE] candidate from" << peerId << "rejected:" << error;
    });
}

// --- Media engine events ---

void NegotiationCoordinator::onIceCandidateGathered(const QString& peerId, const QJsonObject& candidate) {
    if (!m_links.contains(peerId) || candidate.isEmpty()) return;
    emit envelopeReady(RelayEnvelope::ice(m_localId, peerId, candidate));
}

void NegotiationCoordinator::onConnectionStateChanged(const QString& peerId, MediaConnectionState state) {
    if (!m_links.contains(peerId)) return;
    qDebug() << "[NEGOTIATE] media connection" << peerId << mediaConnectionStateName(state);
    if (isTerminalMediaState(state)) {
        removePeer(peerId);
    }
}

void NegotiationCoordinator::onRemoteMediaReady(const QString& peerId) {
    auto it = m_links.find(peerId);
    if (it == m_links.end()) return;
    it->remoteMediaReady = true;
    emit remoteMediaReady(peerId);
}
