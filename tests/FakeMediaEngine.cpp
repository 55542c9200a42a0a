#include "FakeMediaEngine.h"

FakeMediaEngine::FakeMediaEngine(const QString& name, QObject* parent)
    : MediaEngine(parent)
    , name(name)
{
}

bool FakeMediaEngine::openConnection(const QString& peerId, QString* error) {
    calls << "open:" + peerId;
    if (refuseOpenFor.contains(peerId)) {
        if (error) *error = "no capture device";
        return false;
    }
    openConnections.insert(peerId);
    return true;
}

void FakeMediaEngine::closeConnection(const QString& peerId) {
    calls << "close:" + peerId;
    ++closeCount;
    openConnections.remove(peerId);
    frameTransforms.remove(peerId);
    // Real engines report the close back.
    emit connectionStateChanged(peerId, MediaConnectionState::Closed);
}

void FakeMediaEngine::createOffer(const QString& peerId, DescriptionCallback done) {
    calls << "offer:" + peerId;
    if (deferOffers) {
        m_pendingOffers.append(qMakePair(peerId, done));
        return;
    }
    if (failOfferFor.contains(peerId)) {
        done(false, QJsonObject(), "offer rejected");
        return;
    }
    done(true, QJsonObject{{"type", "offer"}, {"sdp", name + "->" + peerId}}, QString());
}

void FakeMediaEngine::releaseOffers() {
    auto pending = m_pendingOffers;
    m_pendingOffers.clear();
    deferOffers = false;
    for (const auto& p : pending) {
        p.second(true, QJsonObject{{"type", "offer"}, {"sdp", name + "->" + p.first}}, QString());
    }
}

void FakeMediaEngine::createAnswer(const QString& peerId, DescriptionCallback done) {
    calls << "answer:" + peerId;
    if (failAnswerFor.contains(peerId)) {
        done(false, QJsonObject(), "answer rejected");
        return;
    }
    done(true, QJsonObject{{"type", "answer"}, {"sdp", name + "->" + peerId}}, QString());
}

void FakeMediaEngine::setLocalDescription(const QString& peerId, const QJsonObject& description, ResultCallback done) {
    calls << "local:" + peerId + ":" + description["type"].toString();
    done(true, QString());
}

void FakeMediaEngine::setRemoteDescription(const QString& peerId, const QJsonObject& description, ResultCallback done) {
    calls << "remote:" + peerId + ":" + description["type"].toString();
    if (!openConnections.contains(peerId)) {
        done(false, "no such connection");
        return;
    }
    remoteDescriptions.insert(peerId, description);
    done(true, QString());
}

void FakeMediaEngine::addIceCandidate(const QString& peerId, const QJsonObject& candidate, ResultCallback done) {
    calls << "ice:" + peerId;
    candidates[peerId].append(candidate);
    done(true, QString());
}

bool FakeMediaEngine::attachFrameTransform(const QString& peerId, FrameCryptor* cryptor) {
    if (!supportsFrameTransform) return false;
    frameTransforms.insert(peerId, cryptor);
    return true;
}

void FakeMediaEngine::emitCandidate(const QString& peerId, const QJsonObject& candidate) {
    emit iceCandidateGathered(peerId, candidate);
}

void FakeMediaEngine::emitState(const QString& peerId, MediaConnectionState state) {
    emit connectionStateChanged(peerId, state);
}
