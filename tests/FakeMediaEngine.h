#pragma once

#include "negotiation/MediaEngine.h"

#include <QMap>
#include <QSet>
#include <QStringList>

// Scripted engine: completes every call synchronously and records it.
class FakeMediaEngine : public MediaEngine {
    Q_OBJECT

public:
    explicit FakeMediaEngine(const QString& name = QString("fake"), QObject* parent = nullptr);

    bool openConnection(const QString& peerId, QString* error) override;
    void closeConnection(const QString& peerId) override;
    void createOffer(const QString& peerId, DescriptionCallback done) override;
    void createAnswer(const QString& peerId, DescriptionCallback done) override;
    void setLocalDescription(const QString& peerId, const QJsonObject& description, ResultCallback done) override;
    void setRemoteDescription(const QString& peerId, const QJsonObject& description, ResultCallback done) override;
    void addIceCandidate(const QString& peerId, const QJsonObject& candidate, ResultCallback done) override;
    bool attachFrameTransform(const QString& peerId, FrameCryptor* cryptor) override;

    // Test controls
    void emitCandidate(const QString& peerId, const QJsonObject& candidate);
    void emitState(const QString& peerId, MediaConnectionState state);

    QString name;
    QSet<QString> failOfferFor;
    QSet<QString> failAnswerFor;
    QSet<QString> refuseOpenFor;
    bool supportsFrameTransform = false;

    // Holds createOffer completions until releaseOffers() when set.
    bool deferOffers = false;
    void releaseOffers();

    QSet<QString> openConnections;
    QStringList calls;
    QMap<QString, QJsonObject> remoteDescriptions;
    QMap<QString, QList<QJsonObject>> candidates;
    QMap<QString, FrameCryptor*> frameTransforms;
    int closeCount = 0;

private:
    QList<QPair<QString, DescriptionCallback>> m_pendingOffers;
};
