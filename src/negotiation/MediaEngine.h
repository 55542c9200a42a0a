#pragma once

#include <QObject>
#include <QMetaType>
#include <QJsonObject>
#include <QString>

#include <functional>

class FrameCryptor;

enum class MediaConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

Q_DECLARE_METATYPE(MediaConnectionState)

QString mediaConnectionStateName(MediaConnectionState state);

// Only Failed and Closed end a link; Disconnected may recover on its own.
bool isTerminalMediaState(MediaConnectionState state);

// Capture/encode/render pipeline seen from the negotiation side. One
// connection per remote peer, keyed by peer id. Completion callbacks may run
// synchronously or later on the event loop.
class MediaEngine : public QObject {
    Q_OBJECT

public:
    using DescriptionCallback = std::function<void(bool ok, const QJsonObject& description, const QString& error)>;
    using ResultCallback = std::function<void(bool ok, const QString& error)>;

    explicit MediaEngine(QObject* parent = nullptr) : QObject(parent) {}
    virtual ~MediaEngine() = default;

    virtual bool openConnection(const QString& peerId, QString* error) = 0;
    virtual void closeConnection(const QString& peerId) = 0;

    virtual void createOffer(const QString& peerId, DescriptionCallback done) = 0;
    virtual void createAnswer(const QString& peerId, DescriptionCallback done) = 0;
    virtual void setLocalDescription(const QString& peerId, const QJsonObject& description, ResultCallback done) = 0;
    virtual void setRemoteDescription(const QString& peerId, const QJsonObject& description, ResultCallback done) = 0;
    virtual void addIceCandidate(const QString& peerId, const QJsonObject& candidate, ResultCallback done) = 0;

    // False when the engine has no encoded-frame path for this connection.
    // The cryptor outlives the connection it is attached to.
    virtual bool attachFrameTransform(const QString& peerId, FrameCryptor* cryptor) = 0;

signals:
    void iceCandidateGathered(const QString& peerId, const QJsonObject& candidate);
    void connectionStateChanged(const QString& peerId, MediaConnectionState state);
    void remoteMediaReady(const QString& peerId);
};
