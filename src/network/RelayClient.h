#pragma once

#include <QObject>
#include <QWebSocket>
#include <QTimer>
#include <QUrl>

#include "protocol/RelayEnvelope.h"

class ChannelCrypto;

// Participant side of a room relay. Joins under a fixed client id and
// exchanges envelopes; offer/answer/ice payloads are sealed with the room key
// when a ChannelCrypto is set.
class RelayClient : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Connecting,
        Joining,
        Joined,
        Closed
    };

    static const int kDefaultJoinTimeoutMs = 5000;

    explicit RelayClient(QObject* parent = nullptr);
    ~RelayClient();

    // Not owned. Must have its key derived before the first signal is sent.
    void setCrypto(ChannelCrypto* crypto) { m_crypto = crypto; }
    void setJoinTimeout(int ms) { m_joinTimer.setInterval(ms); }

    // Completion is reported by welcomed() or connectFailed(), exactly one of them.
    bool connectToRelay(const QUrl& url, const QString& clientId, const QString& displayName,
                        QString* error = nullptr);

    bool send(const RelayEnvelope& env);
    void leave();
    void close();

    State state() const { return m_state; }
    bool isJoined() const { return m_state == State::Joined; }
    const QString& clientId() const { return m_clientId; }
    QUrl url() const { return m_url; }

signals:
    void welcomed(const QList<ParticipantInfo>& participants);
    void envelopeReceived(const RelayEnvelope& env);
    void connectFailed(const QString& error);
    void connectionClosed();

private slots:
    void onConnected();
    void onDisconnected();
    void onTextMessage(const QString& message);
    void onError(QAbstractSocket::SocketError error);
    void onJoinTimeout();

private:
    void fail(const QString& error);
    bool sealPayload(RelayEnvelope* env);
    bool openPayload(RelayEnvelope* env);

    QWebSocket m_socket;
    QTimer m_joinTimer;
    ChannelCrypto* m_crypto = nullptr;
    State m_state = State::Idle;
    QUrl m_url;
    QString m_clientId;
    QString m_displayName;
};
