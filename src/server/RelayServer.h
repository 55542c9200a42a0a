#pragma once

#include <QObject>
#include <QHostAddress>
#include <QWebSocketServer>
#include <QWebSocket>
#include <QList>
#include <QMap>

#include "protocol/RelayEnvelope.h"

struct ClientSession {
    QString clientId;
    QString displayName;
    QWebSocket* socket = nullptr;
};

// Per-room signaling relay. Keeps the membership table for one hosting session
// and forwards offer/answer/ice envelopes between named participants.
class RelayServer : public QObject {
    Q_OBJECT

public:
    static const quint16 kDefaultPort = 57788;

    explicit RelayServer(QObject* parent = nullptr);
    ~RelayServer();

    // Port 0 picks an ephemeral port; see port().
    bool start(quint16 port, QString* error = nullptr,
               const QHostAddress& address = QHostAddress::Any);
    void stop(bool broadcastEnd);

    bool isRunning() const;
    quint16 port() const;

    int participantCount() const { return m_sessions.size(); }
    QList<ParticipantInfo> participants() const;

signals:
    void participantJoined(const QString& clientId, const QString& displayName);
    void participantLeft(const QString& clientId);
    void participantCountChanged(int count);

private slots:
    void onNewConnection();
    void onTextMessage(const QString& message);
    void onDisconnected();

private:
    void handleJoin(QWebSocket* socket, const RelayEnvelope& env);
    void handleLeave(QWebSocket* socket);
    void handleSignal(QWebSocket* socket, const RelayEnvelope& env, const QString& rawMessage);

    void removeSession(const QString& clientId);
    void sendEnvelope(QWebSocket* socket, const RelayEnvelope& env);
    void broadcast(const RelayEnvelope& env, const QString& exceptClientId = QString());

    QWebSocketServer* m_server = nullptr;
    QList<QWebSocket*> m_connections;
    QMap<QString, ClientSession> m_sessions;      // clientId -> session
    QMap<QWebSocket*, QString> m_socketToClientId;
};
