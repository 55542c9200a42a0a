#include "server/RelayServer.h"

#include <QDebug>

const quint16 RelayServer::kDefaultPort;

RelayServer::RelayServer(QObject* parent)
    : QObject(parent)
{
}

RelayServer::~RelayServer() {
    stop(false);
}

bool RelayServer::start(quint16 port, QString* error, const QHostAddress& address) {
    if (m_server) return true;

    m_server = new QWebSocketServer("LanMeetRelay", QWebSocketServer::NonSecureMode, this);
    if (!m_server->listen(address, port)) {
        QString reason = m_server->errorString();
        qWarning() << "[RELAY] failed to start on port" << port << reason;
        if (error) *error = QString("cannot listen on port %1: %2").arg(port).arg(reason);
        delete m_server;
        m_server = nullptr;
        return false;
    }

    connect(m_server, &QWebSocketServer::newConnection, this, &RelayServer::onNewConnection);
    qInfo() << "[RELAY] listening on port" << m_server->serverPort();
    return true;
}

void RelayServer::stop(bool broadcastEnd) {
    if (!m_server) return;
    qInfo() << "[RELAY] stopping, broadcastEnd =" << broadcastEnd;

    if (broadcastEnd) {
        broadcast(RelayEnvelope::end());
        for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
            it->socket->flush();
        }
    }

    // Detach first so the closes below do not come back as peer-left.
    QList<QWebSocket*> sockets = m_connections;
    m_connections.clear();
    m_sessions.clear();
    m_socketToClientId.clear();
    for (QWebSocket* socket : sockets) {
        socket->disconnect(this);
        socket->close(QWebSocketProtocol::CloseCodeGoingAway, "relay stopped");
        socket->flush();
        socket->deleteLater();
    }

    m_server->close();
    m_server->disconnect(this);
    m_server->deleteLater();
    m_server = nullptr;

    emit participantCountChanged(0);
}

bool RelayServer::isRunning() const {
    return m_server && m_server->isListening();
}

quint16 RelayServer::port() const {
    return m_server ? m_server->serverPort() : 0;
}

QList<ParticipantInfo> RelayServer::participants() const {
    QList<ParticipantInfo> list;
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        list.append({it->clientId, it->displayName});
    }
    return list;
}

void RelayServer::onNewConnection() {
    while (m_server->hasPendingConnections()) {
        QWebSocket* socket = m_server->nextPendingConnection();
        connect(socket, &QWebSocket::textMessageReceived, this, &RelayServer::onTextMessage);
        connect(socket, &QWebSocket::disconnected, this, &RelayServer::onDisconnected);
        m_connections.append(socket);
        qDebug() << "[RELAY] new connection from" << socket->peerAddress().toString();
    }
}

void RelayServer::onTextMessage(const QString& message) {
    auto* socket = qobject_cast<QWebSocket*>(sender());
    if (!socket) return;

    RelayEnvelope env;
    QString error;
    if (!RelayEnvelope::parse(message, &env, &error)) {
        qDebug() << "[RELAY] dropped message:" << error;
        return;
    }

    switch (env.type) {
        case RelayEnvelope::Type::Join:
            handleJoin(socket, env);
            break;
        case RelayEnvelope::Type::Leave:
            handleLeave(socket);
            break;
        case RelayEnvelope::Type::Offer:
        case RelayEnvelope::Type::Answer:
        case RelayEnvelope::Type::Ice:
            handleSignal(socket, env, message);
            break;
        default:
            qDebug() << "[RELAY] ignoring client-sent" << relayTypeTag(env.type);
            break;
    }
}

void RelayServer::onDisconnected() {
    auto* socket = qobject_cast<QWebSocket*>(sender());
    if (!socket) return;

    m_connections.removeAll(socket);
    QString clientId = m_socketToClientId.take(socket);
    qDebug() << "[RELAY] socket closed for" << (clientId.isEmpty() ? QString("<unjoined>") : clientId);
    if (!clientId.isEmpty()) {
        removeSession(clientId);
    }

    socket->deleteLater();
}

void RelayServer::handleJoin(QWebSocket* socket, const RelayEnvelope& env) {
    const QString current = m_socketToClientId.value(socket);
    if (!current.isEmpty() && current != env.clientId) {
        qWarning() << "[RELAY] socket already joined as" << current << "- ignoring join as" << env.clientId;
        return;
    }

    if (current == env.clientId) {
        // Repeated join on the same connection; answer again, nothing else changes.
        QList<ParticipantInfo> others;
        for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
            if (it.key() != env.clientId) others.append({it->clientId, it->displayName});
        }
        sendEnvelope(socket, RelayEnvelope::welcome(env.clientId, others));
        return;
    }

    // Same id from a new connection: the old session is gone as far as the
    // others are concerned.
    auto existing = m_sessions.find(env.clientId);
    if (existing != m_sessions.end()) {
        QWebSocket* stale = existing->socket;
        qDebug() << "[RELAY] replacing stale session for" << env.clientId;
        m_socketToClientId.remove(stale);
        removeSession(env.clientId);
        m_connections.removeAll(stale);
        stale->disconnect(this);
        stale->close(QWebSocketProtocol::CloseCodePolicyViolated, "replaced by newer session");
        stale->deleteLater();
    }

    // Welcome is built from the table before this client is added, and sent
    // before anyone hears peer-joined.
    QList<ParticipantInfo> others = participants();
    sendEnvelope(socket, RelayEnvelope::welcome(env.clientId, others));

    ClientSession session;
    session.clientId = env.clientId;
    session.displayName = env.displayName;
    session.socket = socket;
    m_sessions.insert(env.clientId, session);
    m_socketToClientId.insert(socket, env.clientId);

    qInfo() << "[RELAY] join from" << env.clientId << env.displayName
            << "- participants:" << m_sessions.size();

    broadcast(RelayEnvelope::peerJoined(env.clientId, env.displayName), env.clientId);

    emit participantJoined(env.clientId, env.displayName);
    emit participantCountChanged(m_sessions.size());
}

void RelayServer::handleLeave(QWebSocket* socket) {
    QString clientId = m_socketToClientId.take(socket);
    if (clientId.isEmpty()) return;
    qInfo() << "[RELAY] leave from" << clientId;
    removeSession(clientId);
}

void RelayServer::handleSignal(QWebSocket* socket, const RelayEnvelope& env, const QString& rawMessage) {
    const QString senderId = m_socketToClientId.value(socket);
    if (senderId.isEmpty()) {
        qDebug() << "[RELAY] dropping" << relayTypeTag(env.type) << "from unjoined connection";
        return;
    }
    if (env.from != senderId) {
        qWarning() << "[RELAY] sender mismatch: claimed" << env.from << "but connection joined as" << senderId;
        return;
    }

    auto target = m_sessions.constFind(env.to);
    if (target == m_sessions.constEnd()) {
        qDebug() << "[RELAY] no session for" << env.to << "- dropping" << relayTypeTag(env.type);
        return;
    }

    target->socket->sendTextMessage(rawMessage);
    qDebug() << "[RELAY] relayed" << relayTypeTag(env.type) << "from" << env.from << "to" << env.to;
}

void RelayServer::removeSession(const QString& clientId) {
    auto it = m_sessions.find(clientId);
    if (it == m_sessions.end()) return;

    QString displayName = it->displayName;
    m_sessions.erase(it);

    broadcast(RelayEnvelope::peerLeft(clientId, displayName));

    emit participantLeft(clientId);
    emit participantCountChanged(m_sessions.size());
}

void RelayServer::sendEnvelope(QWebSocket* socket, const RelayEnvelope& env) {
    socket->sendTextMessage(env.toText());
}

void RelayServer::broadcast(const RelayEnvelope& env, const QString& exceptClientId) {
    const QString text = env.toText();
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        if (it.key() == exceptClientId) continue;
        it->socket->sendTextMessage(text);
    }
}
