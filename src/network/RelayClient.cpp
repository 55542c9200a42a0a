#include "network/RelayClient.h"

#include "utils/ChannelCrypto.h"

#include <QDebug>

const int RelayClient::kDefaultJoinTimeoutMs;

RelayClient::RelayClient(QObject* parent)
    : QObject(parent)
{
    m_joinTimer.setSingleShot(true);
    m_joinTimer.setInterval(kDefaultJoinTimeoutMs);
    connect(&m_joinTimer, &QTimer::timeout, this, &RelayClient::onJoinTimeout);

    connect(&m_socket, &QWebSocket::connected, this, &RelayClient::onConnected);
    connect(&m_socket, &QWebSocket::disconnected, this, &RelayClient::onDisconnected);
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &RelayClient::onTextMessage);
    connect(&m_socket, QOverload<QAbstractSocket::SocketError>::of(&QWebSocket::error),
            this, &RelayClient::onError);
}

RelayClient::~RelayClient() {
    m_joinTimer.stop();
    m_socket.disconnect(this);
    m_socket.abort();
}

bool RelayClient::connectToRelay(const QUrl& url, const QString& clientId, const QString& displayName,
                                 QString* error) {
    if (m_state != State::Idle && m_state != State::Closed) {
        if (error) *error = "relay connection already in progress";
        return false;
    }
    if (!url.isValid() || clientId.isEmpty()) {
        if (error) *error = QString("invalid relay url or client id: %1").arg(url.toString());
        return false;
    }

    m_url = url;
    m_clientId = clientId;
    m_displayName = displayName;
    m_state = State::Connecting;

    qInfo() << "[SIGNAL] connecting to" << url.toString() << "as" << clientId;
    m_joinTimer.start();
    m_socket.open(url);
    return true;
}

bool RelayClient::send(const RelayEnvelope& env) {
    if (m_state != State::Joined) {
        qDebug() << "[SIGNAL] not joined, dropping outgoing" << relayTypeTag(env.type);
        return false;
    }

    RelayEnvelope out = env;
    if (out.isSignal() && !sealPayload(&out)) return false;

    m_socket.sendTextMessage(out.toText());
    return true;
}

void RelayClient::leave() {
    if (m_state != State::Joined) return;
    qInfo() << "[SIGNAL] leaving relay";
    m_socket.sendTextMessage(RelayEnvelope::leave(m_clientId).toText());
    m_socket.flush();
}

void RelayClient::close() {
    m_joinTimer.stop();
    if (m_state == State::Idle || m_state == State::Closed) return;
    m_state = State::Closed;
    m_socket.close();
}

void RelayClient::onConnected() {
    if (m_state != State::Connecting) return;
    m_state = State::Joining;
    qDebug() << "[SIGNAL] connected, sending join";
    m_socket.sendTextMessage(RelayEnvelope::join(m_clientId, m_displayName).toText());
}

void RelayClient::onDisconnected() {
    m_joinTimer.stop();
    switch (m_state) {
        case State::Connecting:
        case State::Joining:
            fail(QString("connection closed before welcome: %1").arg(m_socket.closeReason()));
            break;
        case State::Joined:
            m_state = State::Closed;
            qInfo() << "[SIGNAL] relay connection closed";
            emit connectionClosed();
            break;
        case State::Idle:
        case State::Closed:
            break;
    }
}

void RelayClient::onTextMessage(const QString& message) {
    if (m_state != State::Joining && m_state != State::Joined) return;

    RelayEnvelope env;
    QString error;
    if (!RelayEnvelope::parse(message, &env, &error)) {
        qDebug() << "[SIGNAL] dropped message:" << error;
        return;
    }

    if (env.type == RelayEnvelope::Type::Welcome) {
        if (m_state == State::Joined) return;
        m_joinTimer.stop();
        m_state = State::Joined;
        qInfo() << "[SIGNAL] welcomed as" << env.clientId << "with" << env.participants.size() << "other(s)";
        emit welcomed(env.participants);
        emit envelopeReceived(env);
        return;
    }

    if (m_state != State::Joined) {
        qDebug() << "[SIGNAL] ignoring" << relayTypeTag(env.type) << "before welcome";
        return;
    }

    if (env.isSignal() && !openPayload(&env)) return;
    emit envelopeReceived(env);
}

void RelayClient::onError(QAbstractSocket::SocketError error) {
    Q_UNUSED(error);
    if (m_state == State::Connecting || m_state == State::Joining) {
        fail(m_socket.errorString());
    } else {
        qWarning() << "[SIGNAL] socket error:" << m_socket.errorString();
    }
}

void RelayClient::onJoinTimeout() {
    if (m_state == State::Connecting || m_state == State::Joining) {
        fail("timed out waiting for welcome");
    }
}

void RelayClient::fail(const QString& error) {
    m_joinTimer.stop();
    m_state = State::Closed;
    qWarning() << "[SIGNAL] could not join" << m_url.toString() << "-" << error;
    m_socket.abort();
    emit connectFailed(error);
}

bool RelayClient::sealPayload(RelayEnvelope* env) {
    if (!m_crypto || env->encrypted) return true;
    if (!env->payload.isObject() && !env->payload.isArray()) return true;

    QString sealed;
    QString error;
    if (!m_crypto->encryptJson(env->payload, &sealed, &error)) {
        qWarning() << "[CRYPTO] cannot seal" << relayTypeTag(env->type) << "for" << env->to << "-" << error;
        return false;
    }
    env->payload = sealed;
    env->encrypted = true;
    return true;
}

bool RelayClient::openPayload(RelayEnvelope* env) {
    if (!env->encrypted) return true;
    if (!m_crypto) {
        qWarning() << "[CRYPTO] encrypted" << relayTypeTag(env->type) << "from" << env->from << "but no room key";
        return false;
    }

    QJsonValue value;
    QString error;
    if (!m_crypto->decryptJson(env->payload.toString(), &value, &error)) {
        qWarning() << "[CRYPTO] dropping" << relayTypeTag(env->type) << "from" << env->from << "-" << error;
        return false;
    }
    env->payload = value;
    env->encrypted = false;
    return true;
}
