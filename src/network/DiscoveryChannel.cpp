#include "network/DiscoveryChannel.h"

#include <QDebug>
#include <QNetworkDatagram>
#include <QNetworkInterface>

const char* const DiscoveryChannel::kDefaultGroup = "239.255.255.250";
const quint16 DiscoveryChannel::kDefaultPort;

namespace {

bool isPrivateIPv4(const QHostAddress& address) {
    return address.isInSubnet(QHostAddress("10.0.0.0"), 8)
        || address.isInSubnet(QHostAddress("172.16.0.0"), 12)
        || address.isInSubnet(QHostAddress("192.168.0.0"), 16);
}

}

DiscoveryChannel::DiscoveryChannel(QObject* parent)
    : QObject(parent)
{
}

DiscoveryChannel::~DiscoveryChannel() {
    close();
}

bool DiscoveryChannel::open(const QHostAddress& group, quint16 port, QString* error) {
    if (m_socket) return true;

    m_group = group;
    m_port = port;

    m_socket = new QUdpSocket(this);
    if (!m_socket->bind(QHostAddress::AnyIPv4, m_port,
                        QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        QString reason = m_socket->errorString();
        qWarning() << "[DISCOVERY] failed to bind UDP port" << m_port << reason;
        if (error) *error = QString("cannot bind discovery port %1: %2").arg(m_port).arg(reason);
        delete m_socket;
        m_socket = nullptr;
        return false;
    }
    // Bound to an ephemeral port when asked for 0.
    m_port = m_socket->localPort();

    if (!m_socket->joinMulticastGroup(m_group)) {
        // Still usable for loopback and same-host traffic.
        qWarning() << "[DISCOVERY] could not join multicast group" << m_group.toString()
                   << m_socket->errorString();
    }
    m_socket->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    m_socket->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);

    connect(m_socket, &QUdpSocket::readyRead, this, &DiscoveryChannel::onReadyRead);

    qInfo() << "[DISCOVERY] channel open on" << m_group.toString() << "port" << m_port;
    return true;
}

void DiscoveryChannel::close() {
    if (!m_socket) return;
    m_socket->disconnect(this);
    m_socket->leaveMulticastGroup(m_group);
    m_socket->close();
    delete m_socket;
    m_socket = nullptr;
    qInfo() << "[DISCOVERY] channel closed";
}

bool DiscoveryChannel::isOpen() const {
    return m_socket != nullptr;
}

bool DiscoveryChannel::send(const DiscoveryMessage& message) {
    if (!m_socket) {
        qWarning() << "[DISCOVERY] cannot send" << discoveryTypeTag(message.type)
                   << "- channel not open";
        return false;
    }

    QByteArray data = message.toDatagram();
    qint64 written = m_socket->writeDatagram(data, m_group, m_port);
    if (written != data.size()) {
        qWarning() << "[DISCOVERY] send" << discoveryTypeTag(message.type)
                   << "failed:" << m_socket->errorString();
        return false;
    }
    return true;
}

void DiscoveryChannel::onReadyRead() {
    while (m_socket && m_socket->hasPendingDatagrams()) {
        QNetworkDatagram datagram = m_socket->receiveDatagram();

        // Normalize IPv4-mapped IPv6 addresses (::ffff:x.x.x.x -> x.x.x.x)
        QHostAddress sender = datagram.senderAddress();
        bool ok = false;
        quint32 ipv4 = sender.toIPv4Address(&ok);
        if (ok) sender = QHostAddress(ipv4);

        DiscoveryMessage message;
        QString error;
        if (!DiscoveryMessage::parse(datagram.data(), &message, &error)) {
            qDebug() << "[DISCOVERY] dropped datagram from" << sender.toString() << error;
            continue;
        }
        emit messageReceived(message, sender);
    }
}

QString DiscoveryChannel::preferredLocalAddress() {
    QString fallback;
    for (const QNetworkInterface& iface : QNetworkInterface::allInterfaces()) {
        if (!(iface.flags() & QNetworkInterface::IsUp)) continue;
        if (iface.flags() & QNetworkInterface::IsLoopBack) continue;

        for (const QNetworkAddressEntry& entry : iface.addressEntries()) {
            QHostAddress address = entry.ip();
            if (address.protocol() != QAbstractSocket::IPv4Protocol) continue;
            if (isPrivateIPv4(address)) return address.toString();
            if (fallback.isEmpty()) fallback = address.toString();
        }
    }
    return fallback.isEmpty() ? QString("127.0.0.1") : fallback;
}
