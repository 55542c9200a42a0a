#pragma once

#include <QObject>
#include <QHostAddress>
#include <QUdpSocket>

#include "protocol/DiscoveryMessage.h"

// The one UDP multicast socket shared by room discovery and presence. Neither
// service opens or closes it; the owner does.
class DiscoveryChannel : public QObject {
    Q_OBJECT

public:
    static const char* const kDefaultGroup;
    static const quint16 kDefaultPort = 55555;

    explicit DiscoveryChannel(QObject* parent = nullptr);
    ~DiscoveryChannel();

    bool open(const QHostAddress& group, quint16 port, QString* error = nullptr);
    void close();
    bool isOpen() const;

    quint16 port() const { return m_port; }
    QHostAddress group() const { return m_group; }

    bool send(const DiscoveryMessage& message);

    // First private-range IPv4 address of a non-loopback interface.
    static QString preferredLocalAddress();

signals:
    void messageReceived(const DiscoveryMessage& message, const QHostAddress& sender);

private slots:
    void onReadyRead();

private:
    QUdpSocket* m_socket = nullptr;
    QHostAddress m_group;
    quint16 m_port = kDefaultPort;
};
