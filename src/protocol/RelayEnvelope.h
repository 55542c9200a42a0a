#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>

struct ParticipantInfo {
    QString clientId;
    QString displayName;
};

// Messages exchanged with the relay. Offer/answer/ice are forwarded verbatim
// by the server; everything else is produced or consumed by the server itself.
struct RelayEnvelope {
    enum class Type {
        Join,
        Welcome,
        PeerJoined,
        PeerLeft,
        Offer,
        Answer,
        Ice,
        Leave,
        End
    };

    static const int kMaxEnvelopeBytes = 64 * 1024;

    Type type = Type::End;
    QString clientId;                      // join, welcome ("you"), peer-joined, peer-left, leave
    QString displayName;                   // join, peer-joined, peer-left
    QList<ParticipantInfo> participants;   // welcome
    QString from;                          // offer, answer, ice
    QString to;                            // offer, answer, ice
    QJsonValue payload;                    // "sdp" for offer/answer, "candidate" for ice
    bool encrypted = false;

    static RelayEnvelope join(const QString& clientId, const QString& displayName);
    static RelayEnvelope welcome(const QString& you, const QList<ParticipantInfo>& participants);
    static RelayEnvelope peerJoined(const QString& clientId, const QString& displayName);
    static RelayEnvelope peerLeft(const QString& clientId, const QString& displayName = QString());
    static RelayEnvelope offer(const QString& from, const QString& to, const QJsonObject& sdp);
    static RelayEnvelope answer(const QString& from, const QString& to, const QJsonObject& sdp);
    static RelayEnvelope ice(const QString& from, const QString& to, const QJsonValue& candidate);
    static RelayEnvelope leave(const QString& clientId);
    static RelayEnvelope end();

    bool isSignal() const;
    QString payloadField() const;

    QJsonObject toJson() const;
    QString toText() const;

    static bool parse(const QString& text, RelayEnvelope* out, QString* error = nullptr);
    static bool fromJson(const QJsonObject& obj, RelayEnvelope* out, QString* error = nullptr);
};

QString relayTypeTag(RelayEnvelope::Type type);
