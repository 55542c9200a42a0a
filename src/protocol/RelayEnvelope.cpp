#include "protocol/RelayEnvelope.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

const int RelayEnvelope::kMaxEnvelopeBytes;

namespace {

const char* const kGuestName = "Guest";

void setError(QString* error, const QString& text) {
    if (error) *error = text;
}

QString displayNameOrGuest(const QJsonObject& obj) {
    QString name = obj["displayName"].toString();
    return name.isEmpty() ? QString(kGuestName) : name;
}

}

QString relayTypeTag(RelayEnvelope::Type type) {
    switch (type) {
        case RelayEnvelope::Type::Join:       return "join";
        case RelayEnvelope::Type::Welcome:    return "welcome";
        case RelayEnvelope::Type::PeerJoined: return "peer-joined";
        case RelayEnvelope::Type::PeerLeft:   return "peer-left";
        case RelayEnvelope::Type::Offer:      return "offer";
        case RelayEnvelope::Type::Answer:     return "answer";
        case RelayEnvelope::Type::Ice:        return "ice";
        case RelayEnvelope::Type::Leave:      return "leave";
        case RelayEnvelope::Type::End:        return "end";
    }
    return QString();
}

RelayEnvelope RelayEnvelope::join(const QString& clientId, const QString& displayName) {
    RelayEnvelope env;
    env.type = Type::Join;
    env.clientId = clientId;
    env.displayName = displayName;
    return env;
}

RelayEnvelope RelayEnvelope::welcome(const QString& you, const QList<ParticipantInfo>& participants) {
    RelayEnvelope env;
    env.type = Type::Welcome;
    env.clientId = you;
    env.participants = participants;
    return env;
}

RelayEnvelope RelayEnvelope::peerJoined(const QString& clientId, const QString& displayName) {
    RelayEnvelope env;
    env.type = Type::PeerJoined;
    env.clientId = clientId;
    env.displayName = displayName;
    return env;
}

RelayEnvelope RelayEnvelope::peerLeft(const QString& clientId, const QString& displayName) {
    RelayEnvelope env;
    env.type = Type::PeerLeft;
    env.clientId = clientId;
    env.displayName = displayName;
    return env;
}

RelayEnvelope RelayEnvelope::offer(const QString& from, const QString& to, const QJsonObject& sdp) {
    RelayEnvelope env;
    env.type = Type::Offer;
    env.from = from;
    env.to = to;
    env.payload = sdp;
    return env;
}

RelayEnvelope RelayEnvelope::answer(const QString& from, const QString& to, const QJsonObject& sdp) {
    RelayEnvelope env;
    env.type = Type::Answer;
    env.from = from;
    env.to = to;
    env.payload = sdp;
    return env;
}

RelayEnvelope RelayEnvelope::ice(const QString& from, const QString& to, const QJsonValue& candidate) {
    RelayEnvelope env;
    env.type = Type::Ice;
    env.from = from;
    env.to = to;
    env.payload = candidate;
    return env;
}

RelayEnvelope RelayEnvelope::leave(const QString& clientId) {
    RelayEnvelope env;
    env.type = Type::Leave;
    env.clientId = clientId;
    return env;
}

RelayEnvelope RelayEnvelope::end() {
    RelayEnvelope env;
    env.type = Type::End;
    return env;
}

bool RelayEnvelope::isSignal() const {
    return type == Type::Offer || type == Type::Answer || type == Type::Ice;
}

QString RelayEnvelope::payloadField() const {
    return type == Type::Ice ? QString("candidate") : QString("sdp");
}

QJsonObject RelayEnvelope::toJson() const {
    QJsonObject obj;
    obj["t"] = relayTypeTag(type);

    switch (type) {
        case Type::Join:
        case Type::PeerJoined:
            obj["clientId"] = clientId;
            obj["displayName"] = displayName;
            break;
        case Type::PeerLeft:
            obj["clientId"] = clientId;
            if (!displayName.isEmpty()) obj["displayName"] = displayName;
            break;
        case Type::Welcome: {
            obj["you"] = clientId;
            QJsonArray arr;
            for (const ParticipantInfo& p : participants) {
                QJsonObject entry;
                entry["clientId"] = p.clientId;
                entry["displayName"] = p.displayName;
                arr.append(entry);
            }
            obj["participants"] = arr;
            break;
        }
        case Type::Offer:
        case Type::Answer:
        case Type::Ice:
            obj["from"] = from;
            obj["to"] = to;
            obj[payloadField()] = payload;
            if (encrypted) obj["encrypted"] = true;
            break;
        case Type::Leave:
            obj["clientId"] = clientId;
            break;
        case Type::End:
            break;
    }
    return obj;
}

QString RelayEnvelope::toText() const {
    return QString::fromUtf8(QJsonDocument(toJson()).toJson(QJsonDocument::Compact));
}

bool RelayEnvelope::parse(const QString& text, RelayEnvelope* out, QString* error) {
    if (text.size() > kMaxEnvelopeBytes) {
        setError(error, QString("oversized envelope (%1 bytes)").arg(text.size()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, QString("invalid json: %1").arg(parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(error, "envelope is not a json object");
        return false;
    }
    return fromJson(doc.object(), out, error);
}

bool RelayEnvelope::fromJson(const QJsonObject& obj, RelayEnvelope* out, QString* error) {
    if (!out) return false;

    const QString tag = obj["t"].toString();
    if (tag.isEmpty()) {
        setError(error, "missing discriminator");
        return false;
    }

    RelayEnvelope env;
    if (tag == "join") {
        env.type = Type::Join;
        env.clientId = obj["clientId"].toString();
        if (env.clientId.isEmpty()) {
            setError(error, "join without clientId");
            return false;
        }
        env.displayName = displayNameOrGuest(obj);
    } else if (tag == "welcome") {
        env.type = Type::Welcome;
        env.clientId = obj["you"].toString();
        for (const QJsonValue& v : obj["participants"].toArray()) {
            QJsonObject entry = v.toObject();
            ParticipantInfo info;
            info.clientId = entry["clientId"].toString();
            if (info.clientId.isEmpty()) continue;
            info.displayName = displayNameOrGuest(entry);
            env.participants.append(info);
        }
    } else if (tag == "peer-joined" || tag == "peer-left") {
        env.type = tag == "peer-joined" ? Type::PeerJoined : Type::PeerLeft;
        env.clientId = obj["clientId"].toString();
        if (env.clientId.isEmpty()) {
            setError(error, QString("%1 without clientId").arg(tag));
            return false;
        }
        env.displayName = obj["displayName"].toString();
    } else if (tag == "offer" || tag == "answer" || tag == "ice") {
        if (tag == "offer") env.type = Type::Offer;
        else if (tag == "answer") env.type = Type::Answer;
        else env.type = Type::Ice;
        env.from = obj["from"].toString();
        env.to = obj["to"].toString();
        if (env.to.isEmpty()) {
            setError(error, QString("%1 without recipient").arg(tag));
            return false;
        }
        env.payload = obj[env.payloadField()];
        env.encrypted = obj["encrypted"].toBool();
    } else if (tag == "leave") {
        env.type = Type::Leave;
        env.clientId = obj["clientId"].toString();
    } else if (tag == "end") {
        env.type = Type::End;
    } else {
        setError(error, QString("unknown envelope type '%1'").arg(tag));
        return false;
    }

    *out = env;
    return true;
}
