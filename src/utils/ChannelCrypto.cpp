#include "utils/ChannelCrypto.h"
#include "utils/CryptoUtils.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

const int ChannelCrypto::kNonceLength;
const int ChannelCrypto::kTagLength;
const int ChannelCrypto::kKeyLength;
const int ChannelCrypto::kIterations;
const char* const ChannelCrypto::kSalt = "LVM-SALT-V1";

namespace {

void setError(QString* error, const QString& text) {
    if (error) *error = text;
}

}

ChannelCrypto::ChannelCrypto(const QString& roomId)
    : m_roomId(roomId)
{
}

bool ChannelCrypto::deriveKey(QString* error) {
    if (isReady()) return true;

    if (m_roomId.isEmpty()) {
        setError(error, "empty room id");
        return false;
    }

    QByteArray key = CryptoUtils::pbkdf2Sha256(m_roomId.toUtf8(), QByteArray(kSalt),
                                               kIterations, kKeyLength);
    if (key.size() != kKeyLength) {
        setError(error, QString("key derivation failed: %1").arg(CryptoUtils::lastError()));
        qWarning() << "[CRYPTO] key derivation failed for room" << m_roomId;
        return false;
    }

    m_key = key;
    qDebug() << "[CRYPTO] key derived for room" << m_roomId;
    return true;
}

bool ChannelCrypto::encrypt(const QByteArray& plaintext, QByteArray* sealed, QString* error) {
    if (!sealed) return false;
    if (!deriveKey(error)) return false;

    QByteArray nonce = CryptoUtils::randomBytes(kNonceLength);
    if (nonce.size() != kNonceLength) {
        setError(error, "nonce generation failed");
        return false;
    }

    QByteArray body;
    if (!CryptoUtils::aesGcmEncrypt(m_key, nonce, plaintext, &body)) {
        setError(error, QString("encrypt failed: %1").arg(CryptoUtils::lastError()));
        return false;
    }

    *sealed = nonce + body;
    return true;
}

bool ChannelCrypto::decrypt(const QByteArray& sealed, QByteArray* plaintext, QString* error) {
    if (!plaintext) return false;
    if (!deriveKey(error)) return false;

    if (sealed.size() < kNonceLength + kTagLength) {
        setError(error, QString("truncated ciphertext (%1 bytes)").arg(sealed.size()));
        return false;
    }

    QByteArray nonce = sealed.left(kNonceLength);
    QByteArray body = sealed.mid(kNonceLength);
    if (!CryptoUtils::aesGcmDecrypt(m_key, nonce, body, plaintext)) {
        setError(error, "authentication failed");
        return false;
    }
    return true;
}

bool ChannelCrypto::encryptJson(const QJsonValue& value, QString* sealedBase64, QString* error) {
    if (!sealedBase64) return false;

    QJsonDocument doc;
    if (value.isObject()) {
        doc = QJsonDocument(value.toObject());
    } else if (value.isArray()) {
        doc = QJsonDocument(value.toArray());
    } else {
        setError(error, "only objects and arrays can be sealed");
        return false;
    }

    QByteArray sealed;
    if (!encrypt(doc.toJson(QJsonDocument::Compact), &sealed, error)) return false;

    *sealedBase64 = QString::fromLatin1(sealed.toBase64());
    return true;
}

bool ChannelCrypto::decryptJson(const QString& sealedBase64, QJsonValue* value, QString* error) {
    if (!value) return false;

    QByteArray sealed = QByteArray::fromBase64(sealedBase64.toLatin1());
    QByteArray plain;
    if (!decrypt(sealed, &plain, error)) return false;

    QJsonDocument doc = QJsonDocument::fromJson(plain);
    if (doc.isObject()) {
        *value = doc.object();
    } else if (doc.isArray()) {
        *value = doc.array();
    } else {
        setError(error, "decrypted payload is not json");
        return false;
    }
    return true;
}
