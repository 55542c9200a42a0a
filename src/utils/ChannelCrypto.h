#pragma once

#include <QByteArray>
#include <QJsonValue>
#include <QString>

// Room-scoped AES-256-GCM. The key is derived from the room id, which acts as
// the shared secret; it is never put on the wire.
//
// Sealed layout: 12-byte nonce || ciphertext || 16-byte tag. A fresh random
// nonce is drawn for every encrypt call.
class ChannelCrypto {
public:
    static const int kNonceLength = 12;
    static const int kTagLength = 16;
    static const int kKeyLength = 32;
    static const int kIterations = 100000;
    static const char* const kSalt;

    explicit ChannelCrypto(const QString& roomId);

    const QString& roomId() const { return m_roomId; }

    // Idempotent; only the first successful call does any work.
    bool deriveKey(QString* error = nullptr);
    bool isReady() const { return !m_key.isEmpty(); }
    QByteArray key() const { return m_key; }

    bool encrypt(const QByteArray& plaintext, QByteArray* sealed, QString* error = nullptr);
    bool decrypt(const QByteArray& sealed, QByteArray* plaintext, QString* error = nullptr);

    // Envelope form: compact JSON of an object or array, sealed, then base64.
    bool encryptJson(const QJsonValue& value, QString* sealedBase64, QString* error = nullptr);
    bool decryptJson(const QString& sealedBase64, QJsonValue* value, QString* error = nullptr);

private:
    QString m_roomId;
    QByteArray m_key;
};
