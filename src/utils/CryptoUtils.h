#pragma once

#include <QByteArray>
#include <QString>

// Thin wrappers over OpenSSL libcrypto. All functions return false/empty on
// failure and never throw.
namespace CryptoUtils {
    QByteArray randomBytes(int count);
    QByteArray pbkdf2Sha256(const QByteArray& password, const QByteArray& salt,
                            int iterations, int keyLength);

    // Output is ciphertext followed by the 16-byte tag.
    bool aesGcmEncrypt(const QByteArray& key, const QByteArray& nonce,
                       const QByteArray& plaintext, QByteArray* sealed);
    bool aesGcmDecrypt(const QByteArray& key, const QByteArray& nonce,
                       const QByteArray& sealed, QByteArray* plaintext);

    QString lastError();
}
