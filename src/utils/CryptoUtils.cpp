#include "utils/CryptoUtils.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace {

const int kTagLength = 16;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

unsigned char* bytes(QByteArray& data) {
    return reinterpret_cast<unsigned char*>(data.data());
}

const unsigned char* bytes(const QByteArray& data) {
    return reinterpret_cast<const unsigned char*>(data.constData());
}

}

namespace CryptoUtils {

QByteArray randomBytes(int count) {
    QByteArray out;
    if (count <= 0) return out;
    out.resize(count);
    if (RAND_bytes(bytes(out), count) != 1) {
        return QByteArray();
    }
    return out;
}

QByteArray pbkdf2Sha256(const QByteArray& password, const QByteArray& salt,
                        int iterations, int keyLength) {
    QByteArray key;
    key.resize(keyLength);
    int ok = PKCS5_PBKDF2_HMAC(password.constData(), password.size(),
                               bytes(salt), salt.size(),
                               iterations, EVP_sha256(),
                               keyLength, bytes(key));
    if (ok != 1) return QByteArray();
    return key;
}

bool aesGcmEncrypt(const QByteArray& key, const QByteArray& nonce,
                   const QByteArray& plaintext, QByteArray* sealed) {
    if (!sealed || key.size() != 32) return false;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return false;

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1) return false;
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key), bytes(nonce)) != 1) return false;

    QByteArray out;
    out.resize(plaintext.size() + kTagLength);
    int len = 0;
    int total = 0;

    if (!plaintext.isEmpty()) {
        if (EVP_EncryptUpdate(ctx.get(), bytes(out), &len, bytes(plaintext), plaintext.size()) != 1) return false;
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(out) + total, &len) != 1) return false;
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLength, bytes(out) + total) != 1) return false;
    total += kTagLength;

    out.resize(total);
    *sealed = out;
    return true;
}

bool aesGcmDecrypt(const QByteArray& key, const QByteArray& nonce,
                   const QByteArray& sealed, QByteArray* plaintext) {
    if (!plaintext || key.size() != 32) return false;
    if (sealed.size() < kTagLength) return false;

    const int cipherLength = sealed.size() - kTagLength;
    QByteArray tag = sealed.right(kTagLength);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) return false;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) return false;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1) return false;
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key), bytes(nonce)) != 1) return false;

    QByteArray out;
    out.resize(cipherLength);
    int len = 0;
    int total = 0;

    if (cipherLength > 0) {
        if (EVP_DecryptUpdate(ctx.get(), bytes(out), &len, bytes(sealed), cipherLength) != 1) return false;
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLength, bytes(tag)) != 1) return false;

    // Fails on tag mismatch.
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(out) + total, &len) != 1) return false;
    total += len;

    out.resize(total);
    *plaintext = out;
    return true;
}

QString lastError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return QString("unknown error");
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return QString::fromLatin1(buffer);
}

}
