#include "utils/FrameCryptor.h"
#include "utils/ChannelCrypto.h"

#include <QDebug>

FrameCryptor::FrameCryptor(ChannelCrypto* crypto)
    : m_crypto(crypto)
    , m_droppedFrames(0)
{
}

bool FrameCryptor::encryptFrame(const QByteArray& frame, QByteArray* out) {
    if (!m_crypto || !m_crypto->isReady()) return false;

    QString error;
    if (!m_crypto->encrypt(frame, out, &error)) {
        qWarning() << "[CRYPTO] frame encrypt failed:" << error;
        return false;
    }
    return true;
}

bool FrameCryptor::decryptFrame(const QByteArray& frame, QByteArray* out) {
    QString error;
    if (!m_crypto || !m_crypto->isReady() || !m_crypto->decrypt(frame, out, &error)) {
        int dropped = m_droppedFrames.fetchAndAddRelaxed(1) + 1;
        // Log the first failure and then sparsely; a bad key fails every frame.
        if (dropped == 1 || dropped % 100 == 0) {
            qWarning() << "[CRYPTO] dropping undecryptable frame" << error << "total" << dropped;
        }
        return false;
    }
    return true;
}
