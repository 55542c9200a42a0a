#pragma once

#include <QAtomicInt>
#include <QByteArray>

class ChannelCrypto;

// Encoded-frame transform handed to the media engine. Shares the room key with
// the envelope path; each frame gets its own nonce.
//
// The engine may call these from its own media threads. ChannelCrypto must
// already have its key derived before the cryptor is attached.
class FrameCryptor {
public:
    explicit FrameCryptor(ChannelCrypto* crypto);

    bool encryptFrame(const QByteArray& frame, QByteArray* out);

    // False means the frame must be dropped.
    bool decryptFrame(const QByteArray& frame, QByteArray* out);

    int droppedFrames() const { return m_droppedFrames.loadAcquire(); }

private:
    ChannelCrypto* m_crypto;
    QAtomicInt m_droppedFrames;
};
