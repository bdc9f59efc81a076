#ifndef RTCMFRAMEDECODER_H
#define RTCMFRAMEDECODER_H

#include <QByteArray>
#include <QVector>

#define RTCM3_PREAMBLE 0xD3

struct RtcmFrame
{
    quint8 syncMarker = RTCM3_PREAMBLE;
    int declaredLength = 0;
    QByteArray payload;
    int messageType = 0;    // 0 when the payload carries no usable type
};

// Incremental RTCM3 framer for a live byte stream. Never fails; malformed
// input only causes resynchronization.
class RtcmFrameDecoder
{
public:
    enum TrailerPolicy {
        TrustLength,
        VerifyCrc
    };

    explicit RtcmFrameDecoder(TrailerPolicy policy = VerifyCrc, int garbageLimit = 1024);

    QVector<RtcmFrame> feed(const QByteArray &data);
    void reset();

    TrailerPolicy trailerPolicy() const;
    int bufferedBytes() const;

    quint64 frameCount() const;
    quint64 crcFailures() const;
    quint64 discardedBytes() const;

    static quint32 crc24q(const char *data, int length);
    static int messageTypeOf(const QByteArray &payload);

private:
    void discard(int count);

    TrailerPolicy m_policy;
    int m_garbageLimit;
    QByteArray m_buffer;
    quint64 m_frameCount;
    quint64 m_crcFailures;
    quint64 m_discardedBytes;
};

#endif // RTCMFRAMEDECODER_H
