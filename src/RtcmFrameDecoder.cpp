#include "RtcmFrameDecoder.h"
#include "LogCategories.h"

#define RTCM3_HEADER_SIZE 3
#define RTCM3_CRC_SIZE 3
#define CRC24Q_POLY 0x1864CFB

RtcmFrameDecoder::RtcmFrameDecoder(TrailerPolicy policy, int garbageLimit)
    : m_policy(policy),
    m_garbageLimit(garbageLimit),
    m_frameCount(0),
    m_crcFailures(0),
    m_discardedBytes(0)
{
}

quint32 RtcmFrameDecoder::crc24q(const char *data, int length)
{
    quint32 crc = 0;
    for (int i = 0; i < length; ++i) {
        crc ^= quint32(quint8(data[i])) << 16;
        for (int bit = 0; bit < 8; ++bit) {
            crc <<= 1;
            if (crc & 0x1000000)
                crc ^= CRC24Q_POLY;
        }
    }
    return crc & 0xFFFFFF;
}

int RtcmFrameDecoder::messageTypeOf(const QByteArray &payload)
{
    if (payload.size() < 2)
        return 0;
    return ((quint8(payload.at(0)) << 4) | (quint8(payload.at(1)) >> 4)) & 0x0FFF;
}

void RtcmFrameDecoder::discard(int count)
{
    if (count <= 0)
        return;
    m_buffer.remove(0, count);
    m_discardedBytes += quint64(count);
}

QVector<RtcmFrame> RtcmFrameDecoder::feed(const QByteArray &data)
{
    QVector<RtcmFrame> frames;
    m_buffer.append(data);

    for (;;) {
        const int sync = m_buffer.indexOf(char(RTCM3_PREAMBLE));
        if (sync < 0) {
            if (m_buffer.size() > m_garbageLimit)
                discard(m_buffer.size());
            break;
        }

        // Bytes before the marker can never become part of a frame.
        discard(sync);

        if (m_buffer.size() < RTCM3_HEADER_SIZE)
            break;

        const int length = ((quint8(m_buffer.at(1)) & 0x03) << 8) | quint8(m_buffer.at(2));
        const int total = RTCM3_HEADER_SIZE + length + RTCM3_CRC_SIZE;
        if (m_buffer.size() < total)
            break;

        if (m_policy == VerifyCrc) {
            const quint32 expected = crc24q(m_buffer.constData(), RTCM3_HEADER_SIZE + length);
            const int pos = RTCM3_HEADER_SIZE + length;
            const quint32 actual = quint32(quint8(m_buffer.at(pos))) << 16
                                   | quint32(quint8(m_buffer.at(pos + 1))) << 8
                                   | quint32(quint8(m_buffer.at(pos + 2)));
            if (expected != actual) {
                ++m_crcFailures;
                qCDebug(lcRtcm) << "RTCM CRC mismatch, resynchronizing";
                discard(1);
                continue;
            }
        }

        RtcmFrame frame;
        frame.syncMarker = RTCM3_PREAMBLE;
        frame.declaredLength = length;
        frame.payload = m_buffer.mid(RTCM3_HEADER_SIZE, length);
        frame.messageType = messageTypeOf(frame.payload);

        m_buffer.remove(0, total);
        ++m_frameCount;
        frames.append(frame);
    }

    return frames;
}

void RtcmFrameDecoder::reset()
{
    m_buffer.clear();
}

RtcmFrameDecoder::TrailerPolicy RtcmFrameDecoder::trailerPolicy() const
{
    return m_policy;
}

int RtcmFrameDecoder::bufferedBytes() const
{
    return m_buffer.size();
}

quint64 RtcmFrameDecoder::frameCount() const
{
    return m_frameCount;
}

quint64 RtcmFrameDecoder::crcFailures() const
{
    return m_crcFailures;
}

quint64 RtcmFrameDecoder::discardedBytes() const
{
    return m_discardedBytes;
}
