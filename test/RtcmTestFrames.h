#ifndef RTCMTESTFRAMES_H
#define RTCMTESTFRAMES_H

#include "RtcmFrameDecoder.h"

#include <QByteArray>

// Builds a valid RTCM3 frame with the given message type and payload length.
inline QByteArray rtcmFrame(int messageType, int payloadLength, quint8 fill = 0x5A)
{
    QByteArray payload(payloadLength, char(fill));
    if (payloadLength >= 2) {
        payload[0] = char((messageType >> 4) & 0xFF);
        payload[1] = char(((messageType & 0x0F) << 4) | (fill & 0x0F));
    }

    QByteArray frame;
    frame.append(char(RTCM3_PREAMBLE));
    frame.append(char((payloadLength >> 8) & 0x03));
    frame.append(char(payloadLength & 0xFF));
    frame.append(payload);

    const quint32 crc = RtcmFrameDecoder::crc24q(frame.constData(), frame.size());
    frame.append(char((crc >> 16) & 0xFF));
    frame.append(char((crc >> 8) & 0xFF));
    frame.append(char(crc & 0xFF));
    return frame;
}

// Noise that never contains the RTCM3 preamble.
inline QByteArray syncFreeNoise(int length, quint8 seed = 1)
{
    QByteArray noise;
    quint8 value = seed;
    for (int i = 0; i < length; ++i) {
        value = quint8(value * 37 + 11);
        noise.append(char(value == RTCM3_PREAMBLE ? 0x00 : value));
    }
    return noise;
}

#endif // RTCMTESTFRAMES_H
