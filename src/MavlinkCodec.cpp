#include "MavlinkCodec.h"
#include "LogCategories.h"

#define MAVLINK_V1_HEADER 6
#define MAVLINK_V2_HEADER 10
#define MAVLINK_CRC_SIZE 2
#define MAVLINK_SIGNATURE_SIZE 13
#define MAVLINK_IFLAG_SIGNED 0x01
#define MAX_UNSYNCED_BYTES 4096

static void appendLe16(QByteArray &out, quint16 value)
{
    out.append(char(value & 0xFF));
    out.append(char((value >> 8) & 0xFF));
}

static void appendLe32(QByteArray &out, quint32 value)
{
    for (int i = 0; i < 4; ++i)
        out.append(char((value >> (8 * i)) & 0xFF));
}

static quint16 readLe16(const QByteArray &in, int pos)
{
    return quint16(quint8(in.at(pos))) | quint16(quint8(in.at(pos + 1))) << 8;
}

static quint32 readLe32(const QByteArray &in, int pos)
{
    quint32 value = 0;
    for (int i = 0; i < 4; ++i)
        value |= quint32(quint8(in.at(pos + i))) << (8 * i);
    return value;
}

QByteArray HeartbeatMessage::encodePayload() const
{
    QByteArray out;
    appendLe32(out, customMode);
    out.append(char(type));
    out.append(char(autopilot));
    out.append(char(baseMode));
    out.append(char(systemStatus));
    out.append(char(mavlinkVersion));
    return out;
}

bool HeartbeatMessage::decodePayload(const QByteArray &payload, HeartbeatMessage *message)
{
    if (payload.size() < PayloadSize)
        return false;

    message->customMode = readLe32(payload, 0);
    message->type = quint8(payload.at(4));
    message->autopilot = quint8(payload.at(5));
    message->baseMode = quint8(payload.at(6));
    message->systemStatus = quint8(payload.at(7));
    message->mavlinkVersion = quint8(payload.at(8));
    return true;
}

QByteArray SerialControlMessage::encodePayload() const
{
    QByteArray out;
    out.reserve(PayloadSize);
    appendLe32(out, baudrate);
    appendLe16(out, timeout);
    out.append(char(device));
    out.append(char(flags));
    out.append(char(count));

    QByteArray chunk = data.left(DataSize);
    chunk.append(QByteArray(DataSize - chunk.size(), '\0'));
    out.append(chunk);
    return out;
}

bool SerialControlMessage::decodePayload(const QByteArray &payload, SerialControlMessage *message)
{
    if (payload.size() < PayloadSize)
        return false;

    message->baudrate = readLe32(payload, 0);
    message->timeout = readLe16(payload, 4);
    message->device = quint8(payload.at(6));
    message->flags = quint8(payload.at(7));
    message->count = quint8(payload.at(8));
    message->data = payload.mid(9, DataSize);
    return message->count <= DataSize;
}

MavlinkCodec::MavlinkCodec(int version, quint8 systemId, quint8 componentId)
    : m_version(version == 2 ? 2 : 1),
    m_systemId(systemId),
    m_componentId(componentId),
    m_sequence(0),
    m_crcErrors(0),
    m_unknownMessages(0)
{
}

int MavlinkCodec::version() const
{
    return m_version;
}

quint16 MavlinkCodec::x25Accumulate(quint8 byte, quint16 crc)
{
    quint8 tmp = byte ^ quint8(crc & 0xFF);
    tmp ^= quint8(tmp << 4);
    return quint16((crc >> 8) ^ (quint16(tmp) << 8) ^ (quint16(tmp) << 3) ^ (tmp >> 4));
}

quint16 MavlinkCodec::x25Crc(const QByteArray &data, quint16 crc)
{
    for (char c : data)
        crc = x25Accumulate(quint8(c), crc);
    return crc;
}

bool MavlinkCodec::crcExtra(quint32 messageId, quint8 *extra)
{
    switch (messageId) {
    case HeartbeatMessage::MessageId:
        *extra = HeartbeatMessage::CrcExtra;
        return true;
    case SerialControlMessage::MessageId:
        *extra = SerialControlMessage::CrcExtra;
        return true;
    default:
        return false;
    }
}

int MavlinkCodec::payloadSize(quint32 messageId)
{
    switch (messageId) {
    case HeartbeatMessage::MessageId:
        return HeartbeatMessage::PayloadSize;
    case SerialControlMessage::MessageId:
        return SerialControlMessage::PayloadSize;
    default:
        return -1;
    }
}

QByteArray MavlinkCodec::pack(quint32 messageId, const QByteArray &payload)
{
    quint8 extra = 0;
    crcExtra(messageId, &extra);

    QByteArray body = payload;
    QByteArray frame;

    if (m_version == 2) {
        // Trailing zero bytes are not transmitted; the first byte always is.
        int len = body.size();
        while (len > 1 && body.at(len - 1) == '\0')
            --len;
        body.truncate(len);

        frame.append(char(MAVLINK_STX_V2));
        frame.append(char(body.size()));
        frame.append(char(0));      // incompat flags
        frame.append(char(0));      // compat flags
        frame.append(char(m_sequence++));
        frame.append(char(m_systemId));
        frame.append(char(m_componentId));
        frame.append(char(messageId & 0xFF));
        frame.append(char((messageId >> 8) & 0xFF));
        frame.append(char((messageId >> 16) & 0xFF));
    } else {
        frame.append(char(MAVLINK_STX_V1));
        frame.append(char(body.size()));
        frame.append(char(m_sequence++));
        frame.append(char(m_systemId));
        frame.append(char(m_componentId));
        frame.append(char(messageId & 0xFF));
    }
    frame.append(body);

    quint16 crc = x25Crc(frame.mid(1));
    crc = x25Accumulate(extra, crc);
    appendLe16(frame, crc);
    return frame;
}

QVector<MavlinkMessage> MavlinkCodec::feed(const QByteArray &data)
{
    QVector<MavlinkMessage> messages;
    m_buffer.append(data);

    for (;;) {
        int start = -1;
        for (int i = 0; i < m_buffer.size(); ++i) {
            quint8 b = quint8(m_buffer.at(i));
            if (b == MAVLINK_STX_V1 || b == MAVLINK_STX_V2) {
                start = i;
                break;
            }
        }

        if (start < 0) {
            if (m_buffer.size() > MAX_UNSYNCED_BYTES)
                m_buffer.clear();
            break;
        }
        if (start > 0)
            m_buffer.remove(0, start);

        const bool v2 = quint8(m_buffer.at(0)) == MAVLINK_STX_V2;
        const int headerSize = v2 ? MAVLINK_V2_HEADER : MAVLINK_V1_HEADER;
        if (m_buffer.size() < headerSize)
            break;

        const int length = quint8(m_buffer.at(1));
        int total = headerSize + length + MAVLINK_CRC_SIZE;
        if (v2 && (quint8(m_buffer.at(2)) & MAVLINK_IFLAG_SIGNED))
            total += MAVLINK_SIGNATURE_SIZE;
        if (m_buffer.size() < total)
            break;

        MavlinkMessage message;
        message.version = v2 ? 2 : 1;
        if (v2) {
            message.sequence = quint8(m_buffer.at(4));
            message.systemId = quint8(m_buffer.at(5));
            message.componentId = quint8(m_buffer.at(6));
            message.messageId = quint32(quint8(m_buffer.at(7)))
                                | quint32(quint8(m_buffer.at(8))) << 8
                                | quint32(quint8(m_buffer.at(9))) << 16;
        } else {
            message.sequence = quint8(m_buffer.at(2));
            message.systemId = quint8(m_buffer.at(3));
            message.componentId = quint8(m_buffer.at(4));
            message.messageId = quint8(m_buffer.at(5));
        }

        quint8 extra = 0;
        if (!crcExtra(message.messageId, &extra)) {
            // Cannot be validated. Skip the whole frame only when another
            // frame starts right behind it, otherwise treat the start byte
            // as noise so a real frame inside the span is not lost.
            if (m_buffer.size() == total)
                break;
            const quint8 next = quint8(m_buffer.at(total));
            if (next == MAVLINK_STX_V1 || next == MAVLINK_STX_V2) {
                ++m_unknownMessages;
                m_buffer.remove(0, total);
            } else {
                m_buffer.remove(0, 1);
            }
            continue;
        }

        quint16 crc = x25Crc(m_buffer.mid(1, headerSize - 1 + length));
        crc = x25Accumulate(extra, crc);
        if (crc != readLe16(m_buffer, headerSize + length)) {
            ++m_crcErrors;
            qCDebug(lcTunnel) << "MAVLink checksum mismatch for message" << message.messageId;
            m_buffer.remove(0, 1);
            continue;
        }

        message.payload = m_buffer.mid(headerSize, length);
        const int expected = payloadSize(message.messageId);
        if (message.payload.size() < expected)
            message.payload.append(QByteArray(expected - message.payload.size(), '\0'));

        m_buffer.remove(0, total);
        messages.append(message);
    }

    return messages;
}

quint64 MavlinkCodec::crcErrors() const
{
    return m_crcErrors;
}

quint64 MavlinkCodec::unknownMessages() const
{
    return m_unknownMessages;
}
