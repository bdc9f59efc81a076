#ifndef MAVLINKCODEC_H
#define MAVLINKCODEC_H

#include <QByteArray>
#include <QVector>

#define MAVLINK_STX_V1 0xFE
#define MAVLINK_STX_V2 0xFD

struct MavlinkMessage
{
    int version = 1;
    quint8 sequence = 0;
    quint8 systemId = 0;
    quint8 componentId = 0;
    quint32 messageId = 0;
    QByteArray payload;     // zero-extended to the full length for known messages
};

struct HeartbeatMessage
{
    static constexpr quint32 MessageId = 0;
    static constexpr quint8 CrcExtra = 50;
    static constexpr int PayloadSize = 9;

    quint32 customMode = 0;
    quint8 type = 6;        // MAV_TYPE_GCS
    quint8 autopilot = 8;   // MAV_AUTOPILOT_INVALID
    quint8 baseMode = 0;
    quint8 systemStatus = 0;
    quint8 mavlinkVersion = 3;

    QByteArray encodePayload() const;
    static bool decodePayload(const QByteArray &payload, HeartbeatMessage *message);
};

struct SerialControlMessage
{
    enum Flag {
        Reply = 1,
        Respond = 2,
        Exclusive = 4,
        Blocking = 8,
        Multi = 16
    };

    static constexpr quint32 MessageId = 126;
    static constexpr quint8 CrcExtra = 220;
    static constexpr int DataSize = 70;
    static constexpr int PayloadSize = 79;

    quint8 device = 0;
    quint8 flags = 0;
    quint16 timeout = 0;
    quint32 baudrate = 0;
    quint8 count = 0;
    QByteArray data;        // always DataSize bytes once encoded

    // Wire order: baudrate, timeout, device, flags, count, data.
    QByteArray encodePayload() const;
    static bool decodePayload(const QByteArray &payload, SerialControlMessage *message);
};

// Packs and parses MAVLink v1/v2 frames. pack() and feed() keep separate
// state and may be used from different threads.
class MavlinkCodec
{
public:
    explicit MavlinkCodec(int version = 1, quint8 systemId = 255, quint8 componentId = 0);

    int version() const;

    QByteArray pack(quint32 messageId, const QByteArray &payload);

    // Returns every complete frame found so far. Frames with a bad checksum
    // are dropped and the parser resynchronizes on the next start marker.
    QVector<MavlinkMessage> feed(const QByteArray &data);

    quint64 crcErrors() const;
    quint64 unknownMessages() const;

    static quint16 x25Crc(const QByteArray &data, quint16 crc = 0xFFFF);
    static quint16 x25Accumulate(quint8 byte, quint16 crc);
    static bool crcExtra(quint32 messageId, quint8 *extra);
    static int payloadSize(quint32 messageId);

private:
    int m_version;
    quint8 m_systemId;
    quint8 m_componentId;
    quint8 m_sequence;

    QByteArray m_buffer;
    quint64 m_crcErrors;
    quint64 m_unknownMessages;
};

#endif // MAVLINKCODEC_H
