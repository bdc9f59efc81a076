#ifndef SERIALCONTROLTUNNEL_H
#define SERIALCONTROLTUNNEL_H

#include "Endpoint.h"
#include "MavlinkCodec.h"

#include <QVector>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

struct TunnelSettings
{
    quint8 device = 3;          // SERIAL_CONTROL_DEV_GPS2
    quint32 baudRate = 115200;
    bool exclusive = true;
    int pollIntervalMs = 50;
    int chunkDelayMs = 10;
    int mavlinkVersion = 1;
    quint8 systemId = 255;
    quint8 componentId = 0;
};

// Byte stream to a vehicle serial device carried in SERIAL_CONTROL messages.
// The tunnel owns the telemetry link endpoint and closes it in stop().
class SerialControlTunnel
{
public:
    using DataHandler = std::function<void(const QByteArray &)>;

    SerialControlTunnel(std::shared_ptr<Endpoint> link, const TunnelSettings &settings);
    ~SerialControlTunnel();

    SerialControlTunnel(const SerialControlTunnel &) = delete;
    SerialControlTunnel &operator=(const SerialControlTunnel &) = delete;

    static QVector<SerialControlMessage> splitIntoChunks(const QByteArray &data,
                                                         const TunnelSettings &settings);
    SerialControlMessage pollRequest() const;

    // Reads the link until a HEARTBEAT arrives. Must be called before start().
    bool waitForHeartbeat(int timeoutMs);

    // Starts the receive loop, and the poll loop when inbound data is wanted.
    void start(bool poll);
    void stop();

    // Sends data as consecutive paced chunks. Concurrent callers never
    // interleave their chunks. Returns false on a link write failure.
    bool send(const QByteArray &data);

    // Called from the receive thread with each non-empty inbound chunk.
    void setDataHandler(DataHandler handler);

    // Feeds raw link bytes through the MAVLink parser.
    void handleLinkData(const QByteArray &data);

    bool isLinkUp() const;
    QString errorString() const;

    const TunnelSettings &settings() const;
    quint8 targetSystem() const;
    quint8 targetComponent() const;
    bool heartbeatSeen() const;

    quint64 bytesSent() const;
    quint64 bytesReceived() const;
    quint64 chunksSent() const;
    quint64 emptyChunks() const;
    quint64 pollsSent() const;
    quint64 magicHints() const;

private:
    bool writeMessage(const SerialControlMessage &message);
    void handleMessage(const MavlinkMessage &message);
    void receiveLoop();
    void pollLoop();
    void setErrorString(const QString &errorString);

    std::shared_ptr<Endpoint> m_link;
    TunnelSettings m_settings;
    MavlinkCodec m_codec;

    std::mutex m_sendMutex;     // one send() at a time
    std::mutex m_writeMutex;    // pack + write, shared with polls

    mutable std::mutex m_handlerMutex;
    DataHandler m_handler;

    std::thread m_receiveThread;
    std::thread m_pollThread;
    std::atomic<bool> m_running;
    std::atomic<bool> m_linkUp;
    std::mutex m_stopMutex;
    std::condition_variable m_stopCondition;

    std::atomic<bool> m_heartbeatSeen;
    std::atomic<quint8> m_targetSystem;
    std::atomic<quint8> m_targetComponent;

    std::chrono::steady_clock::time_point m_lastHint;
    std::atomic<quint64> m_magicHints;

    std::atomic<quint64> m_bytesSent;
    std::atomic<quint64> m_bytesReceived;
    std::atomic<quint64> m_chunksSent;
    std::atomic<quint64> m_emptyChunks;
    std::atomic<quint64> m_pollsSent;

    mutable std::mutex m_errorMutex;
    QString m_errorString;
};

#endif // SERIALCONTROLTUNNEL_H
