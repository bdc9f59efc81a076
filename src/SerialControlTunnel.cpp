#include "SerialControlTunnel.h"
#include "LogCategories.h"

#include <QElapsedTimer>

#define POLL_TIMEOUT_MS 10
#define LINK_READ_SIZE 2048
#define HINT_INTERVAL std::chrono::seconds(1)

SerialControlTunnel::SerialControlTunnel(std::shared_ptr<Endpoint> link, const TunnelSettings &settings)
    : m_link(std::move(link)),
    m_settings(settings),
    m_codec(settings.mavlinkVersion, settings.systemId, settings.componentId),
    m_running(false),
    m_linkUp(true),
    m_heartbeatSeen(false),
    m_targetSystem(0),
    m_targetComponent(0),
    m_magicHints(0),
    m_bytesSent(0),
    m_bytesReceived(0),
    m_chunksSent(0),
    m_emptyChunks(0),
    m_pollsSent(0)
{
}

SerialControlTunnel::~SerialControlTunnel()
{
    stop();
}

QVector<SerialControlMessage> SerialControlTunnel::splitIntoChunks(const QByteArray &data,
                                                                   const TunnelSettings &settings)
{
    QVector<SerialControlMessage> chunks;
    for (int offset = 0; offset < data.size(); offset += SerialControlMessage::DataSize) {
        SerialControlMessage message;
        message.device = settings.device;
        message.flags = settings.exclusive ? SerialControlMessage::Exclusive : 0;
        message.timeout = 0;
        message.baudrate = settings.baudRate;

        QByteArray chunk = data.mid(offset, SerialControlMessage::DataSize);
        message.count = quint8(chunk.size());
        chunk.append(QByteArray(SerialControlMessage::DataSize - chunk.size(), '\0'));
        message.data = chunk;
        chunks.append(message);
    }
    return chunks;
}

SerialControlMessage SerialControlTunnel::pollRequest() const
{
    SerialControlMessage message;
    message.device = m_settings.device;
    message.flags = SerialControlMessage::Respond | SerialControlMessage::Multi;
    if (m_settings.exclusive)
        message.flags |= SerialControlMessage::Exclusive;
    message.timeout = POLL_TIMEOUT_MS;
    message.baudrate = m_settings.baudRate;
    message.count = 0;
    message.data = QByteArray(SerialControlMessage::DataSize, '\0');
    return message;
}

bool SerialControlTunnel::waitForHeartbeat(int timeoutMs)
{
    if (timeoutMs <= 0)
        return true;

    qCInfo(lcTunnel) << "Waiting for MAVLink heartbeat...";

    QElapsedTimer timer;
    timer.start();
    char buf[LINK_READ_SIZE];

    while (timer.elapsed() < timeoutMs) {
        qint64 n = m_link->read(buf, sizeof(buf));
        if (n > 0) {
            handleLinkData(QByteArray(buf, int(n)));
            if (m_heartbeatSeen)
                return true;
            continue;
        }

        if (n == 0) {
            setErrorString("Telemetry link closed while waiting for heartbeat");
            return false;
        }
        if (m_link->error() != Endpoint::TimeoutError) {
            setErrorString(m_link->errorString());
            return false;
        }
    }

    setErrorString(QString("No MAVLink heartbeat within %1 ms").arg(timeoutMs));
    return false;
}

void SerialControlTunnel::start(bool poll)
{
    if (m_running.exchange(true))
        return;

    m_receiveThread = std::thread(&SerialControlTunnel::receiveLoop, this);
    if (poll)
        m_pollThread = std::thread(&SerialControlTunnel::pollLoop, this);

    qCInfo(lcTunnel).noquote() << QString("Tunnel to device %1 started on %2 (poll %3)")
                                      .arg(int(m_settings.device))
                                      .arg(m_link->description())
                                      .arg(poll ? QString("every %1 ms").arg(m_settings.pollIntervalMs)
                                                : QString("off"));
}

void SerialControlTunnel::stop()
{
    {
        std::lock_guard<std::mutex> lk(m_stopMutex);
        m_running = false;
    }
    m_stopCondition.notify_all();

    m_link->close();
    m_linkUp = false;

    if (m_pollThread.joinable())
        m_pollThread.join();
    if (m_receiveThread.joinable())
        m_receiveThread.join();
}

bool SerialControlTunnel::send(const QByteArray &data)
{
    std::lock_guard<std::mutex> lk(m_sendMutex);

    if (!m_linkUp) {
        setErrorString("Telemetry link is down");
        return false;
    }

    const QVector<SerialControlMessage> chunks = splitIntoChunks(data, m_settings);
    for (int i = 0; i < chunks.size(); ++i) {
        const SerialControlMessage &chunk = chunks.at(i);
        if (!writeMessage(chunk))
            return false;

        m_bytesSent += chunk.count;
        ++m_chunksSent;

        // Paces chunks of one write; nothing to wait for after the last.
        if (m_settings.chunkDelayMs > 0 && i + 1 < chunks.size())
            std::this_thread::sleep_for(std::chrono::milliseconds(m_settings.chunkDelayMs));
    }
    return true;
}

void SerialControlTunnel::setDataHandler(DataHandler handler)
{
    std::lock_guard<std::mutex> lk(m_handlerMutex);
    m_handler = std::move(handler);
}

bool SerialControlTunnel::writeMessage(const SerialControlMessage &message)
{
    std::lock_guard<std::mutex> lk(m_writeMutex);

    const QByteArray frame = m_codec.pack(SerialControlMessage::MessageId, message.encodePayload());
    if (m_link->write(frame) < 0) {
        m_linkUp = false;
        setErrorString(QString("Tunnel write failed: %1").arg(m_link->errorString()));
        qCWarning(lcTunnel).noquote() << errorString();
        return false;
    }
    return true;
}

void SerialControlTunnel::handleLinkData(const QByteArray &data)
{
    const QVector<MavlinkMessage> messages = m_codec.feed(data);
    for (const MavlinkMessage &message : messages)
        handleMessage(message);
}

void SerialControlTunnel::handleMessage(const MavlinkMessage &message)
{
    if (message.messageId == HeartbeatMessage::MessageId) {
        if (!m_heartbeatSeen.exchange(true)) {
            m_targetSystem = message.systemId;
            m_targetComponent = message.componentId;
            qCInfo(lcTunnel).noquote() << QString("Heartbeat from sysid=%1 compid=%2")
                                              .arg(int(message.systemId)).arg(int(message.componentId));
        }
        return;
    }

    if (message.messageId != SerialControlMessage::MessageId)
        return;

    SerialControlMessage serial;
    if (!SerialControlMessage::decodePayload(message.payload, &serial))
        return;
    if (serial.count == 0 || serial.device != m_settings.device)
        return;

    const QByteArray chunk = serial.data.left(serial.count);

    bool allZero = true;
    bool allSame = true;
    for (char c : chunk) {
        if (c != '\0')
            allZero = false;
        if (c != chunk.at(0))
            allSame = false;
    }

    if (allZero) {
        ++m_emptyChunks;
        return;
    }

    const quint8 first = quint8(chunk.at(0));
    if (allSame && (first == MAVLINK_STX_V1 || first == MAVLINK_STX_V2)) {
        auto now = std::chrono::steady_clock::now();
        if (m_magicHints == 0 || now - m_lastHint >= HINT_INTERVAL) {
            qCWarning(lcTunnel) << "Got MAVLink magic bytes through the tunnel."
                                << "The device is probably a telemetry port, not the receiver.";
            m_lastHint = now;
            ++m_magicHints;
        }
    }

    m_bytesReceived += quint64(chunk.size());

    DataHandler handler;
    {
        std::lock_guard<std::mutex> lk(m_handlerMutex);
        handler = m_handler;
    }
    if (handler)
        handler(chunk);
}

void SerialControlTunnel::receiveLoop()
{
    char buf[LINK_READ_SIZE];

    while (m_running) {
        qint64 n = m_link->read(buf, sizeof(buf));
        if (n > 0) {
            handleLinkData(QByteArray(buf, int(n)));
            continue;
        }

        if (n < 0 && m_link->error() == Endpoint::TimeoutError)
            continue;

        if (m_running) {
            QString reason = n == 0 ? QString("end of stream") : m_link->errorString();
            setErrorString(QString("Telemetry link lost: %1").arg(reason));
            qCWarning(lcTunnel).noquote() << errorString();
        }
        m_linkUp = false;
        break;
    }
}

void SerialControlTunnel::pollLoop()
{
    const SerialControlMessage request = pollRequest();

    while (m_running) {
        if (!writeMessage(request))
            break;
        ++m_pollsSent;

        std::unique_lock<std::mutex> lk(m_stopMutex);
        m_stopCondition.wait_for(lk, std::chrono::milliseconds(m_settings.pollIntervalMs),
                                 [this] { return !m_running; });
    }
}

bool SerialControlTunnel::isLinkUp() const
{
    return m_linkUp;
}

void SerialControlTunnel::setErrorString(const QString &errorString)
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    m_errorString = errorString;
}

QString SerialControlTunnel::errorString() const
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    return m_errorString;
}

const TunnelSettings &SerialControlTunnel::settings() const
{
    return m_settings;
}

quint8 SerialControlTunnel::targetSystem() const
{
    return m_targetSystem;
}

quint8 SerialControlTunnel::targetComponent() const
{
    return m_targetComponent;
}

bool SerialControlTunnel::heartbeatSeen() const
{
    return m_heartbeatSeen;
}

quint64 SerialControlTunnel::bytesSent() const
{
    return m_bytesSent;
}

quint64 SerialControlTunnel::bytesReceived() const
{
    return m_bytesReceived;
}

quint64 SerialControlTunnel::chunksSent() const
{
    return m_chunksSent;
}

quint64 SerialControlTunnel::emptyChunks() const
{
    return m_emptyChunks;
}

quint64 SerialControlTunnel::pollsSent() const
{
    return m_pollsSent;
}

quint64 SerialControlTunnel::magicHints() const
{
    return m_magicHints;
}
