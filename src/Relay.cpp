#include "Relay.h"
#include "LogCategories.h"
#include "SerialEndpoint.h"

#include <QElapsedTimer>

#define INGRESS_READ_SIZE 4096
#define ROVER_READ_SIZE 1024

Relay::Relay(const RelaySettings &settings)
    : m_settings(settings),
    m_decoder(settings.trailerPolicy, settings.garbageLimit),
    m_monitor(nullptr),
    m_ggaIntervalS(0),
    m_stopRequested(false),
    m_state(Idle),
    m_error(NoError)
{
}

Relay::~Relay()
{
    stop();
}

void Relay::addSinks(SubscriberRegistry *registry)
{
    m_registries.append(registry);
}

void Relay::setTunnel(std::shared_ptr<SerialControlTunnel> tunnel)
{
    m_tunnel = std::move(tunnel);
}

void Relay::setIngressEndpoint(std::shared_ptr<Endpoint> endpoint, const QByteArray &leadingPayload)
{
    std::lock_guard<std::mutex> lk(m_ingressMutex);
    m_ingress = std::move(endpoint);
    m_leadingPayload = leadingPayload;
}

void Relay::attachRover(std::shared_ptr<Endpoint> rover, NmeaMonitor *monitor, int ggaIntervalS)
{
    m_rover = std::move(rover);
    m_monitor = monitor;
    m_ggaIntervalS = ggaIntervalS;
}

QString Relay::stateName(State state)
{
    switch (state) {
    case Idle: return "Idle";
    case Connecting: return "Connecting";
    case Streaming: return "Streaming";
    case Draining: return "Draining";
    case Stopped: return "Stopped";
    case Failed: return "Failed";
    }
    return "Unknown";
}

void Relay::setState(State state)
{
    State previous;
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        previous = m_state;
        m_state = state;
    }
    m_stateChanged.notify_all();
    qCInfo(lcRelay).noquote() << QString("%1: %2 -> %3").arg(m_settings.name, stateName(previous), stateName(state));
}

void Relay::fail(RelayError error, const QString &errorString)
{
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        if (m_error != NoError)
            return;
        m_error = error;
        m_errorString = errorString;
    }
    qCWarning(lcRelay).noquote() << QString("%1: %2").arg(m_settings.name, errorString);
}

void Relay::start()
{
    {
        std::lock_guard<std::mutex> lk(m_stateMutex);
        if (m_state != Idle)
            return;
    }

    {
        std::lock_guard<std::mutex> lk(m_statsMutex);
        m_stats.startTime = QDateTime::currentDateTime();
    }
    m_worker = std::thread(&Relay::run, this);
}

void Relay::stop()
{
    m_stopRequested = true;
    {
        std::lock_guard<std::mutex> lk(m_ingressMutex);
        if (m_ingress)
            m_ingress->close();
    }
    m_tcpListener.close();

    if (m_worker.joinable()) {
        m_worker.join();
    } else {
        std::unique_lock<std::mutex> lk(m_stateMutex);
        if (m_state == Idle) {
            m_state = Stopped;
            lk.unlock();
            m_stateChanged.notify_all();
        }
    }
}

bool Relay::waitForFinished(int timeoutMs)
{
    std::unique_lock<std::mutex> lk(m_stateMutex);
    return m_stateChanged.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                                   [this] { return m_state == Stopped; });
}

bool Relay::isFinished() const
{
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_state == Stopped;
}

Relay::State Relay::state() const
{
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_state;
}

Relay::RelayError Relay::error() const
{
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_error;
}

QString Relay::errorString() const
{
    std::lock_guard<std::mutex> lk(m_stateMutex);
    return m_errorString;
}

QString Relay::name() const
{
    return m_settings.name;
}

const RelaySettings &Relay::settings() const
{
    return m_settings;
}

RelayStats Relay::stats() const
{
    std::lock_guard<std::mutex> lk(m_statsMutex);
    return m_stats;
}

QVector<int> Relay::missingExpectedTypes() const
{
    std::lock_guard<std::mutex> lk(m_statsMutex);
    QVector<int> missing;
    for (int type : m_settings.expectedTypes) {
        if (!m_stats.rtcm.typeCounts.contains(type))
            missing.append(type);
    }
    return missing;
}

bool Relay::acceptTcpClient()
{
    std::shared_ptr<TcpEndpoint> client = m_tcpListener.accept();
    if (!client) {
        if (!m_stopRequested)
            fail(OpenError, QString("Ingress listener failed: %1").arg(m_tcpListener.errorString()));
        return false;
    }

    client->setReadTimeout(m_settings.readTimeoutMs);
    qCInfo(lcRelay).noquote() << QString("%1: ingress client %2 connected").arg(m_settings.name, client->description());

    std::lock_guard<std::mutex> lk(m_ingressMutex);
    if (m_stopRequested) {
        client->close();
        return false;
    }
    m_ingress = client;
    return true;
}

bool Relay::openIngress()
{
    {
        std::lock_guard<std::mutex> lk(m_ingressMutex);
        if (m_ingress)
            return true;
    }

    std::shared_ptr<Endpoint> endpoint;
    QByteArray leading;

    switch (m_settings.source) {
    case RelaySettings::CasterSource: {
        NtripClient client(m_settings.caster);
        qCInfo(lcRelay).noquote() << QString("%1: connecting to NTRIP caster %2:%3, mountpoint '%4'")
                                         .arg(m_settings.name, m_settings.caster.host)
                                         .arg(m_settings.caster.port)
                                         .arg(m_settings.caster.mountpoint);
        QString error;
        std::shared_ptr<TcpEndpoint> socket = client.openConnection(&error, &m_stopRequested);
        if (!socket) {
            if (!m_stopRequested)
                fail(OpenError, QString("%1: %2").arg(NtripSession::errorName(NtripSession::ConnectError), error));
            return false;
        }

        // Published before the handshake so stop() can interrupt it.
        {
            std::lock_guard<std::mutex> lk(m_ingressMutex);
            if (m_stopRequested) {
                socket->close();
                return false;
            }
            m_ingress = socket;
        }

        NtripSession session = client.handshake(socket);
        if (!session.isValid()) {
            if (!m_stopRequested)
                fail(OpenError, QString("%1: %2").arg(NtripSession::errorName(session.error()), session.errorString()));
            return false;
        }
        NtripClient::setStreamTimeout(socket.get());

        std::lock_guard<std::mutex> lk(m_ingressMutex);
        m_leadingPayload = session.leadingPayload();
        return !m_stopRequested;
    }
    case RelaySettings::SerialSource: {
        auto serial = std::make_shared<SerialEndpoint>(m_settings.serialPort);
        if (!serial->open(m_settings.serialBaudRate)) {
            fail(OpenError, serial->errorString());
            return false;
        }
        serial->setReadTimeout(m_settings.readTimeoutMs);
        endpoint = serial;
        break;
    }
    case RelaySettings::TcpSource:
        if (!m_tcpListener.listen(m_settings.tcpHost, m_settings.tcpPort)) {
            fail(OpenError, m_tcpListener.errorString());
            return false;
        }
        qCInfo(lcRelay).noquote() << QString("%1: waiting for ingress client on %2:%3")
                                         .arg(m_settings.name, m_settings.tcpHost).arg(m_tcpListener.serverPort());
        return acceptTcpClient();
    case RelaySettings::TunnelSource:
        fail(OpenError, "No tunnel endpoint attached");
        return false;
    }

    std::lock_guard<std::mutex> lk(m_ingressMutex);
    if (m_stopRequested) {
        endpoint->close();
        return false;
    }
    m_ingress = endpoint;
    m_leadingPayload = leading;
    return true;
}

bool Relay::forward(const QByteArray &data)
{
    const QVector<RtcmFrame> frames = m_decoder.feed(data);
    {
        std::lock_guard<std::mutex> lk(m_statsMutex);
        const QDateTime now = QDateTime::currentDateTime();
        m_stats.bytesReceived += quint64(data.size());
        m_stats.lastActivity = now;

        RtcmStats &rtcm = m_stats.rtcm;
        rtcm.frames = m_decoder.frameCount();
        rtcm.crcFailures = m_decoder.crcFailures();
        rtcm.discardedBytes = m_decoder.discardedBytes();
        for (const RtcmFrame &frame : frames) {
            if (frame.messageType > 0) {
                ++rtcm.typedFrames;
                ++rtcm.typeCounts[frame.messageType];
            }
        }
        if (!frames.isEmpty()) {
            if (!rtcm.firstFrame.isValid())
                rtcm.firstFrame = now;
            rtcm.lastFrame = now;
        }
    }

    for (SubscriberRegistry *registry : m_registries)
        registry->broadcast(data);

    if (m_tunnel && !m_tunnel->send(data)) {
        fail(TunnelError, QString("Tunnel write failed: %1").arg(m_tunnel->errorString()));
        return false;
    }

    std::lock_guard<std::mutex> lk(m_statsMutex);
    m_stats.bytesSent += quint64(data.size());
    return true;
}

void Relay::run()
{
    setState(Connecting);

    if (!openIngress()) {
        if (!m_stopRequested) {
            if (error() == NoError)
                fail(OpenError, "Unable to open ingress");
            setState(Failed);
        }
        m_tcpListener.close();
        setState(Stopped);
        return;
    }

    setState(Streaming);

    if (m_rover)
        m_roverThread = std::thread(&Relay::roverLoop, this);

    std::shared_ptr<Endpoint> ingress;
    QByteArray leading;
    {
        std::lock_guard<std::mutex> lk(m_ingressMutex);
        ingress = m_ingress;
        leading = m_leadingPayload;
        m_leadingPayload.clear();
    }

    bool running = leading.isEmpty() || forward(leading);

    QElapsedTimer idle;
    idle.start();
    char buf[INGRESS_READ_SIZE];

    while (running && !m_stopRequested) {
        qint64 n = ingress->read(buf, sizeof(buf));
        if (n > 0) {
            idle.restart();
            running = forward(QByteArray(buf, int(n)));
            continue;
        }

        if (m_stopRequested)
            break;

        if (n == 0) {
            if (m_settings.source == RelaySettings::TcpSource) {
                qCInfo(lcRelay).noquote() << QString("%1: ingress client %2 disconnected")
                                                 .arg(m_settings.name, ingress->description());
                ingress->close();
                if (!acceptTcpClient())
                    break;
                std::lock_guard<std::mutex> lk(m_ingressMutex);
                ingress = m_ingress;
                idle.restart();
                continue;
            }
            qCWarning(lcRelay).noquote() << QString("%1: %2 closed the connection")
                                                .arg(m_settings.name, ingress->description());
            break;
        }

        if (ingress->error() == Endpoint::TimeoutError) {
            // A quiet source is reported, never treated as fatal.
            if (m_settings.idleWarningMs > 0 && idle.elapsed() >= m_settings.idleWarningMs) {
                qCWarning(lcRelay).noquote() << QString("%1: no data from %2 for %3 s, still waiting")
                                                    .arg(m_settings.name, ingress->description())
                                                    .arg(idle.elapsed() / 1000);
                {
                    std::lock_guard<std::mutex> lk(m_statsMutex);
                    ++m_stats.idleWarnings;
                }
                idle.restart();
            }
            continue;
        }

        fail(TransportError, QString("Ingress error on %1: %2").arg(ingress->description(), ingress->errorString()));
        break;
    }

    setState(Draining);
    m_stopRequested = true;
    {
        std::lock_guard<std::mutex> lk(m_ingressMutex);
        if (m_ingress)
            m_ingress->close();
    }
    m_tcpListener.close();

    if (m_roverThread.joinable())
        m_roverThread.join();

    const RelayStats final = stats();
    qCInfo(lcRelay).noquote() << QString("%1: received %2 bytes, sent %3 bytes, %4 RTCM frames, %5 CRC failures")
                                     .arg(m_settings.name)
                                     .arg(final.bytesReceived)
                                     .arg(final.bytesSent)
                                     .arg(final.rtcm.frames)
                                     .arg(final.rtcm.crcFailures);
    setState(Stopped);
}

void Relay::roverLoop()
{
    QElapsedTimer ggaTimer;
    char buf[ROVER_READ_SIZE];

    while (!m_stopRequested) {
        qint64 n = m_rover->read(buf, sizeof(buf));
        if (n > 0) {
            if (m_monitor)
                m_monitor->feed(QByteArray(buf, int(n)));
        } else if (n == 0) {
            qCWarning(lcRelay).noquote() << QString("%1: rover %2 closed").arg(m_settings.name, m_rover->description());
            break;
        } else if (m_rover->error() != Endpoint::TimeoutError) {
            if (!m_stopRequested)
                qCWarning(lcRelay).noquote() << QString("%1: rover read error: %2")
                                                    .arg(m_settings.name, m_rover->errorString());
            break;
        }

        if (m_ggaIntervalS <= 0 || !m_monitor || m_settings.source != RelaySettings::CasterSource)
            continue;
        if (ggaTimer.isValid() && ggaTimer.elapsed() < qint64(m_ggaIntervalS) * 1000)
            continue;

        const QByteArray gga = m_monitor->latestGga();
        if (gga.isEmpty())
            continue;

        std::shared_ptr<Endpoint> caster;
        {
            std::lock_guard<std::mutex> lk(m_ingressMutex);
            caster = m_ingress;
        }
        const QByteArray line = gga + "\r\n";
        if (caster && caster->write(line) == line.size()) {
            qCDebug(lcRelay) << "Sent GGA to NTRIP caster";
            std::lock_guard<std::mutex> lk(m_statsMutex);
            ++m_stats.ggaSent;
            ggaTimer.restart();
        } else if (caster) {
            qCWarning(lcRelay).noquote() << QString("%1: error sending GGA: %2")
                                                .arg(m_settings.name, caster->errorString());
            ggaTimer.restart();
        }
    }
}
