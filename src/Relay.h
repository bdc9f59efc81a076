#ifndef RELAY_H
#define RELAY_H

#include "Endpoint.h"
#include "NmeaMonitor.h"
#include "RtcmFrameDecoder.h"
#include "SerialControlTunnel.h"
#include "SubscriberRegistry.h"
#include "TcpListener.h"
#include "ntripclient.h"

#include <QDateTime>
#include <QMap>
#include <QVector>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

struct RtcmStats
{
    quint64 frames = 0;
    quint64 typedFrames = 0;
    quint64 crcFailures = 0;
    quint64 discardedBytes = 0;
    QMap<int, quint64> typeCounts;
    QDateTime firstFrame;
    QDateTime lastFrame;
};

struct RelayStats
{
    quint64 bytesReceived = 0;
    quint64 bytesSent = 0;
    quint64 ggaSent = 0;
    quint64 idleWarnings = 0;
    QDateTime startTime;
    QDateTime lastActivity;
    RtcmStats rtcm;
};

struct RelaySettings
{
    enum Source {
        CasterSource,
        SerialSource,
        TcpSource,
        TunnelSource
    };

    QString name = "relay";
    Source source = CasterSource;
    CasterSettings caster;
    QString serialPort;
    int serialBaudRate = 115200;
    QString tcpHost = "127.0.0.1";
    quint16 tcpPort = 5001;

    RtcmFrameDecoder::TrailerPolicy trailerPolicy = RtcmFrameDecoder::VerifyCrc;
    int garbageLimit = 1024;
    QVector<int> expectedTypes;

    int idleWarningMs = 0;      // warn after this long without ingress data, 0 disables
    int readTimeoutMs = 1000;
};

// Copies one ingress stream to registries of sinks and optionally into a
// SERIAL_CONTROL tunnel, decoding RTCM3 on the way for statistics.
class Relay
{
public:
    enum State {
        Idle,
        Connecting,
        Streaming,
        Draining,
        Stopped,
        Failed
    };

    enum RelayError {
        NoError,
        OpenError,
        TransportError,
        TunnelError
    };

    explicit Relay(const RelaySettings &settings);
    ~Relay();

    Relay(const Relay &) = delete;
    Relay &operator=(const Relay &) = delete;

    void addSinks(SubscriberRegistry *registry);
    void setTunnel(std::shared_ptr<SerialControlTunnel> tunnel);

    // Uses an already open endpoint instead of opening the configured source.
    void setIngressEndpoint(std::shared_ptr<Endpoint> endpoint, const QByteArray &leadingPayload = QByteArray());

    // Reads the rover's NMEA into monitor. With a caster source, the latest
    // usable GGA is uploaded every ggaIntervalS seconds.
    void attachRover(std::shared_ptr<Endpoint> rover, NmeaMonitor *monitor, int ggaIntervalS);

    // Opens the ingress and starts streaming on a worker thread.
    void start();

    // Closes the ingress and joins all threads. Safe to call more than once.
    void stop();

    bool waitForFinished(int timeoutMs);
    bool isFinished() const;

    State state() const;
    RelayError error() const;
    QString errorString() const;
    QString name() const;
    const RelaySettings &settings() const;

    RelayStats stats() const;
    QVector<int> missingExpectedTypes() const;

    static QString stateName(State state);

private:
    void run();
    bool openIngress();
    bool acceptTcpClient();
    bool forward(const QByteArray &data);
    void roverLoop();
    void setState(State state);
    void fail(RelayError error, const QString &errorString);

    RelaySettings m_settings;
    RtcmFrameDecoder m_decoder;

    QVector<SubscriberRegistry *> m_registries;
    std::shared_ptr<SerialControlTunnel> m_tunnel;

    std::mutex m_ingressMutex;
    std::shared_ptr<Endpoint> m_ingress;
    QByteArray m_leadingPayload;
    TcpListener m_tcpListener;

    std::shared_ptr<Endpoint> m_rover;
    NmeaMonitor *m_monitor;
    int m_ggaIntervalS;

    std::thread m_worker;
    std::thread m_roverThread;
    std::atomic<bool> m_stopRequested;

    mutable std::mutex m_stateMutex;
    std::condition_variable m_stateChanged;
    State m_state;
    RelayError m_error;
    QString m_errorString;

    mutable std::mutex m_statsMutex;
    RelayStats m_stats;
};

#endif // RELAY_H
