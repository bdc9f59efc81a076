#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTimer>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <thread>

#include "LogCategories.h"
#include "NmeaMonitor.h"
#include "PortLocator.h"
#include "Relay.h"
#include "RelayConfig.h"
#include "RunLog.h"
#include "SerialControlTunnel.h"
#include "SerialEndpoint.h"
#include "SinkListener.h"
#include "StatusDisplay.h"
#include "SubscriberRegistry.h"
#include "TunnelEndpoint.h"
#include "ntripclient.h"

#define TOOL_NAME "rtkrelay"
#define SERIAL_READ_TIMEOUT_MS 500
#define CASTER_IDLE_WARNING_MS 60000
#define COMMAND_START_DELAY_MS 1000
#define COMMAND_SPACING_MS 200

static std::atomic<bool> g_stop(false);

static void handleSignal(int)
{
    g_stop = true;
}

// Sleeps in short steps so a stop request is noticed.
static bool sleepUnlessStopped(int ms)
{
    for (int waited = 0; waited < ms; waited += 50) {
        if (g_stop)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !g_stop;
}

static bool parseCasterOption(const QString &text, CasterSettings *caster)
{
    const int colon = text.lastIndexOf(':');
    if (colon < 0) {
        caster->host = text;
        return !text.isEmpty();
    }

    bool ok = false;
    const uint port = text.mid(colon + 1).toUInt(&ok);
    if (!ok || port == 0 || port > 65535)
        return false;
    caster->host = text.left(colon);
    caster->port = static_cast<quint16>(port);
    return !caster->host.isEmpty();
}

static QStringList buildSummary(const AppSettings &settings, const QString &roverPort, const Relay &relay,
                                const NmeaMonitor *monitor, const SerialControlTunnel *tunnel)
{
    const QDateTime now = QDateTime::currentDateTime();
    const RelayStats stats = relay.stats();
    const double elapsed = stats.startTime.isValid() ? stats.startTime.msecsTo(now) / 1000.0 : 0.0;

    QStringList lines;
    lines << QString("Time       : %1").arg(now.toString("yyyy-MM-dd HH:mm:ss"));
    lines << QString("Caster     : %1:%2").arg(settings.caster.host).arg(settings.caster.port);
    lines << QString("Mountpoint : %1").arg(settings.caster.mountpoint);
    lines << QString("Rover Port : %1").arg(roverPort.isEmpty() ? QString("-") : roverPort);
    lines << "";

    if (relay.error() == Relay::NoError)
        lines << "Result     : COMPLETE";
    else
        lines << QString("Result     : FAILED (%1)").arg(relay.errorString());
    lines << QString("Duration   : %1 s").arg(elapsed, 0, 'f', 1);
    lines << QString("RTCM Rx    : %1 bytes").arg(stats.bytesReceived);
    lines << QString("RTCM Tx    : %1 bytes").arg(stats.bytesSent);
    if (elapsed > 0)
        lines << QString("Avg RTCM   : %1 B/s").arg(stats.bytesReceived / elapsed, 0, 'f', 1);
    lines << QString("Frames     : %1").arg(stats.rtcm.frames);
    lines << QString("CRC Errors : %1").arg(stats.rtcm.crcFailures);
    lines << QString("RTCM Types : %1").arg(StatusDisplay::typeSummary(stats.rtcm.typeCounts));

    const QVector<int> missing = relay.missingExpectedTypes();
    if (!missing.isEmpty()) {
        QStringList names;
        for (int type : missing)
            names << QString::number(type);
        lines << QString("Missing    : %1").arg(names.join(", "));
    }

    RoverStatus rover;
    if (monitor)
        rover = monitor->status();
    lines << QString("Reception  : %1")
                 .arg(StatusDisplay::receptionName(StatusDisplay::classifyReception(stats, monitor ? &rover : nullptr, now)));

    if (monitor && rover.hasGga) {
        lines << "";
        lines << QString("NMEA Msgs  : %1 (%2 checksum errors)").arg(rover.sentences).arg(rover.checksumErrors);
        lines << QString("Best Fix   : %1 (Quality %2)").arg(NmeaMonitor::qualityName(rover.bestQuality)).arg(rover.bestQuality);
        lines << QString("Initial Fix: %1 (Quality %2)").arg(NmeaMonitor::qualityName(rover.initialQuality)).arg(rover.initialQuality);
        if (rover.floatTimeMs >= 0)
            lines << QString("RTK Float  : Achieved in %1 s").arg(rover.floatTimeMs / 1000.0, 0, 'f', 1);
        if (rover.fixedTimeMs >= 0)
            lines << QString("RTK Fixed  : Achieved in %1 s").arg(rover.fixedTimeMs / 1000.0, 0, 'f', 1);
        lines << QString("GGA Sent   : %1").arg(stats.ggaSent);

        if (!rover.qualityChanges.isEmpty()) {
            lines << "";
            if (rover.qualityChangeCount > quint64(rover.qualityChanges.size()))
                lines << QString("Quality Changes (last %1 of %2):").arg(rover.qualityChanges.size())
                                                                    .arg(rover.qualityChangeCount);
            else
                lines << "Quality Changes:";
            for (const QualityChange &change : rover.qualityChanges)
                lines << QString("  %1 s: %2 -> %3")
                             .arg(change.elapsedMs / 1000.0, 0, 'f', 1)
                             .arg(NmeaMonitor::qualityName(change.from), NmeaMonitor::qualityName(change.to));
        }
    }

    if (tunnel) {
        lines << "";
        lines << QString("Tunnel Tx  : %1 bytes in %2 chunks").arg(tunnel->bytesSent()).arg(tunnel->chunksSent());
        lines << QString("Tunnel Rx  : %1 bytes").arg(tunnel->bytesReceived());
    }
    return lines;
}

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName(TOOL_NAME);
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Relays RTCM3 corrections from a caster, serial port or TCP client "
                                     "to local clients, a rover and a MAVLink SERIAL_CONTROL tunnel.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Settings file.", "file", RelayConfig::defaultPath());
    QCommandLineOption casterOption("caster", "Caster host[:port].", "host");
    QCommandLineOption mountpointOption("mountpoint", "Caster mountpoint.", "name");
    QCommandLineOption roverOption("rover", "Rover serial port, or AUTO.", "port");
    QCommandLineOption listMountpointsOption("list-mountpoints", "Print the caster sourcetable and exit.");
    QCommandLineOption listPortsOption("list-ports", "Print the serial ports and exit.");
    QCommandLineOption sendOption("send", "Command sent through the tunnel after start (repeatable).", "command");
    QCommandLineOption debugOption("debug", "Enable debug logging.");
    parser.addOptions({configOption, casterOption, mountpointOption, roverOption,
                       listMountpointsOption, listPortsOption, sendOption, debugOption});
    parser.process(a);

    if (parser.isSet(listPortsOption)) {
        const QStringList ports = PortLocator::describePorts();
        if (ports.isEmpty())
            std::printf("No serial ports found\n");
        for (const QString &line : ports)
            std::printf("%s\n", line.toLocal8Bit().constData());
        return 0;
    }

    AppSettings settings;
    QString error;
    const QString settingsPath = parser.value(configOption);
    if (!RelayConfig::load(settingsPath, &settings, &error)) {
        qCCritical(lcApp).noquote() << error;
        return 1;
    }

    if (parser.isSet(casterOption) && !parseCasterOption(parser.value(casterOption), &settings.caster)) {
        qCCritical(lcApp).noquote() << "Invalid --caster value:" << parser.value(casterOption);
        return 1;
    }
    if (parser.isSet(mountpointOption))
        settings.caster.mountpoint = parser.value(mountpointOption);
    if (parser.isSet(roverOption))
        settings.rover.port = parser.value(roverOption);
    if (parser.isSet(debugOption))
        settings.log.debug = true;
    settings.tunnel.commands += parser.values(sendOption);

    QLoggingCategory::setFilterRules(settings.log.debug ? QStringLiteral("rtkrelay.*.debug=true")
                                                        : QStringLiteral("rtkrelay.*.debug=false"));

    if (!RunLog::install(settings.log.directory, TOOL_NAME, &error))
        qCWarning(lcApp).noquote() << error;
    qCInfo(lcApp).noquote() << "Settings path:" << settingsPath;
    if (!RunLog::logFilePath().isEmpty())
        qCInfo(lcApp).noquote() << "Log file:" << RunLog::logFilePath();

    if (parser.isSet(listMountpointsOption)) {
        NtripClient client(settings.caster);
        const QVector<MountPointInfo> mounts = client.fetchSourceTable(&error);
        if (mounts.isEmpty() && !error.isEmpty()) {
            qCCritical(lcApp).noquote() << error;
            RunLog::uninstall();
            return 1;
        }
        for (const MountPointInfo &mp : mounts)
            std::printf("%-20s %-12s %-4s %10.4f %10.4f\n",
                        mp.name.toLocal8Bit().constData(), mp.format.toLocal8Bit().constData(),
                        mp.country.toLocal8Bit().constData(), mp.latitude, mp.longitude);
        RunLog::uninstall();
        return 0;
    }

    if (settings.ingress.source == RelaySettings::CasterSource
        && (settings.caster.host.isEmpty() || settings.caster.mountpoint.isEmpty())) {
        qCCritical(lcApp) << "caster/host and caster/mountpoint must be set for a caster source";
        RunLog::uninstall();
        return 1;
    }
    if (settings.ingress.source == RelaySettings::TunnelSource && !settings.tunnel.enabled) {
        qCCritical(lcApp) << "ingress/source=tunnel needs tunnel/enabled=true";
        RunLog::uninstall();
        return 1;
    }

    // Rover
    QString roverPort = settings.rover.port;
    if (roverPort.compare("AUTO", Qt::CaseInsensitive) == 0) {
        roverPort = PortLocator::resolve(settings.rover.vendorId, settings.rover.productId, settings.rover.deviceName);
        if (roverPort.isEmpty())
            qCWarning(lcApp).noquote() << QString("Rover not found (VID=%1 PID=%2 name=\"%3\").")
                                              .arg(RelayConfig::hex16(settings.rover.vendorId),
                                                   RelayConfig::hex16(settings.rover.productId),
                                                   settings.rover.deviceName);
    }

    std::shared_ptr<SerialEndpoint> rover;
    if (!roverPort.isEmpty()) {
        rover = std::make_shared<SerialEndpoint>(roverPort);
        if (!rover->open(settings.rover.baudRate)) {
            qCCritical(lcApp).noquote() << rover->errorString();
            RunLog::uninstall();
            return 1;
        }
        rover->setReadTimeout(SERIAL_READ_TIMEOUT_MS);
        qCInfo(lcApp).noquote() << "Rover port:" << rover->description();
    }

    NmeaMonitor monitor;
    SubscriberRegistry sinks(settings.listener.slotMode, "listener");
    SubscriberRegistry roverSinks(SubscriberRegistry::MultiSlot, "rover");
    SubscriberRegistry bridgeSinks(SubscriberRegistry::SingleSlot, "bridge");
    if (rover)
        roverSinks.registerSink(rover);

    std::unique_ptr<SinkListener> listener;
    if (settings.listener.enabled) {
        listener.reset(new SinkListener(&sinks, settings.listener.settings));
        if (!listener->start()) {
            qCCritical(lcApp).noquote() << "Listener failed:" << listener->errorString();
            RunLog::uninstall();
            return 1;
        }
    }

    // Tunnel
    std::shared_ptr<SerialControlTunnel> tunnel;
    const bool bridgeWanted = settings.tunnel.enabled && settings.tunnel.bridgeEnabled
                              && settings.ingress.source != RelaySettings::TunnelSource;
    if (settings.tunnel.enabled) {
        auto link = std::make_shared<SerialEndpoint>(settings.tunnel.linkPort);
        if (!link->open(settings.tunnel.linkBaudRate)) {
            qCCritical(lcApp).noquote() << "Tunnel link:" << link->errorString();
            RunLog::uninstall();
            return 1;
        }
        link->setReadTimeout(SERIAL_READ_TIMEOUT_MS);

        tunnel = std::make_shared<SerialControlTunnel>(link, settings.tunnel.settings);
        if (!tunnel->waitForHeartbeat(settings.tunnel.heartbeatTimeoutMs)) {
            qCCritical(lcApp).noquote() << "Tunnel:" << tunnel->errorString();
            tunnel->stop();
            RunLog::uninstall();
            return 1;
        }
        tunnel->start(bridgeWanted || settings.ingress.source == RelaySettings::TunnelSource);
    }

    // Vehicle serial output to a single local TCP client, whose bytes go back down the tunnel.
    std::unique_ptr<SinkListener> bridgeListener;
    std::unique_ptr<Relay> bridgeRelay;
    if (bridgeWanted) {
        ListenerSettings bridgeSettings;
        bridgeSettings.mode = ListenerSettings::RawBridge;
        bridgeSettings.host = settings.tunnel.bridgeHost;
        bridgeSettings.port = settings.tunnel.bridgePort;
        bridgeSettings.sendTimeoutMs = settings.listener.settings.sendTimeoutMs;

        bridgeListener.reset(new SinkListener(&bridgeSinks, bridgeSettings));
        std::weak_ptr<SerialControlTunnel> weakTunnel = tunnel;
        bridgeListener->setClientDataHandler([weakTunnel](const QByteArray &data) {
            std::shared_ptr<SerialControlTunnel> t = weakTunnel.lock();
            if (t && !t->send(data))
                qCWarning(lcTunnel).noquote() << "Bridge write failed:" << t->errorString();
        });
        if (!bridgeListener->start()) {
            qCCritical(lcApp).noquote() << "Bridge listener failed:" << bridgeListener->errorString();
            tunnel->stop();
            RunLog::uninstall();
            return 1;
        }

        RelaySettings bridgeRelaySettings;
        bridgeRelaySettings.name = "bridge";
        bridgeRelaySettings.source = RelaySettings::TunnelSource;
        bridgeRelaySettings.trailerPolicy = RtcmFrameDecoder::TrustLength;
        bridgeRelay.reset(new Relay(bridgeRelaySettings));
        bridgeRelay->setIngressEndpoint(TunnelEndpoint::attach(tunnel));
        bridgeRelay->addSinks(&bridgeSinks);
    }

    // Main relay
    RelaySettings relaySettings;
    relaySettings.name = "rtcm";
    relaySettings.source = settings.ingress.source;
    relaySettings.caster = settings.caster;
    relaySettings.serialPort = settings.ingress.serialPort;
    relaySettings.serialBaudRate = settings.ingress.serialBaudRate;
    relaySettings.tcpHost = settings.ingress.tcpHost;
    relaySettings.tcpPort = settings.ingress.tcpPort;
    relaySettings.trailerPolicy = settings.rtcm.verifyCrc ? RtcmFrameDecoder::VerifyCrc : RtcmFrameDecoder::TrustLength;
    relaySettings.garbageLimit = settings.rtcm.garbageLimit;
    relaySettings.expectedTypes = settings.rtcm.expectedTypes;
    if (relaySettings.source == RelaySettings::CasterSource)
        relaySettings.idleWarningMs = CASTER_IDLE_WARNING_MS;

    Relay relay(relaySettings);
    if (listener)
        relay.addSinks(&sinks);
    if (rover)
        relay.addSinks(&roverSinks);
    if (relaySettings.source == RelaySettings::TunnelSource)
        relay.setIngressEndpoint(TunnelEndpoint::attach(tunnel));
    else if (tunnel)
        relay.setTunnel(tunnel);
    if (rover && settings.rover.monitorNmea)
        relay.attachRover(rover, &monitor, settings.rover.ggaIntervalS);

    StatusDisplay display(settings.display);
    display.setRelay(&relay);
    if (listener)
        display.setRegistry(&sinks);
    if (rover && settings.rover.monitorNmea)
        display.setMonitor(&monitor);
    if (tunnel)
        display.setTunnel(tunnel);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    relay.start();
    if (bridgeRelay)
        bridgeRelay->start();
    display.start();

    std::thread commandThread;
    if (tunnel && !settings.tunnel.commands.isEmpty()) {
        const QStringList commands = settings.tunnel.commands;
        commandThread = std::thread([tunnel, commands]() {
            if (!sleepUnlessStopped(COMMAND_START_DELAY_MS))
                return;
            for (const QString &command : commands) {
                qCInfo(lcTunnel).noquote() << "Sending command:" << command;
                if (!tunnel->send(command.toLatin1() + "\r\n")) {
                    qCWarning(lcTunnel).noquote() << "Command failed:" << tunnel->errorString();
                    return;
                }
                if (!sleepUnlessStopped(COMMAND_SPACING_MS))
                    return;
            }
        });
    }

    QTimer stopTimer;
    QObject::connect(&stopTimer, &QTimer::timeout, &a, [&]() {
        if (g_stop) {
            qCInfo(lcApp) << "Stopping";
            a.quit();
        } else if (relay.isFinished()) {
            a.quit();
        } else if (bridgeRelay && bridgeRelay->isFinished() && bridgeRelay->error() != Relay::NoError) {
            qCWarning(lcApp).noquote() << "Bridge stopped:" << bridgeRelay->errorString();
            a.quit();
        }
    });
    stopTimer.start(200);

    a.exec();

    g_stop = true;
    stopTimer.stop();
    display.stop();

    relay.stop();
    if (bridgeRelay)
        bridgeRelay->stop();
    if (commandThread.joinable())
        commandThread.join();
    if (listener)
        listener->stop();
    if (bridgeListener)
        bridgeListener->stop();
    if (tunnel)
        tunnel->stop();
    roverSinks.closeAll();
    if (rover)
        rover->close();

    const QStringList summary = buildSummary(settings, roverPort, relay,
                                             rover && settings.rover.monitorNmea ? &monitor : nullptr,
                                             tunnel.get());
    for (const QString &line : summary)
        qCInfo(lcApp).noquote() << line;

    QString summaryPath;
    if (RunLog::writeSummary(settings.log.directory, TOOL_NAME, summary, &summaryPath, &error))
        qCInfo(lcApp).noquote() << "Summary log written to" << summaryPath;
    else
        qCWarning(lcApp).noquote() << error;

    int exitCode = 0;
    if (relay.error() != Relay::NoError)
        exitCode = 1;
    if (bridgeRelay && bridgeRelay->error() != Relay::NoError)
        exitCode = 1;

    RunLog::uninstall();
    return exitCode;
}
