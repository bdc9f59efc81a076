#include "StatusDisplay.h"
#include "LogCategories.h"


#include <cstdio>

// frames older than this no longer count as flowing
#define FLOWING_WINDOW_MS 5000

StatusDisplay::StatusDisplay(const DisplayConfig &config, QObject *parent)
    : QObject(parent),
    m_config(config),
    m_relay(nullptr),
    m_registry(nullptr),
    m_monitor(nullptr)
{
    m_timer.setInterval(qMax(100, m_config.intervalMs));
    connect(&m_timer, &QTimer::timeout, this, &StatusDisplay::refresh);
}

void StatusDisplay::setRelay(Relay *relay)
{
    m_relay = relay;
}

void StatusDisplay::setRegistry(SubscriberRegistry *registry)
{
    m_registry = registry;
}

void StatusDisplay::setMonitor(NmeaMonitor *monitor)
{
    m_monitor = monitor;
}

void StatusDisplay::setTunnel(std::shared_ptr<SerialControlTunnel> tunnel)
{
    m_tunnel = std::move(tunnel);
}

void StatusDisplay::start()
{
    m_statsClock.start();
    m_timer.start();
}

void StatusDisplay::stop()
{
    m_timer.stop();
}

bool StatusDisplay::roverUsingCorrections(const RoverStatus &rover)
{
    if (rover.initialQuality < 0)
        return false;
    if (NmeaMonitor::qualityRank(rover.quality) > NmeaMonitor::qualityRank(rover.initialQuality))
        return true;
    return rover.quality == GGA_QUALITY_RTK_FLOAT || rover.quality == GGA_QUALITY_RTK_FIXED;
}

StatusDisplay::ReceptionStatus StatusDisplay::classifyReception(const RelayStats &stats, const RoverStatus *rover,
                                                                const QDateTime &now)
{
    const bool flowing = stats.lastActivity.isValid() && stats.lastActivity.msecsTo(now) < FLOWING_WINDOW_MS;
    const bool valid = stats.rtcm.frames > 0;
    const bool roverUsing = rover && roverUsingCorrections(*rover);

    if (roverUsing && NmeaMonitor::qualityRank(rover->quality) >= NmeaMonitor::qualityRank(GGA_QUALITY_RTK_FLOAT))
        return RoverUsing;
    if (roverUsing)
        return Converging;
    if (valid && flowing)
        return ValidAndFlowing;
    if (flowing)
        return Validating;
    if (stats.bytesReceived > 0)
        return Stalled;
    return NoData;
}

QString StatusDisplay::receptionName(ReceptionStatus status)
{
    switch (status) {
    case NoData: return "No RTCM data received";
    case Stalled: return "RTCM data stalled";
    case Validating: return "RTCM data flowing (validating)";
    case ValidAndFlowing: return "RTCM data valid and flowing";
    case Converging: return "Rover receiving RTCM (RTK converging)";
    case RoverUsing: return "Rover using RTCM (RTK active)";
    }
    return "Unknown";
}

QString StatusDisplay::typeSummary(const QMap<int, quint64> &typeCounts)
{
    QStringList parts;
    for (auto it = typeCounts.constBegin(); it != typeCounts.constEnd(); ++it)
        parts.append(QString("%1(%2)").arg(it.key()).arg(it.value()));
    return parts.isEmpty() ? QString("-") : parts.join(' ');
}

static double ratePerSecond(quint64 bytes, const QDateTime &start, const QDateTime &now)
{
    if (!start.isValid())
        return 0.0;
    const qint64 ms = start.msecsTo(now);
    return ms > 0 ? bytes * 1000.0 / ms : 0.0;
}

QStringList StatusDisplay::statusBlock() const
{
    const QDateTime now = QDateTime::currentDateTime();
    QStringList lines;

    RoverStatus rover;
    if (m_monitor)
        rover = m_monitor->status();

    if (m_relay) {
        const RelayStats stats = m_relay->stats();
        const qint64 elapsed = stats.startTime.isValid() ? stats.startTime.secsTo(now) : 0;
        lines << QString("[%1] %2  elapsed %3 s").arg(m_relay->name(), Relay::stateName(m_relay->state())).arg(elapsed);
        lines << QString("  RTCM rx %1 B  tx %2 B  %3 B/s")
                     .arg(stats.bytesReceived)
                     .arg(stats.bytesSent)
                     .arg(ratePerSecond(stats.bytesReceived, stats.startTime, now), 0, 'f', 1);
        lines << QString("  Frames %1  CRC failures %2  Types %3")
                     .arg(stats.rtcm.frames)
                     .arg(stats.rtcm.crcFailures)
                     .arg(typeSummary(stats.rtcm.typeCounts));
        lines << QString("  Status %1").arg(receptionName(classifyReception(stats, m_monitor ? &rover : nullptr, now)));

        const QVector<int> missing = m_relay->missingExpectedTypes();
        if (!missing.isEmpty()) {
            QStringList types;
            for (int type : missing)
                types << QString::number(type);
            lines << QString("  Missing types %1").arg(types.join(' '));
        }
    }

    if (m_registry)
        lines << QString("  Sinks %1").arg(m_registry->count());

    if (m_monitor) {
        if (rover.hasGga) {
            lines << QString("  Rover %1 (%2)  sats %3  HDOP %4")
                         .arg(NmeaMonitor::qualityName(rover.quality))
                         .arg(rover.quality)
                         .arg(rover.satellites)
                         .arg(rover.hdop, 0, 'f', 1);
            if (rover.hasPosition)
                lines << QString("  Position %1, %2  alt %3 m")
                             .arg(rover.latitude, 0, 'f', 8)
                             .arg(rover.longitude, 0, 'f', 8)
                             .arg(rover.altitude, 0, 'f', 2);
        } else {
            lines << "  Rover waiting for GGA";
        }
    }

    if (m_tunnel)
        lines << QString("  Tunnel %1  tx %2 B in %3 chunks  rx %4 B")
                     .arg(m_tunnel->isLinkUp() ? QString("up") : QString("down"))
                     .arg(m_tunnel->bytesSent())
                     .arg(m_tunnel->chunksSent())
                     .arg(m_tunnel->bytesReceived());
    return lines;
}

QString StatusDisplay::statsLine() const
{
    if (!m_relay)
        return QString();

    const RelayStats stats = m_relay->stats();
    QString line = QString("%1: rx %2 B, tx %3 B, frames %4, crc %5, types %6")
                       .arg(m_relay->name())
                       .arg(stats.bytesReceived)
                       .arg(stats.bytesSent)
                       .arg(stats.rtcm.frames)
                       .arg(stats.rtcm.crcFailures)
                       .arg(typeSummary(stats.rtcm.typeCounts));
    if (m_monitor) {
        const RoverStatus rover = m_monitor->status();
        line += QString(", fix %1").arg(NmeaMonitor::qualityName(rover.quality));
    }
    return line;
}

void StatusDisplay::refresh()
{
    const QStringList lines = statusBlock();
    for (const QString &line : lines)
        std::printf("%s\n", line.toLocal8Bit().constData());
    std::fflush(stdout);

    if (m_config.statsIntervalS > 0 && m_statsClock.elapsed() >= qint64(m_config.statsIntervalS) * 1000) {
        qCInfo(lcApp).noquote() << statsLine();
        m_statsClock.restart();
    }
}
