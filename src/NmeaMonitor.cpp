#include "NmeaMonitor.h"
#include "LogCategories.h"

#define MAX_LINE_LENGTH 256
#define MAX_QUALITY_CHANGES 100

NmeaMonitor::NmeaMonitor()
{
    m_clock.start();
}

QString NmeaMonitor::qualityName(int quality)
{
    switch (quality) {
    case GGA_QUALITY_NO_FIX: return "No Fix";
    case GGA_QUALITY_GPS: return "GPS";
    case GGA_QUALITY_DGPS: return "DGPS";
    case GGA_QUALITY_PPS: return "PPS";
    case GGA_QUALITY_RTK_FIXED: return "RTK Fixed";
    case GGA_QUALITY_RTK_FLOAT: return "RTK Float";
    case GGA_QUALITY_ESTIMATED: return "Estimated";
    case GGA_QUALITY_MANUAL: return "Manual";
    case GGA_QUALITY_SIMULATION: return "Simulation";
    default: return "Unknown";
    }
}

// Orders fix types by how good the solution is; RTK fixed ranks above float
// although its code is lower.
int NmeaMonitor::qualityRank(int quality)
{
    switch (quality) {
    case GGA_QUALITY_ESTIMATED: return 1;
    case GGA_QUALITY_MANUAL: return 1;
    case GGA_QUALITY_SIMULATION: return 1;
    case GGA_QUALITY_GPS: return 2;
    case GGA_QUALITY_DGPS: return 3;
    case GGA_QUALITY_PPS: return 3;
    case GGA_QUALITY_RTK_FLOAT: return 4;
    case GGA_QUALITY_RTK_FIXED: return 5;
    default: return 0;
    }
}

bool NmeaMonitor::verifyChecksum(const QByteArray &sentence, bool *present)
{
    int star = sentence.lastIndexOf('*');
    if (star < 0 || star + 3 > sentence.size()) {
        if (present)
            *present = false;
        return true;
    }
    if (present)
        *present = true;

    bool ok = false;
    int expected = sentence.mid(star + 1, 2).toInt(&ok, 16);
    if (!ok)
        return false;

    int start = sentence.startsWith('$') ? 1 : 0;
    quint8 sum = 0;
    for (int i = start; i < star; ++i)
        sum ^= quint8(sentence.at(i));
    return sum == expected;
}

double NmeaMonitor::toDegrees(const QByteArray &value, const QByteArray &hemisphere, bool *ok)
{
    *ok = false;
    int dot = value.indexOf('.');
    if (dot < 0)
        dot = value.size();
    // ddmm.mmmm or dddmm.mmmm: minutes always take the two digits before the dot
    if (dot < 3)
        return 0.0;

    bool ok1, ok2;
    double degrees = value.left(dot - 2).toDouble(&ok1);
    double minutes = value.mid(dot - 2).toDouble(&ok2);
    if (!ok1 || !ok2)
        return 0.0;

    double decimal = degrees + minutes / 60.0;
    if (hemisphere == "S" || hemisphere == "W")
        decimal = -decimal;
    *ok = true;
    return decimal;
}

void NmeaMonitor::feed(const QByteArray &data)
{
    QList<QByteArray> complete;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_lineBuffer.append(data);

        int nl;
        while ((nl = m_lineBuffer.indexOf('\n')) >= 0) {
            complete.append(m_lineBuffer.left(nl));
            m_lineBuffer.remove(0, nl + 1);
        }
        if (m_lineBuffer.size() > MAX_LINE_LENGTH)
            m_lineBuffer.clear();
    }

    for (const QByteArray &line : complete)
        parseSentence(line);
}

bool NmeaMonitor::parseSentence(const QByteArray &raw)
{
    int start = raw.indexOf('$');
    if (start < 0)
        return false;
    const QByteArray sentence = raw.mid(start).trimmed();
    if (sentence.size() < 7)
        return false;

    bool hasChecksum = false;
    if (!verifyChecksum(sentence, &hasChecksum)) {
        std::lock_guard<std::mutex> lk(m_mutex);
        ++m_status.checksumErrors;
        qCDebug(lcNmea) << "Checksum error:" << sentence;
        return false;
    }

    QByteArray body = sentence;
    if (hasChecksum)
        body.truncate(body.lastIndexOf('*'));
    const QList<QByteArray> parts = body.split(',');
    const QByteArray type = parts.first().mid(3);

    std::lock_guard<std::mutex> lk(m_mutex);
    ++m_status.sentences;

    if (type == "GGA")
        handleGga(parts, sentence);
    else if (type == "RMC")
        handleRmc(parts);
    else if (type == "GSA")
        handleGsa(parts);
    else
        return false;
    return true;
}

void NmeaMonitor::handleGga(const QList<QByteArray> &parts, const QByteArray &sentence)
{
    if (parts.size() < 10)
        return;

    const int quality = parts.at(6).isEmpty() ? GGA_QUALITY_NO_FIX : parts.at(6).toInt();
    const qint64 now = m_clock.elapsed();

    const QByteArray time = parts.at(1);
    if (time.size() >= 6)
        m_status.utcTime = QString("%1:%2:%3").arg(QString::fromLatin1(time.mid(0, 2)),
                                                   QString::fromLatin1(time.mid(2, 2)),
                                                   QString::fromLatin1(time.mid(4, 2)));

    bool latOk = false, lonOk = false;
    double lat = toDegrees(parts.at(2), parts.at(3), &latOk);
    double lon = toDegrees(parts.at(4), parts.at(5), &lonOk);
    m_status.hasPosition = latOk && lonOk;
    if (m_status.hasPosition) {
        m_status.latitude = lat;
        m_status.longitude = lon;
    }

    m_status.satellites = parts.at(7).toInt();
    m_status.hdop = parts.at(8).toDouble();
    m_status.hasAltitude = !parts.at(9).isEmpty();
    m_status.altitude = parts.at(9).toDouble();
    if (parts.size() > 11)
        m_status.geoidSeparation = parts.at(11).toDouble();

    if (m_status.initialQuality < 0)
        m_status.initialQuality = quality;

    const int previous = m_status.hasGga ? m_status.quality : GGA_QUALITY_NO_FIX;
    if (quality != previous) {
        QualityChange change;
        change.elapsedMs = now;
        change.from = previous;
        change.to = quality;
        ++m_status.qualityChangeCount;
        if (m_status.qualityChanges.size() >= MAX_QUALITY_CHANGES)
            m_status.qualityChanges.removeFirst();
        m_status.qualityChanges.append(change);
        qCInfo(lcNmea).noquote() << QString("Quality change: %1 -> %2")
                                        .arg(qualityName(previous), qualityName(quality));
    }

    if (qualityRank(quality) > qualityRank(m_status.bestQuality)) {
        m_status.bestQuality = quality;
        if (quality == GGA_QUALITY_RTK_FLOAT && m_status.floatTimeMs < 0)
            m_status.floatTimeMs = now;
    }
    if (quality == GGA_QUALITY_RTK_FIXED && m_status.fixedTimeMs < 0)
        m_status.fixedTimeMs = now;

    m_status.quality = quality;
    m_status.hasGga = true;

    if (quality != GGA_QUALITY_NO_FIX && quality != GGA_QUALITY_ESTIMATED)
        m_latestGga = sentence;
    else
        m_latestGga.clear();
}

void NmeaMonitor::handleRmc(const QList<QByteArray> &parts)
{
    if (parts.size() < 9)
        return;

    // knots to m/s
    m_status.hasSpeed = !parts.at(7).isEmpty();
    m_status.speedMs = parts.at(7).toDouble() * 0.514444;
    m_status.hasTrack = !parts.at(8).isEmpty();
    m_status.track = parts.at(8).toDouble();
}

void NmeaMonitor::handleGsa(const QList<QByteArray> &parts)
{
    if (parts.size() < 17)
        return;

    m_status.pdop = parts.at(15).toDouble();
    m_status.gsaHdop = parts.at(16).toDouble();
    if (parts.size() > 17)
        m_status.vdop = parts.at(17).toDouble();
}

RoverStatus NmeaMonitor::status() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_status;
}

QByteArray NmeaMonitor::latestGga() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_latestGga;
}
