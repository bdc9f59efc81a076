#ifndef NMEAMONITOR_H
#define NMEAMONITOR_H

#include <QByteArray>
#include <QElapsedTimer>
#include <QList>
#include <QString>
#include <QVector>

#include <mutex>

#define GGA_QUALITY_NO_FIX 0
#define GGA_QUALITY_GPS 1
#define GGA_QUALITY_DGPS 2
#define GGA_QUALITY_PPS 3
#define GGA_QUALITY_RTK_FIXED 4
#define GGA_QUALITY_RTK_FLOAT 5
#define GGA_QUALITY_ESTIMATED 6
#define GGA_QUALITY_MANUAL 7
#define GGA_QUALITY_SIMULATION 8

struct QualityChange
{
    qint64 elapsedMs = 0;
    int from = GGA_QUALITY_NO_FIX;
    int to = GGA_QUALITY_NO_FIX;
};

struct RoverStatus
{
    quint64 sentences = 0;
    quint64 checksumErrors = 0;
    bool hasGga = false;

    QString utcTime;
    int quality = GGA_QUALITY_NO_FIX;
    int satellites = 0;
    bool hasPosition = false;
    double latitude = 0.0;
    double longitude = 0.0;
    bool hasAltitude = false;
    double altitude = 0.0;
    double geoidSeparation = 0.0;

    double hdop = 0.0;                  // from GGA
    double gsaHdop = 0.0;
    double pdop = 0.0;
    double vdop = 0.0;

    bool hasSpeed = false;
    double speedMs = 0.0;
    bool hasTrack = false;
    double track = 0.0;

    int initialQuality = -1;            // -1 until the first GGA
    int bestQuality = GGA_QUALITY_NO_FIX;
    qint64 floatTimeMs = -1;
    qint64 fixedTimeMs = -1;
    quint64 qualityChangeCount = 0;
    QVector<QualityChange> qualityChanges;  // most recent ones only
};

// Tracks rover fix state from the NMEA it prints. Thread safe: one thread
// feeds, others read status().
class NmeaMonitor
{
public:
    NmeaMonitor();

    // Accepts arbitrary chunks; complete lines are parsed as they appear.
    void feed(const QByteArray &data);
    bool parseSentence(const QByteArray &sentence);

    RoverStatus status() const;

    // Latest GGA with a usable fix (quality neither 0 nor 6), empty otherwise.
    QByteArray latestGga() const;

    static QString qualityName(int quality);
    static int qualityRank(int quality);
    static bool verifyChecksum(const QByteArray &sentence, bool *present = nullptr);
    static double toDegrees(const QByteArray &value, const QByteArray &hemisphere, bool *ok);

private:
    void handleGga(const QList<QByteArray> &parts, const QByteArray &sentence);
    void handleRmc(const QList<QByteArray> &parts);
    void handleGsa(const QList<QByteArray> &parts);

    mutable std::mutex m_mutex;
    QByteArray m_lineBuffer;
    RoverStatus m_status;
    QByteArray m_latestGga;
    QElapsedTimer m_clock;
};

#endif // NMEAMONITOR_H
