#include <QtTest>

#include "NmeaMonitor.h"
#include "Relay.h"
#include "StatusDisplay.h"
#include "SubscriberRegistry.h"

#define GGA_GPS "$GPGGA,123520,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*4D"
#define GGA_FLOAT "$GPGGA,123521,4807.038,N,01131.000,E,5,10,0.8,545.4,M,46.9,M,1.0,0000*6F"

class tst_StatusDisplay : public QObject
{
    Q_OBJECT

private slots:
    void classifyReception_data();
    void classifyReception();
    void roverUsingCorrections();
    void typeSummary();
    void sinksAndMissingTypes();
    void statusBlock();
};

void tst_StatusDisplay::classifyReception_data()
{
    QTest::addColumn<quint64>("bytes");
    QTest::addColumn<quint64>("frames");
    QTest::addColumn<int>("ageMs");         // -1 means no activity yet
    QTest::addColumn<int>("initialQuality");
    QTest::addColumn<int>("quality");
    QTest::addColumn<int>("status");

    QTest::newRow("nothing") << quint64(0) << quint64(0) << -1 << -1 << 0 << int(StatusDisplay::NoData);
    QTest::newRow("bytes, no frames") << quint64(100) << quint64(0) << 100 << -1 << 0 << int(StatusDisplay::Validating);
    QTest::newRow("frames") << quint64(100) << quint64(3) << 100 << -1 << 0 << int(StatusDisplay::ValidAndFlowing);
    QTest::newRow("stalled") << quint64(100) << quint64(3) << 20000 << -1 << 0 << int(StatusDisplay::Stalled);
    QTest::newRow("rover unchanged") << quint64(100) << quint64(3) << 100 << 1 << 1 << int(StatusDisplay::ValidAndFlowing);
    QTest::newRow("rover dgps") << quint64(100) << quint64(3) << 100 << 1 << 2 << int(StatusDisplay::Converging);
    QTest::newRow("rover float") << quint64(100) << quint64(3) << 100 << 1 << 5 << int(StatusDisplay::RoverUsing);
    QTest::newRow("rover fixed") << quint64(100) << quint64(3) << 100 << 4 << 4 << int(StatusDisplay::RoverUsing);
}

void tst_StatusDisplay::classifyReception()
{
    QFETCH(quint64, bytes);
    QFETCH(quint64, frames);
    QFETCH(int, ageMs);
    QFETCH(int, initialQuality);
    QFETCH(int, quality);
    QFETCH(int, status);

    const QDateTime now = QDateTime::currentDateTime();
    RelayStats stats;
    stats.bytesReceived = bytes;
    stats.rtcm.frames = frames;
    if (ageMs >= 0)
        stats.lastActivity = now.addMSecs(-ageMs);

    RoverStatus rover;
    rover.initialQuality = initialQuality;
    rover.quality = quality;
    rover.hasGga = initialQuality >= 0;

    const RoverStatus *roverPtr = initialQuality >= 0 ? &rover : nullptr;
    QCOMPARE(int(StatusDisplay::classifyReception(stats, roverPtr, now)), status);
}

void tst_StatusDisplay::roverUsingCorrections()
{
    RoverStatus rover;
    QVERIFY(!StatusDisplay::roverUsingCorrections(rover));

    rover.initialQuality = GGA_QUALITY_GPS;
    rover.quality = GGA_QUALITY_GPS;
    QVERIFY(!StatusDisplay::roverUsingCorrections(rover));

    rover.quality = GGA_QUALITY_RTK_FIXED;
    QVERIFY(StatusDisplay::roverUsingCorrections(rover));

    rover.initialQuality = GGA_QUALITY_RTK_FLOAT;
    rover.quality = GGA_QUALITY_RTK_FLOAT;
    QVERIFY(StatusDisplay::roverUsingCorrections(rover));
}

void tst_StatusDisplay::typeSummary()
{
    QMap<int, quint64> counts;
    QCOMPARE(StatusDisplay::typeSummary(counts), QString("-"));

    counts[1074] = 2;
    counts[1005] = 3;
    QCOMPARE(StatusDisplay::typeSummary(counts), QString("1005(3) 1074(2)"));
}

void tst_StatusDisplay::sinksAndMissingTypes()
{
    RelaySettings settings;
    settings.name = "rtcm";
    settings.expectedTypes = {1005, 1230};
    Relay relay(settings);

    SubscriberRegistry registry;
    NmeaMonitor monitor;
    QVERIFY(monitor.parseSentence(GGA_GPS));

    StatusDisplay display(DisplayConfig{});
    display.setRelay(&relay);
    display.setRegistry(&registry);
    display.setMonitor(&monitor);

    const QStringList lines = display.statusBlock();
    QVERIFY(lines.first().startsWith("[rtcm] Idle"));
    QVERIFY(lines.contains("  Frames 0  CRC failures 0  Types -"));
    QVERIFY(lines.contains("  Missing types 1005 1230"));
    QVERIFY(lines.contains("  Sinks 0"));
    QVERIFY(lines.join('\n').contains("Rover GPS (1)  sats 8"));
    QVERIFY(lines.join('\n').contains("  Position 48.11730000, 11.51666667"));
}

void tst_StatusDisplay::statusBlock()
{
    Relay relay(RelaySettings{});
    NmeaMonitor monitor;

    StatusDisplay display(DisplayConfig{});
    display.setRelay(&relay);
    display.setMonitor(&monitor);

    QStringList lines = display.statusBlock();
    QVERIFY(lines.first().startsWith("[relay] Idle"));
    QVERIFY(lines.contains("  Status No RTCM data received"));
    QVERIFY(lines.contains("  Rover waiting for GGA"));

    QVERIFY(monitor.parseSentence(GGA_FLOAT));
    lines = display.statusBlock();
    QVERIFY(lines.join('\n').contains("Rover RTK Float (5)  sats 10"));
    QVERIFY(!display.statsLine().isEmpty());
}

QTEST_GUILESS_MAIN(tst_StatusDisplay)
#include "tst_statusdisplay.moc"
