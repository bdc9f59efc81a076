#ifndef RELAYCONFIG_H
#define RELAYCONFIG_H

#include "Relay.h"
#include "SerialControlTunnel.h"
#include "SinkListener.h"
#include "SubscriberRegistry.h"
#include "ntripclient.h"

#include <QSettings>
#include <QString>
#include <QStringList>
#include <QVector>

struct RoverConfig
{
    QString port = "AUTO";      // AUTO resolves through the USB ids or device_name
    int baudRate = 115200;
    QString deviceName;
    quint16 vendorId = 0x1546;
    quint16 productId = 0x01a9;
    bool monitorNmea = true;
    int ggaIntervalS = 0;
};

struct ListenerConfig
{
    bool enabled = true;
    ListenerSettings settings;
    SubscriberRegistry::SlotMode slotMode = SubscriberRegistry::MultiSlot;
};

struct IngressConfig
{
    RelaySettings::Source source = RelaySettings::CasterSource;
    QString serialPort;
    int serialBaudRate = 115200;
    QString tcpHost = "127.0.0.1";
    quint16 tcpPort = 5001;
};

struct TunnelConfig
{
    bool enabled = false;
    QString linkPort = "ttyUSB0";
    int linkBaudRate = 9600;
    TunnelSettings settings;
    int heartbeatTimeoutMs = 10000;
    bool bridgeEnabled = false;
    QString bridgeHost = "127.0.0.1";
    quint16 bridgePort = 5000;
    QStringList commands;
};

struct RtcmConfig
{
    bool verifyCrc = true;
    int garbageLimit = 1024;
    QVector<int> expectedTypes;
};

struct DisplayConfig
{
    int intervalMs = 500;
    int statsIntervalS = 5;
};

struct LogConfig
{
    QString directory = "logs";
    bool debug = false;
};

struct AppSettings
{
    CasterSettings caster;
    RoverConfig rover;
    ListenerConfig listener;
    IngressConfig ingress;
    TunnelConfig tunnel;
    RtcmConfig rtcm;
    DisplayConfig display;
    LogConfig log;
};

// rtkrelay.ini handling. Missing files are created with every default.
class RelayConfig
{
public:
    static QString defaultPath();

    static bool writeDefaults(const QString &path, QString *errorString);
    static bool load(const QString &path, AppSettings *settings, QString *errorString);

    // Accepts the old "vender-id" spelling.
    static quint16 readIdWithFallback(QSettings &s, const QString &key, quint16 def = 0);
    static QString hex16(quint16 x);

    static QVector<int> parseTypeList(const QString &text);
    static bool parseSource(const QString &text, RelaySettings::Source *source);
};

#endif // RELAYCONFIG_H
