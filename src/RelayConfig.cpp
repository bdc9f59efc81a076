#include "RelayConfig.h"
#include "LogCategories.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

#define SETTINGS_FILE_NAME "rtkrelay.ini"

QString RelayConfig::defaultPath()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath(SETTINGS_FILE_NAME);
}

quint16 RelayConfig::readIdWithFallback(QSettings &s, const QString &key, quint16 def)
{
    QVariant v = s.value(key);
    if (!v.isValid()) {
        QString alt = key;
        alt.replace("vendor-id", "vender-id");
        v = s.value(alt);
    }
    if (!v.isValid())
        return def;

    // ids are written in hex by hand more often than not
    bool ok = false;
    const QString text = v.toString().trimmed();
    uint value = text.startsWith("0x", Qt::CaseInsensitive) ? text.mid(2).toUInt(&ok, 16) : text.toUInt(&ok);
    return ok ? static_cast<quint16>(value) : def;
}

QString RelayConfig::hex16(quint16 x)
{
    return QString("0x%1").arg(QString::number(x, 16).rightJustified(4, '0'));
}

QVector<int> RelayConfig::parseTypeList(const QString &text)
{
    QVector<int> types;
    const QStringList parts = text.split(QRegularExpression("[,;\\s]+"), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        bool ok = false;
        int type = part.toInt(&ok);
        if (ok && type > 0 && !types.contains(type))
            types.append(type);
    }
    return types;
}

bool RelayConfig::parseSource(const QString &text, RelaySettings::Source *source)
{
    const QString name = text.trimmed().toLower();
    if (name == "caster")
        *source = RelaySettings::CasterSource;
    else if (name == "serial")
        *source = RelaySettings::SerialSource;
    else if (name == "tcp")
        *source = RelaySettings::TcpSource;
    else if (name == "tunnel")
        *source = RelaySettings::TunnelSource;
    else
        return false;
    return true;
}

bool RelayConfig::writeDefaults(const QString &path, QString *errorString)
{
    QFileInfo finfo(path);
    if (!QDir().mkpath(finfo.absolutePath())) {
        *errorString = QString("Failed to create directory for settings: %1").arg(finfo.absolutePath());
        return false;
    }

    const AppSettings d;
    QSettings init(path, QSettings::IniFormat);

    init.beginGroup("caster");
        init.setValue("host", d.caster.host);
        init.setValue("port", d.caster.port);
        init.setValue("mountpoint", d.caster.mountpoint);
        init.setValue("username", d.caster.username);
        init.setValue("password", d.caster.password);
        init.setValue("user_agent", d.caster.userAgent);
        init.setValue("connect_timeout_ms", d.caster.connectTimeoutMs);
        init.setValue("read_timeout_ms", d.caster.readTimeoutMs);
        init.setValue("header_limit", d.caster.headerLimit);
    init.endGroup();

    init.beginGroup("rover");
        init.setValue("port", d.rover.port);
        init.setValue("baudrate", d.rover.baudRate);
        init.setValue("device_name", d.rover.deviceName);
        init.setValue("vendor-id", hex16(d.rover.vendorId));
        init.setValue("product-id", hex16(d.rover.productId));
        init.setValue("monitor_nmea", d.rover.monitorNmea);
        init.setValue("gga_interval_s", d.rover.ggaIntervalS);
    init.endGroup();

    init.beginGroup("listener");
        init.setValue("enabled", d.listener.enabled);
        init.setValue("host", d.listener.settings.host);
        init.setValue("port", d.listener.settings.port);
        init.setValue("mode", "ntrip");     // "ntrip" or "bridge"
        init.setValue("slots", "multi");    // "multi" or "single"
        init.setValue("send_timeout_ms", d.listener.settings.sendTimeoutMs);
    init.endGroup();

    init.beginGroup("ingress");
        init.setValue("source", "caster");  // caster, serial, tcp or tunnel
        init.setValue("serial_port", d.ingress.serialPort);
        init.setValue("serial_baudrate", d.ingress.serialBaudRate);
        init.setValue("tcp_host", d.ingress.tcpHost);
        init.setValue("tcp_port", d.ingress.tcpPort);
    init.endGroup();

    init.beginGroup("tunnel");
        init.setValue("enabled", d.tunnel.enabled);
        init.setValue("link_port", d.tunnel.linkPort);
        init.setValue("link_baudrate", d.tunnel.linkBaudRate);
        init.setValue("device", int(d.tunnel.settings.device));
        init.setValue("gps_baudrate", d.tunnel.settings.baudRate);
        init.setValue("exclusive", d.tunnel.settings.exclusive);
        init.setValue("poll_interval_ms", d.tunnel.settings.pollIntervalMs);
        init.setValue("chunk_delay_ms", d.tunnel.settings.chunkDelayMs);
        init.setValue("mavlink_version", d.tunnel.settings.mavlinkVersion);
        init.setValue("system_id", int(d.tunnel.settings.systemId));
        init.setValue("component_id", int(d.tunnel.settings.componentId));
        init.setValue("heartbeat_timeout_ms", d.tunnel.heartbeatTimeoutMs);
        init.setValue("bridge_enabled", d.tunnel.bridgeEnabled);
        init.setValue("bridge_host", d.tunnel.bridgeHost);
        init.setValue("bridge_port", d.tunnel.bridgePort);
        init.setValue("commands", QString());   // separated by |
    init.endGroup();

    init.beginGroup("rtcm");
        init.setValue("verify_crc", d.rtcm.verifyCrc);
        init.setValue("garbage_limit", d.rtcm.garbageLimit);
        init.setValue("expected_types", QString());
    init.endGroup();

    init.beginGroup("display");
        init.setValue("interval_ms", d.display.intervalMs);
        init.setValue("stats_interval_s", d.display.statsIntervalS);
    init.endGroup();

    init.beginGroup("log");
        init.setValue("directory", d.log.directory);
        init.setValue("debug", d.log.debug);
    init.endGroup();

    init.sync();
    if (init.status() != QSettings::NoError) {
        *errorString = QString("Failed to write settings: %1").arg(path);
        return false;
    }
    return true;
}

static QString joinedValue(QSettings &s, const QString &key)
{
    // INI values with commas come back as lists
    return s.value(key).toStringList().join(',');
}

bool RelayConfig::load(const QString &path, AppSettings *settings, QString *errorString)
{
    if (!QFile::exists(path)) {
        if (!writeDefaults(path, errorString))
            return false;
        qCInfo(lcApp).noquote() << "Created settings file" << path;
    }

    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        *errorString = QString("Failed to open settings: %1").arg(path);
        return false;
    }

    AppSettings out;

    CasterSettings &caster = out.caster;
    caster.host = s.value("caster/host", caster.host).toString();
    caster.port = static_cast<quint16>(s.value("caster/port", caster.port).toUInt());
    caster.mountpoint = s.value("caster/mountpoint", caster.mountpoint).toString();
    caster.username = s.value("caster/username", caster.username).toString();
    caster.password = s.value("caster/password", caster.password).toString();
    caster.userAgent = s.value("caster/user_agent", caster.userAgent).toString();
    caster.connectTimeoutMs = s.value("caster/connect_timeout_ms", caster.connectTimeoutMs).toInt();
    caster.readTimeoutMs = s.value("caster/read_timeout_ms", caster.readTimeoutMs).toInt();
    caster.headerLimit = s.value("caster/header_limit", caster.headerLimit).toInt();

    RoverConfig &rover = out.rover;
    rover.port = s.value("rover/port", rover.port).toString();
    rover.baudRate = s.value("rover/baudrate", rover.baudRate).toInt();
    rover.deviceName = s.value("rover/device_name", rover.deviceName).toString();
    rover.vendorId = readIdWithFallback(s, "rover/vendor-id", rover.vendorId);
    rover.productId = readIdWithFallback(s, "rover/product-id", rover.productId);
    rover.monitorNmea = s.value("rover/monitor_nmea", rover.monitorNmea).toBool();
    rover.ggaIntervalS = s.value("rover/gga_interval_s", rover.ggaIntervalS).toInt();

    ListenerConfig &listener = out.listener;
    listener.enabled = s.value("listener/enabled", listener.enabled).toBool();
    listener.settings.host = s.value("listener/host", listener.settings.host).toString();
    listener.settings.port = static_cast<quint16>(s.value("listener/port", listener.settings.port).toUInt());
    listener.settings.sendTimeoutMs = s.value("listener/send_timeout_ms", listener.settings.sendTimeoutMs).toInt();

    const QString mode = s.value("listener/mode", "ntrip").toString().toLower();
    if (mode == "ntrip") {
        listener.settings.mode = ListenerSettings::NtripCaster;
    } else if (mode == "bridge") {
        listener.settings.mode = ListenerSettings::RawBridge;
    } else {
        *errorString = QString("Invalid listener/mode: %1").arg(mode);
        return false;
    }

    const QString slotMode = s.value("listener/slots", "multi").toString().toLower();
    if (slotMode == "multi") {
        listener.slotMode = SubscriberRegistry::MultiSlot;
    } else if (slotMode == "single") {
        listener.slotMode = SubscriberRegistry::SingleSlot;
    } else {
        *errorString = QString("Invalid listener/slots: %1").arg(slotMode);
        return false;
    }

    IngressConfig &ingress = out.ingress;
    const QString source = s.value("ingress/source", "caster").toString();
    if (!parseSource(source, &ingress.source)) {
        *errorString = QString("Invalid ingress/source: %1").arg(source);
        return false;
    }
    ingress.serialPort = s.value("ingress/serial_port", ingress.serialPort).toString();
    ingress.serialBaudRate = s.value("ingress/serial_baudrate", ingress.serialBaudRate).toInt();
    ingress.tcpHost = s.value("ingress/tcp_host", ingress.tcpHost).toString();
    ingress.tcpPort = static_cast<quint16>(s.value("ingress/tcp_port", ingress.tcpPort).toUInt());

    TunnelConfig &tunnel = out.tunnel;
    tunnel.enabled = s.value("tunnel/enabled", tunnel.enabled).toBool();
    tunnel.linkPort = s.value("tunnel/link_port", tunnel.linkPort).toString();
    tunnel.linkBaudRate = s.value("tunnel/link_baudrate", tunnel.linkBaudRate).toInt();
    tunnel.settings.device = static_cast<quint8>(s.value("tunnel/device", int(tunnel.settings.device)).toUInt());
    tunnel.settings.baudRate = s.value("tunnel/gps_baudrate", tunnel.settings.baudRate).toUInt();
    tunnel.settings.exclusive = s.value("tunnel/exclusive", tunnel.settings.exclusive).toBool();
    tunnel.settings.pollIntervalMs = s.value("tunnel/poll_interval_ms", tunnel.settings.pollIntervalMs).toInt();
    tunnel.settings.chunkDelayMs = s.value("tunnel/chunk_delay_ms", tunnel.settings.chunkDelayMs).toInt();
    tunnel.settings.mavlinkVersion = s.value("tunnel/mavlink_version", tunnel.settings.mavlinkVersion).toInt();
    tunnel.settings.systemId = static_cast<quint8>(s.value("tunnel/system_id", int(tunnel.settings.systemId)).toUInt());
    tunnel.settings.componentId = static_cast<quint8>(s.value("tunnel/component_id", int(tunnel.settings.componentId)).toUInt());
    tunnel.heartbeatTimeoutMs = s.value("tunnel/heartbeat_timeout_ms", tunnel.heartbeatTimeoutMs).toInt();
    tunnel.bridgeEnabled = s.value("tunnel/bridge_enabled", tunnel.bridgeEnabled).toBool();
    tunnel.bridgeHost = s.value("tunnel/bridge_host", tunnel.bridgeHost).toString();
    tunnel.bridgePort = static_cast<quint16>(s.value("tunnel/bridge_port", tunnel.bridgePort).toUInt());

    const QStringList commands = joinedValue(s, "tunnel/commands").split('|', Qt::SkipEmptyParts);
    for (const QString &command : commands) {
        if (!command.trimmed().isEmpty())
            tunnel.commands.append(command.trimmed());
    }

    if (tunnel.settings.mavlinkVersion != 1 && tunnel.settings.mavlinkVersion != 2) {
        *errorString = QString("Invalid tunnel/mavlink_version: %1").arg(tunnel.settings.mavlinkVersion);
        return false;
    }

    RtcmConfig &rtcm = out.rtcm;
    rtcm.verifyCrc = s.value("rtcm/verify_crc", rtcm.verifyCrc).toBool();
    rtcm.garbageLimit = s.value("rtcm/garbage_limit", rtcm.garbageLimit).toInt();
    rtcm.expectedTypes = parseTypeList(joinedValue(s, "rtcm/expected_types"));

    DisplayConfig &display = out.display;
    display.intervalMs = s.value("display/interval_ms", display.intervalMs).toInt();
    display.statsIntervalS = s.value("display/stats_interval_s", display.statsIntervalS).toInt();

    LogConfig &log = out.log;
    log.directory = s.value("log/directory", log.directory).toString();
    log.debug = s.value("log/debug", log.debug).toBool();

    *settings = out;
    return true;
}
