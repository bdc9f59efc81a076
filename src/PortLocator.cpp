#include "PortLocator.h"
#include "LogCategories.h"
#include "RelayConfig.h"

#include <QSerialPortInfo>

QString PortLocator::findPortByUsbIds(quint16 vendorId, quint16 productId)
{
    for (const QSerialPortInfo &info : QSerialPortInfo::availablePorts()) {
        if (info.hasVendorIdentifier() && info.hasProductIdentifier()) {
            if (info.vendorIdentifier() == vendorId && info.productIdentifier() == productId) {
                return info.portName();
            }
        }
    }
    return {};
}

QString PortLocator::findPortByDescription(const QString &deviceName)
{
    if (deviceName.isEmpty())
        return {};

    for (const QSerialPortInfo &info : QSerialPortInfo::availablePorts()) {
        if (info.description().contains(deviceName, Qt::CaseInsensitive))
            return info.portName();
    }
    return {};
}

QString PortLocator::resolve(quint16 vendorId, quint16 productId, const QString &deviceName)
{
    QString port;
    if (vendorId != 0 || productId != 0) {
        port = findPortByUsbIds(vendorId, productId);
        if (!port.isEmpty()) {
            qCInfo(lcApp).noquote() << QString("Found %1 by USB id (VID=%2 PID=%3)")
                                           .arg(port, RelayConfig::hex16(vendorId), RelayConfig::hex16(productId));
            return port;
        }
    }

    port = findPortByDescription(deviceName);
    if (!port.isEmpty())
        qCInfo(lcApp).noquote() << QString("Found %1 matching \"%2\"").arg(port, deviceName);
    return port;
}

QStringList PortLocator::describePorts()
{
    QStringList lines;
    for (const QSerialPortInfo &info : QSerialPortInfo::availablePorts()) {
        QString line = QString("%1  %2").arg(info.portName(), -12).arg(info.description());
        if (info.hasVendorIdentifier() && info.hasProductIdentifier())
            line += QString("  [VID=%1 PID=%2]").arg(RelayConfig::hex16(info.vendorIdentifier()),
                                                     RelayConfig::hex16(info.productIdentifier()));
        if (!info.manufacturer().isEmpty())
            line += "  " + info.manufacturer();
        lines.append(line);
    }
    return lines;
}
