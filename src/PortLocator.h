#ifndef PORTLOCATOR_H
#define PORTLOCATOR_H

#include <QString>
#include <QStringList>

// Serial port lookup through QSerialPortInfo.
class PortLocator
{
public:
    static QString findPortByUsbIds(quint16 vendorId, quint16 productId);
    static QString findPortByDescription(const QString &deviceName);

    // USB ids first, then a case-insensitive match on the description.
    static QString resolve(quint16 vendorId, quint16 productId, const QString &deviceName);

    static QStringList describePorts();
};

#endif // PORTLOCATOR_H
