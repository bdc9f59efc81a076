#ifndef SERIALENDPOINT_H
#define SERIALENDPOINT_H

#include "Endpoint.h"

#include <atomic>
#include <mutex>

// Raw 8N1 serial port without flow control.
class SerialEndpoint : public Endpoint
{
public:
    explicit SerialEndpoint(const QString &portName);
    ~SerialEndpoint() override;

    // Relative names such as "ttyACM0" are looked up under /dev.
    bool open(int baudRate);

    // 0 means read() blocks until data arrives or the port is closed.
    void setReadTimeout(int ms);

    qint64 read(char *data, qint64 maxSize) override;
    qint64 write(const QByteArray &data) override;
    void close() override;
    bool isOpen() const override;
    QString description() const override;

    QString portName() const;
    int baudRate() const;

    static bool isSupportedBaudRate(int baudRate);

private:
    void releaseDescriptor();

    QString m_portName;
    std::atomic<int> m_fd;
    int m_baudRate;
    std::atomic<int> m_readTimeoutMs;
    std::atomic<bool> m_closed;
    std::mutex m_writeMutex;
};

#endif // SERIALENDPOINT_H
