#ifndef TCPENDPOINT_H
#define TCPENDPOINT_H

#include "Endpoint.h"

#include <atomic>
#include <memory>

class TcpEndpoint : public Endpoint
{
public:
    // Takes ownership of a connected socket descriptor.
    TcpEndpoint(int fd, const QString &peer);
    ~TcpEndpoint() override;

    // Resolves host and connects within timeoutMs. Returns nullptr on failure
    // or as soon as *abort becomes true.
    static std::shared_ptr<TcpEndpoint> connectToHost(const QString &host, quint16 port,
                                                      int timeoutMs, QString *errorString,
                                                      const std::atomic<bool> *abort = nullptr);

    // 0 disables the timeout.
    bool setReadTimeout(int ms);
    bool setWriteTimeout(int ms);
    bool setNoDelay(bool enabled);

    // Stays valid after close() until the endpoint is destroyed.
    int socketDescriptor() const;

    qint64 read(char *data, qint64 maxSize) override;
    qint64 write(const QByteArray &data) override;
    void close() override;
    bool isOpen() const override;
    QString description() const override;

private:
    bool setTimeout(int option, int ms);

    int m_fd;
    std::atomic<bool> m_closed;
    QString m_peer;
};

#endif // TCPENDPOINT_H
