#ifndef TUNNELENDPOINT_H
#define TUNNELENDPOINT_H

#include "Endpoint.h"
#include "SerialControlTunnel.h"

#include <condition_variable>
#include <memory>
#include <mutex>

// Inbound side of a SerialControlTunnel as a readable Endpoint. Writes go
// out through the tunnel. close() only affects this endpoint, the tunnel
// keeps running until its owner stops it.
class TunnelEndpoint : public Endpoint
{
public:
    explicit TunnelEndpoint(std::shared_ptr<SerialControlTunnel> tunnel, int maxQueuedBytes = 1 << 20);
    ~TunnelEndpoint() override;

    // Creates an endpoint and installs it as the tunnel's data handler.
    static std::shared_ptr<TunnelEndpoint> attach(const std::shared_ptr<SerialControlTunnel> &tunnel);

    void deliver(const QByteArray &data);
    void setReadTimeout(int ms);
    quint64 droppedBytes() const;

    qint64 read(char *data, qint64 maxSize) override;
    qint64 write(const QByteArray &data) override;
    void close() override;
    bool isOpen() const override;
    QString description() const override;

private:
    std::shared_ptr<SerialControlTunnel> m_tunnel;
    const int m_maxQueuedBytes;

    mutable std::mutex m_mutex;
    std::condition_variable m_dataReady;
    QByteArray m_pending;
    bool m_closed;
    int m_readTimeoutMs;
    quint64 m_droppedBytes;
};

#endif // TUNNELENDPOINT_H
