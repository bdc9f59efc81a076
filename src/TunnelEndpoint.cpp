#include "TunnelEndpoint.h"
#include "LogCategories.h"

#include <chrono>
#include <string.h>

TunnelEndpoint::TunnelEndpoint(std::shared_ptr<SerialControlTunnel> tunnel, int maxQueuedBytes)
    : m_tunnel(std::move(tunnel)),
    m_maxQueuedBytes(maxQueuedBytes),
    m_closed(false),
    m_readTimeoutMs(1000),
    m_droppedBytes(0)
{
}

TunnelEndpoint::~TunnelEndpoint()
{
    close();
}

std::shared_ptr<TunnelEndpoint> TunnelEndpoint::attach(const std::shared_ptr<SerialControlTunnel> &tunnel)
{
    auto endpoint = std::make_shared<TunnelEndpoint>(tunnel);
    std::weak_ptr<TunnelEndpoint> weak = endpoint;
    tunnel->setDataHandler([weak](const QByteArray &data) {
        if (auto ep = weak.lock())
            ep->deliver(data);
    });
    return endpoint;
}

void TunnelEndpoint::deliver(const QByteArray &data)
{
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_closed)
            return;

        // Nobody is reading; keep the newest bytes.
        if (m_pending.size() + data.size() > m_maxQueuedBytes) {
            int overflow = m_pending.size() + data.size() - m_maxQueuedBytes;
            int drop = qMin(overflow, int(m_pending.size()));
            m_pending.remove(0, drop);
            m_droppedBytes += quint64(drop);
            qCWarning(lcTunnel) << "Tunnel inbound queue full, dropped" << drop << "bytes";
        }
        m_pending.append(data);
    }
    m_dataReady.notify_one();
}

void TunnelEndpoint::setReadTimeout(int ms)
{
    std::lock_guard<std::mutex> lk(m_mutex);
    m_readTimeoutMs = ms;
}

quint64 TunnelEndpoint::droppedBytes() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_droppedBytes;
}

qint64 TunnelEndpoint::read(char *data, qint64 maxSize)
{
    std::unique_lock<std::mutex> lk(m_mutex);

    m_dataReady.wait_for(lk, std::chrono::milliseconds(m_readTimeoutMs),
                         [this] { return m_closed || !m_pending.isEmpty(); });

    if (m_closed) {
        lk.unlock();
        setError(ClosedError, "Endpoint closed");
        return -1;
    }

    if (!m_pending.isEmpty()) {
        qint64 n = qMin<qint64>(maxSize, m_pending.size());
        memcpy(data, m_pending.constData(), size_t(n));
        m_pending.remove(0, int(n));
        return n;
    }

    lk.unlock();
    if (!m_tunnel->isLinkUp()) {
        setError(ReadError, QString("Tunnel link down: %1").arg(m_tunnel->errorString()));
        return -1;
    }
    setError(TimeoutError, "Read timed out");
    return -1;
}

qint64 TunnelEndpoint::write(const QByteArray &data)
{
    if (!isOpen()) {
        setError(ClosedError, "Endpoint closed");
        return -1;
    }

    if (!m_tunnel->send(data)) {
        setError(WriteError, m_tunnel->errorString());
        return -1;
    }
    return data.size();
}

void TunnelEndpoint::close()
{
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_closed)
            return;
        m_closed = true;
        m_pending.clear();
    }
    m_dataReady.notify_all();
}

bool TunnelEndpoint::isOpen() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return !m_closed;
}

QString TunnelEndpoint::description() const
{
    return QString("tunnel device %1").arg(int(m_tunnel->settings().device));
}
