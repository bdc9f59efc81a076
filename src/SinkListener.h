#ifndef SINKLISTENER_H
#define SINKLISTENER_H

#include "SubscriberRegistry.h"
#include "TcpListener.h"

#include <QString>

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

struct ListenerSettings
{
    enum Mode {
        NtripCaster,    // answers the client's request with ICY 200 OK
        RawBridge       // plain TCP, no handshake
    };

    QString host = "127.0.0.1";
    quint16 port = 8888;
    Mode mode = NtripCaster;
    int sendTimeoutMs = 5000;
    int requestTimeoutMs = 5000;
};

// Accepts egress connections and registers them with a registry. Each
// connection gets a keep-alive thread that notices when the peer goes away.
class SinkListener
{
public:
    using ClientDataHandler = std::function<void(const QByteArray &)>;

    SinkListener(SubscriberRegistry *registry, const ListenerSettings &settings);
    ~SinkListener();

    SinkListener(const SinkListener &) = delete;
    SinkListener &operator=(const SinkListener &) = delete;

    bool start();
    void stop();

    // Bytes sent by a connected client, e.g. a bridge client feeding the tunnel.
    void setClientDataHandler(ClientDataHandler handler);

    quint16 serverPort() const;
    QString errorString() const;
    int activeConnections() const;

    static QByteArray casterResponse();

private:
    struct Connection
    {
        std::shared_ptr<TcpEndpoint> endpoint;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    void acceptLoop();
    void serveClient(std::shared_ptr<TcpEndpoint> endpoint, std::shared_ptr<std::atomic<bool>> done);
    bool answerRequest(const std::shared_ptr<TcpEndpoint> &endpoint);
    void pruneFinished();

    SubscriberRegistry *m_registry;
    ListenerSettings m_settings;
    TcpListener m_listener;

    std::thread m_acceptThread;
    std::atomic<bool> m_running;

    mutable std::mutex m_connectionsMutex;
    std::list<Connection> m_connections;

    std::mutex m_handlerMutex;
    ClientDataHandler m_handler;
};

#endif // SINKLISTENER_H
