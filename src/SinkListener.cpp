#include "SinkListener.h"
#include "LogCategories.h"

#define REQUEST_READ_SIZE 4096
#define CLIENT_READ_SIZE 2048

SinkListener::SinkListener(SubscriberRegistry *registry, const ListenerSettings &settings)
    : m_registry(registry),
    m_settings(settings),
    m_running(false)
{
}

SinkListener::~SinkListener()
{
    stop();
}

QByteArray SinkListener::casterResponse()
{
    return QByteArrayLiteral("ICY 200 OK\r\n\r\n");
}

bool SinkListener::start()
{
    if (m_running)
        return true;

    if (!m_listener.listen(m_settings.host, m_settings.port))
        return false;

    m_running = true;
    m_acceptThread = std::thread(&SinkListener::acceptLoop, this);

    qCInfo(lcListener).noquote() << QString("%1 listening on %2:%3")
                                        .arg(m_settings.mode == ListenerSettings::NtripCaster
                                                 ? QString("NTRIP server") : QString("TCP bridge"))
                                        .arg(m_settings.host).arg(m_listener.serverPort());
    return true;
}

void SinkListener::stop()
{
    m_running = false;
    m_listener.close();
    if (m_acceptThread.joinable())
        m_acceptThread.join();

    std::list<Connection> connections;
    {
        std::lock_guard<std::mutex> lk(m_connectionsMutex);
        connections.swap(m_connections);
    }

    for (Connection &conn : connections)
        conn.endpoint->close();
    for (Connection &conn : connections) {
        if (conn.thread.joinable())
            conn.thread.join();
    }
}

void SinkListener::setClientDataHandler(ClientDataHandler handler)
{
    std::lock_guard<std::mutex> lk(m_handlerMutex);
    m_handler = std::move(handler);
}

quint16 SinkListener::serverPort() const
{
    return m_listener.serverPort();
}

QString SinkListener::errorString() const
{
    return m_listener.errorString();
}

int SinkListener::activeConnections() const
{
    std::lock_guard<std::mutex> lk(m_connectionsMutex);
    int active = 0;
    for (const Connection &conn : m_connections) {
        if (!*conn.done)
            ++active;
    }
    return active;
}

void SinkListener::pruneFinished()
{
    std::lock_guard<std::mutex> lk(m_connectionsMutex);
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if (*it->done) {
            if (it->thread.joinable())
                it->thread.join();
            it = m_connections.erase(it);
        } else {
            ++it;
        }
    }
}

void SinkListener::acceptLoop()
{
    while (m_running) {
        std::shared_ptr<TcpEndpoint> endpoint = m_listener.accept();
        if (!endpoint)
            break;

        qCInfo(lcListener) << "Client connected from" << endpoint->description();
        endpoint->setNoDelay(true);
        endpoint->setWriteTimeout(m_settings.sendTimeoutMs);

        pruneFinished();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lk(m_connectionsMutex);
        if (!m_running) {
            endpoint->close();
            break;
        }
        Connection conn;
        conn.endpoint = endpoint;
        conn.done = done;
        conn.thread = std::thread(&SinkListener::serveClient, this, endpoint, done);
        m_connections.push_back(std::move(conn));
    }
}

bool SinkListener::answerRequest(const std::shared_ptr<TcpEndpoint> &endpoint)
{
    endpoint->setReadTimeout(m_settings.requestTimeoutMs);

    char buf[REQUEST_READ_SIZE];
    qint64 n = endpoint->read(buf, sizeof(buf));
    if (n < 0) {
        qCWarning(lcListener).noquote() << QString("No request from %1: %2")
                                               .arg(endpoint->description(), endpoint->errorString());
        return false;
    }

    if (n > 0) {
        QByteArray request(buf, int(n));
        qCInfo(lcListener).noquote() << QString("Client %1 request: %2")
                                            .arg(endpoint->description(),
                                                 QString::fromLatin1(request.left(request.indexOf('\r'))));
    }

    if (endpoint->write(casterResponse()) < 0) {
        qCWarning(lcListener).noquote() << QString("Error sending response to %1: %2")
                                               .arg(endpoint->description(), endpoint->errorString());
        return false;
    }

    endpoint->setReadTimeout(0);
    return true;
}

void SinkListener::serveClient(std::shared_ptr<TcpEndpoint> endpoint, std::shared_ptr<std::atomic<bool>> done)
{
    if (m_settings.mode == ListenerSettings::NtripCaster && !answerRequest(endpoint)) {
        endpoint->close();
        *done = true;
        return;
    }

    const int id = m_registry->registerSink(endpoint);

    char buf[CLIENT_READ_SIZE];
    for (;;) {
        qint64 n = endpoint->read(buf, sizeof(buf));
        if (n <= 0)
            break;

        ClientDataHandler handler;
        {
            std::lock_guard<std::mutex> lk(m_handlerMutex);
            handler = m_handler;
        }
        if (handler)
            handler(QByteArray(buf, int(n)));
    }

    m_registry->remove(id);
    endpoint->close();
    *done = true;
}
