#include "TcpListener.h"
#include "LogCategories.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

TcpListener::TcpListener()
    : m_fd(-1),
    m_closed(true),
    m_port(0)
{
}

TcpListener::~TcpListener()
{
    close();
    releaseSocket();
}

void TcpListener::releaseSocket()
{
    int fd = m_fd.exchange(-1);
    if (fd >= 0)
        ::close(fd);
}

void TcpListener::setErrorString(const QString &errorString)
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    m_errorString = errorString;
}

bool TcpListener::listen(const QString &host, quint16 port, int backlog)
{
    if (!m_closed) {
        setErrorString("Already listening");
        return false;
    }
    releaseSocket();

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    const QByteArray hostName = host.toUtf8();
    const QByteArray service = QByteArray::number(port);
    int rc = getaddrinfo(host.isEmpty() ? nullptr : hostName.constData(), service.constData(), &hints, &res);
    if (rc != 0) {
        setErrorString(QString("getaddrinfo %1: %2").arg(host, QString::fromLocal8Bit(gai_strerror(rc))));
        return false;
    }

    int fd = -1;
    for (struct addrinfo *p = res; p; p = p->ai_next) {
        fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0)
            continue;

        int reuse = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (::bind(fd, p->ai_addr, p->ai_addrlen) == 0 && ::listen(fd, backlog) == 0)
            break;

        setErrorString(QString("Unable to listen on %1:%2: %3").arg(host).arg(port)
                           .arg(QString::fromLocal8Bit(strerror(errno))));
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd < 0)
        return false;

    struct sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<struct sockaddr *>(&bound), &len) == 0) {
        if (bound.ss_family == AF_INET)
            m_port = ntohs(reinterpret_cast<struct sockaddr_in *>(&bound)->sin_port);
        else if (bound.ss_family == AF_INET6)
            m_port = ntohs(reinterpret_cast<struct sockaddr_in6 *>(&bound)->sin6_port);
    }

    m_fd = fd;
    m_address = host;
    m_closed = false;
    qCInfo(lcListener).noquote() << QString("Listening on %1:%2").arg(host).arg(m_port);
    return true;
}

std::shared_ptr<TcpEndpoint> TcpListener::accept()
{
    for (;;) {
        if (m_closed)
            return nullptr;

        struct sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int fd = ::accept(m_fd, reinterpret_cast<struct sockaddr *>(&addr), &len);
        if (fd < 0) {
            if (errno == EINTR)
                continue;
            if (!m_closed) {
                const QString error = QString("Accept error: %1").arg(QString::fromLocal8Bit(strerror(errno)));
                setErrorString(error);
                qCWarning(lcListener).noquote() << error;
            }
            return nullptr;
        }

        char host[NI_MAXHOST] = {0};
        char serv[NI_MAXSERV] = {0};
        QString peer = "unknown";
        if (getnameinfo(reinterpret_cast<struct sockaddr *>(&addr), len, host, sizeof(host),
                        serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) == 0)
            peer = QString("%1:%2").arg(QString::fromLatin1(host), QString::fromLatin1(serv));

        return std::make_shared<TcpEndpoint>(fd, peer);
    }
}

void TcpListener::close()
{
    if (m_closed.exchange(true))
        return;

    // shutdown() makes a blocked accept() return on Linux. The descriptor
    // itself is released by the destructor or the next listen().
    ::shutdown(m_fd, SHUT_RDWR);
    qCDebug(lcListener).noquote() << QString("Stopped listening on %1:%2").arg(m_address).arg(m_port);
}

bool TcpListener::isListening() const
{
    return !m_closed;
}

quint16 TcpListener::serverPort() const
{
    return m_port;
}

QString TcpListener::errorString() const
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    return m_errorString;
}
