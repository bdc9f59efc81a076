#include "TcpEndpoint.h"
#include "LogCategories.h"

#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <QElapsedTimer>

#define CONNECT_POLL_SLICE_MS 100

static QString systemError(int err)
{
    return QString::fromLocal8Bit(strerror(err));
}

// Non-blocking connect bounded by timeoutMs, then back to blocking mode.
// The wait runs in slices so a set abort flag cancels it.
static bool connectWithTimeout(int fd, const struct sockaddr *addr, socklen_t len,
                               int timeoutMs, const std::atomic<bool> *abort, int *err)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        *err = errno;
        return false;
    }

    int rc = ::connect(fd, addr, len);
    if (rc < 0 && errno != EINPROGRESS) {
        *err = errno;
        return false;
    }

    if (rc < 0) {
        QElapsedTimer timer;
        timer.start();
        struct pollfd pfd { fd, POLLOUT, 0 };
        for (;;) {
            if (abort && *abort) {
                *err = ECANCELED;
                return false;
            }

            int slice = CONNECT_POLL_SLICE_MS;
            if (timeoutMs > 0) {
                const qint64 remaining = timeoutMs - timer.elapsed();
                if (remaining <= 0) {
                    *err = ETIMEDOUT;
                    return false;
                }
                slice = int(qMin<qint64>(slice, remaining));
            }

            rc = ::poll(&pfd, 1, slice);
            if (rc > 0)
                break;
            if (rc < 0 && errno != EINTR) {
                *err = errno;
                return false;
            }
        }

        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0) {
            *err = errno;
            return false;
        }
        if (soError != 0) {
            *err = soError;
            return false;
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        *err = errno;
        return false;
    }
    return true;
}

TcpEndpoint::TcpEndpoint(int fd, const QString &peer)
    : m_fd(fd),
    m_closed(fd < 0),
    m_peer(peer)
{
}

TcpEndpoint::~TcpEndpoint()
{
    close();
    if (m_fd >= 0)
        ::close(m_fd);
}

std::shared_ptr<TcpEndpoint> TcpEndpoint::connectToHost(const QString &host, quint16 port,
                                                        int timeoutMs, QString *errorString,
                                                        const std::atomic<bool> *abort)
{
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const QByteArray hostName = host.toUtf8();
    const QByteArray service = QByteArray::number(port);
    int rc = getaddrinfo(hostName.constData(), service.constData(), &hints, &res);
    if (rc != 0) {
        if (errorString)
            *errorString = QString("getaddrinfo %1: %2").arg(host, QString::fromLocal8Bit(gai_strerror(rc)));
        return nullptr;
    }

    int lastError = 0;
    for (struct addrinfo *p = res; p; p = p->ai_next) {
        int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) {
            lastError = errno;
            continue;
        }

        if (connectWithTimeout(fd, p->ai_addr, p->ai_addrlen, timeoutMs, abort, &lastError)) {
            freeaddrinfo(res);
            auto endpoint = std::make_shared<TcpEndpoint>(fd, QString("%1:%2").arg(host).arg(port));
            qCDebug(lcEndpoint) << "Connected to" << endpoint->description();
            return endpoint;
        }
        ::close(fd);
        if (lastError == ECANCELED)
            break;
    }
    freeaddrinfo(res);

    if (errorString)
        *errorString = QString("Unable to connect to %1:%2: %3").arg(host).arg(port).arg(systemError(lastError));
    return nullptr;
}

bool TcpEndpoint::setTimeout(int option, int ms)
{
    if (m_closed)
        return false;

    struct timeval tv { ms / 1000, (ms % 1000) * 1000 };
    if (setsockopt(m_fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        qCWarning(lcEndpoint) << "setsockopt failed on" << m_peer << ":" << systemError(errno);
        return false;
    }
    return true;
}

bool TcpEndpoint::setReadTimeout(int ms)
{
    return setTimeout(SO_RCVTIMEO, ms);
}

bool TcpEndpoint::setWriteTimeout(int ms)
{
    return setTimeout(SO_SNDTIMEO, ms);
}

bool TcpEndpoint::setNoDelay(bool enabled)
{
    if (m_closed)
        return false;

    int flag = enabled ? 1 : 0;
    return setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
}

int TcpEndpoint::socketDescriptor() const
{
    return m_fd;
}

qint64 TcpEndpoint::read(char *data, qint64 maxSize)
{
    if (m_closed) {
        setError(ClosedError, "Endpoint closed");
        return -1;
    }

    for (;;) {
        ssize_t n = ::recv(m_fd, data, static_cast<size_t>(maxSize), 0);
        if (n > 0)
            return n;

        if (n == 0) {
            if (m_closed) {
                setError(ClosedError, "Endpoint closed");
                return -1;
            }
            return 0;
        }

        if (errno == EINTR)
            continue;

        if (m_closed) {
            setError(ClosedError, "Endpoint closed");
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            setError(TimeoutError, "Read timed out");
        } else {
            setError(ReadError, QString("Recv error: %1").arg(systemError(errno)));
        }
        return -1;
    }
}

qint64 TcpEndpoint::write(const QByteArray &data)
{
    if (m_closed) {
        setError(ClosedError, "Endpoint closed");
        return -1;
    }

    qint64 offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::send(m_fd, data.constData() + offset, static_cast<size_t>(data.size() - offset),
                           MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;

            if (m_closed)
                setError(ClosedError, "Endpoint closed");
            else if (errno == EAGAIN || errno == EWOULDBLOCK)
                setError(TimeoutError, "Write timed out");
            else
                setError(WriteError, QString("Send error: %1").arg(systemError(errno)));
            return -1;
        }
        offset += n;
    }
    return offset;
}

void TcpEndpoint::close()
{
    if (m_closed.exchange(true))
        return;

    // shutdown() wakes up a recv()/send() blocked in another thread. The
    // descriptor stays allocated until the destructor so its number cannot be
    // reused under a thread that is still about to call recv() or send().
    ::shutdown(m_fd, SHUT_RDWR);
    qCDebug(lcEndpoint) << "Closed" << m_peer;
}

bool TcpEndpoint::isOpen() const
{
    return !m_closed;
}

QString TcpEndpoint::description() const
{
    return m_peer;
}
