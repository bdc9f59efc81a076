#include "SerialEndpoint.h"
#include "LogCategories.h"

#include <QElapsedTimer>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#define POLL_SLICE_MS 100
#define WRITE_TIMEOUT_MS 2000

static bool speedForBaudRate(int baudRate, speed_t *speed)
{
    switch (baudRate) {
    case 9600: *speed = B9600; return true;
    case 19200: *speed = B19200; return true;
    case 38400: *speed = B38400; return true;
    case 57600: *speed = B57600; return true;
    case 115200: *speed = B115200; return true;
    case 230400: *speed = B230400; return true;
    case 460800: *speed = B460800; return true;
    case 921600: *speed = B921600; return true;
    default: return false;
    }
}

SerialEndpoint::SerialEndpoint(const QString &portName)
    : m_portName(portName),
    m_fd(-1),
    m_baudRate(0),
    m_readTimeoutMs(0),
    m_closed(true)
{
}

SerialEndpoint::~SerialEndpoint()
{
    close();
    releaseDescriptor();
}

void SerialEndpoint::releaseDescriptor()
{
    int fd = m_fd.exchange(-1);
    if (fd >= 0)
        ::close(fd);
}

bool SerialEndpoint::isSupportedBaudRate(int baudRate)
{
    speed_t speed;
    return speedForBaudRate(baudRate, &speed);
}

bool SerialEndpoint::open(int baudRate)
{
    if (!m_closed) {
        setError(ConnectError, "Serial port already open");
        return false;
    }

    speed_t speed;
    if (!speedForBaudRate(baudRate, &speed)) {
        setError(ConnectError, QString("Unsupported baud rate %1").arg(baudRate));
        return false;
    }
    releaseDescriptor();

    QString device = m_portName;
    if (!device.startsWith('/'))
        device.prepend("/dev/");

    int fd = ::open(device.toLocal8Bit().constData(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        setError(ConnectError, QString("Failed to open serial port %1: %2")
                                   .arg(device, QString::fromLocal8Bit(strerror(errno))));
        return false;
    }

    struct termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
        setError(ConnectError, QString("tcgetattr failed: %1").arg(QString::fromLocal8Bit(strerror(errno))));
        ::close(fd);
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag |= CREAD | CLOCAL;
    tio.c_cflag &= ~CSIZE;
    tio.c_cflag |= CS8;
    tio.c_cflag &= ~PARENB;
    tio.c_cflag &= ~CSTOPB;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    tcflush(fd, TCIFLUSH);
    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        setError(ConnectError, QString("tcsetattr failed: %1").arg(QString::fromLocal8Bit(strerror(errno))));
        ::close(fd);
        return false;
    }

    m_fd = fd;
    m_baudRate = baudRate;
    m_closed = false;
    setError(NoError, QString());
    qCInfo(lcEndpoint).noquote() << QString("Opened serial port %1 at %2 baud").arg(device).arg(baudRate);
    return true;
}

void SerialEndpoint::setReadTimeout(int ms)
{
    m_readTimeoutMs = ms;
}

// The descriptor is non-blocking; poll() in short slices so close() from
// another thread is noticed promptly.
qint64 SerialEndpoint::read(char *data, qint64 maxSize)
{
    QElapsedTimer timer;
    timer.start();

    while (!m_closed) {
        struct pollfd pfd { m_fd, POLLIN, 0 };
        int rc = ::poll(&pfd, 1, POLL_SLICE_MS);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }

        if (rc > 0) {
            if (pfd.revents & (POLLERR | POLLNVAL)) {
                setError(ReadError, QString("Serial port %1 reported an error").arg(m_portName));
                return -1;
            }

            ssize_t n = ::read(m_fd, data, static_cast<size_t>(maxSize));
            if (n > 0)
                return n;
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                if (m_closed)
                    break;
                setError(ReadError, QString("Serial read error: %1").arg(QString::fromLocal8Bit(strerror(errno))));
                return -1;
            }
            // Readable with no data means the device went away.
            if (n == 0 && (pfd.revents & POLLHUP))
                return 0;
        }

        int timeout = m_readTimeoutMs;
        if (timeout > 0 && timer.elapsed() >= timeout) {
            setError(TimeoutError, "Read timed out");
            return -1;
        }
    }

    setError(ClosedError, "Endpoint closed");
    return -1;
}

qint64 SerialEndpoint::write(const QByteArray &data)
{
    std::lock_guard<std::mutex> lk(m_writeMutex);

    qint64 offset = 0;
    while (offset < data.size()) {
        if (m_closed) {
            setError(ClosedError, "Endpoint closed");
            return -1;
        }

        ssize_t n = ::write(m_fd, data.constData() + offset, static_cast<size_t>(data.size() - offset));
        if (n > 0) {
            offset += n;
            continue;
        }

        if (n < 0 && errno == EINTR)
            continue;

        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            setError(WriteError, QString("Serial write error: %1").arg(QString::fromLocal8Bit(strerror(errno))));
            return -1;
        }

        struct pollfd pfd { m_fd, POLLOUT, 0 };
        int rc = ::poll(&pfd, 1, WRITE_TIMEOUT_MS);
        if (rc == 0) {
            setError(TimeoutError, "Write timed out");
            return -1;
        }
        if (rc < 0 && errno != EINTR) {
            setError(WriteError, QString("Serial poll error: %1").arg(QString::fromLocal8Bit(strerror(errno))));
            return -1;
        }
    }
    return offset;
}

void SerialEndpoint::close()
{
    if (m_closed.exchange(true))
        return;

    // Readers notice m_closed within one poll slice, writers after their
    // current poll. The descriptor is released by the destructor or open().
    qCInfo(lcEndpoint).noquote() << QString("Closed serial port %1").arg(m_portName);
}

bool SerialEndpoint::isOpen() const
{
    return !m_closed;
}

QString SerialEndpoint::description() const
{
    return m_portName;
}

QString SerialEndpoint::portName() const
{
    return m_portName;
}

int SerialEndpoint::baudRate() const
{
    return m_baudRate;
}
