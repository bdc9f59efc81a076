#ifndef ENDPOINT_H
#define ENDPOINT_H

#include <QByteArray>
#include <QString>

#include <mutex>

// Blocking byte stream shared by sockets, serial ports and the MAVLink tunnel.
// read() and write() may be called from different threads; close() may be
// called from any thread and makes a blocked read() or write() return -1.
class Endpoint
{
public:
    enum EndpointError {
        NoError,
        ConnectError,
        TimeoutError,
        ReadError,
        WriteError,
        ClosedError
    };

    virtual ~Endpoint() = default;

    // Returns the number of bytes read, 0 at end of stream or -1 on error.
    virtual qint64 read(char *data, qint64 maxSize) = 0;

    // Writes all of data. Returns data.size() on success, -1 on error.
    virtual qint64 write(const QByteArray &data) = 0;

    // Idempotent. Releases the underlying resource exactly once.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual QString description() const = 0;

    EndpointError error() const;
    QString errorString() const;

protected:
    void setError(EndpointError error, const QString &errorString);

private:
    mutable std::mutex m_errorMutex;
    EndpointError m_error = NoError;
    QString m_errorString;
};

#endif // ENDPOINT_H
