#ifndef TCPLISTENER_H
#define TCPLISTENER_H

#include "TcpEndpoint.h"

#include <QString>

#include <atomic>
#include <memory>
#include <mutex>

class TcpListener
{
public:
    TcpListener();
    ~TcpListener();

    TcpListener(const TcpListener &) = delete;
    TcpListener &operator=(const TcpListener &) = delete;

    // Port 0 picks an ephemeral port, see serverPort().
    bool listen(const QString &host, quint16 port, int backlog = 5);

    // Blocks until a client connects. Returns nullptr once close() was called
    // or on an accept error. Safe to call from a thread other than close().
    std::shared_ptr<TcpEndpoint> accept();

    void close();
    bool isListening() const;
    quint16 serverPort() const;
    QString errorString() const;

private:
    void releaseSocket();
    void setErrorString(const QString &errorString);

    std::atomic<int> m_fd;
    std::atomic<bool> m_closed;
    quint16 m_port;
    QString m_address;
    mutable std::mutex m_errorMutex;
    QString m_errorString;
};

#endif // TCPLISTENER_H
