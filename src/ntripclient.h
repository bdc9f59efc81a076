#ifndef NTRIPCLIENT_H
#define NTRIPCLIENT_H

#include "Endpoint.h"
#include "TcpEndpoint.h"

#include <QByteArray>
#include <QString>
#include <QVector>

#include <atomic>
#include <memory>

struct CasterSettings
{
    QString host;
    quint16 port = 2101;
    QString mountpoint;
    QString username;
    QString password;
    QString userAgent = "NTRIP RtkRelay/1.0";
    int connectTimeoutMs = 10000;
    int readTimeoutMs = 30000;
    int headerLimit = 64 * 1024;
};

struct MountPointInfo
{
    QString name;
    QString identifier;
    QString format;
    QString formatDetails;
    QString carrier;
    QString navSystem;
    QString network;
    QString country;
    double latitude = 0.0;
    double longitude = 0.0;
};

// Result of a handshake. On success it carries the connected endpoint and
// any stream bytes that arrived together with the response header.
class NtripSession
{
public:
    enum SessionError {
        NoError,
        ConnectError,
        TimeoutError,
        TransportError,
        AuthError,
        MountpointError,
        ServerError,
        ProtocolError
    };

    bool isValid() const;
    SessionError error() const;
    QString errorString() const;

    std::shared_ptr<Endpoint> endpoint() const;
    QByteArray leadingPayload() const;
    QByteArray header() const;
    QByteArray statusLine() const;

    static QString errorName(SessionError error);

private:
    friend class NtripClient;

    SessionError m_error = NoError;
    QString m_errorString;
    std::shared_ptr<Endpoint> m_endpoint;
    QByteArray m_leadingPayload;
    QByteArray m_header;
    QByteArray m_statusLine;
};

class NtripClient
{
public:
    explicit NtripClient(const CasterSettings &settings);

    const CasterSettings &settings() const;

    // Connects to the caster and requests the configured mountpoint.
    NtripSession connectToCaster();

    // First half of connectToCaster(): opens the socket with the header read
    // timeout applied. Lets the caller keep the socket reachable for close()
    // while handshake() runs.
    std::shared_ptr<TcpEndpoint> openConnection(QString *errorString,
                                                const std::atomic<bool> *abort = nullptr);

    // Read timeout for a socket whose handshake succeeded.
    static void setStreamTimeout(TcpEndpoint *socket);

    // Runs the request/response exchange on an already connected endpoint.
    // The endpoint is closed when the handshake fails.
    NtripSession handshake(const std::shared_ptr<Endpoint> &endpoint);

    // Requests "GET /" and returns the STR records of the sourcetable.
    QVector<MountPointInfo> fetchSourceTable(QString *errorString);

    static QByteArray buildRequest(const CasterSettings &settings, const QString &mountpoint);
    static bool containsSuccessToken(const QByteArray &text);

    // Offset of the first stream byte in a raw response, or -1 when the
    // whole response is header.
    static int findPayloadStart(const QByteArray &response);

    static QByteArray statusLine(const QByteArray &header);
    static NtripSession::SessionError classifyStatus(const QByteArray &statusLine);
    static QVector<MountPointInfo> parseSourceTable(const QByteArray &data);

private:
    NtripSession fail(NtripSession::SessionError error, const QString &errorString,
                      const std::shared_ptr<Endpoint> &endpoint);

    CasterSettings m_settings;
};

#endif // NTRIPCLIENT_H
