#include "ntripclient.h"
#include "LogCategories.h"
#include "TcpEndpoint.h"

#define HEADER_TERMINATOR "\r\n\r\n"
#define HEADER_READ_SIZE 1024
#define SUCCESS_HEADER_MIN 128    // bytes before a 200 without terminator counts as a header
#define CONTROL_BYTE_WINDOW 200
#define RTCM_SYNC '\xD3'
#define STREAM_READ_TIMEOUT_MS 5000
#define MOUNTPOINT_INFO_SIZE 11

bool NtripSession::isValid() const
{
    return m_error == NoError && m_endpoint != nullptr;
}

NtripSession::SessionError NtripSession::error() const
{
    return m_error;
}

QString NtripSession::errorString() const
{
    return m_errorString;
}

std::shared_ptr<Endpoint> NtripSession::endpoint() const
{
    return m_endpoint;
}

QByteArray NtripSession::leadingPayload() const
{
    return m_leadingPayload;
}

QByteArray NtripSession::header() const
{
    return m_header;
}

QByteArray NtripSession::statusLine() const
{
    return m_statusLine;
}

QString NtripSession::errorName(SessionError error)
{
    switch (error) {
    case NoError: return "NoError";
    case ConnectError: return "ConnectError";
    case TimeoutError: return "TimeoutError";
    case TransportError: return "TransportError";
    case AuthError: return "AuthError";
    case MountpointError: return "MountpointError";
    case ServerError: return "ServerError";
    case ProtocolError: return "ProtocolError";
    }
    return "UnknownError";
}

NtripClient::NtripClient(const CasterSettings &settings)
    : m_settings(settings)
{
}

const CasterSettings &NtripClient::settings() const
{
    return m_settings;
}

QByteArray NtripClient::buildRequest(const CasterSettings &settings, const QString &mountpoint)
{
    QByteArray req;
    QByteArray auth = (settings.username + ":" + settings.password).toUtf8().toBase64();

    req += "GET /" + mountpoint.toUtf8() + " HTTP/1.0\r\n";
    req += "Host: " + settings.host.toUtf8() + "\r\n";
    req += "User-Agent: " + settings.userAgent.toUtf8() + "\r\n";
    req += "Authorization: Basic " + auth + "\r\n";
    req += "Ntrip-Version: Ntrip/2.0\r\n";
    req += "Connection: close\r\n\r\n";
    return req;
}

bool NtripClient::containsSuccessToken(const QByteArray &text)
{
    return text.contains("ICY 200") || text.contains(" 200 ");
}

int NtripClient::findPayloadStart(const QByteArray &response)
{
    int idx = response.indexOf(HEADER_TERMINATOR);
    if (idx >= 0)
        return idx + 4;

    int statusEnd = response.indexOf("\r\n");
    int skip = 2;
    if (statusEnd < 0) {
        statusEnd = response.indexOf('\n');
        skip = 1;
    }

    if (statusEnd < 0) {
        // Status line not terminated at all, look for a sync byte after the token
        int token = response.indexOf("ICY 200");
        int tokenLength = 7;
        if (token < 0) {
            token = response.indexOf(" 200 ");
            tokenLength = 5;
        }
        if (token < 0)
            return -1;
        return response.indexOf(RTCM_SYNC, token + tokenLength);
    }

    const int from = statusEnd + skip;
    int sync = response.indexOf(RTCM_SYNC, from);
    if (sync >= 0)
        return sync;

    const int end = qMin(int(response.size()), statusEnd + CONTROL_BYTE_WINDOW);
    for (int i = from; i < end; ++i) {
        const quint8 c = quint8(response.at(i));
        if (c < 32 && c != '\t' && c != '\n' && c != '\r')
            return i;
    }
    return -1;
}

QByteArray NtripClient::statusLine(const QByteArray &header)
{
    int end = header.indexOf("\r\n");
    if (end < 0)
        end = header.indexOf('\n');
    return (end < 0 ? header : header.left(end)).trimmed();
}

NtripSession::SessionError NtripClient::classifyStatus(const QByteArray &statusLine)
{
    if (containsSuccessToken(statusLine))
        return NtripSession::NoError;
    if (statusLine.contains("401") || statusLine.contains("403"))
        return NtripSession::AuthError;
    if (statusLine.contains("404"))
        return NtripSession::MountpointError;
    if (statusLine.contains("500"))
        return NtripSession::ServerError;
    return NtripSession::ProtocolError;
}

NtripSession NtripClient::fail(NtripSession::SessionError error, const QString &errorString,
                               const std::shared_ptr<Endpoint> &endpoint)
{
    if (endpoint)
        endpoint->close();

    NtripSession session;
    session.m_error = error;
    session.m_errorString = errorString;
    qCWarning(lcNtrip).noquote() << QString("%1: %2").arg(NtripSession::errorName(error), errorString);
    return session;
}

NtripSession NtripClient::connectToCaster()
{
    qCInfo(lcNtrip).noquote() << QString("Connecting to NTRIP caster %1:%2, mountpoint '%3'")
                                     .arg(m_settings.host).arg(m_settings.port).arg(m_settings.mountpoint);

    QString error;
    std::shared_ptr<TcpEndpoint> socket = openConnection(&error);
    if (!socket)
        return fail(NtripSession::ConnectError, error, nullptr);

    NtripSession session = handshake(socket);
    if (session.isValid())
        setStreamTimeout(socket.get());
    return session;
}

std::shared_ptr<TcpEndpoint> NtripClient::openConnection(QString *errorString, const std::atomic<bool> *abort)
{
    std::shared_ptr<TcpEndpoint> socket = TcpEndpoint::connectToHost(m_settings.host, m_settings.port,
                                                                     m_settings.connectTimeoutMs, errorString,
                                                                     abort);
    if (socket)
        socket->setReadTimeout(m_settings.readTimeoutMs);
    return socket;
}

void NtripClient::setStreamTimeout(TcpEndpoint *socket)
{
    socket->setReadTimeout(STREAM_READ_TIMEOUT_MS);
}

NtripSession NtripClient::handshake(const std::shared_ptr<Endpoint> &endpoint)
{
    const QByteArray request = buildRequest(m_settings, m_settings.mountpoint);
    qCDebug(lcNtrip) << "Sending NTRIP request for" << m_settings.mountpoint;
    if (endpoint->write(request) != request.size())
        return fail(NtripSession::TransportError, endpoint->errorString(), endpoint);

    QByteArray response;
    char buf[HEADER_READ_SIZE];

    while (response.size() < m_settings.headerLimit) {
        qint64 n = endpoint->read(buf, sizeof(buf));
        if (n > 0) {
            response.append(buf, int(n));
            if (response.contains(HEADER_TERMINATOR))
                break;
            if (containsSuccessToken(response) && response.size() > SUCCESS_HEADER_MIN) {
                qCDebug(lcNtrip) << "200 status without header terminator, assuming start of data";
                break;
            }
            continue;
        }

        if (n == 0) {
            qCDebug(lcNtrip) << "Connection closed while reading header," << response.size() << "bytes";
            break;
        }

        if (endpoint->error() == Endpoint::TimeoutError) {
            if (containsSuccessToken(response)) {
                qCDebug(lcNtrip) << "Timeout while reading header, but 200 status detected";
                break;
            }
            return fail(NtripSession::TimeoutError, "Timed out while waiting for NTRIP response header",
                        endpoint);
        }

        return fail(NtripSession::TransportError, endpoint->errorString(), endpoint);
    }

    if (response.size() >= m_settings.headerLimit && !response.contains(HEADER_TERMINATOR)
        && !containsSuccessToken(response))
        return fail(NtripSession::ProtocolError,
                    QString("Response header exceeds %1 bytes").arg(m_settings.headerLimit), endpoint);

    int split = findPayloadStart(response);
    if (split < 0)
        split = response.size();

    NtripSession session;
    session.m_header = response.left(split);
    session.m_leadingPayload = response.mid(split);
    session.m_statusLine = statusLine(session.m_header);

    const NtripSession::SessionError status = classifyStatus(session.m_statusLine);
    switch (status) {
    case NtripSession::NoError:
        break;
    case NtripSession::AuthError:
        return fail(status, "Authentication failed (401/403), check username and password", endpoint);
    case NtripSession::MountpointError:
        return fail(status, QString("Mountpoint '%1' not found (404)").arg(m_settings.mountpoint), endpoint);
    case NtripSession::ServerError:
        return fail(status, "Caster internal error (500)", endpoint);
    default:
        return fail(status, QString("Unexpected response: %1").arg(QString::fromLatin1(session.m_statusLine)),
                    endpoint);
    }

    session.m_endpoint = endpoint;
    qCInfo(lcNtrip).noquote() << QString("NTRIP connection established (%1), %2 payload bytes with header")
                                     .arg(QString::fromLatin1(session.m_statusLine))
                                     .arg(session.m_leadingPayload.size());
    return session;
}

QVector<MountPointInfo> NtripClient::fetchSourceTable(QString *errorString)
{
    QString error;
    std::shared_ptr<TcpEndpoint> socket = TcpEndpoint::connectToHost(m_settings.host, m_settings.port,
                                                                     m_settings.connectTimeoutMs, &error);
    if (!socket) {
        if (errorString)
            *errorString = error;
        return {};
    }
    socket->setReadTimeout(m_settings.readTimeoutMs);

    const QByteArray request = buildRequest(m_settings, QString());
    if (socket->write(request) != request.size()) {
        if (errorString)
            *errorString = socket->errorString();
        return {};
    }

    QByteArray data;
    char buf[HEADER_READ_SIZE];
    for (;;) {
        qint64 n = socket->read(buf, sizeof(buf));
        if (n > 0) {
            data.append(buf, int(n));
            if (data.contains("ENDSOURCETABLE"))
                break;
            continue;
        }
        if (n < 0 && data.isEmpty()) {
            if (errorString)
                *errorString = socket->errorString();
            return {};
        }
        break;
    }
    socket->close();

    QVector<MountPointInfo> mounts = parseSourceTable(data);
    if (mounts.isEmpty() && errorString)
        *errorString = QString("No mountpoints in response: %1").arg(QString::fromLatin1(statusLine(data)));
    return mounts;
}

QVector<MountPointInfo> NtripClient::parseSourceTable(const QByteArray &data)
{
    QVector<MountPointInfo> mounts;
    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray &raw : lines) {
        const QByteArray line = raw.trimmed();
        if (!line.startsWith("STR;"))
            continue;

        const QList<QByteArray> cols = line.split(';');
        if (cols.size() < MOUNTPOINT_INFO_SIZE)
            continue;

        MountPointInfo mp;
        mp.name = QString::fromUtf8(cols.at(1));
        mp.identifier = QString::fromUtf8(cols.at(2));
        mp.format = QString::fromUtf8(cols.at(3));
        mp.formatDetails = QString::fromUtf8(cols.at(4));
        mp.carrier = QString::fromUtf8(cols.at(5));
        mp.navSystem = QString::fromUtf8(cols.at(6));
        mp.network = QString::fromUtf8(cols.at(7));
        mp.country = QString::fromUtf8(cols.at(8));
        mp.latitude = cols.at(9).toDouble();
        mp.longitude = cols.at(10).toDouble();
        mounts.append(mp);
    }
    return mounts;
}
