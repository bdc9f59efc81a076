#include <QtTest>

#include "RtcmFrameDecoder.h"
#include "RtcmTestFrames.h"
#include "ScriptedEndpoint.h"
#include "ntripclient.h"

class tst_NtripClient : public QObject
{
    Q_OBJECT

private slots:
    void buildRequest();
    void classifyStatus_data();
    void classifyStatus();
    void findPayloadStart_data();
    void findPayloadStart();

    void icyWithFrame();
    void statusLineFollowedBySync();
    void terminatorSplitAcrossReads();
    void successWithoutTerminator();
    void headerLimitExceeded();
    void authenticationFailure();
    void mountpointNotFound();
    void unexpectedStatus();
    void timeoutWithoutStatus();
    void timeoutAfterSuccess();
    void readErrorIsTransportError();
    void writeFailure();
    void parseSourceTable();

private:
    static CasterSettings testSettings();
};

CasterSettings tst_NtripClient::testSettings()
{
    CasterSettings settings;
    settings.host = "caster.example.net";
    settings.port = 2101;
    settings.mountpoint = "BASE1";
    settings.username = "user";
    settings.password = "pass";
    return settings;
}

void tst_NtripClient::buildRequest()
{
    const QByteArray request = NtripClient::buildRequest(testSettings(), "BASE1");

    QVERIFY(request.startsWith("GET /BASE1 HTTP/1.0\r\n"));
    QVERIFY(request.contains("Host: caster.example.net\r\n"));
    QVERIFY(request.contains("User-Agent: NTRIP RtkRelay/1.0\r\n"));
    QVERIFY(request.contains("Authorization: Basic dXNlcjpwYXNz\r\n"));
    QVERIFY(request.contains("Ntrip-Version: Ntrip/2.0\r\n"));
    QVERIFY(request.endsWith("Connection: close\r\n\r\n"));

    QVERIFY(NtripClient::buildRequest(testSettings(), QString()).startsWith("GET / HTTP/1.0\r\n"));
}

void tst_NtripClient::classifyStatus_data()
{
    QTest::addColumn<QByteArray>("status");
    QTest::addColumn<int>("error");

    QTest::newRow("icy") << QByteArray("ICY 200 OK") << int(NtripSession::NoError);
    QTest::newRow("http") << QByteArray("HTTP/1.1 200 OK") << int(NtripSession::NoError);
    QTest::newRow("401") << QByteArray("HTTP/1.1 401 Unauthorized") << int(NtripSession::AuthError);
    QTest::newRow("403") << QByteArray("HTTP/1.1 403 Forbidden") << int(NtripSession::AuthError);
    QTest::newRow("404") << QByteArray("HTTP/1.1 404 Not Found") << int(NtripSession::MountpointError);
    QTest::newRow("500") << QByteArray("HTTP/1.1 500 Internal Server Error") << int(NtripSession::ServerError);
    QTest::newRow("302") << QByteArray("HTTP/1.1 302 Found") << int(NtripSession::ProtocolError);
    QTest::newRow("empty") << QByteArray() << int(NtripSession::ProtocolError);
}

void tst_NtripClient::classifyStatus()
{
    QFETCH(QByteArray, status);
    QFETCH(int, error);

    QCOMPARE(int(NtripClient::classifyStatus(status)), error);
}

void tst_NtripClient::findPayloadStart_data()
{
    QTest::addColumn<QByteArray>("response");
    QTest::addColumn<int>("start");

    QByteArray sync(1, char(RTCM3_PREAMBLE));

    QTest::newRow("terminator") << QByteArray("ICY 200 OK\r\n\r\n") + sync << 14;
    QTest::newRow("terminator only") << QByteArray("ICY 200 OK\r\n\r\n") << 14;
    QTest::newRow("sync after status") << QByteArray("ICY 200 OK\r\n") + sync << 12;
    QTest::newRow("lf status") << QByteArray("ICY 200 OK\nx") + sync << 12;
    QTest::newRow("control byte") << QByteArray("ICY 200 OK\r\nab") + QByteArray(1, '\x01') << 14;
    QTest::newRow("no line end") << QByteArray("ICY 200 OK") + sync << 10;
    QTest::newRow("no line end, no sync") << QByteArray("ICY 200 OK") << -1;
    QTest::newRow("header text only") << QByteArray("HTTP/1.1 200 OK\r\nServer: x") << -1;
}

void tst_NtripClient::findPayloadStart()
{
    QFETCH(QByteArray, response);
    QFETCH(int, start);

    QCOMPARE(NtripClient::findPayloadStart(response), start);
}

void tst_NtripClient::icyWithFrame()
{
    const QByteArray frame = rtcmFrame(1005, 14);
    QCOMPARE(int(frame.size()), 20);

    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData(QByteArray("ICY 200 OK\r\n\r\n") + frame);

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QVERIFY(session.isValid());
    QCOMPARE(session.error(), NtripSession::NoError);
    QCOMPARE(session.statusLine(), QByteArray("ICY 200 OK"));
    QCOMPARE(session.leadingPayload(), frame);
    QVERIFY(session.endpoint() == endpoint);
    QVERIFY(endpoint->isOpen());
    QVERIFY(endpoint->written().startsWith("GET /BASE1 HTTP/1.0\r\n"));

    RtcmFrameDecoder decoder;
    const QVector<RtcmFrame> frames = decoder.feed(session.leadingPayload());
    QCOMPARE(int(frames.size()), 1);
    QCOMPARE(frames.at(0).messageType, 1005);
}

void tst_NtripClient::statusLineFollowedBySync()
{
    const QByteArray frame = rtcmFrame(1074, 50);

    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData(QByteArray("ICY 200 OK\r\n") + frame);

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QVERIFY(session.isValid());
    QCOMPARE(session.header(), QByteArray("ICY 200 OK\r\n"));
    QCOMPARE(session.leadingPayload(), frame);
}

void tst_NtripClient::terminatorSplitAcrossReads()
{
    const QByteArray frame = rtcmFrame(1084, 30);

    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData("HTTP/1.1 200 OK\r\nContent-Type: gnss/data\r\n\r");
    endpoint->addData(QByteArray("\n") + frame);

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QVERIFY(session.isValid());
    QCOMPARE(session.statusLine(), QByteArray("HTTP/1.1 200 OK"));
    QCOMPARE(session.header(), QByteArray("HTTP/1.1 200 OK\r\nContent-Type: gnss/data\r\n\r\n"));
    QCOMPARE(session.leadingPayload(), frame);
}

void tst_NtripClient::successWithoutTerminator()
{
    const QByteArray header = QByteArray("ICY 200 OK\r\nServer: ") + QByteArray(120, 'x') + "\r\n";
    const QByteArray first = rtcmFrame(1005, 19);
    const QByteArray second = rtcmFrame(1074, 40);

    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData(header + first);
    endpoint->addData(second);

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QVERIFY(session.isValid());
    QCOMPARE(session.header(), header);
    QCOMPARE(session.leadingPayload(), first);

    // the header read stopped without waiting for more data
    char buf[256];
    QCOMPARE(endpoint->read(buf, sizeof(buf)), qint64(second.size()));
    QCOMPARE(QByteArray(buf, int(second.size())), second);
}

void tst_NtripClient::headerLimitExceeded()
{
    QByteArray response("HTTP/1.1 302 Found\r\n");
    while (response.size() < 70000)
        response.append("X-Padding: ").append(QByteArray(64, 'p')).append("\r\n");

    auto endpoint = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Block);
    endpoint->addData(response);

    NtripClient client(testSettings());
    QCOMPARE(client.settings().headerLimit, 64 * 1024);
    NtripSession session = client.handshake(endpoint);

    QVERIFY(!session.isValid());
    QCOMPARE(session.error(), NtripSession::ProtocolError);
    QVERIFY(session.errorString().contains("exceeds 65536 bytes"));
    QVERIFY(!endpoint->isOpen());
}

void tst_NtripClient::authenticationFailure()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData("HTTP/1.1 401 Unauthorized\r\nWWW-Authenticate: Basic realm=\"x\"\r\n\r\n");

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QVERIFY(!session.isValid());
    QCOMPARE(session.error(), NtripSession::AuthError);
    QVERIFY(!session.endpoint());
    QVERIFY(!endpoint->isOpen());
    QCOMPARE(endpoint->releases(), 1);
}

void tst_NtripClient::mountpointNotFound()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData("HTTP/1.1 404 Not Found\r\n\r\n");

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QCOMPARE(session.error(), NtripSession::MountpointError);
    QVERIFY(session.errorString().contains("BASE1"));
}

void tst_NtripClient::unexpectedStatus()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData("HTTP/1.1 302 Found\r\nLocation: /\r\n\r\n");

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QCOMPARE(session.error(), NtripSession::ProtocolError);
    QVERIFY(session.errorString().contains("HTTP/1.1 302 Found"));
}

void tst_NtripClient::timeoutWithoutStatus()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData("HTTP/1.1 ");
    endpoint->addTimeout();

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QCOMPARE(session.error(), NtripSession::TimeoutError);
    QVERIFY(!endpoint->isOpen());
}

void tst_NtripClient::timeoutAfterSuccess()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addData("ICY 200 OK\r\n");
    endpoint->addTimeout();

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QVERIFY(session.isValid());
    QVERIFY(session.leadingPayload().isEmpty());
}

void tst_NtripClient::readErrorIsTransportError()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->addError();

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QCOMPARE(session.error(), NtripSession::TransportError);
}

void tst_NtripClient::writeFailure()
{
    auto endpoint = std::make_shared<ScriptedEndpoint>();
    endpoint->setFailWrites(true);

    NtripClient client(testSettings());
    NtripSession session = client.handshake(endpoint);

    QCOMPARE(session.error(), NtripSession::TransportError);
    QCOMPARE(endpoint->releases(), 1);
}

void tst_NtripClient::parseSourceTable()
{
    const QByteArray table =
        "SOURCETABLE 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "CAS;caster.example.net;2101;Example;none;0;DEU;50.00;8.00;0.0.0.0;0;none\r\n"
        "STR;BASE1;Frankfurt;RTCM 3.3;1005(10),1074(1);2;GPS+GLO;EXNET;DEU;50.11;8.68;1;0;sNTRIP;none;B;N;2400;\r\n"
        "STR;SHORT;x;RTCM 3\r\n"
        "STR;BASE2;Berlin;RTCM 3.2;1005(10);2;GPS;EXNET;DEU;52.52;13.40;1;0;sNTRIP;none;B;N;2400;\r\n"
        "ENDSOURCETABLE\r\n";

    const QVector<MountPointInfo> mounts = NtripClient::parseSourceTable(table);
    QCOMPARE(int(mounts.size()), 2);

    QCOMPARE(mounts.at(0).name, QString("BASE1"));
    QCOMPARE(mounts.at(0).identifier, QString("Frankfurt"));
    QCOMPARE(mounts.at(0).format, QString("RTCM 3.3"));
    QCOMPARE(mounts.at(0).navSystem, QString("GPS+GLO"));
    QCOMPARE(mounts.at(0).country, QString("DEU"));
    QCOMPARE(mounts.at(0).latitude, 50.11);
    QCOMPARE(mounts.at(0).longitude, 8.68);

    QCOMPARE(mounts.at(1).name, QString("BASE2"));
}

QTEST_GUILESS_MAIN(tst_NtripClient)
#include "tst_ntripclient.moc"
