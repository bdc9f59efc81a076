#include <QtTest>

#include "MavlinkCodec.h"
#include "ScriptedEndpoint.h"
#include "SerialControlTunnel.h"
#include "TunnelEndpoint.h"

#include <mutex>

class tst_SerialControlTunnel : public QObject
{
    Q_OBJECT

private slots:
    void x25CheckValue();
    void serialControlWireOrder();
    void packV1Frame();
    void packV2TruncatesPayload();
    void feedRejectsBadCrc();
    void feedSkipsUnknownMessage();
    void feedResyncsOnStrayStartByte();

    void chunkCount_data();
    void chunkCount();
    void split150Bytes();
    void pollRequest();
    void sendWritesChunks();
    void sendPacesBetweenChunks();
    void sendFailureTakesLinkDown();

    void inboundChunkDelivered();
    void allZeroChunkSuppressed();
    void magicBytesStillDelivered();
    void otherDeviceIgnored();
    void waitForHeartbeat();
    void heartbeatTimeout();
    void receiveLoopAndPolling();

    void tunnelEndpointRead();
    void tunnelEndpointQueueLimit();
    void tunnelEndpointLinkDown();

private:
    static TunnelSettings testSettings();
    static QByteArray vehicleReply(const QByteArray &data, quint8 device = 3);
};

TunnelSettings tst_SerialControlTunnel::testSettings()
{
    TunnelSettings settings;
    settings.device = 3;
    settings.baudRate = 115200;
    settings.exclusive = true;
    settings.chunkDelayMs = 0;
    settings.pollIntervalMs = 20;
    return settings;
}

QByteArray tst_SerialControlTunnel::vehicleReply(const QByteArray &data, quint8 device)
{
    SerialControlMessage reply;
    reply.device = device;
    reply.flags = SerialControlMessage::Reply;
    reply.baudrate = 115200;
    reply.count = quint8(data.size());
    reply.data = data;

    MavlinkCodec vehicle(1, 1, 1);
    return vehicle.pack(SerialControlMessage::MessageId, reply.encodePayload());
}

void tst_SerialControlTunnel::x25CheckValue()
{
    QCOMPARE(MavlinkCodec::x25Crc("123456789"), quint16(0x6F91));
}

void tst_SerialControlTunnel::serialControlWireOrder()
{
    SerialControlMessage message;
    message.device = 3;
    message.flags = SerialControlMessage::Exclusive;
    message.timeout = 0x0102;
    message.baudrate = 115200;
    message.count = 2;
    message.data = "AB";

    const QByteArray payload = message.encodePayload();
    QCOMPARE(int(payload.size()), SerialControlMessage::PayloadSize);
    QCOMPARE(payload.left(4), QByteArray::fromHex("00c20100"));
    QCOMPARE(payload.mid(4, 2), QByteArray::fromHex("0201"));
    QCOMPARE(quint8(payload.at(6)), quint8(3));
    QCOMPARE(quint8(payload.at(7)), quint8(SerialControlMessage::Exclusive));
    QCOMPARE(quint8(payload.at(8)), quint8(2));
    QCOMPARE(payload.mid(9, 2), QByteArray("AB"));
    QCOMPARE(payload.mid(11), QByteArray(68, '\0'));

    SerialControlMessage decoded;
    QVERIFY(SerialControlMessage::decodePayload(payload, &decoded));
    QCOMPARE(decoded.baudrate, quint32(115200));
    QCOMPARE(decoded.timeout, quint16(0x0102));
    QCOMPARE(decoded.count, quint8(2));
}

void tst_SerialControlTunnel::packV1Frame()
{
    MavlinkCodec codec(1, 255, 0);
    SerialControlMessage message;
    message.device = 3;
    message.count = 1;
    message.data = "x";

    const QByteArray first = codec.pack(SerialControlMessage::MessageId, message.encodePayload());
    const QByteArray second = codec.pack(SerialControlMessage::MessageId, message.encodePayload());

    QCOMPARE(int(first.size()), 6 + SerialControlMessage::PayloadSize + 2);
    QCOMPARE(quint8(first.at(0)), quint8(MAVLINK_STX_V1));
    QCOMPARE(quint8(first.at(1)), quint8(SerialControlMessage::PayloadSize));
    QCOMPARE(quint8(first.at(2)), quint8(0));
    QCOMPARE(quint8(second.at(2)), quint8(1));
    QCOMPARE(quint8(first.at(3)), quint8(255));
    QCOMPARE(quint8(first.at(4)), quint8(0));
    QCOMPARE(quint8(first.at(5)), quint8(SerialControlMessage::MessageId));

    MavlinkCodec parser;
    const QVector<MavlinkMessage> messages = parser.feed(first + second);
    QCOMPARE(int(messages.size()), 2);
    QCOMPARE(messages.at(0).version, 1);
    QCOMPARE(messages.at(0).systemId, quint8(255));
    QCOMPARE(messages.at(1).sequence, quint8(1));
    QCOMPARE(parser.crcErrors(), quint64(0));
}

void tst_SerialControlTunnel::packV2TruncatesPayload()
{
    MavlinkCodec codec(2, 255, 0);
    SerialControlMessage message;
    message.device = 3;
    message.baudrate = 115200;
    message.count = 10;
    message.data = "0123456789";

    const QByteArray frame = codec.pack(SerialControlMessage::MessageId, message.encodePayload());
    QCOMPARE(quint8(frame.at(0)), quint8(MAVLINK_STX_V2));
    QCOMPARE(quint8(frame.at(1)), quint8(19));
    QCOMPARE(int(frame.size()), 10 + 19 + 2);

    MavlinkCodec parser;
    const QVector<MavlinkMessage> messages = parser.feed(frame);
    QCOMPARE(int(messages.size()), 1);
    QCOMPARE(messages.at(0).version, 2);
    QCOMPARE(int(messages.at(0).payload.size()), SerialControlMessage::PayloadSize);

    SerialControlMessage decoded;
    QVERIFY(SerialControlMessage::decodePayload(messages.at(0).payload, &decoded));
    QCOMPARE(decoded.data.left(decoded.count), QByteArray("0123456789"));
}

void tst_SerialControlTunnel::feedRejectsBadCrc()
{
    QByteArray frame = vehicleReply("hello");
    frame[frame.size() - 1] = char(frame.at(frame.size() - 1) ^ 0xFF);

    MavlinkCodec parser;
    QVector<MavlinkMessage> messages = parser.feed(frame + vehicleReply("world"));
    QCOMPARE(parser.crcErrors(), quint64(1));
    QCOMPARE(int(messages.size()), 1);

    SerialControlMessage decoded;
    QVERIFY(SerialControlMessage::decodePayload(messages.at(0).payload, &decoded));
    QCOMPARE(decoded.data.left(decoded.count), QByteArray("world"));
}

void tst_SerialControlTunnel::feedSkipsUnknownMessage()
{
    MavlinkCodec codec(1, 1, 1);
    const QByteArray unknown = codec.pack(30, QByteArray(28, '\x01'));

    MavlinkCodec parser;
    const QVector<MavlinkMessage> messages = parser.feed(unknown + vehicleReply("ok"));
    QCOMPARE(int(messages.size()), 1);
    QCOMPARE(messages.at(0).messageId, quint32(SerialControlMessage::MessageId));
    QCOMPARE(parser.unknownMessages(), quint64(1));
}

void tst_SerialControlTunnel::feedResyncsOnStrayStartByte()
{
    // v1 start byte, length 10, unknown id 30: spans into the real frame
    const QByteArray stray("\xFE\x0A\x00\x00\x00\x1E", 6);
    const QByteArray reply = vehicleReply("fix");

    MavlinkCodec parser;
    const QVector<MavlinkMessage> messages = parser.feed(stray + reply);
    QCOMPARE(int(messages.size()), 1);
    QCOMPARE(parser.unknownMessages(), quint64(0));

    SerialControlMessage decoded;
    QVERIFY(SerialControlMessage::decodePayload(messages.at(0).payload, &decoded));
    QCOMPARE(decoded.data.left(decoded.count), QByteArray("fix"));
}

void tst_SerialControlTunnel::chunkCount_data()
{
    QTest::addColumn<int>("length");
    QTest::addColumn<int>("chunks");

    QTest::newRow("0") << 0 << 0;
    QTest::newRow("1") << 1 << 1;
    QTest::newRow("69") << 69 << 1;
    QTest::newRow("70") << 70 << 1;
    QTest::newRow("71") << 71 << 2;
    QTest::newRow("140") << 140 << 2;
    QTest::newRow("141") << 141 << 3;
    QTest::newRow("1000") << 1000 << 15;
}

void tst_SerialControlTunnel::chunkCount()
{
    QFETCH(int, length);
    QFETCH(int, chunks);

    QByteArray data;
    for (int i = 0; i < length; ++i)
        data.append(char(i % 251));

    const QVector<SerialControlMessage> split = SerialControlTunnel::splitIntoChunks(data, testSettings());
    QCOMPARE(int(split.size()), chunks);

    QByteArray joined;
    for (const SerialControlMessage &chunk : split) {
        QVERIFY(chunk.count <= SerialControlMessage::DataSize);
        QCOMPARE(int(chunk.data.size()), SerialControlMessage::DataSize);
        joined.append(chunk.data.left(chunk.count));
    }
    QCOMPARE(joined, data);
}

void tst_SerialControlTunnel::split150Bytes()
{
    const QByteArray data(150, 'r');
    const QVector<SerialControlMessage> split = SerialControlTunnel::splitIntoChunks(data, testSettings());

    QCOMPARE(int(split.size()), 3);
    QCOMPARE(split.at(0).count, quint8(70));
    QCOMPARE(split.at(1).count, quint8(70));
    QCOMPARE(split.at(2).count, quint8(10));
    QCOMPARE(split.at(2).data.mid(10), QByteArray(60, '\0'));

    for (const SerialControlMessage &chunk : split) {
        QCOMPARE(chunk.device, quint8(3));
        QCOMPARE(chunk.flags, quint8(SerialControlMessage::Exclusive));
        QCOMPARE(chunk.timeout, quint16(0));
        QCOMPARE(chunk.baudrate, quint32(115200));
    }

    TunnelSettings shared = testSettings();
    shared.exclusive = false;
    QCOMPARE(SerialControlTunnel::splitIntoChunks(data, shared).at(0).flags, quint8(0));
}

void tst_SerialControlTunnel::pollRequest()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    SerialControlTunnel tunnel(link, testSettings());

    const SerialControlMessage request = tunnel.pollRequest();
    QCOMPARE(request.flags, quint8(SerialControlMessage::Respond | SerialControlMessage::Multi
                                   | SerialControlMessage::Exclusive));
    QCOMPARE(request.count, quint8(0));
    QCOMPARE(request.timeout, quint16(10));
    QCOMPARE(request.data, QByteArray(70, '\0'));
}

void tst_SerialControlTunnel::sendWritesChunks()
{
    auto link = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Block);
    SerialControlTunnel tunnel(link, testSettings());

    QByteArray data;
    for (int i = 0; i < 150; ++i)
        data.append(char('a' + i % 26));
    QVERIFY(tunnel.send(data));

    QCOMPARE(int(link->writes().size()), 3);
    QCOMPARE(tunnel.chunksSent(), quint64(3));
    QCOMPARE(tunnel.bytesSent(), quint64(150));

    MavlinkCodec parser;
    const QVector<MavlinkMessage> messages = parser.feed(link->written());
    QCOMPARE(int(messages.size()), 3);

    QByteArray joined;
    QVector<int> counts;
    for (const MavlinkMessage &message : messages) {
        QCOMPARE(message.messageId, quint32(SerialControlMessage::MessageId));
        SerialControlMessage chunk;
        QVERIFY(SerialControlMessage::decodePayload(message.payload, &chunk));
        counts.append(chunk.count);
        joined.append(chunk.data.left(chunk.count));
    }
    QCOMPARE(counts, QVector<int>({70, 70, 10}));
    QCOMPARE(joined, data);
}

void tst_SerialControlTunnel::sendPacesBetweenChunks()
{
    auto link = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Block);
    TunnelSettings settings = testSettings();
    settings.chunkDelayMs = 300;
    SerialControlTunnel tunnel(link, settings);

    QElapsedTimer timer;
    timer.start();
    QVERIFY(tunnel.send(QByteArray(10, 'a')));
    QVERIFY(timer.elapsed() < 250);

    timer.restart();
    QVERIFY(tunnel.send(QByteArray(71, 'b')));
    const qint64 elapsed = timer.elapsed();
    QVERIFY(elapsed >= 290);
    QVERIFY(elapsed < 550);
    QCOMPARE(tunnel.chunksSent(), quint64(3));
}

void tst_SerialControlTunnel::sendFailureTakesLinkDown()
{
    auto link = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Block);
    link->setFailWrites(true);
    SerialControlTunnel tunnel(link, testSettings());

    QVERIFY(!tunnel.send("$PUBX,40*00\r\n"));
    QVERIFY(!tunnel.isLinkUp());
    QVERIFY(!tunnel.errorString().isEmpty());

    // stays down
    link->setFailWrites(false);
    QVERIFY(!tunnel.send("x"));
    QVERIFY(link->writes().isEmpty());
}

void tst_SerialControlTunnel::inboundChunkDelivered()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    SerialControlTunnel tunnel(link, testSettings());

    QByteArray received;
    tunnel.setDataHandler([&received](const QByteArray &data) { received.append(data); });

    tunnel.handleLinkData(vehicleReply("$GNGGA,1"));
    tunnel.handleLinkData(vehicleReply("23519.00"));

    QCOMPARE(received, QByteArray("$GNGGA,123519.00"));
    QCOMPARE(tunnel.bytesReceived(), quint64(16));
}

void tst_SerialControlTunnel::allZeroChunkSuppressed()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    SerialControlTunnel tunnel(link, testSettings());

    int calls = 0;
    tunnel.setDataHandler([&calls](const QByteArray &) { ++calls; });

    tunnel.handleLinkData(vehicleReply(QByteArray(12, '\0')));
    QCOMPARE(calls, 0);
    QCOMPARE(tunnel.emptyChunks(), quint64(1));
}

void tst_SerialControlTunnel::magicBytesStillDelivered()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    SerialControlTunnel tunnel(link, testSettings());

    QByteArray received;
    tunnel.setDataHandler([&received](const QByteArray &data) { received.append(data); });

    const QByteArray magic(8, char(MAVLINK_STX_V1));
    tunnel.handleLinkData(vehicleReply(magic));
    tunnel.handleLinkData(vehicleReply(magic));

    QCOMPARE(received, magic + magic);
    QCOMPARE(tunnel.magicHints(), quint64(1));
}

void tst_SerialControlTunnel::otherDeviceIgnored()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    SerialControlTunnel tunnel(link, testSettings());

    int calls = 0;
    tunnel.setDataHandler([&calls](const QByteArray &) { ++calls; });

    tunnel.handleLinkData(vehicleReply("telemetry", 0));
    QCOMPARE(calls, 0);
}

void tst_SerialControlTunnel::waitForHeartbeat()
{
    MavlinkCodec vehicle(1, 7, 1);
    const QByteArray heartbeat = vehicle.pack(HeartbeatMessage::MessageId, HeartbeatMessage().encodePayload());

    auto link = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Timeout);
    link->addTimeout();
    link->addData(heartbeat.left(5));
    link->addData(heartbeat.mid(5));

    SerialControlTunnel tunnel(link, testSettings());
    QVERIFY(tunnel.waitForHeartbeat(2000));
    QVERIFY(tunnel.heartbeatSeen());
    QCOMPARE(tunnel.targetSystem(), quint8(7));
    QCOMPARE(tunnel.targetComponent(), quint8(1));
}

void tst_SerialControlTunnel::heartbeatTimeout()
{
    auto link = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Timeout);
    SerialControlTunnel tunnel(link, testSettings());

    QVERIFY(!tunnel.waitForHeartbeat(100));
    QVERIFY(!tunnel.heartbeatSeen());
    QVERIFY(tunnel.errorString().contains("heartbeat"));

    QVERIFY(tunnel.waitForHeartbeat(0));
}

void tst_SerialControlTunnel::receiveLoopAndPolling()
{
    std::mutex mutex;
    QByteArray received;

    auto link = std::make_shared<ScriptedEndpoint>(ScriptedEndpoint::Block);
    SerialControlTunnel tunnel(link, testSettings());
    tunnel.setDataHandler([&](const QByteArray &data) {
        std::lock_guard<std::mutex> lk(mutex);
        received.append(data);
    });

    tunnel.start(true);
    link->addData(vehicleReply("$GNRMC"));

    QTRY_VERIFY(tunnel.pollsSent() >= 2);
    QTRY_COMPARE(tunnel.bytesReceived(), quint64(6));
    {
        std::lock_guard<std::mutex> lk(mutex);
        QCOMPARE(received, QByteArray("$GNRMC"));
    }

    MavlinkCodec parser;
    const QVector<MavlinkMessage> messages = parser.feed(link->writes().first());
    QCOMPARE(int(messages.size()), 1);
    SerialControlMessage poll;
    QVERIFY(SerialControlMessage::decodePayload(messages.at(0).payload, &poll));
    QCOMPARE(poll.count, quint8(0));
    QVERIFY(poll.flags & SerialControlMessage::Respond);

    tunnel.stop();
    QVERIFY(!tunnel.isLinkUp());
    QCOMPARE(link->releases(), 1);
}

void tst_SerialControlTunnel::tunnelEndpointRead()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    auto tunnel = std::make_shared<SerialControlTunnel>(link, testSettings());
    std::shared_ptr<TunnelEndpoint> endpoint = TunnelEndpoint::attach(tunnel);
    endpoint->setReadTimeout(50);

    char buf[64];
    QCOMPARE(endpoint->read(buf, sizeof(buf)), qint64(-1));
    QCOMPARE(endpoint->error(), Endpoint::TimeoutError);

    tunnel->handleLinkData(vehicleReply("abc"));
    tunnel->handleLinkData(vehicleReply("def"));
    QCOMPARE(endpoint->read(buf, 4), qint64(4));
    QCOMPARE(QByteArray(buf, 4), QByteArray("abcd"));
    QCOMPARE(endpoint->read(buf, sizeof(buf)), qint64(2));
    QCOMPARE(QByteArray(buf, 2), QByteArray("ef"));

    QCOMPARE(endpoint->write("xyz"), qint64(3));
    QCOMPARE(int(link->writes().size()), 1);

    endpoint->close();
    QCOMPARE(endpoint->read(buf, sizeof(buf)), qint64(-1));
    QCOMPARE(endpoint->error(), Endpoint::ClosedError);
    QVERIFY(tunnel->isLinkUp());
}

void tst_SerialControlTunnel::tunnelEndpointQueueLimit()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    auto tunnel = std::make_shared<SerialControlTunnel>(link, testSettings());
    TunnelEndpoint endpoint(tunnel, 10);

    endpoint.deliver("01234567");
    endpoint.deliver("89abc");
    QCOMPARE(endpoint.droppedBytes(), quint64(3));

    char buf[32];
    QCOMPARE(endpoint.read(buf, sizeof(buf)), qint64(10));
    QCOMPARE(QByteArray(buf, 10), QByteArray("3456789abc"));
}

void tst_SerialControlTunnel::tunnelEndpointLinkDown()
{
    auto link = std::make_shared<ScriptedEndpoint>();
    link->setFailWrites(true);
    auto tunnel = std::make_shared<SerialControlTunnel>(link, testSettings());
    std::shared_ptr<TunnelEndpoint> endpoint = TunnelEndpoint::attach(tunnel);
    endpoint->setReadTimeout(20);

    QCOMPARE(endpoint->write("x"), qint64(-1));
    QCOMPARE(endpoint->error(), Endpoint::WriteError);

    char buf[8];
    QCOMPARE(endpoint->read(buf, sizeof(buf)), qint64(-1));
    QCOMPARE(endpoint->error(), Endpoint::ReadError);
}

QTEST_GUILESS_MAIN(tst_SerialControlTunnel)
#include "tst_serialcontroltunnel.moc"
