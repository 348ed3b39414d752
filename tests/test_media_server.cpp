#include <QtTest>
#include <QElapsedTimer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <memory>
#include "core/media/MediaServer.hpp"

namespace {

struct Response {
    int status = 0;
    QHash<QByteArray, QByteArray> headers;   // lower-case names
    QByteArray body;
};

// Pop one complete response off the front of buffer.
bool takeResponse(QByteArray& buffer, Response& out)
{
    const int end = buffer.indexOf("\r\n\r\n");
    if (end < 0)
        return false;

    Response r;
    const QList<QByteArray> lines = buffer.left(end).split('\n');
    const QList<QByteArray> statusLine = lines.first().trimmed().split(' ');
    if (statusLine.size() < 2)
        return false;
    r.status = statusLine[1].toInt();
    for (int i = 1; i < lines.size(); ++i) {
        const int colon = lines[i].indexOf(':');
        if (colon > 0)
            r.headers.insert(lines[i].left(colon).trimmed().toLower(), lines[i].mid(colon + 1).trimmed());
    }

    const int length = r.headers.value("content-length", "0").toInt();
    if (buffer.size() < end + 4 + length)
        return false;
    r.body = buffer.mid(end + 4, length);
    buffer.remove(0, end + 4 + length);
    out = r;
    return true;
}

class Client {
public:
    explicit Client(quint16 port)
    {
        socket_.connectToHost(QHostAddress::LocalHost, port);
        QElapsedTimer clock;
        clock.start();
        while (socket_.state() != QAbstractSocket::ConnectedState && clock.elapsed() < 5000)
            QTest::qWait(5);
    }

    bool connected() const { return socket_.state() == QAbstractSocket::ConnectedState; }

    void send(const QByteArray& raw) { socket_.write(raw); socket_.flush(); }

    QList<Response> read(int count, int timeoutMs = 5000)
    {
        QList<Response> responses;
        QElapsedTimer clock;
        clock.start();
        while (responses.size() < count && clock.elapsed() < timeoutMs) {
            buffer_ += socket_.readAll();
            Response r;
            while (responses.size() < count && takeResponse(buffer_, r))
                responses.append(r);
            if (responses.size() < count)
                QTest::qWait(5);
        }
        return responses;
    }

    bool waitClosed(int timeoutMs = 5000)
    {
        QElapsedTimer clock;
        clock.start();
        while (socket_.state() != QAbstractSocket::UnconnectedState && clock.elapsed() < timeoutMs)
            QTest::qWait(5);
        return socket_.state() == QAbstractSocket::UnconnectedState;
    }

private:
    QTcpSocket socket_;
    QByteArray buffer_;
};

QByteArray get(const QByteArray& path, const QByteArray& extra = QByteArray())
{
    return "GET " + path + " HTTP/1.1\r\nHost: 127.0.0.1\r\n" + extra + "\r\n";
}

} // namespace

class TestMediaServer : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void servesWholeFile();
    void servesClosedRange();
    void openEndedRangeStopsAtChunk();
    void openEndedRangeStopsAtEof();
    void unsatisfiableRange();
    void hugeRangeStartRejected();
    void malformedRange();
    void missingFile();
    void queryStringIgnored();
    void nonGetRejected();
    void malformedRequestLine();
    void pathEscapesRejected();
    void keepAliveServesSequentialRequests();
    void connectionsAreIndependent();
    void largeFileStreamedInChunks();
    void floodDuringBodyClosesConnection();
    void stopClosesListener();

private:
    std::unique_ptr<QTemporaryDir> dir_;
    std::unique_ptr<cvn::MediaServer> server_;
    QByteArray data_;
    quint16 port_ = 0;
};

void TestMediaServer::init()
{
    dir_ = std::make_unique<QTemporaryDir>();
    QVERIFY(dir_->isValid());

    data_.clear();
    for (int i = 0; i < 200; ++i)
        data_.append(static_cast<char>(i % 251));
    QFile f(dir_->filePath("kitchen.mp3"));
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(data_);
    f.close();

    server_ = std::make_unique<cvn::MediaServer>(dir_->path(), 64);
    QVERIFY(server_->start(0, QHostAddress::LocalHost));
    port_ = server_->port();
    QVERIFY(port_ != 0);
}

void TestMediaServer::cleanup()
{
    server_.reset();
    dir_.reset();
}

void TestMediaServer::servesWholeFile()
{
    Client client(port_);
    QVERIFY(client.connected());
    client.send(get("/kitchen.mp3"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);

    const Response& r = responses.first();
    QCOMPARE(r.status, 200);
    QCOMPARE(r.body, data_);
    QCOMPARE(r.headers.value("content-type"), QByteArray("audio/mpeg"));
    QCOMPARE(r.headers.value("content-length"), QByteArray("200"));
    QCOMPARE(r.headers.value("accept-ranges"), QByteArray("bytes"));
    QVERIFY(r.headers.value("cache-control").contains("no-cache"));
    QCOMPARE(r.headers.value("pragma"), QByteArray("no-cache"));
    QCOMPARE(r.headers.value("expires"), QByteArray("0"));
}

void TestMediaServer::servesClosedRange()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: bytes=10-19\r\n"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);

    const Response& r = responses.first();
    QCOMPARE(r.status, 206);
    QCOMPARE(r.body, data_.mid(10, 10));
    QCOMPARE(r.headers.value("content-range"), QByteArray("bytes 10-19/200"));
    QCOMPARE(r.headers.value("content-length"), QByteArray("10"));
}

void TestMediaServer::openEndedRangeStopsAtChunk()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: bytes=100-\r\n"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 206);
    QCOMPARE(responses[0].headers.value("content-range"), QByteArray("bytes 100-163/200"));
    QCOMPARE(responses[0].body, data_.mid(100, 64));
}

void TestMediaServer::openEndedRangeStopsAtEof()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: bytes=150-\r\n"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 206);
    QCOMPARE(responses[0].headers.value("content-range"), QByteArray("bytes 150-199/200"));
    QCOMPARE(responses[0].body, data_.mid(150));
}

void TestMediaServer::unsatisfiableRange()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: bytes=500-600\r\n"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 416);
    QCOMPARE(responses[0].headers.value("content-range"), QByteArray("bytes */200"));
    QVERIFY(responses[0].body.isEmpty());
}

void TestMediaServer::hugeRangeStartRejected()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: bytes=9223372036854775807-\r\n"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 416);
    QCOMPARE(responses[0].headers.value("content-range"), QByteArray("bytes */200"));
}

void TestMediaServer::malformedRange()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: items=1-2\r\n"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 400);
    QVERIFY(client.waitClosed());
}

void TestMediaServer::missingFile()
{
    QSignalSpy served(server_.get(), &cvn::MediaServer::requestServed);
    Client client(port_);
    client.send(get("/nobody.mp3"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 404);
    QCOMPARE(responses[0].headers.value("content-type"), QByteArray("audio/mpeg"));

    QCOMPARE(served.count(), 1);
    QCOMPARE(served[0][0].toInt(), 404);
    QCOMPARE(served[0][1].toString(), QString("/nobody.mp3"));
}

void TestMediaServer::queryStringIgnored()
{
    Client client(port_);
    client.send(get("/kitchen.mp3?t=1700000000000"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 200);
    QCOMPARE(responses[0].body, data_);
}

void TestMediaServer::nonGetRejected()
{
    Client client(port_);
    client.send("POST /kitchen.mp3 HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n");
    client.send("HEAD /kitchen.mp3 HTTP/1.1\r\nHost: x\r\n\r\n");
    auto responses = client.read(2);
    QCOMPARE(responses.size(), 2);
    QCOMPARE(responses[0].status, 405);
    QCOMPARE(responses[1].status, 405);
}

void TestMediaServer::malformedRequestLine()
{
    Client client(port_);
    client.send("GARBAGE\r\n\r\n");
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 400);
    QVERIFY(client.waitClosed());
}

void TestMediaServer::pathEscapesRejected()
{
    // A file next to the asset directory must never be reachable
    QTemporaryDir outer;
    QVERIFY(outer.isValid());
    QDir(outer.path()).mkdir("assets");
    QFile secret(outer.filePath("secret.mp3"));
    QVERIFY(secret.open(QIODevice::WriteOnly));
    secret.write("secret");
    secret.close();

    cvn::MediaServer server(outer.filePath("assets"), 64);
    QVERIFY(server.resolvePath("/../secret.mp3").isEmpty());
    QVERIFY(server.resolvePath("/assets/../../secret.mp3").isEmpty());
    QVERIFY(server.resolvePath("/").isEmpty());
    QVERIFY(server_->resolvePath("/kitchen.mp3").endsWith("/kitchen.mp3"));

    Client client(port_);
    client.send(get("/../kitchen.mp3"));
    auto responses = client.read(1);
    QCOMPARE(responses.size(), 1);
    // Cleaned to /kitchen.mp3 inside the root, or refused; never outside
    QVERIFY(responses[0].status == 200 || responses[0].status == 404);
}

void TestMediaServer::keepAliveServesSequentialRequests()
{
    Client client(port_);
    client.send(get("/kitchen.mp3", "Range: bytes=0-63\r\n"));
    client.send(get("/kitchen.mp3", "Range: bytes=64-127\r\n"));
    auto responses = client.read(2);
    QCOMPARE(responses.size(), 2);
    QCOMPARE(responses[0].status, 206);
    QCOMPARE(responses[0].body, data_.mid(0, 64));
    QCOMPARE(responses[1].status, 206);
    QCOMPARE(responses[1].body, data_.mid(64, 64));
    QCOMPARE(server_->connectionCount(), 1);
}

void TestMediaServer::connectionsAreIndependent()
{
    Client first(port_);
    Client second(port_);
    QVERIFY(first.connected());
    QVERIFY(second.connected());

    // An unfinished request on one connection must not hold up the other
    first.send("GET /kitchen.mp3 HTTP/1.1\r\nHost: x\r\n");
    second.send(get("/kitchen.mp3", "Range: bytes=0-9\r\n"));
    auto responses = second.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].body, data_.left(10));

    first.send("\r\n");
    responses = first.read(1);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 200);
}

void TestMediaServer::largeFileStreamedInChunks()
{
    QByteArray big(1024 * 1024, '\0');
    for (int i = 0; i < big.size(); ++i)
        big[i] = static_cast<char>((i * 7) % 256);
    QFile f(dir_->filePath("big.mp3"));
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(big);
    f.close();

    cvn::MediaServer server(dir_->path(), 16384);
    QVERIFY(server.start(0, QHostAddress::LocalHost));

    Client client(server.port());
    client.send(get("/big.mp3"));
    auto responses = client.read(1, 15000);
    QCOMPARE(responses.size(), 1);
    QCOMPARE(responses[0].status, 200);
    QCOMPARE(responses[0].body.size(), big.size());
    QVERIFY(responses[0].body == big);
}

void TestMediaServer::floodDuringBodyClosesConnection()
{
    QByteArray big(16 * 1024 * 1024, 'a');
    QFile f(dir_->filePath("long.mp3"));
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(big);
    f.close();

    cvn::MediaServer server(dir_->path(), 1024);
    QVERIFY(server.start(0, QHostAddress::LocalHost));

    Client client(server.port());
    QVERIFY(client.connected());
    // No header terminator, so none of this can ever become a request
    client.send(get("/long.mp3") + QByteArray(256 * 1024, 'x'));

    QVERIFY(client.waitClosed(10000));
    QVERIFY(client.read(1, 200).isEmpty());
    QTRY_COMPARE(server.connectionCount(), 0);
}

void TestMediaServer::stopClosesListener()
{
    QVERIFY(server_->isListening());
    server_->stop();
    QVERIFY(!server_->isListening());
    QCOMPARE(server_->connectionCount(), 0);
}

QTEST_MAIN(TestMediaServer)
#include "test_media_server.moc"
