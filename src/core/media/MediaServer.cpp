#include "core/media/MediaServer.hpp"
#include <QDir>
#include <QFileInfo>
#include <QTcpServer>
#include <QTcpSocket>
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace cvn {

namespace {
constexpr int MAX_HEADER_BYTES = 16 * 1024;
// Pipelined bytes held back while a body is still streaming
constexpr int MAX_PENDING_BYTES = 4 * MAX_HEADER_BYTES;
constexpr char CONTENT_TYPE[] = "audio/mpeg";
}

MediaServer::MediaServer(const QString& assetDir, int chunkBytes, QObject* parent)
    : QObject(parent)
    , assetDir_(QDir(assetDir).absolutePath())
    , chunkBytes_(chunkBytes > 0 ? chunkBytes : 16384)
{
}

MediaServer::~MediaServer()
{
    stop();
}

bool MediaServer::start(quint16 port, const QHostAddress& address)
{
    if (server_ && server_->isListening())
        return true;

    if (!server_) {
        server_ = new QTcpServer(this);
        connect(server_, &QTcpServer::newConnection, this, &MediaServer::onNewConnection);
    }

    if (!server_->listen(address, port)) {
        BOOST_LOG_TRIVIAL(error) << "[MediaServer] cannot listen on port " << port << ": "
                                 << server_->errorString().toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[MediaServer] serving " << assetDir_.toStdString()
                            << " on port " << server_->serverPort();
    return true;
}

void MediaServer::stop()
{
    if (server_ && server_->isListening()) {
        server_->close();
        BOOST_LOG_TRIVIAL(info) << "[MediaServer] stopped";
    }

    const auto sockets = connections_.keys();
    connections_.clear();
    for (QTcpSocket* socket : sockets) {
        socket->disconnect(this);
        socket->abort();
        socket->deleteLater();
    }
}

bool MediaServer::isListening() const
{
    return server_ && server_->isListening();
}

quint16 MediaServer::port() const
{
    return server_ ? server_->serverPort() : 0;
}

QString MediaServer::resolvePath(const QString& requestPath) const
{
    const QString cleaned = QDir::cleanPath("/" + requestPath);
    if (cleaned == "/" || cleaned.contains("/../") || cleaned.endsWith("/.."))
        return {};

    QFileInfo info(assetDir_ + cleaned);
    if (!info.exists() || !info.isFile())
        return {};

    // Symlinks must not lead outside the asset directory either
    const QString root = QFileInfo(assetDir_).canonicalFilePath();
    const QString resolved = info.canonicalFilePath();
    if (root.isEmpty() || !resolved.startsWith(root + "/"))
        return {};
    return resolved;
}

void MediaServer::onNewConnection()
{
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        connections_.insert(socket, std::make_shared<Connection>());

        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::bytesWritten, this, [this, socket]() { onBytesWritten(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            connections_.remove(socket);
            socket->deleteLater();
        });
    }
}

void MediaServer::onReadyRead(QTcpSocket* socket)
{
    auto it = connections_.find(socket);
    if (it == connections_.end())
        return;
    std::shared_ptr<Connection> conn = it.value();

    conn->buffer.append(socket->readAll());
    if (conn->buffer.size() > MAX_PENDING_BYTES) {
        BOOST_LOG_TRIVIAL(warning) << "[MediaServer] client sent " << conn->buffer.size()
                                   << " unprocessed bytes, closing connection";
        conn->buffer.clear();
        conn->file.reset();
        conn->remaining = 0;
        socket->abort();
        return;
    }
    // Pipelined requests wait until the current body is out
    if (!conn->file)
        processBuffer(socket, *conn);
}

void MediaServer::processBuffer(QTcpSocket* socket, Connection& conn)
{
    while (!conn.file && socket->state() == QAbstractSocket::ConnectedState) {
        int end = conn.buffer.indexOf("\r\n\r\n");
        int separator = 4;
        if (end < 0) {
            end = conn.buffer.indexOf("\n\n");
            separator = 2;
        }
        if (end < 0) {
            if (conn.buffer.size() > MAX_HEADER_BYTES) {
                conn.buffer.clear();
                sendError(socket, conn, 400, QString(), true);
            }
            return;
        }

        const QByteArray head = conn.buffer.left(end);
        conn.buffer.remove(0, end + separator);

        try {
            handleRequest(socket, conn, head);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[MediaServer] request failed: " << e.what();
            conn.file.reset();
            conn.remaining = 0;
            sendError(socket, conn, 500, QString(), true);
            return;
        }

        if (!conn.keepAlive)
            return;
    }
}

void MediaServer::handleRequest(QTcpSocket* socket, Connection& conn, const QByteArray& head)
{
    HttpRequest request;
    if (!HttpRequest::parse(head, request)) {
        BOOST_LOG_TRIVIAL(warning) << "[MediaServer] malformed request from "
                                   << socket->peerAddress().toString().toStdString();
        sendError(socket, conn, 400, QString(), true);
        return;
    }

    conn.keepAlive = request.keepAlive();

    if (request.method != QLatin1String("GET")) {
        sendError(socket, conn, 405, request.path, !conn.keepAlive);
        return;
    }

    serveFile(socket, conn, request);
}

void MediaServer::serveFile(QTcpSocket* socket, Connection& conn, const HttpRequest& request)
{
    const QString filePath = resolvePath(request.path);
    if (filePath.isEmpty()) {
        sendError(socket, conn, 404, request.path, !conn.keepAlive);
        return;
    }

    auto file = std::make_unique<QFile>(filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(error) << "[MediaServer] cannot open " << filePath.toStdString()
                                 << ": " << file->errorString().toStdString();
        sendError(socket, conn, 500, request.path, true);
        return;
    }
    const qint64 fileSize = file->size();

    QList<QPair<QByteArray, QByteArray>> headers;
    headers.append({"Accept-Ranges", "bytes"});
    headers.append({"Cache-Control", "no-store, no-cache, must-revalidate"});
    headers.append({"Pragma", "no-cache"});
    headers.append({"Expires", "0"});

    int status = 200;
    ByteRange range{0, fileSize - 1};

    const QString rangeHeader = request.header("range");
    if (!rangeHeader.isEmpty()) {
        switch (parseRangeHeader(rangeHeader, fileSize, chunkBytes_, range)) {
        case RangeParse::Malformed:
            sendError(socket, conn, 400, request.path, true);
            return;
        case RangeParse::Unsatisfiable:
            headers.clear();
            headers.append({"Content-Range", "bytes */" + QByteArray::number(fileSize)});
            headers.append({"Content-Length", "0"});
            writeHead(socket, 416, headers, conn.keepAlive);
            emit requestServed(416, request.path, 0);
            finishResponse(socket, conn);
            return;
        case RangeParse::Valid:
            status = 206;
            headers.append({"Content-Range", "bytes " + QByteArray::number(range.start) + "-"
                                                 + QByteArray::number(range.end) + "/"
                                                 + QByteArray::number(fileSize)});
            break;
        }
    }

    const qint64 length = status == 206 ? range.length() : fileSize;
    headers.append({"Content-Length", QByteArray::number(length)});

    if (status == 206 && !file->seek(range.start))
        throw std::runtime_error("seek failed on " + filePath.toStdString());

    writeHead(socket, status, headers, conn.keepAlive);

    BOOST_LOG_TRIVIAL(debug) << "[MediaServer] " << status << " " << request.path.toStdString()
                             << (status == 206 ? " bytes " + std::to_string(range.start) + "-"
                                                     + std::to_string(range.end) : std::string())
                             << " (" << length << " of " << fileSize << " bytes)";
    emit requestServed(status, request.path, length);

    conn.file = std::move(file);
    conn.remaining = length;
    pump(socket, conn);
}

void MediaServer::sendError(QTcpSocket* socket, Connection& conn, int status,
                            const QString& path, bool close)
{
    if (close)
        conn.keepAlive = false;

    writeHead(socket, status, {{"Content-Length", "0"}}, conn.keepAlive);
    BOOST_LOG_TRIVIAL(debug) << "[MediaServer] " << status << " " << path.toStdString();
    emit requestServed(status, path, 0);
    finishResponse(socket, conn);
}

void MediaServer::writeHead(QTcpSocket* socket, int status,
                            const QList<QPair<QByteArray, QByteArray>>& headers, bool keepAlive)
{
    QByteArray head;
    head.reserve(256);
    head += "HTTP/1.1 " + QByteArray::number(status) + " " + httpReasonPhrase(status) + "\r\n";
    head += QByteArray("Content-Type: ") + CONTENT_TYPE + "\r\n";
    for (const auto& h : headers)
        head += h.first + ": " + h.second + "\r\n";
    head += keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    head += "\r\n";
    socket->write(head);
}

void MediaServer::onBytesWritten(QTcpSocket* socket)
{
    auto it = connections_.find(socket);
    if (it == connections_.end())
        return;
    std::shared_ptr<Connection> conn = it.value();
    if (conn->file)
        pump(socket, *conn);
}

void MediaServer::pump(QTcpSocket* socket, Connection& conn)
{
    while (conn.file && conn.remaining > 0 && socket->bytesToWrite() < 2 * chunkBytes_) {
        const QByteArray data = conn.file->read(qMin<qint64>(chunkBytes_, conn.remaining));
        if (data.isEmpty()) {
            // File shrank underneath us; the declared length can no longer be honoured
            BOOST_LOG_TRIVIAL(warning) << "[MediaServer] short read on "
                                       << conn.file->fileName().toStdString();
            conn.file.reset();
            conn.remaining = 0;
            socket->abort();
            return;
        }
        socket->write(data);
        conn.remaining -= data.size();
    }

    if (conn.file && conn.remaining == 0) {
        conn.file.reset();
        finishResponse(socket, conn);
    }
}

void MediaServer::finishResponse(QTcpSocket* socket, Connection& conn)
{
    if (!conn.keepAlive) {
        socket->disconnectFromHost();
        return;
    }
    if (!conn.buffer.isEmpty() && !conn.file)
        QMetaObject::invokeMethod(this, [this, socket]() { onReadyRead(socket); },
                                  Qt::QueuedConnection);
}

} // namespace cvn
