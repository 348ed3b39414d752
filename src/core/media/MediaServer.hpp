#pragma once

#include "core/media/HttpRequest.hpp"
#include <QHostAddress>
#include <QObject>
#include <QHash>
#include <QFile>
#include <memory>

class QTcpServer;
class QTcpSocket;

namespace cvn {

/// Minimal GET-only HTTP/1.1 server for the synthesized audio files.
/// Lives on the main thread's event loop so fetching is never blocked by the
/// notification worker; every connection is handled independently.
class MediaServer : public QObject {
    Q_OBJECT
public:
    MediaServer(const QString& assetDir, int chunkBytes, QObject* parent = nullptr);
    ~MediaServer() override;

    bool start(quint16 port, const QHostAddress& address = QHostAddress::Any);
    /// Stop accepting and drop open connections.
    void stop();

    bool isListening() const;
    quint16 port() const;
    QString assetDir() const { return assetDir_; }
    int chunkBytes() const { return chunkBytes_; }
    int connectionCount() const { return connections_.size(); }

    /// Map a request path to a file inside the asset directory.
    /// Returns an empty string for escapes, directories and missing files.
    QString resolvePath(const QString& requestPath) const;

signals:
    void requestServed(int status, const QString& path, qint64 bytes);

private:
    struct Connection {
        QByteArray buffer;
        std::unique_ptr<QFile> file;
        qint64 remaining = 0;
        bool keepAlive = true;
    };

    void onNewConnection();
    void onReadyRead(QTcpSocket* socket);
    void onBytesWritten(QTcpSocket* socket);
    void processBuffer(QTcpSocket* socket, Connection& conn);
    void handleRequest(QTcpSocket* socket, Connection& conn, const QByteArray& head);
    void serveFile(QTcpSocket* socket, Connection& conn, const HttpRequest& request);
    void sendError(QTcpSocket* socket, Connection& conn, int status,
                   const QString& path, bool close);
    void writeHead(QTcpSocket* socket, int status, const QList<QPair<QByteArray, QByteArray>>& headers,
                   bool keepAlive);
    void pump(QTcpSocket* socket, Connection& conn);
    void finishResponse(QTcpSocket* socket, Connection& conn);

    QString assetDir_;
    int chunkBytes_;
    QTcpServer* server_ = nullptr;
    QHash<QTcpSocket*, std::shared_ptr<Connection>> connections_;
};

} // namespace cvn
