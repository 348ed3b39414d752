#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QHash>

namespace cvn {

class NotificationCenter;
class TargetRegistry;

/// Unix domain socket IPC server, the local trigger surface.
///
/// Each request is one JSON object per line:
///   {"command": "notify", "data": {"target": "Kitchen", "text": "..."}}
/// and is answered with one JSON object per line.
///
/// Per-target controls: set_volume {target, level 0-100}, mute {target, muted},
/// seek {target, percent}, rewind {target}, stop_app {target},
/// start_app {target, app_id}.
class IpcServer : public QObject {
    Q_OBJECT

public:
    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    /// Start listening. Returns false if the socket cannot be bound.
    bool start(const QString& socketPath = QStringLiteral("/tmp/cast-voice-notifier.sock"));
    void stop();
    bool isListening() const { return server_ && server_->isListening(); }

    void setNotificationCenter(NotificationCenter* center) { center_ = center; }
    void setTargetRegistry(const TargetRegistry* registry) { registry_ = registry; }

    /// Dispatch one request line; exposed for tests.
    QByteArray handleRequest(const QByteArray& request);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    QByteArray handleNotify(const QVariantMap& data);
    QByteArray handleListTargets();
    QByteArray handleStatus();
    QByteArray handleTargetCommand(const QString& command, const QVariantMap& data);

    QLocalServer* server_ = nullptr;
    QHash<QLocalSocket*, QByteArray> buffers_;
    NotificationCenter* center_ = nullptr;
    const TargetRegistry* registry_ = nullptr;
};

} // namespace cvn
