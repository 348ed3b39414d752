#include "core/services/IpcServer.hpp"
#include "core/notify/NotificationCenter.hpp"
#include "core/notify/TargetRegistry.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QFile>
#include <QDebug>

namespace cvn {

namespace {
// Requests larger than this without a newline are dropped
constexpr int MAX_REQUEST_BYTES = 64 * 1024;

QByteArray errorReply(const QString& message)
{
    QJsonObject obj;
    obj["ok"] = false;
    obj["error"] = message;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}
} // namespace

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    stop();
}

bool IpcServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "IpcServer: Failed to listen on" << socketPath << ":" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "IpcServer: Listening on" << socketPath;
    return true;
}

void IpcServer::stop()
{
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

void IpcServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);
    }
}

void IpcServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    QByteArray& buffer = buffers_[socket];
    buffer.append(socket->readAll());

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        if (line.isEmpty())
            continue;
        socket->write(handleRequest(line) + "\n");
    }
    socket->flush();

    if (buffer.size() > MAX_REQUEST_BYTES) {
        qWarning() << "IpcServer: request too large, closing client";
        buffers_.remove(socket);
        socket->disconnectFromServer();
    }
}

void IpcServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (socket) {
        buffers_.remove(socket);
        socket->deleteLater();
    }
}

QByteArray IpcServer::handleRequest(const QByteArray& request)
{
    QJsonDocument doc = QJsonDocument::fromJson(request);
    if (!doc.isObject()) {
        return errorReply(QStringLiteral("Invalid JSON"));
    }

    QJsonObject obj = doc.object();
    QString command = obj.value("command").toString();
    QVariantMap data = obj.value("data").toObject().toVariantMap();

    if (command == QLatin1String("notify"))
        return handleNotify(data);
    if (command == QLatin1String("list_targets"))
        return handleListTargets();
    if (command == QLatin1String("status"))
        return handleStatus();
    if (command == QLatin1String("set_volume") || command == QLatin1String("mute")
        || command == QLatin1String("seek") || command == QLatin1String("rewind")
        || command == QLatin1String("stop_app") || command == QLatin1String("start_app"))
        return handleTargetCommand(command, data);

    return errorReply(QStringLiteral("Unknown command"));
}

QByteArray IpcServer::handleNotify(const QVariantMap& data)
{
    if (!center_) return errorReply(QStringLiteral("Notifications not available"));

    const QString text = data.value("text").toString();
    const QString target = data.value("target").toString();

    QString error;
    if (!center_->notify(target, text, &error))
        return errorReply(error);

    QJsonObject obj;
    obj["ok"] = true;
    obj["pending"] = center_->pendingCount();
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray IpcServer::handleTargetCommand(const QString& command, const QVariantMap& data)
{
    if (!registry_) return errorReply(QStringLiteral("Target registry not available"));

    const QString name = data.value("target").toString().trimmed();
    if (name.isEmpty())
        return errorReply(QStringLiteral("Missing target"));
    std::shared_ptr<ITarget> target = registry_->resolve(name);
    if (!target)
        return errorReply(QStringLiteral("Unknown target '%1'").arg(name));
    if (!target->isReady())
        return errorReply(QStringLiteral("Target '%1' is not connected").arg(target->name()));

    if (command == QLatin1String("set_volume")) {
        bool ok = false;
        const double level = data.value("level").toDouble(&ok);
        if (!ok || level < 0.0 || level > 100.0)
            return errorReply(QStringLiteral("level must be between 0 and 100"));
        target->setVolume(level / 100.0);
    } else if (command == QLatin1String("mute")) {
        if (!data.contains("muted"))
            return errorReply(QStringLiteral("Missing muted"));
        target->setMuted(data.value("muted").toBool());
    } else if (command == QLatin1String("seek") || command == QLatin1String("rewind")) {
        IMediaSession* media = target->mediaSession();
        if (!media || !media->isActive())
            return errorReply(QStringLiteral("Nothing is playing on '%1'").arg(target->name()));
        double position = 0.0;
        if (command == QLatin1String("seek")) {
            bool ok = false;
            const double percent = data.value("percent").toDouble(&ok);
            if (!ok || percent < 0.0 || percent > 100.0)
                return errorReply(QStringLiteral("percent must be between 0 and 100"));
            const PlaybackObservation obs = media->getStatus();
            if (!obs.hasDuration || obs.duration <= 0.0)
                return errorReply(QStringLiteral("No duration found, seeking is not possible"));
            position = obs.duration * percent / 100.0;
        }
        if (!media->seek(position))
            return errorReply(QStringLiteral("Seek rejected by '%1'").arg(target->name()));
    } else if (command == QLatin1String("stop_app")) {
        target->stopApp();
    } else {
        const QString appId = data.value("app_id").toString().trimmed();
        if (appId.isEmpty())
            return errorReply(QStringLiteral("Missing app_id"));
        target->startApp(appId);
    }

    qInfo() << "IpcServer:" << command << "sent to" << target->name();
    QJsonObject obj;
    obj["ok"] = true;
    obj["target"] = target->id();
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray IpcServer::handleListTargets()
{
    if (!registry_) return errorReply(QStringLiteral("Target registry not available"));

    QJsonArray arr;
    for (const auto& target : registry_->targets()) {
        QJsonObject t;
        t["id"] = target->id();
        t["name"] = target->name();
        t["model"] = target->model();
        t["ready"] = target->isReady();
        arr.append(t);
    }

    QJsonObject obj;
    obj["ok"] = true;
    obj["targets"] = arr;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray IpcServer::handleStatus()
{
    if (!center_) return errorReply(QStringLiteral("Notifications not available"));

    const WorkerStats stats = center_->stats();

    QJsonArray recent;
    for (const auto& outcome : stats.recent) {
        QJsonObject o;
        o["target"] = outcome.target;
        o["outcome"] = QString::fromLatin1(notifyErrorName(outcome.error));
        o["timestamp"] = outcome.timestampMs;
        recent.append(o);
    }

    QJsonObject obj;
    obj["ok"] = true;
    obj["running"] = center_->isRunning();
    obj["queue_length"] = center_->pendingCount();
    obj["completed"] = stats.completed;
    obj["failed"] = stats.failed;
    obj["skipped"] = stats.skipped;
    obj["interrupted"] = stats.interrupted;
    obj["recent"] = recent;
    obj["media_port"] = center_->mediaPort();
    obj["stage"] = QString::fromLatin1(workerStageName(center_->stage()));
    if (registry_)
        obj["targets"] = registry_->size();
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace cvn
