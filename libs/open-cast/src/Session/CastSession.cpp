#include <ocast/Session/CastSession.hpp>
#include <ocast/Status/StatusParser.hpp>
#include <ocast/Channel/Namespaces.hpp>
#include <ocast/Version.hpp>
#include <QDebug>

namespace ocast {

namespace {

QJsonObject typed(const char* type)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("type"), QString::fromLatin1(type));
    return obj;
}

} // namespace

CastSession::CastSession(ITransport* transport, const SessionConfig& config,
                         QObject* parent)
    : QObject(parent)
    , config_(config)
    , transport_(transport)
    , messenger_(new Messenger(transport, this))
{
    connectTimer_.setSingleShot(true);
    connect(&connectTimer_, &QTimer::timeout, this, &CastSession::onConnectTimeout);
    connect(&heartbeatTimer_, &QTimer::timeout, this, &CastSession::onHeartbeatTick);

    connect(transport_, &ITransport::connected,
            this, &CastSession::onTransportConnected);
    connect(transport_, &ITransport::disconnected,
            this, &CastSession::onTransportDisconnected);
    connect(transport_, &ITransport::error,
            this, &CastSession::onTransportError);

    connect(messenger_, &Messenger::messageReceived,
            this, &CastSession::onMessage);
    connect(messenger_, &Messenger::protocolError,
            this, &CastSession::onTransportError);
}

CastSession::~CastSession()
{
    stop();
}

void CastSession::start()
{
    if (state_ != SessionState::Idle && state_ != SessionState::Disconnected)
        return;

    receiverStatus_ = ReceiverStatus{};
    clearMediaSession();
    hasPendingLoad_ = false;

    messenger_->start();
    setState(SessionState::Connecting);

    if (transport_->isConnected()) {
        onTransportConnected();
    } else {
        connectTimer_.start(config_.connectTimeout);
        transport_->start();
    }
}

void CastSession::stop()
{
    if (state_ == SessionState::Idle || state_ == SessionState::Disconnected)
        return;

    if (state_ == SessionState::Connected) {
        if (!mediaTransportId_.isEmpty())
            messenger_->send(config_.senderId, mediaTransportId_,
                             Namespace::Connection, typed(MessageType::Close));
        messenger_->send(config_.senderId, config_.receiverId,
                         Namespace::Connection, typed(MessageType::Close));
    }
    teardown(DisconnectReason::UserRequested);
    transport_->stop();
}

SessionState CastSession::state() const
{
    return state_;
}

Messenger* CastSession::messenger() const
{
    return messenger_;
}

void CastSession::setState(SessionState newState)
{
    if (state_ == newState)
        return;
    state_ = newState;
    emit stateChanged(newState);
}

void CastSession::teardown(DisconnectReason reason)
{
    if (state_ == SessionState::Disconnected || state_ == SessionState::Idle)
        return;

    connectTimer_.stop();
    heartbeatTimer_.stop();
    messenger_->stop();

    bool wasActive = mediaActive_;
    clearMediaSession();
    if (wasActive)
        emit mediaSessionInactive();

    if (hasPendingLoad_) {
        hasPendingLoad_ = false;
        emit mediaLoadFailed(QStringLiteral("session closed before load"));
    }

    setState(SessionState::Disconnected);
    emit disconnected(reason);
}

void CastSession::onTransportConnected()
{
    if (state_ != SessionState::Connecting)
        return;
    connectTimer_.stop();

    QJsonObject hello = typed(MessageType::Connect);
    hello.insert(QStringLiteral("userAgent"), config_.userAgent);
    messenger_->send(config_.senderId, config_.receiverId,
                     Namespace::Connection, hello);

    lastReceived_.start();
    heartbeatTimer_.start(config_.heartbeatInterval);
    setState(SessionState::Connected);

    requestReceiverStatus();
}

void CastSession::onTransportDisconnected()
{
    qInfo() << "[CastSession] transport disconnected";
    teardown(DisconnectReason::TransportError);
}

void CastSession::onTransportError(const QString& message)
{
    qWarning() << "[CastSession] transport error:" << message;
    teardown(DisconnectReason::TransportError);
    transport_->stop();
}

void CastSession::onConnectTimeout()
{
    if (state_ != SessionState::Connecting)
        return;
    qWarning() << "[CastSession] connect timed out after" << config_.connectTimeout << "ms";
    teardown(DisconnectReason::ConnectTimeout);
    transport_->stop();
}

void CastSession::onHeartbeatTick()
{
    if (state_ != SessionState::Connected)
        return;

    if (lastReceived_.elapsed() > config_.heartbeatTimeout) {
        qWarning() << "[CastSession] no traffic for" << lastReceived_.elapsed()
                   << "ms, dropping connection";
        teardown(DisconnectReason::HeartbeatTimeout);
        transport_->stop();
        return;
    }

    messenger_->send(config_.senderId, config_.receiverId,
                     Namespace::Heartbeat, typed(MessageType::Ping));
}

void CastSession::onMessage(const QString& sourceId, const QString& destinationId,
                            const QString& ns, const QJsonObject& payload)
{
    Q_UNUSED(destinationId)
    if (state_ != SessionState::Connected)
        return;

    lastReceived_.restart();
    const QString type = payload.value(QStringLiteral("type")).toString();

    if (ns == QLatin1String(Namespace::Heartbeat))
        handleHeartbeat(sourceId, type);
    else if (ns == QLatin1String(Namespace::Connection))
        handleConnection(sourceId, type);
    else if (ns == QLatin1String(Namespace::Receiver))
        handleReceiver(type, payload);
    else if (ns == QLatin1String(Namespace::Media))
        handleMedia(type, payload);
    else
        qDebug() << "[CastSession] ignoring message on" << ns << "type" << type;
}

void CastSession::handleHeartbeat(const QString& sourceId, const QString& type)
{
    if (type == QLatin1String(MessageType::Ping)) {
        messenger_->send(config_.senderId, sourceId,
                         Namespace::Heartbeat, typed(MessageType::Pong));
    }
    // PONG only refreshes lastReceived_
}

void CastSession::handleConnection(const QString& sourceId, const QString& type)
{
    if (type != QLatin1String(MessageType::Close))
        return;

    if (sourceId == config_.receiverId) {
        qInfo() << "[CastSession] receiver closed the virtual connection";
        teardown(DisconnectReason::RemoteClosed);
        transport_->stop();
    } else if (sourceId == mediaTransportId_) {
        qInfo() << "[CastSession] media receiver closed its connection";
        clearMediaSession();
        emit mediaSessionInactive();
    }
}

void CastSession::handleReceiver(const QString& type, const QJsonObject& payload)
{
    if (type == QLatin1String(MessageType::LaunchError)) {
        QString reason = payload.value(QStringLiteral("reason")).toString();
        qWarning() << "[CastSession] launch failed:" << reason;
        if (hasPendingLoad_) {
            hasPendingLoad_ = false;
            emit mediaLoadFailed(reason.isEmpty() ? QStringLiteral("LAUNCH_ERROR") : reason);
        }
        return;
    }

    if (type != QLatin1String(MessageType::ReceiverStatus))
        return;

    ReceiverStatus status;
    if (!StatusParser::parseReceiverStatus(payload, status)) {
        qWarning() << "[CastSession] RECEIVER_STATUS without status object";
        return;
    }
    receiverStatus_ = status;

    const bool isMediaReceiver = status.appId == QLatin1String(DEFAULT_MEDIA_RECEIVER_APP_ID)
                                 && !status.transportId.isEmpty()
                                 && status.sessionId != stoppedSessionId_;

    if (isMediaReceiver) {
        if (status.transportId != mediaTransportId_)
            connectMediaTransport(status.transportId);
    } else if (mediaActive_) {
        clearMediaSession();
        emit mediaSessionInactive();
    }

    emit receiverStatusChanged(receiverStatus_);
}

void CastSession::handleMedia(const QString& type, const QJsonObject& payload)
{
    if (type == QLatin1String(MessageType::MediaStatus)) {
        MediaStatus status;
        if (!StatusParser::parseMediaStatus(payload, status)) {
            qWarning() << "[CastSession] MEDIA_STATUS without status array";
            return;
        }
        mediaStatus_ = status;
        emit mediaStatusChanged(mediaStatus_);
        return;
    }

    if (type == QLatin1String(MessageType::LoadFailed)
        || type == QLatin1String(MessageType::LoadCancelled)
        || type == QLatin1String(MessageType::InvalidRequest)) {
        QString reason = payload.value(QStringLiteral("reason")).toString();
        qWarning() << "[CastSession]" << type << reason;
        emit mediaLoadFailed(reason.isEmpty() ? type : reason);
    }
}

void CastSession::connectMediaTransport(const QString& transportId)
{
    if (mediaActive_ && !mediaTransportId_.isEmpty())
        qDebug() << "[CastSession] media transport changed" << mediaTransportId_ << "->" << transportId;

    mediaTransportId_ = transportId;
    mediaStatus_ = MediaStatus{};
    messenger_->send(config_.senderId, mediaTransportId_,
                     Namespace::Connection, typed(MessageType::Connect));
    mediaActive_ = true;
    emit mediaSessionActive(mediaTransportId_);

    if (hasPendingLoad_)
        sendLoad();
    else
        requestMediaStatus();
}

void CastSession::clearMediaSession()
{
    mediaActive_ = false;
    mediaTransportId_.clear();
    mediaStatus_ = MediaStatus{};
}

int CastSession::nextRequestId()
{
    return ++requestId_;
}

void CastSession::sendReceiver(QJsonObject payload)
{
    if (state_ != SessionState::Connected)
        return;
    payload.insert(QStringLiteral("requestId"), nextRequestId());
    messenger_->send(config_.senderId, config_.receiverId, Namespace::Receiver, payload);
}

void CastSession::sendMedia(QJsonObject payload)
{
    if (state_ != SessionState::Connected || mediaTransportId_.isEmpty())
        return;
    payload.insert(QStringLiteral("requestId"), nextRequestId());
    messenger_->send(config_.senderId, mediaTransportId_, Namespace::Media, payload);
}

void CastSession::requestReceiverStatus()
{
    sendReceiver(typed(MessageType::GetStatus));
}

void CastSession::setVolume(double level)
{
    QJsonObject volume;
    volume.insert(QStringLiteral("level"), qBound(0.0, level, 1.0));
    QJsonObject msg = typed(MessageType::SetVolume);
    msg.insert(QStringLiteral("volume"), volume);
    sendReceiver(msg);
}

void CastSession::setMuted(bool muted)
{
    QJsonObject volume;
    volume.insert(QStringLiteral("muted"), muted);
    QJsonObject msg = typed(MessageType::SetVolume);
    msg.insert(QStringLiteral("volume"), volume);
    sendReceiver(msg);
}

void CastSession::launchApp(const QString& appId)
{
    QJsonObject msg = typed(MessageType::Launch);
    msg.insert(QStringLiteral("appId"), appId);
    sendReceiver(msg);
}

bool CastSession::stopApp()
{
    if (!receiverStatus_.hasApplication() || receiverStatus_.sessionId.isEmpty())
        return false;

    QJsonObject msg = typed(MessageType::Stop);
    msg.insert(QStringLiteral("sessionId"), receiverStatus_.sessionId);
    sendReceiver(msg);

    stoppedSessionId_ = receiverStatus_.sessionId;
    if (mediaActive_) {
        clearMediaSession();
        emit mediaSessionInactive();
    }
    return true;
}

void CastSession::loadMedia(const QString& url, const QString& contentType)
{
    if (state_ != SessionState::Connected) {
        emit mediaLoadFailed(QStringLiteral("not connected"));
        return;
    }

    hasPendingLoad_ = true;
    pendingUrl_ = url;
    pendingContentType_ = contentType;
    // A fresh launch may reuse the session id we stopped earlier
    stoppedSessionId_.clear();

    if (mediaActive_)
        sendLoad();
    else
        launchApp(QString::fromLatin1(DEFAULT_MEDIA_RECEIVER_APP_ID));
}

void CastSession::sendLoad()
{
    QJsonObject media;
    media.insert(QStringLiteral("contentId"), pendingUrl_);
    media.insert(QStringLiteral("contentType"), pendingContentType_);
    media.insert(QStringLiteral("streamType"), QStringLiteral("BUFFERED"));

    QJsonObject msg = typed(MessageType::Load);
    msg.insert(QStringLiteral("media"), media);
    msg.insert(QStringLiteral("autoplay"), true);
    msg.insert(QStringLiteral("currentTime"), 0);

    hasPendingLoad_ = false;
    sendMedia(msg);
}

bool CastSession::requestMediaStatus()
{
    if (!mediaActive_)
        return false;
    sendMedia(typed(MessageType::GetStatus));
    return true;
}

bool CastSession::seek(double position)
{
    if (!mediaActive_ || mediaStatus_.mediaSessionId == 0)
        return false;
    QJsonObject msg = typed(MessageType::Seek);
    msg.insert(QStringLiteral("mediaSessionId"), mediaStatus_.mediaSessionId);
    msg.insert(QStringLiteral("currentTime"), position);
    sendMedia(msg);
    return true;
}

} // namespace ocast
