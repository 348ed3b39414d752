#include "core/cast/CastTarget.hpp"
#include <ocast/Transport/TLSTransport.hpp>
#include <QMetaObject>
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace cvn {

CastTarget::CastTarget(const EndpointInfo& endpoint, ocast::ITransport* transport,
                       const CastTargetConfig& config, QObject* parent)
    : QObject(parent)
    , endpoint_(endpoint)
    , config_(config)
    , transport_(transport)
{
    transport_->setParent(this);

    ocast::SessionConfig sessionConfig;
    sessionConfig.heartbeatInterval = config_.heartbeatIntervalMs;
    sessionConfig.heartbeatTimeout = config_.heartbeatTimeoutMs;
    session_ = new ocast::CastSession(transport_, sessionConfig, this);

    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, [this]() {
        if (stopped_) return;
        BOOST_LOG_TRIVIAL(debug) << "[CastTarget] reconnecting to '" << endpoint_.name.toStdString() << "'";
        session_->start();
    });

    connect(session_, &ocast::CastSession::receiverStatusChanged,
            this, &CastTarget::onReceiverStatus);
    connect(session_, &ocast::CastSession::mediaStatusChanged,
            this, &CastTarget::onMediaStatus);
    connect(session_, &ocast::CastSession::mediaSessionActive,
            this, &CastTarget::onMediaActive);
    connect(session_, &ocast::CastSession::mediaSessionInactive,
            this, &CastTarget::onMediaInactive);
    connect(session_, &ocast::CastSession::disconnected,
            this, &CastTarget::onDisconnected);
    connect(session_, &ocast::CastSession::mediaLoadFailed, this, [this](const QString& reason) {
        BOOST_LOG_TRIVIAL(warning) << "[CastTarget] '" << endpoint_.name.toStdString()
                                   << "' could not load media: " << reason.toStdString();
    });
}

CastTarget::~CastTarget()
{
    stopped_ = true;
    reconnectTimer_.stop();
    session_->disconnect(this);
}

std::shared_ptr<CastTarget> CastTarget::create(const EndpointInfo& endpoint,
                                               const CastTargetConfig& config)
{
    auto* transport = new ocast::TLSTransport(endpoint.host, endpoint.port);
    return std::shared_ptr<CastTarget>(new CastTarget(endpoint, transport, config),
                                       [](CastTarget* target) { target->deleteLater(); });
}

template <typename F>
void CastTarget::post(F&& fn)
{
    // Direct when already on the owning thread, queued from the worker
    QMetaObject::invokeMethod(this, std::forward<F>(fn), Qt::AutoConnection);
}

void CastTarget::start()
{
    stopped_ = false;
    BOOST_LOG_TRIVIAL(info) << "[CastTarget] connecting to '" << endpoint_.name.toStdString()
                            << "' at " << endpoint_.host.toStdString() << ":" << endpoint_.port;
    session_->start();
}

void CastTarget::stop()
{
    stopped_ = true;
    reconnectTimer_.stop();
    session_->stop();
}

bool CastTarget::isReady() const
{
    QMutexLocker locker(&mutex_);
    return ready_;
}

bool CastTarget::getStatus(TargetStatus& out) const
{
    QMutexLocker locker(&mutex_);
    if (!hasReceiverStatus_)
        return false;

    out = TargetStatus{};
    out.hasVolume = receiverStatus_.hasVolume;
    out.volumeLevel = receiverStatus_.volumeLevel;
    out.hasMuted = receiverStatus_.hasVolume;
    out.muted = receiverStatus_.muted;
    if (!receiverStatus_.isIdleScreen)
        out.runningAppId = receiverStatus_.appId;
    return true;
}

void CastTarget::setVolume(double level)
{
    post([this, level]() { session_->setVolume(level); });
}

void CastTarget::setMuted(bool muted)
{
    post([this, muted]() { session_->setMuted(muted); });
}

void CastTarget::startApp(const QString& appId)
{
    post([this, appId]() { session_->launchApp(appId); });
}

void CastTarget::stopApp()
{
    {
        QMutexLocker locker(&mutex_);
        mediaActive_ = false;
        hasMediaStatus_ = false;
        mediaStatus_ = ocast::MediaStatus{};
    }
    post([this]() { session_->stopApp(); });
}

void CastTarget::play(const QString& url, const QString& mimeType)
{
    {
        // The detector must never see the previous session's state
        QMutexLocker locker(&mutex_);
        mediaActive_ = false;
        hasMediaStatus_ = false;
        mediaStatus_ = ocast::MediaStatus{};
    }
    post([this, url, mimeType]() {
        session_->loadMedia(url, mimeType);
        // LOAD went straight to an already connected receiver app
        if (session_->isMediaActive()) {
            QMutexLocker locker(&mutex_);
            mediaActive_ = true;
        }
    });
}

bool CastTarget::seek(double position)
{
    if (!isActive())
        return false;
    post([this, position]() { session_->seek(position); });
    return true;
}

bool CastTarget::isActive() const
{
    QMutexLocker locker(&mutex_);
    return mediaActive_;
}

void CastTarget::requestStatus()
{
    post([this]() { session_->requestMediaStatus(); });
}

PlaybackObservation CastTarget::getStatus() const
{
    QMutexLocker locker(&mutex_);
    PlaybackObservation obs;
    if (!hasMediaStatus_) {
        // Nothing reported yet: neither playing nor idle
        obs.isIdle = false;
        return obs;
    }

    obs.isPlaying = mediaStatus_.isPlaying();
    obs.isPaused = mediaStatus_.isPaused();
    obs.isIdle = mediaStatus_.isIdle();
    obs.hasDuration = mediaStatus_.hasDuration;
    obs.duration = mediaStatus_.duration;
    obs.supportsSeek = mediaStatus_.supportsSeek;
    if (mediaStatus_.hasCurrentTime) {
        obs.hasPosition = true;
        obs.position = mediaStatus_.currentTime;
        if (obs.isPlaying)
            obs.position += mediaStatusAge_.elapsed() / 1000.0;
        if (obs.hasDuration)
            obs.position = qMin(obs.position, obs.duration);
    }
    return obs;
}

void CastTarget::onReceiverStatus(const ocast::ReceiverStatus& status)
{
    bool becameReady = false;
    {
        QMutexLocker locker(&mutex_);
        receiverStatus_ = status;
        hasReceiverStatus_ = true;
        becameReady = !ready_;
        ready_ = true;
    }
    if (becameReady) {
        BOOST_LOG_TRIVIAL(info) << "[CastTarget] '" << endpoint_.name.toStdString() << "' ready";
        emit readyChanged(true);
    }
    emit statusChanged();
}

void CastTarget::onMediaStatus(const ocast::MediaStatus& status)
{
    {
        QMutexLocker locker(&mutex_);
        // Status from a media session we have not (re)connected to is stale
        if (!mediaActive_)
            return;
        mediaStatus_ = status;
        hasMediaStatus_ = true;
        mediaStatusAge_.start();
    }
    BOOST_LOG_TRIVIAL(trace) << "[CastTarget] '" << endpoint_.name.toStdString() << "' player "
                             << ocast::playerStateName(status.playerState);
}

void CastTarget::onMediaActive()
{
    QMutexLocker locker(&mutex_);
    mediaActive_ = true;
}

void CastTarget::onMediaInactive()
{
    QMutexLocker locker(&mutex_);
    mediaActive_ = false;
}

void CastTarget::onDisconnected(ocast::DisconnectReason reason)
{
    bool wasReady = false;
    {
        QMutexLocker locker(&mutex_);
        wasReady = ready_;
        ready_ = false;
        mediaActive_ = false;
    }
    BOOST_LOG_TRIVIAL(warning) << "[CastTarget] '" << endpoint_.name.toStdString()
                               << "' disconnected (reason " << static_cast<int>(reason) << ")";
    if (wasReady)
        emit readyChanged(false);

    if (!stopped_)
        reconnectTimer_.start(config_.reconnectIntervalMs);
}

} // namespace cvn
