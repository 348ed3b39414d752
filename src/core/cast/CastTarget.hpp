#pragma once

#include "core/discovery/EndpointInfo.hpp"
#include "core/notify/ITarget.hpp"
#include <ocast/Session/CastSession.hpp>
#include <ocast/Status/MediaStatus.hpp>
#include <ocast/Status/ReceiverStatus.hpp>
#include <QElapsedTimer>
#include <QMutex>
#include <QObject>
#include <QTimer>
#include <memory>

namespace ocast {
class ITransport;
}

namespace cvn {

struct CastTargetConfig {
    int heartbeatIntervalMs = 5000;
    int heartbeatTimeoutMs = 15000;
    int reconnectIntervalMs = 5000;
};

/// ITarget over a Cast V2 session. The session lives on the thread that owns
/// this object; worker-thread calls read a mutex-guarded status cache and
/// marshal commands onto the owning thread.
class CastTarget : public QObject, public ITarget, public IMediaSession {
    Q_OBJECT
public:
    /// Takes ownership of transport.
    CastTarget(const EndpointInfo& endpoint, ocast::ITransport* transport,
               const CastTargetConfig& config, QObject* parent = nullptr);
    ~CastTarget() override;

    /// TLS connection to endpoint.host:endpoint.port. The returned handle
    /// defers destruction to the owning thread.
    static std::shared_ptr<CastTarget> create(const EndpointInfo& endpoint,
                                              const CastTargetConfig& config);

    void start();
    void stop();

    EndpointInfo endpoint() const { return endpoint_; }
    ocast::CastSession* session() const { return session_; }

    // ITarget
    QString id() const override { return endpoint_.id; }
    QString name() const override { return endpoint_.name; }
    QString model() const override { return endpoint_.model; }
    bool isReady() const override;
    bool getStatus(TargetStatus& out) const override;
    void setVolume(double level) override;
    void setMuted(bool muted) override;
    void startApp(const QString& appId) override;
    void stopApp() override;
    IMediaSession* mediaSession() override { return this; }

    // IMediaSession
    void play(const QString& url, const QString& mimeType) override;
    bool seek(double position) override;
    bool isActive() const override;
    void requestStatus() override;
    PlaybackObservation getStatus() const override;

signals:
    void readyChanged(bool ready);
    void statusChanged();

private:
    void onReceiverStatus(const ocast::ReceiverStatus& status);
    void onMediaStatus(const ocast::MediaStatus& status);
    void onMediaActive();
    void onMediaInactive();
    void onDisconnected(ocast::DisconnectReason reason);

    template <typename F>
    void post(F&& fn);

    EndpointInfo endpoint_;
    CastTargetConfig config_;
    ocast::ITransport* transport_;
    ocast::CastSession* session_;
    QTimer reconnectTimer_;
    bool stopped_ = true;

    mutable QMutex mutex_;
    bool ready_ = false;
    bool hasReceiverStatus_ = false;
    ocast::ReceiverStatus receiverStatus_;
    bool mediaActive_ = false;
    bool hasMediaStatus_ = false;
    ocast::MediaStatus mediaStatus_;
    QElapsedTimer mediaStatusAge_;
};

} // namespace cvn
