#pragma once

#include <QObject>
#include <QTimer>
#include <QElapsedTimer>
#include <QJsonObject>

#include <ocast/Transport/ITransport.hpp>
#include <ocast/Messenger/Messenger.hpp>
#include <ocast/Session/SessionState.hpp>
#include <ocast/Session/SessionConfig.hpp>
#include <ocast/Status/ReceiverStatus.hpp>
#include <ocast/Status/MediaStatus.hpp>

namespace ocast {

class CastSession : public QObject {
    Q_OBJECT
public:
    CastSession(ITransport* transport, const SessionConfig& config,
                QObject* parent = nullptr);
    ~CastSession() override;

    void start();
    void stop();

    SessionState state() const;
    Messenger* messenger() const;

    const ReceiverStatus& receiverStatus() const { return receiverStatus_; }
    const MediaStatus& mediaStatus() const { return mediaStatus_; }

    /// True once we are connected to the media receiver's transport.
    bool isMediaActive() const { return mediaActive_; }
    QString mediaTransportId() const { return mediaTransportId_; }

    // Receiver namespace
    void requestReceiverStatus();
    void setVolume(double level);
    void setMuted(bool muted);
    void launchApp(const QString& appId);
    bool stopApp();

    // Media namespace
    /// Launches the default media receiver if needed, then loads url.
    void loadMedia(const QString& url, const QString& contentType);
    bool requestMediaStatus();
    bool seek(double position);

signals:
    void stateChanged(ocast::SessionState newState);
    void disconnected(ocast::DisconnectReason reason);
    void receiverStatusChanged(const ocast::ReceiverStatus& status);
    void mediaStatusChanged(const ocast::MediaStatus& status);
    void mediaSessionActive(const QString& transportId);
    void mediaSessionInactive();
    void mediaLoadFailed(const QString& reason);

private:
    void setState(SessionState newState);
    void teardown(DisconnectReason reason);

    void onTransportConnected();
    void onTransportDisconnected();
    void onTransportError(const QString& message);
    void onMessage(const QString& sourceId, const QString& destinationId,
                   const QString& ns, const QJsonObject& payload);
    void onHeartbeatTick();
    void onConnectTimeout();

    void handleConnection(const QString& sourceId, const QString& type);
    void handleHeartbeat(const QString& sourceId, const QString& type);
    void handleReceiver(const QString& type, const QJsonObject& payload);
    void handleMedia(const QString& type, const QJsonObject& payload);

    void connectMediaTransport(const QString& transportId);
    void clearMediaSession();
    void sendLoad();

    void sendReceiver(QJsonObject payload);
    void sendMedia(QJsonObject payload);
    int nextRequestId();

    SessionConfig config_;
    ITransport* transport_;
    Messenger* messenger_;
    SessionState state_ = SessionState::Idle;

    QTimer heartbeatTimer_;
    QTimer connectTimer_;
    QElapsedTimer lastReceived_;

    ReceiverStatus receiverStatus_;
    MediaStatus mediaStatus_;
    bool mediaActive_ = false;
    QString mediaTransportId_;
    QString stoppedSessionId_;

    bool hasPendingLoad_ = false;
    QString pendingUrl_;
    QString pendingContentType_;

    int requestId_ = 0;
};

} // namespace ocast
