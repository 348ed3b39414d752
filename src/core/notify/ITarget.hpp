#pragma once

#include <QString>

namespace cvn {

/// Platform-level state of an endpoint as last reported by the device.
struct TargetStatus {
    bool hasVolume = false;
    double volumeLevel = 0.0;   // 0.0 - 1.0
    bool hasMuted = false;
    bool muted = false;
    QString runningAppId;       // empty when nothing (or only the idle screen) runs
};

/// One poll of the media transport. Fields are re-read on every tick.
struct PlaybackObservation {
    bool isPlaying = false;
    bool isPaused = false;
    bool isIdle = true;
    bool hasDuration = false;
    double duration = 0.0;
    bool hasPosition = false;
    double position = 0.0;
    bool supportsSeek = false;
};

class IMediaSession {
public:
    virtual ~IMediaSession() = default;

    /// Ask the endpoint to fetch and play url. Returns immediately.
    virtual void play(const QString& url, const QString& mimeType) = 0;
    virtual bool seek(double position) = 0;

    /// True once the endpoint has an active media session for the last play().
    virtual bool isActive() const = 0;

    /// Ask the endpoint for a fresh status; the answer lands in getStatus() later.
    virtual void requestStatus() = 0;
    virtual PlaybackObservation getStatus() const = 0;
};

/// A playback endpoint. All methods are safe to call from the worker thread.
class ITarget {
public:
    virtual ~ITarget() = default;

    virtual QString id() const = 0;
    virtual QString name() const = 0;
    virtual QString model() const = 0;

    /// Connected and has reported its status at least once.
    virtual bool isReady() const = 0;

    /// Returns false when no status is available yet.
    virtual bool getStatus(TargetStatus& out) const = 0;

    virtual void setVolume(double level) = 0;
    virtual void setMuted(bool muted) = 0;
    virtual void startApp(const QString& appId) = 0;
    virtual void stopApp() = 0;

    virtual IMediaSession* mediaSession() = 0;
};

} // namespace cvn
