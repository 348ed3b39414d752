#pragma once

#include <QString>
#include <QMetaType>

namespace ocast {

enum class PlayerState {
    Unknown,
    Idle,
    Buffering,
    Playing,
    Paused
};

struct MediaStatus {
    int mediaSessionId = 0;
    PlayerState playerState = PlayerState::Unknown;

    bool hasCurrentTime = false;
    double currentTime = 0.0;
    bool hasDuration = false;
    double duration = 0.0;

    int supportedMediaCommands = 0;
    bool supportsSeek = false;
    QString idleReason;

    bool isPlaying() const { return playerState == PlayerState::Playing; }
    bool isPaused() const { return playerState == PlayerState::Paused; }
    bool isIdle() const { return playerState == PlayerState::Idle; }
};

const char* playerStateName(PlayerState state);

} // namespace ocast

Q_DECLARE_METATYPE(ocast::MediaStatus)
