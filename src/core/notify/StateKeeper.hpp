#pragma once

#include "core/notify/ITarget.hpp"
#include <QString>

namespace cvn {

class CancellationToken;

/// Target state captured before a notification plays. Absent fields were not
/// reported by the device and are left alone on restore.
struct TargetStateSnapshot {
    bool hasVolume = false;
    double volumeLevel = 0.0;
    bool hasMuted = false;
    bool muted = false;
    bool hasRunningApp = false;
    QString runningApp;
    bool hasSupportsSeek = false;
    bool supportsSeek = false;

    bool isEmpty() const { return !hasVolume && !hasMuted && !hasRunningApp; }
};

enum class RestoreResult {
    Skipped,    // nothing captured
    Restored,
    Timeout,    // target never became ready
    Cancelled
};

class StateKeeper {
public:
    struct Config {
        double notificationVolume = 0.5;    // 0.0 - 1.0
        int readyAttempts = 10;
        double readyIntervalSeconds = 1.0;
    };

    explicit StateKeeper(const Config& config);

    /// Record volume, mute and running app, then prepare the target for the
    /// notification: stop the app, set the notification volume, unmute.
    TargetStateSnapshot snapshot(ITarget& target) const;

    /// Reapply a snapshot once the target is ready again. Waits at most
    /// readyAttempts * readyIntervalSeconds; never restores partially.
    RestoreResult restore(ITarget& target, const TargetStateSnapshot& snapshot,
                          const CancellationToken& cancel) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace cvn
