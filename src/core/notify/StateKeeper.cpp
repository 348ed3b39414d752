#include "core/notify/StateKeeper.hpp"
#include "core/notify/CancellationToken.hpp"
#include <boost/log/trivial.hpp>

namespace cvn {

StateKeeper::StateKeeper(const Config& config)
    : config_(config)
{
}

TargetStateSnapshot StateKeeper::snapshot(ITarget& target) const
{
    TargetStateSnapshot snap;

    TargetStatus status;
    if (target.getStatus(status)) {
        snap.hasVolume = status.hasVolume;
        snap.volumeLevel = status.volumeLevel;
        snap.hasMuted = status.hasMuted;
        snap.muted = status.muted;
        snap.hasRunningApp = true;
        snap.runningApp = status.runningAppId;
    } else {
        BOOST_LOG_TRIVIAL(debug) << "[StateKeeper] '" << target.name().toStdString()
                                 << "' has no status, nothing to save";
    }

    if (IMediaSession* media = target.mediaSession()) {
        if (media->isActive()) {
            snap.hasSupportsSeek = true;
            snap.supportsSeek = media->getStatus().supportsSeek;
        }
    }

    target.stopApp();
    target.setVolume(config_.notificationVolume);
    target.setMuted(false);

    BOOST_LOG_TRIVIAL(debug) << "[StateKeeper] saved '" << target.name().toStdString()
                             << "' volume=" << (snap.hasVolume ? snap.volumeLevel : -1.0)
                             << " muted=" << snap.muted
                             << " app='" << snap.runningApp.toStdString() << "'";
    return snap;
}

RestoreResult StateKeeper::restore(ITarget& target, const TargetStateSnapshot& snapshot,
                                   const CancellationToken& cancel) const
{
    if (snapshot.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "[StateKeeper] no state to restore for '"
                                << target.name().toStdString() << "'";
        return RestoreResult::Skipped;
    }

    // The device often drops and re-establishes its connection when the
    // media app exits, so give it time to come back.
    int attempt = 0;
    while (!target.isReady() && attempt < config_.readyAttempts) {
        BOOST_LOG_TRIVIAL(debug) << "[StateKeeper] waiting for '" << target.name().toStdString()
                                 << "' to reconnect (" << attempt + 1 << "/"
                                 << config_.readyAttempts << ")";
        if (cancel.waitForSeconds(config_.readyIntervalSeconds))
            return RestoreResult::Cancelled;
        ++attempt;
    }

    if (!target.isReady()) {
        BOOST_LOG_TRIVIAL(error) << "[StateKeeper] '" << target.name().toStdString()
                                 << "' did not reconnect in time, state not restored";
        return RestoreResult::Timeout;
    }

    target.stopApp();
    if (snapshot.hasVolume)
        target.setVolume(snapshot.volumeLevel);
    if (snapshot.hasMuted)
        target.setMuted(snapshot.muted);

    BOOST_LOG_TRIVIAL(debug) << "[StateKeeper] restored '" << target.name().toStdString() << "'";
    return RestoreResult::Restored;
}

} // namespace cvn
