#include "core/notify/PlaybackCompletionDetector.hpp"
#include "core/notify/AudioAsset.hpp"
#include "core/notify/CancellationToken.hpp"
#include <QElapsedTimer>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iomanip>

namespace cvn {

namespace {
constexpr int ACTIVE_POLL_MS = 100;
}

PlaybackCompletionDetector::PlaybackCompletionDetector(const DetectorConfig& config)
    : config_(config)
{
}

double PlaybackCompletionDetector::estimateDurationSeconds(qint64 sizeBytes) const
{
    return AudioAsset::estimateDuration(sizeBytes, config_.bitrateBps);
}

bool PlaybackCompletionDetector::awaitActive(const IMediaSession& session,
                                             const CancellationToken& cancel) const
{
    QElapsedTimer clock;
    clock.start();
    const qint64 limitMs = static_cast<qint64>(config_.activeTimeoutSeconds * 1000.0);

    while (!session.isActive()) {
        if (clock.elapsed() >= limitMs)
            return false;
        if (cancel.waitFor(ACTIVE_POLL_MS))
            return false;
    }
    return true;
}

DetectionResult PlaybackCompletionDetector::detect(IMediaSession& session,
                                                   double estimatedDurationSeconds,
                                                   const CancellationToken& cancel) const
{
    DetectionResult result;
    QElapsedTimer clock;
    clock.start();
    auto now = [&clock]() { return clock.elapsed() / 1000.0; };

    if (cancel.waitForSeconds(config_.settleSeconds)) {
        result.cancelled = true;
        result.elapsedSeconds = now();
        return result;
    }

    double deadline = now() + std::max(config_.minTimeoutSeconds,
                                       estimatedDurationSeconds + config_.estimateMarginSeconds);

    while (now() < deadline) {
        session.requestStatus();
        if (cancel.waitForSeconds(config_.pollIntervalSeconds)) {
            result.cancelled = true;
            break;
        }

        const PlaybackObservation obs = session.getStatus();
        ++result.polls;

        if (obs.isPlaying || obs.isPaused)
            result.sawPlaying = true;

        if (result.sawPlaying && !result.durationKnown && obs.hasDuration) {
            deadline = now() + obs.duration + config_.durationMarginSeconds;
            result.durationKnown = true;
        }

        if (result.sawPlaying && obs.isIdle) {
            result.completed = true;
            break;
        }

        if (!result.sawPlaying) {
            BOOST_LOG_TRIVIAL(trace) << "[Detector] waiting for player to start (timeout in "
                                     << std::fixed << std::setprecision(1)
                                     << deadline - now() << " s)";
        } else if (obs.hasDuration && obs.duration > 0.0 && obs.hasPosition) {
            BOOST_LOG_TRIVIAL(trace) << "[Detector] playing " << std::fixed << std::setprecision(1)
                                     << obs.position << " of " << obs.duration << " s ("
                                     << static_cast<int>(obs.position / obs.duration * 100.0)
                                     << "%)";
        } else {
            BOOST_LOG_TRIVIAL(trace) << "[Detector] playing, position unknown";
        }
    }

    // The player reports idle before the speaker has drained its buffer
    if (!result.cancelled && cancel.waitForSeconds(config_.flushGraceSeconds))
        result.cancelled = true;

    result.elapsedSeconds = now();
    return result;
}

} // namespace cvn
