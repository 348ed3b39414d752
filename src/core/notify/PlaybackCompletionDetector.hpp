#pragma once

#include "core/notify/ITarget.hpp"

namespace cvn {

class CancellationToken;

struct DetectorConfig {
    int bitrateBps = 64000;
    double activeTimeoutSeconds = 10.0;
    double settleSeconds = 1.5;
    double pollIntervalSeconds = 0.5;
    double flushGraceSeconds = 2.0;
    double minTimeoutSeconds = 15.0;
    double estimateMarginSeconds = 10.0;
    double durationMarginSeconds = 5.0;
};

struct DetectionResult {
    bool completed = false;
    bool sawPlaying = false;
    bool durationKnown = false;
    bool cancelled = false;
    int polls = 0;
    double elapsedSeconds = 0.0;
};

/// Decides when a play request has really finished. Player-reported state is
/// unreliable: it may never leave idle, may report no duration, and usually
/// goes idle before the speaker has flushed its buffer.
class PlaybackCompletionDetector {
public:
    explicit PlaybackCompletionDetector(const DetectorConfig& config);

    double estimateDurationSeconds(qint64 sizeBytes) const;

    /// Block until the session reports active, up to activeTimeoutSeconds.
    bool awaitActive(const IMediaSession& session, const CancellationToken& cancel) const;

    /// Settle, poll until idle-after-playing or deadline, then flush grace.
    DetectionResult detect(IMediaSession& session, double estimatedDurationSeconds,
                           const CancellationToken& cancel) const;

    const DetectorConfig& config() const { return config_; }

private:
    DetectorConfig config_;
};

} // namespace cvn
