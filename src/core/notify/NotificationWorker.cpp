#include "core/notify/NotificationWorker.hpp"
#include "core/notify/AudioAsset.hpp"
#include "core/notify/CancellationToken.hpp"
#include "core/notify/NotificationQueue.hpp"
#include "core/notify/PlaybackCompletionDetector.hpp"
#include "core/notify/StateKeeper.hpp"
#include "core/notify/TargetRegistry.hpp"
#include "core/tts/ISpeechSynthesizer.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <boost/log/trivial.hpp>
#include <exception>

namespace cvn {

const char* workerStageName(WorkerStage stage)
{
    switch (stage) {
    case WorkerStage::Idle: return "idle";
    case WorkerStage::ResolveTarget: return "resolve_target";
    case WorkerStage::CheckMute: return "check_mute";
    case WorkerStage::Synthesize: return "synthesize";
    case WorkerStage::CheckAssetExists: return "check_asset_exists";
    case WorkerStage::SnapshotState: return "snapshot_state";
    case WorkerStage::Play: return "play";
    case WorkerStage::AwaitActive: return "await_active";
    case WorkerStage::DetectCompletion: return "detect_completion";
    case WorkerStage::RestoreState: return "restore_state";
    case WorkerStage::Cleanup: return "cleanup";
    }
    return "unknown";
}

NotificationWorker::NotificationWorker(NotificationQueue& queue, const TargetRegistry& registry,
                                       ISpeechSynthesizer& synthesizer,
                                       const StateKeeper& stateKeeper,
                                       const PlaybackCompletionDetector& detector,
                                       const CancellationToken& cancel, const Config& config,
                                       UrlBuilder urlBuilder, QObject* parent)
    : QThread(parent)
    , queue_(queue)
    , registry_(registry)
    , synthesizer_(synthesizer)
    , stateKeeper_(stateKeeper)
    , detector_(detector)
    , cancel_(cancel)
    , config_(config)
    , urlBuilder_(std::move(urlBuilder))
{
    setObjectName("NotificationWorker");
    qRegisterMetaType<cvn::NotifyError>("cvn::NotifyError");
}

void NotificationWorker::run()
{
    BOOST_LOG_TRIVIAL(debug) << "[NotificationWorker] started";

    while (!cancel_.isCancelled()) {
        NotificationRequest request;
        if (!queue_.dequeue(request, config_.dequeueTimeoutMs))
            continue;

        if (request.isSentinel()) {
            queue_.markProcessed();
            break;
        }

        NotifyError error = NotifyError::None;
        try {
            error = process(request);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] notification for '"
                                     << request.target.toStdString() << "' failed: " << e.what();
            error = NotifyError::ProtocolError;
            record(request.target, error);
        }
        setStage(WorkerStage::Idle);
        queue_.markProcessed();
        emit notificationFinished(request.target, error);
    }

    const int dropped = queue_.discardPending();
    if (dropped > 0)
        BOOST_LOG_TRIVIAL(warning) << "[NotificationWorker] dropped " << dropped
                                   << " pending notification(s) at shutdown";
    BOOST_LOG_TRIVIAL(debug) << "[NotificationWorker] exiting";
}

void NotificationWorker::setStage(WorkerStage stage)
{
    stage_.store(stage);
    if (stage != WorkerStage::Idle)
        BOOST_LOG_TRIVIAL(trace) << "[NotificationWorker] stage " << workerStageName(stage);
}

NotifyError NotificationWorker::process(const NotificationRequest& request)
{
    BOOST_LOG_TRIVIAL(debug) << "[NotificationWorker] '" << request.text.toStdString()
                             << "' for '" << request.target.toStdString() << "'";

    setStage(WorkerStage::ResolveTarget);
    std::shared_ptr<ITarget> target = registry_.resolve(request.target);
    if (!target) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] target '" << request.target.toStdString()
                                 << "' not found, notification dropped";
        record(request.target, NotifyError::TargetNotFound);
        return NotifyError::TargetNotFound;
    }
    const std::string name = target->name().toStdString();

    setStage(WorkerStage::CheckMute);
    TargetStatus status;
    if (target->getStatus(status) && status.hasMuted && status.muted) {
        BOOST_LOG_TRIVIAL(info) << "[NotificationWorker] '" << name << "' is muted, notification skipped";
        record(request.target, NotifyError::MutedSkip);
        return NotifyError::MutedSkip;
    }

    if (!target->isReady()) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] '" << name << "' is not connected, ignored";
        record(request.target, NotifyError::TargetUnavailable);
        return NotifyError::TargetUnavailable;
    }

    setStage(WorkerStage::Synthesize);
    AudioAsset asset;
    asset.fileName = AudioAsset::fileNameFor(target->id());
    asset.path = QDir(config_.assetDir).filePath(asset.fileName);

    QString synthError;
    if (!synthesizer_.synthesize(request.text, config_.language, asset.path, cancel_, synthError)) {
        if (cancel_.isCancelled()) {
            record(request.target, NotifyError::Cancelled);
            return NotifyError::Cancelled;
        }
        BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] speech synthesis for '" << name
                                 << "' failed: " << synthError.toStdString();
        record(request.target, NotifyError::SynthesisFailure);
        return NotifyError::SynthesisFailure;
    }

    setStage(WorkerStage::CheckAssetExists);
    QFileInfo info(asset.path);
    if (!info.exists() || info.size() == 0) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] '" << asset.path.toStdString()
                                 << "' not found, synthesis must have failed";
        record(request.target, NotifyError::AssetMissing);
        return NotifyError::AssetMissing;
    }
    asset.sizeBytes = info.size();
    asset.estimatedDurationSeconds = detector_.estimateDurationSeconds(asset.sizeBytes);
    BOOST_LOG_TRIVIAL(debug) << "[NotificationWorker] '" << asset.path.toStdString() << "' created, "
                             << asset.sizeBytes << " bytes, ~" << asset.estimatedDurationSeconds << " s";

    if (cancel_.isCancelled()) {
        record(request.target, NotifyError::Cancelled);
        return NotifyError::Cancelled;
    }

    setStage(WorkerStage::SnapshotState);
    const TargetStateSnapshot snapshot = stateKeeper_.snapshot(*target);

    // From here on the target runs at notification volume; restore must run once
    DetectionResult detection;
    NotifyError failure = NotifyError::None;
    try {
        setStage(WorkerStage::Play);
        IMediaSession* media = target->mediaSession();
        if (!media) {
            BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] '" << name << "' has no media session";
            failure = NotifyError::TargetUnavailable;
        } else {
            const QString url = urlBuilder_(asset.fileName);
            BOOST_LOG_TRIVIAL(debug) << "[NotificationWorker] playing " << url.toStdString();
            media->play(url, config_.mimeType);

            setStage(WorkerStage::AwaitActive);
            if (!detector_.awaitActive(*media, cancel_) && !cancel_.isCancelled()) {
                BOOST_LOG_TRIVIAL(warning) << "[NotificationWorker] '" << name
                                           << "' did not open a media session in time";
            }

            if (!cancel_.isCancelled()) {
                setStage(WorkerStage::DetectCompletion);
                detection = detector_.detect(*media, asset.estimatedDurationSeconds, cancel_);
            }
        }
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] playback on '" << name
                                 << "' failed: " << e.what();
        failure = NotifyError::ProtocolError;
    }

    // Best effort, exactly once, even when shutting down
    setStage(WorkerStage::RestoreState);
    const RestoreResult restored = stateKeeper_.restore(*target, snapshot, cancel_);

    if (failure != NotifyError::None) {
        record(request.target, failure);
        return failure;
    }

    setStage(WorkerStage::Cleanup);
    NotifyError result = NotifyError::None;
    if (detection.completed) {
        if (!QFile::remove(asset.path))
            BOOST_LOG_TRIVIAL(warning) << "[NotificationWorker] could not remove "
                                       << asset.path.toStdString();
        if (restored == RestoreResult::Timeout) {
            result = NotifyError::RestoreTimeout;
        } else {
            BOOST_LOG_TRIVIAL(info) << "[NotificationWorker] notification sent to '" << name
                                    << "' completed";
        }
    } else if (cancel_.isCancelled()) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationWorker] notification to '" << name
                                   << "' interrupted by shutdown";
        result = NotifyError::Cancelled;
    } else {
        BOOST_LOG_TRIVIAL(error) << "[NotificationWorker] notification sent to '" << name
                                 << "' timed out (" << detection.polls << " polls, playback "
                                 << (detection.sawPlaying ? "seen" : "never seen") << "), kept "
                                 << asset.path.toStdString();
        result = NotifyError::PlaybackTimeout;
    }

    record(request.target, result);
    return result;
}

void NotificationWorker::record(const QString& target, NotifyError error)
{
    QMutexLocker locker(&statsMutex_);
    switch (error) {
    case NotifyError::None:
        ++stats_.completed;
        break;
    case NotifyError::MutedSkip:
        ++stats_.skipped;
        break;
    case NotifyError::Cancelled:
        ++stats_.interrupted;
        break;
    default:
        ++stats_.failed;
        break;
    }

    NotificationOutcome outcome;
    outcome.target = target;
    outcome.error = error;
    outcome.timestampMs = QDateTime::currentMSecsSinceEpoch();
    stats_.recent.append(outcome);
    while (stats_.recent.size() > RECENT_OUTCOMES)
        stats_.recent.removeFirst();
}

WorkerStats NotificationWorker::stats() const
{
    QMutexLocker locker(&statsMutex_);
    return stats_;
}

} // namespace cvn
