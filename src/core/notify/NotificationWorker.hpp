#pragma once

#include "core/notify/NotifyError.hpp"
#include "core/notify/NotificationRequest.hpp"
#include <QList>
#include <QMutex>
#include <QString>
#include <QThread>
#include <atomic>
#include <functional>

namespace cvn {

class CancellationToken;
class ISpeechSynthesizer;
class NotificationQueue;
class PlaybackCompletionDetector;
class StateKeeper;
class TargetRegistry;

enum class WorkerStage {
    Idle,
    ResolveTarget,
    CheckMute,
    Synthesize,
    CheckAssetExists,
    SnapshotState,
    Play,
    AwaitActive,
    DetectCompletion,
    RestoreState,
    Cleanup
};

const char* workerStageName(WorkerStage stage);

struct NotificationOutcome {
    QString target;
    NotifyError error = NotifyError::None;
    qint64 timestampMs = 0;
};

struct WorkerStats {
    int completed = 0;
    int failed = 0;
    int skipped = 0;       // muted targets
    int interrupted = 0;   // cut short by shutdown
    QList<NotificationOutcome> recent;   // newest last
};

/// The single consumer of the notification queue. Runs one request at a time
/// through synthesis, playback and state restore.
class NotificationWorker : public QThread {
    Q_OBJECT
public:
    struct Config {
        QString assetDir;
        QString language = "en";
        QString mimeType = "audio/mpeg";
        int dequeueTimeoutMs = 1000;
    };

    /// Builds the URL a target should fetch for an asset file name.
    using UrlBuilder = std::function<QString(const QString& fileName)>;

    static constexpr int RECENT_OUTCOMES = 20;

    NotificationWorker(NotificationQueue& queue, const TargetRegistry& registry,
                       ISpeechSynthesizer& synthesizer, const StateKeeper& stateKeeper,
                       const PlaybackCompletionDetector& detector,
                       const CancellationToken& cancel, const Config& config,
                       UrlBuilder urlBuilder, QObject* parent = nullptr);

    /// Run one request through the whole pipeline on the calling thread.
    NotifyError process(const NotificationRequest& request);

    WorkerStats stats() const;
    WorkerStage stage() const { return stage_.load(); }

signals:
    void notificationFinished(const QString& target, cvn::NotifyError error);

protected:
    void run() override;

private:
    void setStage(WorkerStage stage);
    void record(const QString& target, NotifyError error);

    NotificationQueue& queue_;
    const TargetRegistry& registry_;
    ISpeechSynthesizer& synthesizer_;
    const StateKeeper& stateKeeper_;
    const PlaybackCompletionDetector& detector_;
    const CancellationToken& cancel_;
    Config config_;
    UrlBuilder urlBuilder_;

    std::atomic<WorkerStage> stage_{WorkerStage::Idle};
    mutable QMutex statsMutex_;
    WorkerStats stats_;
};

} // namespace cvn
