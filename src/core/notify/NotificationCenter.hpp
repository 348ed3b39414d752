#pragma once

#include "core/notify/CancellationToken.hpp"
#include "core/notify/NotificationQueue.hpp"
#include "core/notify/NotificationWorker.hpp"
#include "core/notify/PlaybackCompletionDetector.hpp"
#include "core/notify/ShutdownCoordinator.hpp"
#include "core/notify/StateKeeper.hpp"
#include <QObject>
#include <memory>

namespace cvn {

class ISpeechSynthesizer;
class MediaServer;
class TargetRegistry;
class YamlConfig;

/// Owns the notification pipeline: queue, worker, media server and the
/// cancellation token they share. Producers only ever call notify().
class NotificationCenter : public QObject {
    Q_OBJECT
public:
    NotificationCenter(const YamlConfig& config, TargetRegistry& registry,
                       ISpeechSynthesizer& synthesizer, QObject* parent = nullptr);
    ~NotificationCenter() override;

    /// Create the asset directory, start serving it and start the worker.
    /// advertiseAddress is the host targets use to reach the media server.
    bool start(const QString& advertiseAddress);

    /// Queue text for a target (id or friendly name). An empty target means the
    /// configured default. Returns false and fills error when rejected.
    bool notify(const QString& target, const QString& text, QString* error = nullptr);

    /// Bounded stop. Safe to call more than once.
    ShutdownReport shutdown();

    bool isRunning() const { return started_ && !stopped_; }
    int pendingCount() const { return queue_.size(); }
    WorkerStats stats() const { return worker_->stats(); }
    WorkerStage stage() const { return worker_->stage(); }
    quint16 mediaPort() const { return mediaPort_; }
    QString assetDir() const { return assetDir_; }

signals:
    void notificationFinished(const QString& target, cvn::NotifyError error);

private:
    QString defaultTarget_;
    QString assetDir_;
    quint16 configuredPort_;
    quint16 mediaPort_ = 0;
    QString advertiseAddress_;
    ShutdownCoordinator::Config shutdownConfig_;

    CancellationToken cancel_;
    NotificationQueue queue_;
    StateKeeper stateKeeper_;
    PlaybackCompletionDetector detector_;
    MediaServer* server_ = nullptr;
    std::unique_ptr<NotificationWorker> worker_;
    ShutdownReport lastReport_;
    bool started_ = false;
    bool stopped_ = false;
};

} // namespace cvn
