#pragma once

#include <QtGlobal>

class QThread;

namespace cvn {

class CancellationToken;
class MediaServer;
class NotificationQueue;

struct ShutdownReport {
    bool workerStopped = false;
    bool drained = false;
    bool serverStopped = false;
    int discarded = 0;
    qint64 elapsedMs = 0;

    bool clean() const { return workerStopped && drained && serverStopped; }
};

/// Bounded stop sequence: cancel, wake the worker with the sentinel, join it,
/// drain the queue, then close the media server. Never blocks indefinitely.
class ShutdownCoordinator {
public:
    struct Config {
        int workerTimeoutMs = 30000;
        int drainTimeoutMs = 5000;
    };

    ShutdownCoordinator(CancellationToken& cancel, NotificationQueue& queue,
                        QThread* worker, MediaServer* server, const Config& config);

    /// Must run on the thread that owns the media server. Keeps that thread's
    /// event loop turning while it waits so commands the worker marshals to
    /// targets during its final restore still go out.
    ShutdownReport shutdown();

private:
    CancellationToken& cancel_;
    NotificationQueue& queue_;
    QThread* worker_;
    MediaServer* server_;
    Config config_;
};

} // namespace cvn
