#include "core/notify/ShutdownCoordinator.hpp"
#include "core/notify/CancellationToken.hpp"
#include "core/notify/NotificationQueue.hpp"
#include "core/media/MediaServer.hpp"
#include <QCoreApplication>
#include <QDeadlineTimer>
#include <QElapsedTimer>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace cvn {

namespace {
constexpr int JOIN_SLICE_MS = 50;
}

ShutdownCoordinator::ShutdownCoordinator(CancellationToken& cancel, NotificationQueue& queue,
                                         QThread* worker, MediaServer* server,
                                         const Config& config)
    : cancel_(cancel)
    , queue_(queue)
    , worker_(worker)
    , server_(server)
    , config_(config)
{
}

ShutdownReport ShutdownCoordinator::shutdown()
{
    ShutdownReport report;
    QElapsedTimer clock;
    clock.start();

    BOOST_LOG_TRIVIAL(info) << "[Shutdown] stopping notification pipeline ("
                            << queue_.size() << " queued)";

    cancel_.cancel();
    queue_.enqueue(NotificationRequest::shutdownSentinel());

    if (!worker_ || !worker_->isRunning()) {
        report.workerStopped = true;
    } else {
        QElapsedTimer joinClock;
        joinClock.start();
        while (!worker_->wait(QDeadlineTimer(JOIN_SLICE_MS))) {
            QCoreApplication::processEvents();
            if (joinClock.elapsed() >= config_.workerTimeoutMs)
                break;
        }
        report.workerStopped = worker_->isFinished() || !worker_->isRunning();
        if (!report.workerStopped)
            BOOST_LOG_TRIVIAL(error) << "[Shutdown] notification worker did not stop within "
                                     << config_.workerTimeoutMs << " ms";
    }
    // Flush commands the worker queued for targets just before exiting
    QCoreApplication::processEvents();

    // Whatever the worker left behind (including a sentinel it never saw) is
    // discarded only once the worker can no longer touch the queue.
    if (report.workerStopped)
        report.discarded = queue_.discardPending();

    report.drained = queue_.drain(config_.drainTimeoutMs);
    if (!report.drained)
        BOOST_LOG_TRIVIAL(error) << "[Shutdown] queue not drained, " << queue_.unfinished()
                                 << " notification(s) unaccounted for";

    if (server_)
        server_->stop();
    report.serverStopped = !server_ || !server_->isListening();

    report.elapsedMs = clock.elapsed();
    BOOST_LOG_TRIVIAL(info) << "[Shutdown] finished in " << report.elapsedMs << " ms"
                            << (report.clean() ? "" : " with errors");
    return report;
}

} // namespace cvn
