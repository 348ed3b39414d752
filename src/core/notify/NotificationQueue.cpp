#include "core/notify/NotificationQueue.hpp"
#include <QDeadlineTimer>
#include <QMutexLocker>
#include <boost/log/trivial.hpp>

namespace cvn {

void NotificationQueue::enqueue(NotificationRequest request)
{
    QMutexLocker locker(&mutex_);
    items_.push_back(std::move(request));
    ++unfinished_;
    notEmpty_.wakeOne();
}

bool NotificationQueue::dequeue(NotificationRequest& out, int timeoutMs)
{
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline(qMax(0, timeoutMs));
    while (items_.empty()) {
        if (!notEmpty_.wait(&mutex_, deadline))
            break;
    }
    if (items_.empty())
        return false;

    out = std::move(items_.front());
    items_.pop_front();
    return true;
}

void NotificationQueue::markProcessed()
{
    QMutexLocker locker(&mutex_);
    if (unfinished_ <= 0) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationQueue] markProcessed() called more times than items enqueued";
        return;
    }
    if (--unfinished_ == 0)
        allProcessed_.wakeAll();
}

bool NotificationQueue::drain(int timeoutMs)
{
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline = timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever)
                                            : QDeadlineTimer(timeoutMs);
    while (unfinished_ > 0) {
        if (!allProcessed_.wait(&mutex_, deadline))
            break;
    }
    return unfinished_ == 0;
}

int NotificationQueue::discardPending()
{
    QMutexLocker locker(&mutex_);
    int dropped = 0;
    while (!items_.empty()) {
        const NotificationRequest& request = items_.front();
        if (!request.isSentinel()) {
            BOOST_LOG_TRIVIAL(info) << "[NotificationQueue] discarding notification for '"
                                    << request.target.toStdString() << "'";
            ++dropped;
        }
        items_.pop_front();
        --unfinished_;
    }
    if (unfinished_ <= 0) {
        unfinished_ = 0;
        allProcessed_.wakeAll();
    }
    return dropped;
}

int NotificationQueue::size() const
{
    QMutexLocker locker(&mutex_);
    return static_cast<int>(items_.size());
}

int NotificationQueue::unfinished() const
{
    QMutexLocker locker(&mutex_);
    return unfinished_;
}

} // namespace cvn
