#pragma once

#include "core/notify/NotificationRequest.hpp"
#include <QMutex>
#include <QWaitCondition>
#include <deque>

namespace cvn {

/// Unbounded FIFO between producers and the single notification worker.
/// Tracks unfinished items: every dequeued item must be matched by exactly
/// one markProcessed() so that drain() can return.
class NotificationQueue {
public:
    void enqueue(NotificationRequest request);

    /// Block up to timeoutMs for an item. Returns false when nothing arrived.
    bool dequeue(NotificationRequest& out, int timeoutMs);

    void markProcessed();

    /// Block until every enqueued item has been marked processed.
    /// timeoutMs < 0 waits forever. Returns false on timeout.
    bool drain(int timeoutMs = -1);

    /// Remove every queued item and mark it processed without running it.
    /// Returns the number of real (non-sentinel) requests dropped.
    int discardPending();

    int size() const;
    int unfinished() const;

private:
    mutable QMutex mutex_;
    QWaitCondition notEmpty_;
    QWaitCondition allProcessed_;
    std::deque<NotificationRequest> items_;
    int unfinished_ = 0;
};

} // namespace cvn
