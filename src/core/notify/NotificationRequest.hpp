#pragma once

#include <QString>
#include <QtGlobal>

namespace cvn {

struct NotificationRequest {
    QString target;
    QString text;
    qint64 enqueuedAtMs = 0;
    bool sentinel = false;

    bool isSentinel() const { return sentinel; }

    /// Reserved value that tells the worker to stop; never processed as work.
    static NotificationRequest shutdownSentinel()
    {
        NotificationRequest r;
        r.sentinel = true;
        return r;
    }
};

} // namespace cvn
