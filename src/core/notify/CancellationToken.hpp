#pragma once

#include <QMutex>
#include <QWaitCondition>
#include <atomic>

namespace cvn {

/// Process-wide stop signal. Set once, never cleared. Every blocking wait in
/// the notification pipeline goes through waitFor() so it wakes on cancel().
class CancellationToken {
public:
    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    /// Sleep up to ms milliseconds. Returns true if cancelled (before or during).
    bool waitFor(int ms) const;
    bool waitForSeconds(double seconds) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable QMutex mutex_;
    mutable QWaitCondition condition_;
};

} // namespace cvn
