#include "core/notify/CancellationToken.hpp"
#include <QDeadlineTimer>
#include <QMutexLocker>

namespace cvn {

void CancellationToken::cancel()
{
    QMutexLocker locker(&mutex_);
    cancelled_.store(true);
    condition_.wakeAll();
}

bool CancellationToken::waitFor(int ms) const
{
    QMutexLocker locker(&mutex_);
    if (ms <= 0)
        return cancelled_.load();

    QDeadlineTimer deadline(ms);
    while (!cancelled_.load()) {
        if (!condition_.wait(&mutex_, deadline))
            break;
    }
    return cancelled_.load();
}

bool CancellationToken::waitForSeconds(double seconds) const
{
    return waitFor(static_cast<int>(seconds * 1000.0));
}

} // namespace cvn
