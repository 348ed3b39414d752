#pragma once

#include <QString>
#include <QMetaType>

namespace ocast {

/// Snapshot of the receiver-0 platform status (volume plus the running app).
struct ReceiverStatus {
    bool hasVolume = false;
    double volumeLevel = 0.0;
    bool muted = false;

    // Empty appId means no application is running.
    QString appId;
    QString displayName;
    QString sessionId;
    QString transportId;
    bool isIdleScreen = false;

    bool hasApplication() const { return !appId.isEmpty(); }
};

} // namespace ocast

Q_DECLARE_METATYPE(ocast::ReceiverStatus)
