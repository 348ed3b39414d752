#pragma once

#include <ocast/Status/ReceiverStatus.hpp>
#include <ocast/Status/MediaStatus.hpp>
#include <QJsonObject>

namespace ocast {

class StatusParser {
public:
    /// Parse a RECEIVER_STATUS payload. Returns false if the "status"
    /// object is missing.
    static bool parseReceiverStatus(const QJsonObject& payload, ReceiverStatus& out);

    /// Parse a MEDIA_STATUS payload. Only the first entry of the "status"
    /// array is used; an empty array yields an Idle status with
    /// mediaSessionId 0.
    static bool parseMediaStatus(const QJsonObject& payload, MediaStatus& out);

    static PlayerState parsePlayerState(const QString& value);
};

} // namespace ocast
