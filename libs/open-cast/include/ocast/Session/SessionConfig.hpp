#pragma once

#include <QString>
#include <ocast/Version.hpp>

namespace ocast {

struct SessionConfig {
    QString senderId = SENDER_ID;
    QString receiverId = RECEIVER_ID;
    QString userAgent = "cast-voice-notifier";

    // Timeouts (ms)
    int connectTimeout = 10000;
    int heartbeatInterval = 5000;
    int heartbeatTimeout = 15000;
};

} // namespace ocast
