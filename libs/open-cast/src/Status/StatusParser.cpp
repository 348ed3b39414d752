#include <ocast/Status/StatusParser.hpp>
#include <ocast/Version.hpp>
#include <QJsonArray>

namespace ocast {

const char* playerStateName(PlayerState state)
{
    switch (state) {
    case PlayerState::Idle: return "IDLE";
    case PlayerState::Buffering: return "BUFFERING";
    case PlayerState::Playing: return "PLAYING";
    case PlayerState::Paused: return "PAUSED";
    case PlayerState::Unknown: break;
    }
    return "UNKNOWN";
}

PlayerState StatusParser::parsePlayerState(const QString& value)
{
    if (value == QLatin1String("IDLE")) return PlayerState::Idle;
    if (value == QLatin1String("BUFFERING")) return PlayerState::Buffering;
    if (value == QLatin1String("PLAYING")) return PlayerState::Playing;
    if (value == QLatin1String("PAUSED")) return PlayerState::Paused;
    return PlayerState::Unknown;
}

bool StatusParser::parseReceiverStatus(const QJsonObject& payload, ReceiverStatus& out)
{
    const QJsonValue statusValue = payload.value(QStringLiteral("status"));
    if (!statusValue.isObject())
        return false;
    const QJsonObject status = statusValue.toObject();

    out = ReceiverStatus{};

    const QJsonValue volumeValue = status.value(QStringLiteral("volume"));
    if (volumeValue.isObject()) {
        const QJsonObject volume = volumeValue.toObject();
        if (volume.contains(QStringLiteral("level"))) {
            out.hasVolume = true;
            out.volumeLevel = volume.value(QStringLiteral("level")).toDouble();
        }
        out.muted = volume.value(QStringLiteral("muted")).toBool(false);
    }

    const QJsonArray apps = status.value(QStringLiteral("applications")).toArray();
    if (!apps.isEmpty()) {
        const QJsonObject app = apps.first().toObject();
        out.appId = app.value(QStringLiteral("appId")).toString();
        out.displayName = app.value(QStringLiteral("displayName")).toString();
        out.sessionId = app.value(QStringLiteral("sessionId")).toString();
        out.transportId = app.value(QStringLiteral("transportId")).toString();
        out.isIdleScreen = app.value(QStringLiteral("isIdleScreen")).toBool(false)
                           || out.appId == QLatin1String(BACKDROP_APP_ID);
    }
    return true;
}

bool StatusParser::parseMediaStatus(const QJsonObject& payload, MediaStatus& out)
{
    const QJsonValue statusValue = payload.value(QStringLiteral("status"));
    if (!statusValue.isArray())
        return false;

    out = MediaStatus{};
    const QJsonArray entries = statusValue.toArray();
    if (entries.isEmpty()) {
        out.playerState = PlayerState::Idle;
        return true;
    }

    const QJsonObject entry = entries.first().toObject();
    out.mediaSessionId = entry.value(QStringLiteral("mediaSessionId")).toInt();
    out.playerState = parsePlayerState(entry.value(QStringLiteral("playerState")).toString());
    out.idleReason = entry.value(QStringLiteral("idleReason")).toString();

    if (entry.value(QStringLiteral("currentTime")).isDouble()) {
        out.hasCurrentTime = true;
        out.currentTime = entry.value(QStringLiteral("currentTime")).toDouble();
    }

    // Duration lives on the media information object and is often absent
    // until the receiver has buffered the stream.
    const QJsonObject media = entry.value(QStringLiteral("media")).toObject();
    if (media.value(QStringLiteral("duration")).isDouble()) {
        double duration = media.value(QStringLiteral("duration")).toDouble();
        if (duration > 0.0) {
            out.hasDuration = true;
            out.duration = duration;
        }
    }

    out.supportedMediaCommands = entry.value(QStringLiteral("supportedMediaCommands")).toInt();
    out.supportsSeek = (out.supportedMediaCommands & MEDIA_COMMAND_SEEK) != 0;
    return true;
}

} // namespace ocast
