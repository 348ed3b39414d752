#pragma once

#include <QMetaType>

namespace cvn {

enum class NotifyError {
    None,
    TargetNotFound,
    TargetUnavailable,
    MutedSkip,
    SynthesisFailure,
    AssetMissing,
    PlaybackTimeout,
    RestoreTimeout,
    ProtocolError,
    NotFound,
    MethodNotAllowed,
    Cancelled
};

inline const char* notifyErrorName(NotifyError error)
{
    switch (error) {
    case NotifyError::None: return "none";
    case NotifyError::TargetNotFound: return "target_not_found";
    case NotifyError::TargetUnavailable: return "target_unavailable";
    case NotifyError::MutedSkip: return "muted_skip";
    case NotifyError::SynthesisFailure: return "synthesis_failure";
    case NotifyError::AssetMissing: return "asset_missing";
    case NotifyError::PlaybackTimeout: return "playback_timeout";
    case NotifyError::RestoreTimeout: return "restore_timeout";
    case NotifyError::ProtocolError: return "protocol_error";
    case NotifyError::NotFound: return "not_found";
    case NotifyError::MethodNotAllowed: return "method_not_allowed";
    case NotifyError::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace cvn

Q_DECLARE_METATYPE(cvn::NotifyError)
