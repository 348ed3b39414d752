#pragma once

namespace ocast {

enum class SessionState {
    Idle,
    Connecting,
    Connected,
    Disconnected
};

enum class DisconnectReason {
    Normal,
    HeartbeatTimeout,
    ConnectTimeout,
    TransportError,
    RemoteClosed,
    UserRequested
};

} // namespace ocast
