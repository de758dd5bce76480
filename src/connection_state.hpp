#pragma once

namespace clawlink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Authenticating,
    Connected,
    Reconnecting,
    Failed,
};

inline const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected:   return "disconnected";
        case ConnectionState::Connecting:     return "connecting";
        case ConnectionState::Authenticating: return "authenticating";
        case ConnectionState::Connected:      return "connected";
        case ConnectionState::Reconnecting:   return "reconnecting";
        case ConnectionState::Failed:         return "failed";
    }
    return "unknown";
}

} // namespace clawlink
