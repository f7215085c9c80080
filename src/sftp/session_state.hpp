#pragma once

// Lifecycle of one SFTP session. Only connect()/close() move between states.
enum class SessionState {
    Disconnected,
    Connected,
};

inline const char* session_state_name(SessionState state) {
    return state == SessionState::Connected ? "connected" : "disconnected";
}
