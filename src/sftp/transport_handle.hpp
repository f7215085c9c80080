#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "backend.hpp"
#include "session_state.hpp"

// Owns the single backend connection of a session and refuses every remote
// operation while Disconnected. Not thread-safe; callers serialize access.
class TransportHandle {
public:
    TransportHandle(ConnectionConfig config, std::unique_ptr<SftpBackend> backend);
    ~TransportHandle();

    TransportHandle(const TransportHandle&) = delete;
    TransportHandle& operator=(const TransportHandle&) = delete;

    // No-op when already connected.
    Result<void> connect(StatusCallback callback = nullptr);

    // Releases the backend connection at most once per connect attempt.
    void close();

    SessionState state() const { return state_; }
    bool is_connected() const { return state_ == SessionState::Connected; }
    const ConnectionConfig& config() const { return config_; }

    Result<std::vector<RemoteEntry>> list_directory(const std::string& path);
    Result<RemoteEntry> stat(const std::string& path);
    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path);
    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path, unsigned mode);
    Result<void> mkdir(const std::string& path, unsigned mode);

    // Keeps an idle connection alive between transfers. No-op while Disconnected.
    Result<void> keepalive();

private:
    ConnectionConfig config_;
    std::unique_ptr<SftpBackend> backend_;
    SessionState state_;
    bool release_pending_;   // backend may hold resources (full or partial connect)

    std::string not_connected_message(const char* op) const;
};
