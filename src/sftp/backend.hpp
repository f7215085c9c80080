#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

// An open remote file. Closed when destroyed; must not outlive the
// backend connection that produced it.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns the number of bytes read, 0 at end of file.
    virtual Result<size_t> read(char* buf, size_t len) = 0;

    // Returns the number of bytes accepted, which may be less than len.
    virtual Result<size_t> write(const char* buf, size_t len) = 0;
};

// The SSH/SFTP library behind a session. Libssh2Backend is the production
// implementation; anything else (tests) only has to honour the same error kinds:
// RemoteNotFound, Permission, Connection, Remote.
class SftpBackend {
public:
    virtual ~SftpBackend() = default;

    // TCP connect, SSH handshake, public key auth and SFTP subsystem start.
    // On failure the backend may hold partial state; close() releases it.
    virtual Result<void> authenticate(const ConnectionConfig& config,
                                      StatusCallback callback = nullptr) = 0;

    // Release everything. Safe to call repeatedly and after a failed authenticate().
    virtual void close() = 0;

    // One directory level, in server order, without "." and "..".
    virtual Result<std::vector<RemoteEntry>> list_directory(const std::string& path) = 0;

    // Follows symlinks. The returned entry's name is the basename of path.
    virtual Result<RemoteEntry> stat(const std::string& path) = 0;

    virtual Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) = 0;

    // Creates or truncates.
    virtual Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path,
                                                           unsigned mode) = 0;

    virtual Result<void> mkdir(const std::string& path, unsigned mode) = 0;

    // Send an SSH keepalive if one is due. Ok when nothing is connected.
    virtual Result<void> keepalive() = 0;
};
