#pragma once

#include <string>
#include <platform/socket_util.hpp>
#include "backend.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Blocking libssh2 SFTP connection authenticated with a private key file.
class Libssh2Backend : public SftpBackend {
public:
    Libssh2Backend();
    ~Libssh2Backend() override;

    Libssh2Backend(const Libssh2Backend&) = delete;
    Libssh2Backend& operator=(const Libssh2Backend&) = delete;

    Result<void> authenticate(const ConnectionConfig& config,
                              StatusCallback callback = nullptr) override;
    void close() override;

    Result<std::vector<RemoteEntry>> list_directory(const std::string& path) override;
    Result<RemoteEntry> stat(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path,
                                                   unsigned mode) override;
    Result<void> mkdir(const std::string& path, unsigned mode) override;
    Result<void> keepalive() override;

    // Map the last libssh2/SFTP failure onto an ErrorKind and a readable message.
    ErrorKind last_error_kind() const;
    std::string last_error_message(const std::string& context) const;

private:
    socket_t sock_;
    LIBSSH2_SESSION* session_;
    LIBSSH2_SFTP* sftp_;

    Result<void> tcp_connect(const std::string& host, int port, int timeout_secs);
    Result<void> userauth(const ConnectionConfig& config);
};
