#include "libssh2_backend.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netdb.h>
#  include <unistd.h>
#endif
#include <cstring>
#include <cerrno>
#include <filesystem>

// libssh2_init must run once per process before any session exists
static int ensure_libssh2_init() {
    static int rc = libssh2_init(0);
    return rc;
}

static const char* sftp_status_name(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_EOF:                 return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE:        return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:   return "permission denied";
        case LIBSSH2_FX_FAILURE:             return "failure";
        case LIBSSH2_FX_BAD_MESSAGE:         return "bad message";
        case LIBSSH2_FX_NO_CONNECTION:       return "no connection";
        case LIBSSH2_FX_CONNECTION_LOST:     return "connection lost";
        case LIBSSH2_FX_OP_UNSUPPORTED:      return "operation unsupported";
        case LIBSSH2_FX_INVALID_HANDLE:      return "invalid handle";
        case LIBSSH2_FX_NO_SUCH_PATH:        return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT:       return "write protected";
        case LIBSSH2_FX_NO_MEDIA:            return "no media";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED:      return "quota exceeded";
        case LIBSSH2_FX_DIR_NOT_EMPTY:       return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:     return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME:    return "invalid filename";
        case LIBSSH2_FX_LINK_LOOP:           return "link loop";
    }
    return "unknown status";
}

static RemoteEntry entry_from_attrs(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteEntry entry;
    entry.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        entry.permissions = static_cast<std::uint32_t>(attrs.permissions);
        entry.is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        entry.size = attrs.filesize;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        entry.modified_time = static_cast<std::int64_t>(attrs.mtime);
    }
    return entry;
}

// ── Libssh2RemoteFile ────────────────────────────────────────────────

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(LIBSSH2_SFTP_HANDLE* handle, const Libssh2Backend& backend,
                      const std::string& path)
        : handle_(handle), backend_(backend), path_(path) {}

    ~Libssh2RemoteFile() override {
        if (handle_) libssh2_sftp_close(handle_);
    }

    Result<size_t> read(char* buf, size_t len) override {
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            return Result<size_t>::Err(backend_.last_error_kind(),
                                       backend_.last_error_message("Read failed for " + path_));
        }
        return Result<size_t>::Ok(static_cast<size_t>(n));
    }

    Result<size_t> write(const char* buf, size_t len) override {
        ssize_t n = libssh2_sftp_write(handle_, buf, len);
        if (n < 0) {
            return Result<size_t>::Err(backend_.last_error_kind(),
                                       backend_.last_error_message("Write failed for " + path_));
        }
        return Result<size_t>::Ok(static_cast<size_t>(n));
    }

private:
    LIBSSH2_SFTP_HANDLE* handle_;
    const Libssh2Backend& backend_;
    std::string path_;
};

// ── Libssh2Backend ───────────────────────────────────────────────────

Libssh2Backend::Libssh2Backend()
    : sock_(SLATE_INVALID_SOCKET), session_(nullptr), sftp_(nullptr) {
}

Libssh2Backend::~Libssh2Backend() {
    close();
}

Result<void> Libssh2Backend::tcp_connect(const std::string& host, int port, int timeout_secs) {
    platform::init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<void>::Err(ErrorKind::Connection,
                                 fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)));
    }

    int timeout_ms = timeout_secs > 0 ? timeout_secs * 1000 : -1;
    std::string last_error = "no usable address";

    for (auto* rp = res; rp != nullptr; rp = rp->ai_next) {
        socket_t s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == SLATE_INVALID_SOCKET) continue;

        // Non-blocking connect so the configured timeout applies
        platform::set_nonblocking(s);
        int ret = ::connect(s, rp->ai_addr, static_cast<socklen_t>(rp->ai_addrlen));
        if (ret < 0 && !platform::connect_pending()) {
            last_error = platform::last_socket_error();
            platform::close_socket(s);
            continue;
        }

        if (ret < 0) {
            int revents = platform::poll_socket(s, POLLOUT, timeout_ms);
            if (revents == 0) {
                last_error = fmt::format("timed out after {}s", timeout_secs);
                platform::close_socket(s);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                platform::close_socket(s);
                continue;
            }
        }

        platform::set_blocking(s);
        platform::enable_keepalive(s, TCP_KEEPIDLE_SECS, TCP_KEEPINTVL_SECS, TCP_KEEPCNT_PROBES);
        sock_ = s;
        freeaddrinfo(res);
        return Result<void>::Ok();
    }

    freeaddrinfo(res);
    return Result<void>::Err(ErrorKind::Connection,
                             fmt::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

Result<void> Libssh2Backend::userauth(const ConnectionConfig& config) {
    // Public key is derived from the private key file
    int rc = libssh2_userauth_publickey_fromfile_ex(
        session_,
        config.username.c_str(), static_cast<unsigned int>(config.username.size()),
        nullptr,
        config.private_key_path.c_str(),
        nullptr);
    if (rc == 0) return Result<void>::Ok();

    switch (rc) {
        case LIBSSH2_ERROR_FILE:
            return Result<void>::Err(ErrorKind::Configuration,
                last_error_message("Unable to use private key " + config.private_key_path +
                                   " (passphrase-protected keys are not supported)"));
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
            return Result<void>::Err(ErrorKind::Connection,
                                     last_error_message("Connection lost during authentication"));
        default:
            return Result<void>::Err(ErrorKind::Authentication,
                last_error_message("Authentication failed for " + config.username));
    }
}

Result<void> Libssh2Backend::authenticate(const ConnectionConfig& config, StatusCallback callback) {
    if (ensure_libssh2_init() != 0) {
        return Result<void>::Err(ErrorKind::Connection, "Failed to initialize libssh2");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config.private_key_path, ec)) {
        return Result<void>::Err(ErrorKind::Configuration,
                                 "Private key file not found at " + config.private_key_path);
    }

    if (callback) callback("Connecting to " + config.hostname + "...");

    auto tcp = tcp_connect(config.hostname, config.port, config.timeout_secs);
    if (tcp.is_err()) return tcp;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init();
    if (!session_) {
        return Result<void>::Err(ErrorKind::Connection, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 1);
    if (config.timeout_secs > 0) {
        libssh2_session_set_timeout(session_, static_cast<long>(config.timeout_secs) * 1000);
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        return Result<void>::Err(ErrorKind::Connection, last_error_message("SSH handshake failed"));
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = userauth(config);
    if (auth.is_err()) return auth;

    if (callback) callback("Authentication successful, starting SFTP...");

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        return Result<void>::Err(ErrorKind::Connection,
                                 last_error_message("Failed to start SFTP subsystem"));
    }

    slate_log(fmt::format("connected {}@{}:{}", config.username, config.hostname, config.port));
    return Result<void>::Ok();
}

void Libssh2Backend::close() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != SLATE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SLATE_INVALID_SOCKET;
    }
}

ErrorKind Libssh2Backend::last_error_kind() const {
    if (!session_) return ErrorKind::Connection;

    int rc = libssh2_session_last_errno(session_);
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        switch (libssh2_sftp_last_error(sftp_)) {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                return ErrorKind::RemoteNotFound;
            case LIBSSH2_FX_PERMISSION_DENIED:
            case LIBSSH2_FX_WRITE_PROTECT:
                return ErrorKind::Permission;
            case LIBSSH2_FX_NO_CONNECTION:
            case LIBSSH2_FX_CONNECTION_LOST:
                return ErrorKind::Connection;
            default:
                return ErrorKind::Remote;
        }
    }

    switch (rc) {
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
            return ErrorKind::Connection;
        default:
            return ErrorKind::Remote;
    }
}

std::string Libssh2Backend::last_error_message(const std::string& context) const {
    if (!session_) return context;

    int rc = libssh2_session_last_errno(session_);
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        return fmt::format("{}: {}", context, sftp_status_name(libssh2_sftp_last_error(sftp_)));
    }

    char* errmsg = nullptr;
    int errlen = 0;
    libssh2_session_last_error(session_, &errmsg, &errlen, 0);
    if (errmsg && errlen > 0) {
        return fmt::format("{}: {}", context, std::string(errmsg, errlen));
    }
    return context;
}

Result<std::vector<RemoteEntry>> Libssh2Backend::list_directory(const std::string& path) {
    using R = Result<std::vector<RemoteEntry>>;
    if (!sftp_) return R::Err(ErrorKind::NotConnected, "SFTP subsystem not started");

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        return R::Err(last_error_kind(), last_error_message("Cannot open directory " + path));
    }

    std::vector<RemoteEntry> entries;
    char filename[SFTP_NAME_BUF_SIZE];
    char longentry[SFTP_LONGENTRY_BUF_SIZE];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc == 0) break;
        if (rc < 0) {
            auto kind = last_error_kind();
            auto msg = last_error_message("Failed to read directory " + path);
            libssh2_sftp_closedir(dir);
            return R::Err(kind, msg);
        }

        std::string name(filename, rc);
        if (name == "." || name == "..") continue;

        RemoteEntry entry = entry_from_attrs(name, attrs);

        // Classify symlinks by their target; drop dangling ones
        if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISLNK(attrs.permissions)) {
            auto target = stat(join_remote(path, name));
            if (target.is_err()) {
                slate_log(fmt::format("skipping unresolvable link {}: {}", join_remote(path, name), target.error));
                continue;
            }
            entry = target.value;
            entry.name = name;
        }

        entries.push_back(std::move(entry));
    }

    libssh2_sftp_closedir(dir);
    return R::Ok(std::move(entries));
}

Result<RemoteEntry> Libssh2Backend::stat(const std::string& path) {
    if (!sftp_) return Result<RemoteEntry>::Err(ErrorKind::NotConnected, "SFTP subsystem not started");

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    int rc = libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                  LIBSSH2_SFTP_STAT, &attrs);
    if (rc != 0) {
        return Result<RemoteEntry>::Err(last_error_kind(), last_error_message("Cannot stat " + path));
    }
    return Result<RemoteEntry>::Ok(entry_from_attrs(remote_basename(path), attrs));
}

Result<std::unique_ptr<RemoteFile>> Libssh2Backend::open_read(const std::string& path) {
    using R = Result<std::unique_ptr<RemoteFile>>;
    if (!sftp_) return R::Err(ErrorKind::NotConnected, "SFTP subsystem not started");

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open_ex(sftp_, path.c_str(),
                                                   static_cast<unsigned int>(path.size()),
                                                   LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!fh) {
        return R::Err(last_error_kind(), last_error_message("Cannot open " + path + " for reading"));
    }
    return R::Ok(std::make_unique<Libssh2RemoteFile>(fh, *this, path));
}

Result<std::unique_ptr<RemoteFile>> Libssh2Backend::open_write(const std::string& path, unsigned mode) {
    using R = Result<std::unique_ptr<RemoteFile>>;
    if (!sftp_) return R::Err(ErrorKind::NotConnected, "SFTP subsystem not started");

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open_ex(sftp_, path.c_str(),
                                                   static_cast<unsigned int>(path.size()),
                                                   LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                   static_cast<long>(mode), LIBSSH2_SFTP_OPENFILE);
    if (!fh) {
        return R::Err(last_error_kind(), last_error_message("Cannot open " + path + " for writing"));
    }
    return R::Ok(std::make_unique<Libssh2RemoteFile>(fh, *this, path));
}

Result<void> Libssh2Backend::mkdir(const std::string& path, unsigned mode) {
    if (!sftp_) return Result<void>::Err(ErrorKind::NotConnected, "SFTP subsystem not started");

    int rc = libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
                                   static_cast<long>(mode));
    if (rc != 0) {
        return Result<void>::Err(last_error_kind(), last_error_message("Cannot create directory " + path));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Backend::keepalive() {
    if (!session_) return Result<void>::Ok();

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        return Result<void>::Err(last_error_kind(), last_error_message("Keepalive failed"));
    }
    return Result<void>::Ok();
}
