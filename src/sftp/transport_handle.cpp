#include "transport_handle.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

TransportHandle::TransportHandle(ConnectionConfig config, std::unique_ptr<SftpBackend> backend)
    : config_(std::move(config)), backend_(std::move(backend)),
      state_(SessionState::Disconnected), release_pending_(false) {
}

TransportHandle::~TransportHandle() {
    close();
}

Result<void> TransportHandle::connect(StatusCallback callback) {
    if (state_ == SessionState::Connected) {
        return Result<void>::Ok();
    }

    auto valid = validate_connection_config(config_);
    if (valid.is_err()) {
        slate_log("connect rejected: " + valid.error);
        return valid;
    }

    release_pending_ = true;
    auto result = backend_->authenticate(config_, callback);
    if (result.is_err()) {
        slate_log(fmt::format("connect to {} failed [{}]: {}", config_.hostname,
                              error_kind_name(result.kind), result.error));
        close();
        return result;
    }

    state_ = SessionState::Connected;
    if (callback) callback("Connected to " + config_.hostname);
    return Result<void>::Ok();
}

void TransportHandle::close() {
    if (release_pending_) {
        backend_->close();
        release_pending_ = false;
        if (state_ == SessionState::Connected) {
            slate_log("disconnected from " + config_.hostname);
        }
    }
    state_ = SessionState::Disconnected;
}

std::string TransportHandle::not_connected_message(const char* op) const {
    return fmt::format("Cannot {}: not connected (call connect() first)", op);
}

Result<std::vector<RemoteEntry>> TransportHandle::list_directory(const std::string& path) {
    if (!is_connected()) {
        return Result<std::vector<RemoteEntry>>::Err(ErrorKind::NotConnected, not_connected_message("list directory"));
    }
    return backend_->list_directory(path);
}

Result<RemoteEntry> TransportHandle::stat(const std::string& path) {
    if (!is_connected()) {
        return Result<RemoteEntry>::Err(ErrorKind::NotConnected, not_connected_message("stat"));
    }
    return backend_->stat(path);
}

Result<std::unique_ptr<RemoteFile>> TransportHandle::open_read(const std::string& path) {
    if (!is_connected()) {
        return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::NotConnected, not_connected_message("open file"));
    }
    return backend_->open_read(path);
}

Result<std::unique_ptr<RemoteFile>> TransportHandle::open_write(const std::string& path, unsigned mode) {
    if (!is_connected()) {
        return Result<std::unique_ptr<RemoteFile>>::Err(ErrorKind::NotConnected, not_connected_message("open file"));
    }
    return backend_->open_write(path, mode);
}

Result<void> TransportHandle::mkdir(const std::string& path, unsigned mode) {
    if (!is_connected()) {
        return Result<void>::Err(ErrorKind::NotConnected, not_connected_message("create directory"));
    }
    return backend_->mkdir(path, mode);
}

Result<void> TransportHandle::keepalive() {
    if (!is_connected()) {
        return Result<void>::Ok();
    }
    return backend_->keepalive();
}
