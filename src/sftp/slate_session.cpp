#include "slate_session.hpp"
#include "libssh2_backend.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SlateSession::SlateSession(ConnectionConfig config)
    : SlateSession(std::move(config), std::make_unique<Libssh2Backend>()) {
}

SlateSession::SlateSession(ConnectionConfig config, std::unique_ptr<SftpBackend> backend)
    : transport_(std::move(config), std::move(backend)),
      lister_(transport_),
      engine_(transport_, lister_) {
}

SlateSession::~SlateSession() {
    close();
}

// ── Connection lifecycle ──────────────────────────────────────

Result<void> SlateSession::connect(StatusCallback cb) {
    return transport_.connect(cb);
}

void SlateSession::close() {
    transport_.close();
}

std::string SlateSession::not_connected(const char* op) const {
    return fmt::format("Cannot {}: session is {}", op, session_state_name(transport_.state()));
}

// ── Listing ───────────────────────────────────────────────────

Result<std::vector<RemoteEntry>> SlateSession::list_entries(const std::string& dir) {
    if (!is_connected()) {
        return Result<std::vector<RemoteEntry>>::Err(ErrorKind::NotConnected, not_connected("list directory"));
    }
    return lister_.list_entries(dir);
}

Result<std::vector<std::string>> SlateSession::list_files(const std::string& dir) {
    if (!is_connected()) {
        return Result<std::vector<std::string>>::Err(ErrorKind::NotConnected, not_connected("list files"));
    }
    return lister_.list_files(dir);
}

Result<std::vector<std::string>> SlateSession::list_directories(const std::string& dir) {
    if (!is_connected()) {
        return Result<std::vector<std::string>>::Err(ErrorKind::NotConnected, not_connected("list directories"));
    }
    return lister_.list_directories(dir);
}

Result<DirectoryListing> SlateSession::list_all(const std::string& dir) {
    if (!is_connected()) {
        return Result<DirectoryListing>::Err(ErrorKind::NotConnected, not_connected("list directory"));
    }
    return lister_.list_all(dir);
}

Result<void> SlateSession::create_directory(const std::string& path, unsigned mode) {
    if (!is_connected()) {
        return Result<void>::Err(ErrorKind::NotConnected, not_connected("create directory"));
    }
    auto result = transport_.mkdir(path, mode);
    if (result.is_ok()) {
        slate_log(fmt::format("mkdir {} ({:o})", path, mode));
    } else {
        slate_log(fmt::format("mkdir {} failed [{}]: {}", path, error_kind_name(result.kind), result.error));
    }
    return result;
}

// ── Transfers ─────────────────────────────────────────────────

Result<TransferResult> SlateSession::download_file(const std::string& remote_path, const fs::path& local_path) {
    if (!is_connected()) {
        return Result<TransferResult>::Err(ErrorKind::NotConnected, not_connected("download"));
    }
    return engine_.download_file(remote_path, local_path);
}

Result<TransferResult> SlateSession::upload_file(const fs::path& local_path, const std::string& remote_path) {
    if (!is_connected()) {
        return Result<TransferResult>::Err(ErrorKind::NotConnected, not_connected("upload"));
    }
    return engine_.upload_file(local_path, remote_path);
}

Result<BatchReport> SlateSession::download_matching(const std::string& remote_dir,
                                                    const std::string& pattern,
                                                    const fs::path& local_dir) {
    if (!is_connected()) {
        return Result<BatchReport>::Err(ErrorKind::NotConnected, not_connected("download"));
    }
    return engine_.download_matching(remote_dir, pattern, local_dir);
}

Result<BatchReport> SlateSession::download_files(const std::vector<std::string>& remote_paths,
                                                 const fs::path& local_dir) {
    if (!is_connected()) {
        return Result<BatchReport>::Err(ErrorKind::NotConnected, not_connected("download"));
    }
    return engine_.download_files(remote_paths, local_dir);
}

Result<BatchReport> SlateSession::upload_files(const std::vector<fs::path>& local_paths,
                                               const std::string& remote_dir) {
    if (!is_connected()) {
        return Result<BatchReport>::Err(ErrorKind::NotConnected, not_connected("upload"));
    }
    return engine_.upload_files(local_paths, remote_dir);
}

Result<BatchReport> SlateSession::download_directory(const std::string& remote_dir,
                                                     const fs::path& local_dir,
                                                     bool recursive) {
    if (!is_connected()) {
        return Result<BatchReport>::Err(ErrorKind::NotConnected, not_connected("download"));
    }
    return engine_.download_directory(remote_dir, local_dir, recursive);
}

Result<BatchReport> SlateSession::upload_directory(const fs::path& local_dir,
                                                   const std::string& remote_dir,
                                                   bool recursive) {
    if (!is_connected()) {
        return Result<BatchReport>::Err(ErrorKind::NotConnected, not_connected("upload"));
    }
    return engine_.upload_directory(local_dir, remote_dir, recursive);
}

// ── SessionScope ──────────────────────────────────────────────

SessionScope::SessionScope(SlateSession& session, StatusCallback cb)
    : session_(session), status_(session.connect(cb)) {
}

SessionScope::~SessionScope() {
    session_.close();
}
