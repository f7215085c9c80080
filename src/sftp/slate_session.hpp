#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "backend.hpp"
#include "batch_transfer.hpp"
#include "directory_lister.hpp"
#include "transport_handle.hpp"

namespace fs = std::filesystem;

// Headless SFTP session facade: one connection, listing and transfers.
// Every operation except connect()/close() fails with NotConnected while
// disconnected, without touching the backend.
class SlateSession {
public:
    // Production session over libssh2.
    explicit SlateSession(ConnectionConfig config);
    SlateSession(ConnectionConfig config, std::unique_ptr<SftpBackend> backend);
    ~SlateSession();

    SlateSession(const SlateSession&) = delete;
    SlateSession& operator=(const SlateSession&) = delete;

    // ── Connection lifecycle ──────────────────────────────────

    Result<void> connect(StatusCallback cb = nullptr);
    void close();

    bool is_connected() const { return transport_.is_connected(); }
    SessionState state() const { return transport_.state(); }
    const ConnectionConfig& config() const { return transport_.config(); }

    // Per-file progress for every transfer, single or batch.
    void on_transfer(TransferCallback cb) { engine_.on_transfer(std::move(cb)); }

    // ── Listing ───────────────────────────────────────────────

    // An empty dir means the configured default remote directory.
    Result<std::vector<RemoteEntry>> list_entries(const std::string& dir = "");
    Result<std::vector<std::string>> list_files(const std::string& dir = "");
    Result<std::vector<std::string>> list_directories(const std::string& dir = "");
    Result<DirectoryListing> list_all(const std::string& dir = "");

    // Creates exactly one directory; the parent must exist.
    Result<void> create_directory(const std::string& path, unsigned mode = DEFAULT_DIR_MODE);

    // ── Transfers ─────────────────────────────────────────────

    Result<TransferResult> download_file(const std::string& remote_path, const fs::path& local_path);
    Result<TransferResult> upload_file(const fs::path& local_path, const std::string& remote_path);

    Result<BatchReport> download_matching(const std::string& remote_dir,
                                          const std::string& pattern,
                                          const fs::path& local_dir);
    Result<BatchReport> download_files(const std::vector<std::string>& remote_paths,
                                       const fs::path& local_dir);
    Result<BatchReport> upload_files(const std::vector<fs::path>& local_paths,
                                     const std::string& remote_dir);
    Result<BatchReport> download_directory(const std::string& remote_dir,
                                           const fs::path& local_dir,
                                           bool recursive = true);
    Result<BatchReport> upload_directory(const fs::path& local_dir,
                                         const std::string& remote_dir,
                                         bool recursive = true);

private:
    TransportHandle transport_;
    DirectoryLister lister_;
    BatchTransferEngine engine_;

    std::string not_connected(const char* op) const;
};

// Connects on construction and closes on every exit from the enclosing block,
// exceptions included. Check ok() before using session().
class SessionScope {
public:
    explicit SessionScope(SlateSession& session, StatusCallback cb = nullptr);
    ~SessionScope();

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

    bool ok() const { return status_.is_ok(); }
    const Result<void>& status() const { return status_; }
    SlateSession& session() { return session_; }

private:
    SlateSession& session_;
    Result<void> status_;
};
