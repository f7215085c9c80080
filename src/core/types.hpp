#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// What went wrong, for callers that need to react differently per failure.
enum class ErrorKind {
    None,
    Configuration,       // missing/invalid settings, never retried
    Authentication,      // key or user rejected, fatal to the session
    Connection,          // host unreachable, handshake or socket failure
    NotConnected,        // operation attempted on a disconnected session
    RemoteNotFound,
    LocalNotFound,
    Permission,          // remote access denied
    IO,                  // local disk read/write fault
    Remote,              // any other SFTP server failure
    NothingMatched,      // batch selected zero files
    AllTransfersFailed,  // batch attempted files and none succeeded
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Failure that still carries a value (e.g. per-file results of a batch)
    static Result<T> Err(ErrorKind kind, const std::string& err, T val) {
        return {false, std::move(val), err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Connection settings for one SFTP session
struct ConnectionConfig {
    std::string hostname;
    std::string username;
    std::string private_key_path;
    int port = DEFAULT_SFTP_PORT;
    std::optional<std::string> default_remote_dir;
    int timeout_secs = 0;                        // 0 = block indefinitely
};

// One record of a remote directory listing
struct RemoteEntry {
    std::string name;
    bool is_directory = false;
    std::uint64_t size = 0;
    std::int64_t modified_time = 0;              // epoch seconds
    std::uint32_t permissions = 0;
};

struct DirectoryListing {
    std::vector<std::string> directories;
    std::vector<std::string> files;
};

enum class TransferStatus {
    Success,
    Failed,
};

struct TransferResult {
    std::string source_path;
    std::string destination_path;
    TransferStatus status = TransferStatus::Failed;
    ErrorKind error_kind = ErrorKind::None;
    std::string reason;                          // empty on success
    std::uint64_t bytes_transferred = 0;

    bool ok() const { return status == TransferStatus::Success; }
};

// Ordered per-file outcomes of a batch operation
struct BatchReport {
    std::vector<TransferResult> results;

    size_t succeeded() const;
    size_t failed() const { return results.size() - succeeded(); }
    std::uint64_t total_bytes() const;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
