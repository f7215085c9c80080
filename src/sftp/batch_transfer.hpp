#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "transport_handle.hpp"
#include "directory_lister.hpp"

namespace fs = std::filesystem;

// Called once per attempted file, in processing order.
using TransferCallback = std::function<void(const TransferResult&)>;

// Sequential single-file and batch transfers over one TransportHandle.
//
// Single-file calls return the specific failure. Batch calls never stop at a
// failed file: each failure becomes a TransferResult entry, and the batch as a
// whole only fails when nothing was selected (NothingMatched) or when every
// attempt failed (AllTransfersFailed, per-file results still in .value).
// Destinations are always overwritten.
class BatchTransferEngine {
public:
    BatchTransferEngine(TransportHandle& transport, DirectoryLister& lister);

    void on_transfer(TransferCallback callback) { on_transfer_ = std::move(callback); }

    // Creates the local parent directory if missing.
    Result<TransferResult> download_file(const std::string& remote_path, const fs::path& local_path);

    // Creates missing remote parent directories.
    Result<TransferResult> upload_file(const fs::path& local_path, const std::string& remote_path);

    // Files in remote_dir whose name contains pattern, saved under local_dir
    // with their remote basename.
    Result<BatchReport> download_matching(const std::string& remote_dir,
                                          const std::string& pattern,
                                          const fs::path& local_dir);

    Result<BatchReport> download_files(const std::vector<std::string>& remote_paths,
                                       const fs::path& local_dir);

    Result<BatchReport> upload_files(const std::vector<fs::path>& local_paths,
                                     const std::string& remote_dir);

    // Mirror a directory tree. An empty source directory is a success with no results.
    Result<BatchReport> download_directory(const std::string& remote_dir,
                                           const fs::path& local_dir,
                                           bool recursive = true);
    Result<BatchReport> upload_directory(const fs::path& local_dir,
                                         const std::string& remote_dir,
                                         bool recursive = true);

    // mkdir -p on the remote side.
    Result<void> make_remote_dirs(const std::string& remote_dir);

private:
    TransportHandle& transport_;
    DirectoryLister& lister_;
    TransferCallback on_transfer_;

    TransferResult transfer_down(const std::string& remote_path, const fs::path& local_path);
    TransferResult transfer_up(const fs::path& local_path, const std::string& remote_path);
    void record(BatchReport& report, TransferResult result);

    Result<void> collect_download_tree(const std::string& remote_dir, const fs::path& local_dir,
                                       bool recursive, BatchReport& report);
    void collect_upload_tree(const fs::path& local_dir, const std::string& remote_dir,
                             bool recursive, BatchReport& report);
};
