#include "batch_transfer.hpp"
#include "pattern_matcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

static Result<BatchReport> finish_batch(BatchReport report, const char* what) {
    if (!report.results.empty() && report.succeeded() == 0) {
        std::string msg = fmt::format("All {} {} failed", report.results.size(), what);
        slate_log(msg);
        return Result<BatchReport>::Err(ErrorKind::AllTransfersFailed, msg, std::move(report));
    }
    return Result<BatchReport>::Ok(std::move(report));
}

static TransferResult failed_entry(const std::string& source, const std::string& destination,
                                   ErrorKind kind, const std::string& reason) {
    TransferResult r;
    r.source_path = source;
    r.destination_path = destination;
    r.status = TransferStatus::Failed;
    r.error_kind = kind;
    r.reason = reason;
    return r;
}

static Result<TransferResult> single_result(TransferResult r) {
    if (r.ok()) return Result<TransferResult>::Ok(std::move(r));
    ErrorKind kind = r.error_kind;
    std::string reason = r.reason;
    return Result<TransferResult>::Err(kind, reason, std::move(r));
}

BatchTransferEngine::BatchTransferEngine(TransportHandle& transport, DirectoryLister& lister)
    : transport_(transport), lister_(lister) {
}

void BatchTransferEngine::record(BatchReport& report, TransferResult result) {
    slate_log_transfer("batch", result);
    if (on_transfer_) on_transfer_(result);
    report.results.push_back(std::move(result));

    // Long batches leave the channel idle between files
    auto alive = transport_.keepalive();
    if (alive.is_err()) {
        slate_log(fmt::format("keepalive failed [{}]: {}", error_kind_name(alive.kind), alive.error));
    }
}

// ── Single-file primitives ───────────────────────────────────────────

TransferResult BatchTransferEngine::transfer_down(const std::string& remote_path, const fs::path& local_path) {
    std::string local_str = local_path.string();

    auto info = transport_.stat(remote_path);
    if (info.is_err()) {
        return failed_entry(remote_path, local_str, info.kind, info.error);
    }
    if (info.value.is_directory) {
        return failed_entry(remote_path, local_str, ErrorKind::Remote, remote_path + " is a directory");
    }

    std::error_code ec;
    auto parent = local_path.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            return failed_entry(remote_path, local_str, ErrorKind::IO,
                                "Cannot create " + parent.string() + ": " + ec.message());
        }
    }

    auto remote = transport_.open_read(remote_path);
    if (remote.is_err()) {
        return failed_entry(remote_path, local_str, remote.kind, remote.error);
    }

    std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return failed_entry(remote_path, local_str, ErrorKind::IO, "Cannot open " + local_str + " for writing");
    }

    TransferResult r;
    r.source_path = remote_path;
    r.destination_path = local_str;

    std::vector<char> buf(TRANSFER_CHUNK_SIZE);
    while (true) {
        auto n = remote.value->read(buf.data(), buf.size());
        if (n.is_err()) {
            return failed_entry(remote_path, local_str, n.kind, n.error);
        }
        if (n.value == 0) break;

        out.write(buf.data(), static_cast<std::streamsize>(n.value));
        if (!out) {
            return failed_entry(remote_path, local_str, ErrorKind::IO, "Write failed for " + local_str);
        }
        r.bytes_transferred += n.value;
    }

    out.close();
    if (!out) {
        return failed_entry(remote_path, local_str, ErrorKind::IO, "Failed to finish writing " + local_str);
    }

    r.status = TransferStatus::Success;
    return r;
}

TransferResult BatchTransferEngine::transfer_up(const fs::path& local_path, const std::string& remote_path) {
    std::string local_str = local_path.string();

    std::error_code ec;
    if (!fs::exists(local_path, ec)) {
        return failed_entry(local_str, remote_path, ErrorKind::LocalNotFound, "Local file not found: " + local_str);
    }
    if (!fs::is_regular_file(local_path, ec)) {
        return failed_entry(local_str, remote_path, ErrorKind::IO, local_str + " is not a regular file");
    }

    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return failed_entry(local_str, remote_path, ErrorKind::IO, "Cannot read file: " + local_str);
    }

    std::string parent = remote_dirname(remote_path);
    if (!parent.empty()) {
        auto dirs = make_remote_dirs(parent);
        if (dirs.is_err()) {
            return failed_entry(local_str, remote_path, dirs.kind, dirs.error);
        }
    }

    auto remote = transport_.open_write(remote_path, DEFAULT_FILE_MODE);
    if (remote.is_err()) {
        return failed_entry(local_str, remote_path, remote.kind, remote.error);
    }

    TransferResult r;
    r.source_path = local_str;
    r.destination_path = remote_path;

    std::vector<char> buf(TRANSFER_CHUNK_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (in.bad()) {
            return failed_entry(local_str, remote_path, ErrorKind::IO, "Read failed for " + local_str);
        }
        if (got <= 0) continue;

        size_t sent = 0;
        size_t total = static_cast<size_t>(got);
        while (sent < total) {
            auto w = remote.value->write(buf.data() + sent, total - sent);
            if (w.is_err()) {
                return failed_entry(local_str, remote_path, w.kind, w.error);
            }
            if (w.value == 0) {
                return failed_entry(local_str, remote_path, ErrorKind::Remote,
                                    "Server accepted no data for " + remote_path);
            }
            sent += w.value;
        }
        r.bytes_transferred += total;
    }

    r.status = TransferStatus::Success;
    return r;
}

Result<TransferResult> BatchTransferEngine::download_file(const std::string& remote_path,
                                                          const fs::path& local_path) {
    auto r = transfer_down(remote_path, local_path);
    slate_log_transfer("download", r);
    if (on_transfer_) on_transfer_(r);
    return single_result(std::move(r));
}

Result<TransferResult> BatchTransferEngine::upload_file(const fs::path& local_path,
                                                        const std::string& remote_path) {
    auto r = transfer_up(local_path, remote_path);
    slate_log_transfer("upload", r);
    if (on_transfer_) on_transfer_(r);
    return single_result(std::move(r));
}

// ── Batches ──────────────────────────────────────────────────────────

Result<BatchReport> BatchTransferEngine::download_matching(const std::string& remote_dir,
                                                           const std::string& pattern,
                                                           const fs::path& local_dir) {
    std::string dir = lister_.resolve_dir(remote_dir);

    auto entries = lister_.list_entries(dir);
    if (entries.is_err()) {
        return Result<BatchReport>::Err(entries.kind, entries.error);
    }

    PatternMatcher matcher(pattern);
    auto selected = matcher.select_files(entries.value);
    if (selected.empty()) {
        std::string msg = pattern.empty()
            ? fmt::format("No files found in {}", dir)
            : fmt::format("No files in {} match '{}'", dir, pattern);
        return Result<BatchReport>::Err(ErrorKind::NothingMatched, msg);
    }

    slate_log(fmt::format("download_matching {} '{}': {} selected", dir, pattern, selected.size()));

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        return Result<BatchReport>::Err(ErrorKind::IO,
                                        "Cannot create " + local_dir.string() + ": " + ec.message());
    }

    BatchReport report;
    for (const auto& entry : selected) {
        record(report, transfer_down(join_remote(dir, entry.name), local_dir / entry.name));
    }
    return finish_batch(std::move(report), "downloads");
}

Result<BatchReport> BatchTransferEngine::download_files(const std::vector<std::string>& remote_paths,
                                                        const fs::path& local_dir) {
    if (remote_paths.empty()) {
        return Result<BatchReport>::Err(ErrorKind::NothingMatched, "No files to download");
    }

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        return Result<BatchReport>::Err(ErrorKind::IO,
                                        "Cannot create " + local_dir.string() + ": " + ec.message());
    }

    BatchReport report;
    for (const auto& remote_path : remote_paths) {
        record(report, transfer_down(remote_path, local_dir / remote_basename(remote_path)));
    }
    return finish_batch(std::move(report), "downloads");
}

Result<BatchReport> BatchTransferEngine::upload_files(const std::vector<fs::path>& local_paths,
                                                      const std::string& remote_dir) {
    if (local_paths.empty()) {
        return Result<BatchReport>::Err(ErrorKind::NothingMatched, "No files to upload");
    }

    std::string dir = lister_.resolve_dir(remote_dir);
    auto dirs = make_remote_dirs(dir);
    if (dirs.is_err()) {
        return Result<BatchReport>::Err(dirs.kind, dirs.error);
    }

    BatchReport report;
    for (const auto& local_path : local_paths) {
        record(report, transfer_up(local_path, join_remote(dir, local_path.filename().string())));
    }
    return finish_batch(std::move(report), "uploads");
}

Result<void> BatchTransferEngine::collect_download_tree(const std::string& remote_dir,
                                                        const fs::path& local_dir,
                                                        bool recursive, BatchReport& report) {
    auto entries = lister_.list_entries(remote_dir);
    if (entries.is_err()) {
        return Result<void>::Err(entries.kind, entries.error);
    }

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO, "Cannot create " + local_dir.string() + ": " + ec.message());
    }

    for (const auto& entry : entries.value) {
        std::string remote_path = join_remote(remote_dir, entry.name);
        fs::path local_path = local_dir / entry.name;

        if (!entry.is_directory) {
            record(report, transfer_down(remote_path, local_path));
            continue;
        }
        if (!recursive) continue;

        auto sub = collect_download_tree(remote_path, local_path, true, report);
        if (sub.is_err()) {
            record(report, failed_entry(remote_path, local_path.string(), sub.kind, sub.error));
        }
    }
    return Result<void>::Ok();
}

Result<BatchReport> BatchTransferEngine::download_directory(const std::string& remote_dir,
                                                            const fs::path& local_dir,
                                                            bool recursive) {
    BatchReport report;
    auto top = collect_download_tree(lister_.resolve_dir(remote_dir), local_dir, recursive, report);
    if (top.is_err()) {
        return Result<BatchReport>::Err(top.kind, top.error);
    }
    return finish_batch(std::move(report), "downloads");
}

void BatchTransferEngine::collect_upload_tree(const fs::path& local_dir, const std::string& remote_dir,
                                              bool recursive, BatchReport& report) {
    std::error_code ec;
    std::vector<fs::directory_entry> children;
    for (fs::directory_iterator it(local_dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        record(report, failed_entry(local_dir.string(), remote_dir, ErrorKind::IO,
                                    "Cannot read directory " + local_dir.string() + ": " + ec.message()));
        return;
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& child : children) {
        std::string name = child.path().filename().string();
        std::string remote_path = join_remote(remote_dir, name);

        if (child.is_directory(ec)) {
            if (!recursive) continue;
            auto made = make_remote_dirs(remote_path);
            if (made.is_err()) {
                record(report, failed_entry(child.path().string(), remote_path, made.kind, made.error));
                continue;
            }
            collect_upload_tree(child.path(), remote_path, true, report);
        } else {
            record(report, transfer_up(child.path(), remote_path));
        }
    }
}

Result<BatchReport> BatchTransferEngine::upload_directory(const fs::path& local_dir,
                                                          const std::string& remote_dir,
                                                          bool recursive) {
    std::error_code ec;
    if (!fs::is_directory(local_dir, ec)) {
        return Result<BatchReport>::Err(ErrorKind::LocalNotFound,
                                        "Local directory not found: " + local_dir.string());
    }

    std::string dir = lister_.resolve_dir(remote_dir);
    auto dirs = make_remote_dirs(dir);
    if (dirs.is_err()) {
        return Result<BatchReport>::Err(dirs.kind, dirs.error);
    }

    BatchReport report;
    collect_upload_tree(local_dir, dir, recursive, report);
    return finish_batch(std::move(report), "uploads");
}

Result<void> BatchTransferEngine::make_remote_dirs(const std::string& remote_dir) {
    if (remote_dir.empty() || remote_dir == "/" || remote_dir == ".") {
        return Result<void>::Ok();
    }

    auto info = transport_.stat(remote_dir);
    if (info.is_ok()) {
        if (info.value.is_directory) return Result<void>::Ok();
        return Result<void>::Err(ErrorKind::Remote, remote_dir + " exists and is not a directory");
    }
    if (info.kind != ErrorKind::RemoteNotFound) {
        return Result<void>::Err(info.kind, info.error);
    }

    std::string parent = remote_dirname(remote_dir);
    if (!parent.empty() && parent != remote_dir) {
        auto up = make_remote_dirs(parent);
        if (up.is_err()) return up;
    }

    auto made = transport_.mkdir(remote_dir, DEFAULT_DIR_MODE);
    if (made.is_err()) return made;

    slate_log("created remote directory " + remote_dir);
    return Result<void>::Ok();
}
