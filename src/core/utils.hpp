#pragma once

#include <string>
#include <cstdint>
#include <ctime>

// Format an epoch timestamp as "MM/DD/YYYY HH:MM:SS" (local time). "-" for 0.
std::string format_mtime(std::int64_t epoch_secs);

// Format a byte count as kilobytes with two decimals and thousands separators,
// e.g. 1536000 -> "1,500.00 KB".
std::string format_size_kb(std::uint64_t bytes);

// Join two remote (POSIX) path components with exactly one '/' between them.
std::string join_remote(const std::string& dir, const std::string& name);

// Last component of a remote path ("/a/b/c.txt" -> "c.txt"). Trailing slashes ignored.
std::string remote_basename(const std::string& path);

// Parent of a remote path ("/a/b/c.txt" -> "/a/b", "c.txt" -> "", "/c" -> "/").
std::string remote_dirname(const std::string& path);

// Replace a leading "~" with the user's home directory.
std::string expand_home(const std::string& path);
