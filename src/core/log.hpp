#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string slate_log_path() {
    static std::string path = (platform::temp_dir() / SLATE_DEBUG_LOG).string();
    return path;
}

// Append a timestamped line to the debug log. Never fails the caller.
inline void slate_log(const std::string& msg) {
    std::ofstream out(slate_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void slate_log_transfer(const char* label, const TransferResult& r) {
    if (r.ok()) {
        slate_log(fmt::format("{} {} -> {} ok ({} bytes)", label,
                              r.source_path, r.destination_path, r.bytes_transferred));
    } else {
        slate_log(fmt::format("{} {} -> {} failed [{}]: {}", label,
                              r.source_path, r.destination_path,
                              error_kind_name(r.error_kind), r.reason));
    }
}
