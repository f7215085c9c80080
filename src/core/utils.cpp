#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <ctime>
#include <cstdio>

std::string format_mtime(std::int64_t epoch_secs) {
    if (epoch_secs <= 0) return "-";
    std::time_t t = static_cast<std::time_t>(epoch_secs);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%m/%d/%Y %H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_size_kb(std::uint64_t bytes) {
    // Hundredths of a KB, rounded half up
    std::uint64_t centi = (bytes * 100 + 512) / 1024;
    std::uint64_t whole = centi / 100;
    unsigned frac = static_cast<unsigned>(centi % 100);

    std::string digits = std::to_string(whole);
    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) grouped.insert(grouped.begin(), ',');
        grouped.insert(grouped.begin(), *it);
        count++;
    }
    return fmt::format("{}.{:02d} KB", grouped, frac);
}

std::string join_remote(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;
    std::string head = dir;
    while (head.size() > 1 && head.back() == '/') head.pop_back();
    std::string tail = name;
    while (!tail.empty() && tail.front() == '/') tail.erase(0, 1);
    if (head == "/") return "/" + tail;
    return head + "/" + tail;
}

std::string remote_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return p;
    if (p == "/") return "";
    return p.substr(slash + 1);
}

std::string remote_dirname(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;  // ~user is not expanded
    return platform::home_dir().string() + path.substr(1);
}
