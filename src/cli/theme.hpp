#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Slate palette (ANSI escape sequences)
// Slate:  #5A6B7D
// Copper: #B87333
namespace color {
    const std::string SLATE     = "\033[38;2;90;107;125m";
    const std::string COPPER    = "\033[38;2;184;115;51m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(size_t width = 60) {
    std::string line;
    for (size_t i = 0; i < width; ++i) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::SLATE + color::BOLD + "  Slate SFTP\n"
         + color::RESET + color::DIM + "  v" + SLATE_VERSION
         + color::RESET + "\n\n" + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::COPPER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::COPPER + "    > " + color::RESET + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// Usage line: command in slate, arguments in copper, description dimmed
inline std::string usage(const std::string& cmd, const std::string& args, const std::string& desc) {
    return color::SLATE + fmt::format("    {:<16}", cmd) + color::RESET
         + color::COPPER + fmt::format("{:<40}", args) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
