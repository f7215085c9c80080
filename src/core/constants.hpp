#pragma once

#include <cstddef>

// ── Connection ──────────────────────────────────────────────
constexpr int DEFAULT_SFTP_PORT          = 22;
constexpr int SSH_KEEPALIVE_SECS         = 30;    // libssh2 keepalive interval
constexpr int TCP_KEEPIDLE_SECS          = 60;
constexpr int TCP_KEEPINTVL_SECS         = 15;
constexpr int TCP_KEEPCNT_PROBES         = 4;

// ── Transfer ────────────────────────────────────────────────
constexpr std::size_t TRANSFER_CHUNK_SIZE = 64 * 1024;
constexpr unsigned DEFAULT_DIR_MODE      = 0755;
constexpr unsigned DEFAULT_FILE_MODE     = 0644;

// ── Listing ─────────────────────────────────────────────────
constexpr std::size_t SFTP_NAME_BUF_SIZE = 512;
constexpr std::size_t SFTP_LONGENTRY_BUF_SIZE = 1024;

// ── Config / files ──────────────────────────────────────────
constexpr const char* SLATE_CONFIG_DIRNAME   = ".slate";
constexpr const char* SLATE_CONFIG_FILENAME  = "config.yaml";
constexpr const char* SLATE_PROJECT_FILENAME = "slate.yaml";
constexpr const char* SLATE_DEBUG_LOG        = "slate_debug.log";
constexpr const char* SLATE_VERSION          = "0.1.0";
