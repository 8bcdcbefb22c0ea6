#pragma once

// ── Remote command ──────────────────────────────────────────
// Appended to the command when gzip transport is enabled.
constexpr const char* GZIP_PIPE_SUFFIX = " | /usr/bin/gzip -f";
constexpr int DEFAULT_SSH_PORT           = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_DIAL_TIMEOUT_SECS      = 10;    // TCP connect + handshake bound
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;    // Back-off between EAGAIN retries

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int GZIP_READ_BUF_SIZE         = 16384;

// ── Report layout ───────────────────────────────────────────
constexpr int REPORT_HOST_WIDTH          = 15;
constexpr const char* REPORT_ERROR_HEADER =
    "================================= ERROR =================================";
constexpr const char* REPORT_OUTPUT_HEADER =
    "================================= OUTPUT =================================";

// ── Local paths ─────────────────────────────────────────────
constexpr const char* FLEETCMD_DIR_NAME  = ".fleetcmd";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* CREDENTIALS_FILE_NAME = "credentials";
constexpr const char* DEBUG_LOG_NAME     = "fleetcmd_debug.log";

// ── CLI ─────────────────────────────────────────────────────
constexpr const char* FLEETCMD_VERSION   = "0.1.0";
constexpr int INTERRUPT_POLL_MS          = 100;   // Signal watcher wake-up interval
