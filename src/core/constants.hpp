#pragma once

// ── Batch defaults ──────────────────────────────────────────
constexpr int DEFAULT_CONCURRENCY        = 32;    // Max sessions active at once
constexpr int DEFAULT_TIMEOUT_SECS       = 60;    // Per-host deadline (0 = none)
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS = 10;  // TCP connect limit (0 = per-host deadline only)
constexpr int DEFAULT_SSH_PORT           = 22;

// ── Polling ─────────────────────────────────────────────────
constexpr int SOCKET_POLL_MS             = 50;    // Max wait per socket poll before re-checking cancellation
constexpr int WATCHDOG_IDLE_MS           = 250;   // Watchdog wakeup when no deadline is armed

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;
constexpr int SFTP_CHUNK_SIZE            = 32768;

// ── Remote environment ──────────────────────────────────────
constexpr const char* ENV_NODENUM        = "FANOUT_NODENUM";
constexpr const char* ENV_HOST           = "FANOUT_HOST";

// ── Templates ───────────────────────────────────────────────
// Replaced by the host name in copy destinations and slurp local names.
constexpr const char* HOST_PLACEHOLDER   = "{host}";

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".fanout";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* DEFAULT_LOG_NAME   = "fanout_debug.log";
constexpr const char* FANOUT_VERSION     = "0.4.0";
