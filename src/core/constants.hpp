#pragma once

// ── SSH options ─────────────────────────────────────────────
// Used when handing the frontend node over to the system ssh client.
constexpr const char* SSH_OPTS_NOCHECK = "StrictHostKeyChecking=no";
constexpr const char* SSH_OPTS_NO_KNOWN_HOSTS = "UserKnownHostsFile=/dev/null";
constexpr int SSH_PORT                   = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int STARTUP_TIMEOUT_SECS       = 600;   // Per polling phase (10 min)
constexpr int LIVENESS_POLL_SECS         = 10;    // Seconds between run-state rounds
constexpr int CONNECT_POLL_SECS          = 5;     // Seconds between SSH rounds
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 5;     // Single SSH connection attempt
constexpr int CLOUD_CMD_TIMEOUT_SECS     = 120;   // Max time for one cloud CLI call
constexpr int INTERRUPT_CHECK_MS         = 1000;  // Provisioning wait granularity

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE         = 4096;

// ── Naming ──────────────────────────────────────────────────
constexpr const char* NODE_NAME_FORMAT   = "{}{:03d}";   // kind + ordinal
constexpr const char* KIND_PATTERN       = "^[a-zA-Z0-9-]+$";

// ── Local paths ─────────────────────────────────────────────
constexpr const char* CUMULUS_HOME_DIR   = ".cumulus";
constexpr const char* STORAGE_SUBDIR     = "storage";
constexpr const char* LOG_SUBDIR         = "logs";
