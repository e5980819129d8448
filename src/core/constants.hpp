#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* ECHOTERM_VERSION = "0.2.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SSH_EAGAIN_SLEEP_MS        = 100;   // Backoff between libssh2 EAGAIN retries
constexpr int RELAY_POLL_MS              = 100;   // Relay loop poll interval

// ── Local echo ──────────────────────────────────────────────
constexpr int DEFAULT_ECHO_PAUSE_MS      = 500;   // Echo suppression after Tab / Ctrl-C

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;

// ── Keys ────────────────────────────────────────────────────
constexpr char KEY_TAB                   = 0x09;
constexpr char KEY_CTRL_C                = 0x03;
