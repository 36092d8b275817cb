#pragma once

#include <cstdint>

constexpr const char* NIMBUS_VERSION = "0.1.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single remote command
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max time to get a channel from the session
constexpr int SSH_SOCKET_WAIT_MS         = 10;    // Poll slice while libssh2 reports EAGAIN

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;
constexpr int SCP_BUF_SIZE               = 65536;
constexpr int ARCHIVE_BUF_SIZE           = 65536;

// ── Block layout ────────────────────────────────────────────
// Block names carry a fixed-width decimal index: archive.part.0000 .. archive.part.9999
constexpr int BLOCK_INDEX_WIDTH          = 4;
constexpr uint64_t BYTES_PER_MB          = 1024ULL * 1024ULL;

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_MAX_RETRIES        = 5;
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT    = 30;
constexpr const char* DEFAULT_CHUNK_PREFIX   = "archive.part.";
constexpr const char* DEFAULT_MANIFEST_NAME  = "archive.manifest";
constexpr const char* DEFAULT_REMOTE_TMP_DIR = "/tmp/chunk_transfer";
constexpr const char* TMP_ARCHIVE_BASE       = "archive.tar";

// Tools the remote host needs for staging, verifying and unpacking blocks.
constexpr const char* REMOTE_BASE_TOOLS[] = {"tar", "cat", "split", "md5sum", "stat"};
