#pragma once

#include <cstddef>

// ── Sidecar ─────────────────────────────────────────────────
// Per-directory audit file and the temp name used for atomic replacement.
constexpr const char* SIDECAR_FILENAME     = ".safename.json";
constexpr const char* SIDECAR_TMP_SUFFIX   = ".tmp";

// ── Sanitizer ───────────────────────────────────────────────
constexpr const char* PLACEHOLDER_STEM     = "file";

// Intermediate name for renames the filesystem sees as a no-op
// (same object under a case- or normalization-equivalent name).
constexpr const char* RENAME_TMP_SUFFIX    = ".safename-rename";

// ── Hashing ─────────────────────────────────────────────────
constexpr std::size_t HASH_CHUNK_SIZE      = 64 * 1024;   // Bytes per read when hashing
constexpr const char* DEFAULT_LOCAL_HASH   = "sha256";
constexpr const char* DEFAULT_REMOTE_HASH  = "md5";        // What most cloud remotes expose

// ── External sync tool ──────────────────────────────────────
constexpr const char* DEFAULT_RCLONE_BINARY = "rclone";
constexpr int RCLONE_EXIT_DIR_NOT_FOUND    = 3;
constexpr int RCLONE_EXIT_FILE_NOT_FOUND   = 4;
constexpr int EXEC_FAILED_EXIT_CODE        = 127;         // Child could not exec the binary
constexpr int PROCESS_READ_BUF_SIZE        = 4096;
constexpr std::size_t LOG_OUTPUT_TRUNCATE  = 500;         // Chars of tool output kept in the log

// ── CLI ─────────────────────────────────────────────────────
constexpr const char* SAFENAME_VERSION     = "0.4.0";
constexpr int EXIT_OK                      = 0;
constexpr int EXIT_BATCH_ERRORS            = 1;
constexpr int EXIT_USAGE                   = 2;
