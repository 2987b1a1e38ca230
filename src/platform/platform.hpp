#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a fresh, not yet existing path in the temp directory with the given prefix.
std::filesystem::path temp_path(const std::string& prefix);

// Rename that fails instead of replacing an existing destination.
// Uses renameat2(RENAME_NOREPLACE) on Linux, link+unlink elsewhere on Unix,
// MoveFileEx without MOVEFILE_REPLACE_EXISTING on Windows.
Result<void> rename_no_replace(const std::filesystem::path& from,
                               const std::filesystem::path& to);

// Atomically replace `to` with `from` (same directory).
Result<void> replace_file(const std::filesystem::path& from,
                          const std::filesystem::path& to);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
