#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/types.hpp>
#include <core/models.hpp>
#include <core/byte_stream.hpp>

// Primitive file capabilities the rename engine and sidecar manager need.
// One implementation per backend (local filesystem, rclone remote).
// Paths are backend-native strings built with join().
class FileOperations {
public:
    virtual ~FileOperations() = default;

    // Checked once before any file is touched.
    virtual Result<void> preflight(const std::string& root) = 0;

    // Immediate children of a directory, in no particular order. Entries whose
    // type cannot be determined are returned with DirEntry::error set.
    virtual Result<std::vector<DirEntry>> list_entries(const std::string& directory) = 0;

    virtual Result<bool> exists(const std::string& path) = 0;

    // True when both paths resolve to one stored object, as happens when a
    // filesystem ignores case or Unicode normalization in names.
    virtual Result<bool> same_file(const std::string& a, const std::string& b) = 0;

    // Rename within a backend. Fails if `to` already exists.
    virtual Result<void> move(const std::string& from, const std::string& to) = 0;

    virtual Result<std::unique_ptr<ByteStream>> open_for_read(const std::string& path) = 0;

    // Digest the backend can supply without transferring the content, for
    // "md5" or "sha256". nullopt means the caller has to stream the file.
    virtual Result<std::optional<std::string>> stored_hash(const std::string& path,
                                                           const std::string& algorithm) = 0;

    // ── Sidecar primitives ─────────────────────────────────

    // Whole-file text read. nullopt when the file does not exist.
    virtual Result<std::optional<std::string>> read_text(const std::string& path) = 0;
    virtual Result<void> write_text(const std::string& path, const std::string& data) = 0;

    // Move that overwrites `to`. Used only to swap in a freshly written sidecar.
    virtual Result<void> replace(const std::string& from, const std::string& to) = 0;

    virtual std::string join(const std::string& directory, const std::string& name) const = 0;

    // Error kind attached to results when a primitive of this backend fails.
    virtual ErrorKind failure_kind() const = 0;
    virtual std::string backend_name() const = 0;
};
