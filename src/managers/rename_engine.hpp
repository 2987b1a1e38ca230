#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <core/types.hpp>
#include <core/models.hpp>
#include <core/sanitizer.hpp>
#include <core/hash_computer.hpp>
#include <operations/file_operations.hpp>
#include <managers/sidecar_manager.hpp>

// Thrown when the root fails pre-flight, before any file is touched.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Renames every file of a directory (optionally the whole tree) to its
// sanitized name. Collisions are resolved by content hash and never
// overwrite. Each directory's renames are appended to its sidecar in one
// write once its files are done, before descending into subdirectories.
class RenameEngine {
public:
    RenameEngine(std::unique_ptr<FileOperations> ops,
                 std::unique_ptr<HashComputer> hasher,
                 FilenameSanitizer sanitizer = FilenameSanitizer());

    // One result per file entry, plus one per directory that could not be listed.
    // Throws ConfigurationError if the root fails pre-flight.
    std::vector<RenameResult> rename_directory(const std::string& directory,
                                               bool recursive = false,
                                               bool dry_run = false);

    // Cooperative stop, checked between entries. Safe to call from a signal handler.
    void cancel() { cancel_.store(true); }
    bool cancelled() const { return cancel_.load(); }

    // Called with each directory path as processing starts on it.
    void set_status_callback(StatusCallback cb) { status_cb_ = std::move(cb); }

    static OperationStats stats(const std::vector<RenameResult>& results);

    FileOperations& operations() { return *ops_; }
    const HashComputer& hasher() const { return *hasher_; }
    const FilenameSanitizer& sanitizer() const { return sanitizer_; }

private:
    // A completed move whose sidecar entry is still pending.
    struct PendingAudit {
        std::size_t result_index;
        SidecarEntry entry;
    };

    // Per-directory state for one pass.
    struct DirectoryPass {
        std::string directory;
        bool dry_run = false;
        std::set<std::string> listed;                 // names present when the pass began
        std::map<std::string, std::string> claimed;   // dry-run: target name -> source path
        std::vector<PendingAudit> pending;
    };

    void process_directory(const std::string& directory, bool recursive, bool dry_run,
                           std::vector<RenameResult>& results);
    RenameResult process_file(DirectoryPass& pass, const std::string& name,
                              std::optional<SidecarEntry>& audit);
    RenameResult resolve_collision(const std::string& name, const std::string& path,
                                   const std::string& target, const std::string& existing_path,
                                   const OperationTiming& timing);
    Result<void> move_through_temp(const DirectoryPass& pass, const std::string& path,
                                   const std::string& target);
    void flush_sidecar(DirectoryPass& pass, std::vector<RenameResult>& results);

    Result<std::string> hash_file(const std::string& path);

    std::unique_ptr<FileOperations> ops_;
    std::unique_ptr<HashComputer> hasher_;
    FilenameSanitizer sanitizer_;
    SidecarManager sidecar_;
    std::atomic<bool> cancel_{false};
    StatusCallback status_cb_;
};
