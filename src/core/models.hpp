#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

// How a single file entry was resolved.
enum class RenameOutcome {
    AlreadySafe,        // sanitize(name) == name, nothing to do
    Excluded,           // OS metadata file, never renamed
    Renamed,            // moved and recorded in the sidecar
    WouldRename,        // dry-run: destination is free
    CollisionMatch,     // destination exists with identical content
    CollisionConflict,  // destination exists with different content
    Failed,             // move, hash or listing failed; original untouched
    RenamedUnaudited,   // moved, but the sidecar could not record it
};

enum class ErrorKind {
    None,
    CollisionConflict,
    IOFailure,
    HashFailure,
    RemoteToolFailure,
    SidecarWriteFailure,
};

const char* to_string(RenameOutcome outcome);
const char* to_string(ErrorKind kind);

// Wall time spent on one file. Observability only.
struct OperationTiming {
    using Clock = std::chrono::steady_clock;

    Clock::time_point start;
    Clock::time_point end;

    static OperationTiming start_now();
    OperationTiming finish_now() const;
    double duration_seconds() const;
};

// Immutable outcome of processing one file entry.
// Invariants: renamed() implies success() and new_path();
//             !success() implies !new_path().
class RenameResult {
public:
    static RenameResult already_safe(const std::string& name, const std::string& path,
                                     const OperationTiming& timing);
    static RenameResult excluded(const std::string& name, const std::string& path,
                                 const OperationTiming& timing);
    static RenameResult renamed_to(const std::string& name, const std::string& path,
                                   const std::string& new_name, const std::string& new_path,
                                   const std::string& hash, const std::string& algorithm,
                                   const OperationTiming& timing);
    static RenameResult would_rename(const std::string& name, const std::string& path,
                                     const std::string& new_name, const std::string& new_path,
                                     const OperationTiming& timing);
    static RenameResult collision_match(const std::string& name, const std::string& path,
                                        const std::string& existing_name,
                                        const std::string& hash, const std::string& algorithm,
                                        const OperationTiming& timing);
    static RenameResult collision_conflict(const std::string& name, const std::string& path,
                                           const std::string& existing_name,
                                           const std::string& error,
                                           const OperationTiming& timing);
    static RenameResult failed(const std::string& name, const std::string& path,
                               ErrorKind kind, const std::string& error,
                               const OperationTiming& timing,
                               const std::optional<std::string>& attempted_name = std::nullopt);

    // A renamed result whose audit record could not be written.
    static RenameResult unaudited(const RenameResult& renamed, ErrorKind kind,
                                  const std::string& error);

    const std::string& original_name() const { return original_name_; }
    const std::optional<std::string>& new_name() const { return new_name_; }
    const std::string& original_path() const { return original_path_; }
    const std::optional<std::string>& new_path() const { return new_path_; }
    bool renamed() const { return renamed_; }
    bool success() const { return success_; }
    const std::optional<std::string>& error() const { return error_; }
    const std::optional<std::string>& content_hash() const { return content_hash_; }
    const std::string& hash_algorithm() const { return hash_algorithm_; }
    const OperationTiming& timing() const { return timing_; }
    RenameOutcome outcome() const { return outcome_; }
    ErrorKind error_kind() const { return error_kind_; }

    bool skipped() const;

    // Value equality; timing is deliberately not compared.
    bool operator==(const RenameResult& other) const;
    bool operator!=(const RenameResult& other) const { return !(*this == other); }

private:
    RenameResult() = default;

    std::string original_name_;
    std::optional<std::string> new_name_;
    std::string original_path_;
    std::optional<std::string> new_path_;
    bool renamed_ = false;
    bool success_ = true;
    std::optional<std::string> error_;
    std::optional<std::string> content_hash_;
    std::string hash_algorithm_;
    OperationTiming timing_;
    RenameOutcome outcome_ = RenameOutcome::AlreadySafe;
    ErrorKind error_kind_ = ErrorKind::None;
};

// Aggregate counts over a batch. Built once from a result sequence.
class OperationStats {
public:
    static OperationStats from_results(const std::vector<RenameResult>& results);

    std::size_t total() const { return total_; }
    std::size_t renamed() const { return renamed_; }
    std::size_t would_rename() const { return would_rename_; }
    std::size_t skipped_already_safe() const { return skipped_safe_; }
    std::size_t skipped_excluded() const { return skipped_excluded_; }
    std::size_t collision_match() const { return collision_match_; }
    std::size_t collision_conflict() const { return collision_conflict_; }
    std::size_t errored() const { return errored_; }
    std::size_t unaudited() const { return unaudited_; }

    std::size_t skipped() const;
    double success_rate() const;
    bool has_errors() const { return errored_ > 0 || unaudited_ > 0; }

    bool operator==(const OperationStats& other) const;

private:
    OperationStats() = default;

    std::size_t total_ = 0;
    std::size_t renamed_ = 0;
    std::size_t would_rename_ = 0;
    std::size_t skipped_safe_ = 0;
    std::size_t skipped_excluded_ = 0;
    std::size_t collision_match_ = 0;
    std::size_t collision_conflict_ = 0;
    std::size_t errored_ = 0;
    std::size_t unaudited_ = 0;
};

// One original → renamed mapping in a directory's sidecar.
struct SidecarEntry {
    std::string original;
    std::string renamed;
    std::string hash;
    std::string hash_algorithm;

    bool operator==(const SidecarEntry& other) const {
        return original == other.original && renamed == other.renamed &&
               hash == other.hash && hash_algorithm == other.hash_algorithm;
    }
};

// Whole sidecar file. Mappings are kept in rename order.
struct SidecarDocument {
    std::string timestamp;
    std::vector<SidecarEntry> mappings;
};
