#include "models.hpp"

const char* to_string(RenameOutcome outcome) {
    switch (outcome) {
        case RenameOutcome::AlreadySafe:       return "already-safe";
        case RenameOutcome::Excluded:          return "excluded";
        case RenameOutcome::Renamed:           return "renamed";
        case RenameOutcome::WouldRename:       return "would-rename";
        case RenameOutcome::CollisionMatch:    return "collision-match";
        case RenameOutcome::CollisionConflict: return "collision-conflict";
        case RenameOutcome::Failed:            return "failed";
        case RenameOutcome::RenamedUnaudited:  return "renamed-unaudited";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::CollisionConflict:   return "collision-conflict";
        case ErrorKind::IOFailure:           return "io-failure";
        case ErrorKind::HashFailure:         return "hash-failure";
        case ErrorKind::RemoteToolFailure:   return "remote-tool-failure";
        case ErrorKind::SidecarWriteFailure: return "sidecar-write-failure";
    }
    return "unknown";
}

// ── OperationTiming ─────────────────────────────────────────

OperationTiming OperationTiming::start_now() {
    auto now = Clock::now();
    return {now, now};
}

OperationTiming OperationTiming::finish_now() const {
    return {start, Clock::now()};
}

double OperationTiming::duration_seconds() const {
    return std::chrono::duration<double>(end - start).count();
}

// ── RenameResult ────────────────────────────────────────────

RenameResult RenameResult::already_safe(const std::string& name, const std::string& path,
                                        const OperationTiming& timing) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::AlreadySafe;
    return r;
}

RenameResult RenameResult::excluded(const std::string& name, const std::string& path,
                                    const OperationTiming& timing) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::Excluded;
    return r;
}

RenameResult RenameResult::renamed_to(const std::string& name, const std::string& path,
                                      const std::string& new_name, const std::string& new_path,
                                      const std::string& hash, const std::string& algorithm,
                                      const OperationTiming& timing) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.new_name_ = new_name;
    r.new_path_ = new_path;
    r.renamed_ = true;
    r.content_hash_ = hash;
    r.hash_algorithm_ = algorithm;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::Renamed;
    return r;
}

RenameResult RenameResult::would_rename(const std::string& name, const std::string& path,
                                        const std::string& new_name, const std::string& new_path,
                                        const OperationTiming& timing) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.new_name_ = new_name;
    r.new_path_ = new_path;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::WouldRename;
    return r;
}

RenameResult RenameResult::collision_match(const std::string& name, const std::string& path,
                                           const std::string& existing_name,
                                           const std::string& hash, const std::string& algorithm,
                                           const OperationTiming& timing) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.new_name_ = existing_name;
    r.content_hash_ = hash;
    r.hash_algorithm_ = algorithm;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::CollisionMatch;
    return r;
}

RenameResult RenameResult::collision_conflict(const std::string& name, const std::string& path,
                                              const std::string& existing_name,
                                              const std::string& error,
                                              const OperationTiming& timing) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.new_name_ = existing_name;
    r.success_ = false;
    r.error_ = error;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::CollisionConflict;
    r.error_kind_ = ErrorKind::CollisionConflict;
    return r;
}

RenameResult RenameResult::failed(const std::string& name, const std::string& path,
                                  ErrorKind kind, const std::string& error,
                                  const OperationTiming& timing,
                                  const std::optional<std::string>& attempted_name) {
    RenameResult r;
    r.original_name_ = name;
    r.original_path_ = path;
    r.new_name_ = attempted_name;
    r.success_ = false;
    r.error_ = error;
    r.timing_ = timing;
    r.outcome_ = RenameOutcome::Failed;
    r.error_kind_ = kind;
    return r;
}

RenameResult RenameResult::unaudited(const RenameResult& renamed, ErrorKind kind,
                                     const std::string& error) {
    RenameResult r = renamed;
    r.error_ = error;
    r.error_kind_ = kind;
    r.outcome_ = RenameOutcome::RenamedUnaudited;
    return r;
}

bool RenameResult::skipped() const {
    return outcome_ == RenameOutcome::AlreadySafe ||
           outcome_ == RenameOutcome::Excluded ||
           outcome_ == RenameOutcome::CollisionMatch ||
           outcome_ == RenameOutcome::CollisionConflict;
}

bool RenameResult::operator==(const RenameResult& other) const {
    return original_name_ == other.original_name_ &&
           new_name_ == other.new_name_ &&
           original_path_ == other.original_path_ &&
           new_path_ == other.new_path_ &&
           renamed_ == other.renamed_ &&
           success_ == other.success_ &&
           error_ == other.error_ &&
           content_hash_ == other.content_hash_ &&
           hash_algorithm_ == other.hash_algorithm_ &&
           outcome_ == other.outcome_ &&
           error_kind_ == other.error_kind_;
}

// ── OperationStats ──────────────────────────────────────────

OperationStats OperationStats::from_results(const std::vector<RenameResult>& results) {
    OperationStats s;
    s.total_ = results.size();
    for (const auto& r : results) {
        switch (r.outcome()) {
            case RenameOutcome::AlreadySafe:       s.skipped_safe_++; break;
            case RenameOutcome::Excluded:          s.skipped_excluded_++; break;
            case RenameOutcome::Renamed:           s.renamed_++; break;
            case RenameOutcome::WouldRename:       s.would_rename_++; break;
            case RenameOutcome::CollisionMatch:    s.collision_match_++; break;
            case RenameOutcome::CollisionConflict: s.collision_conflict_++; break;
            case RenameOutcome::Failed:            break;
            case RenameOutcome::RenamedUnaudited:
                s.renamed_++;
                s.unaudited_++;
                break;
        }
        if (!r.success()) s.errored_++;
    }
    return s;
}

std::size_t OperationStats::skipped() const {
    return skipped_safe_ + skipped_excluded_ + collision_match_ + collision_conflict_;
}

double OperationStats::success_rate() const {
    if (total_ == 0) return 0.0;
    return static_cast<double>(renamed_) / static_cast<double>(total_);
}

bool OperationStats::operator==(const OperationStats& other) const {
    return total_ == other.total_ && renamed_ == other.renamed_ &&
           would_rename_ == other.would_rename_ &&
           skipped_safe_ == other.skipped_safe_ &&
           skipped_excluded_ == other.skipped_excluded_ &&
           collision_match_ == other.collision_match_ &&
           collision_conflict_ == other.collision_conflict_ &&
           errored_ == other.errored_ && unaudited_ == other.unaudited_;
}
