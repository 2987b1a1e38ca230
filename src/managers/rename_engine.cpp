#include "rename_engine.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

// Last path component of a local or remote directory path.
std::string leaf_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) p.pop_back();
    auto pos = p.find_last_of("/\\:");
    if (pos == std::string::npos || pos + 1 >= p.size()) return p;
    return p.substr(pos + 1);
}

bool is_sidecar_file(const std::string& name) {
    return name == SIDECAR_FILENAME ||
           name == std::string(SIDECAR_FILENAME) + SIDECAR_TMP_SUFFIX;
}

} // namespace

RenameEngine::RenameEngine(std::unique_ptr<FileOperations> ops,
                           std::unique_ptr<HashComputer> hasher,
                           FilenameSanitizer sanitizer)
    : ops_(std::move(ops)),
      hasher_(std::move(hasher)),
      sanitizer_(std::move(sanitizer)),
      sidecar_(*ops_) {
}

std::vector<RenameResult> RenameEngine::rename_directory(const std::string& directory,
                                                         bool recursive, bool dry_run) {
    safename_log(fmt::format("engine: start {} backend={} hash={} recursive={} dry_run={}",
                             directory, ops_->backend_name(), hasher_->algorithm_name(),
                             recursive, dry_run));

    auto pf = ops_->preflight(directory);
    if (pf.is_err()) {
        safename_log(fmt::format("engine: preflight failed: {}", pf.error));
        throw ConfigurationError(pf.error);
    }

    std::vector<RenameResult> results;
    process_directory(directory, recursive, dry_run, results);

    auto s = stats(results);
    safename_log(fmt::format("engine: done {} total={} renamed={} would_rename={} skipped={} errored={}{}",
                             directory, s.total(), s.renamed(), s.would_rename(), s.skipped(),
                             s.errored(), cancelled() ? " (cancelled)" : ""));
    return results;
}

OperationStats RenameEngine::stats(const std::vector<RenameResult>& results) {
    return OperationStats::from_results(results);
}

// ── Directory pass ──────────────────────────────────────────

void RenameEngine::process_directory(const std::string& directory, bool recursive, bool dry_run,
                                     std::vector<RenameResult>& results) {
    if (cancelled()) return;
    if (status_cb_) status_cb_(directory);

    auto timing = OperationTiming::start_now();
    auto listing = ops_->list_entries(directory);
    if (listing.is_err()) {
        safename_log(fmt::format("engine: list {} failed: {}", directory, listing.error));
        results.push_back(RenameResult::failed(leaf_name(directory), directory,
                                               ops_->failure_kind(), listing.error,
                                               timing.finish_now()));
        return;
    }

    auto entries = std::move(listing.value);
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });

    DirectoryPass pass;
    pass.directory = directory;
    pass.dry_run = dry_run;
    for (const auto& e : entries) pass.listed.insert(e.name);

    for (const auto& e : entries) {
        if (e.is_directory || is_sidecar_file(e.name)) continue;
        if (cancelled()) {
            safename_log(fmt::format("engine: cancelled in {}", directory));
            break;
        }
        if (!e.error.empty()) {
            auto t = OperationTiming::start_now();
            safename_log(fmt::format("engine: skipped {}: {}", e.name, e.error));
            results.push_back(RenameResult::failed(e.name, ops_->join(directory, e.name),
                                                   ops_->failure_kind(), e.error, t.finish_now()));
            continue;
        }
        std::optional<SidecarEntry> audit;
        results.push_back(process_file(pass, e.name, audit));
        if (audit) pass.pending.push_back({results.size() - 1, *audit});
    }

    // Completed renames are recorded even when cancelled mid-directory
    flush_sidecar(pass, results);

    if (!recursive) return;
    for (const auto& e : entries) {
        if (!e.is_directory) continue;
        if (cancelled()) return;
        // A linked directory may lead out of the tree or back into it
        if (e.is_symlink) {
            safename_log(fmt::format("engine: not following link {}", ops_->join(directory, e.name)));
            continue;
        }
        process_directory(ops_->join(directory, e.name), recursive, dry_run, results);
    }
}

void RenameEngine::flush_sidecar(DirectoryPass& pass, std::vector<RenameResult>& results) {
    if (pass.dry_run || pass.pending.empty()) return;

    std::vector<SidecarEntry> entries;
    entries.reserve(pass.pending.size());
    for (const auto& p : pass.pending) entries.push_back(p.entry);

    auto w = sidecar_.append_entries(pass.directory, entries);
    if (w.is_ok()) return;

    std::string msg = fmt::format("renamed but sidecar not written: {}", w.error);
    safename_log(fmt::format("engine: {} in {}", msg, pass.directory));
    for (const auto& p : pass.pending) {
        results[p.result_index] = RenameResult::unaudited(results[p.result_index],
                                                          ErrorKind::SidecarWriteFailure, msg);
    }
}

// ── Single entry ────────────────────────────────────────────

RenameResult RenameEngine::process_file(DirectoryPass& pass, const std::string& name,
                                        std::optional<SidecarEntry>& audit) {
    auto timing = OperationTiming::start_now();
    std::string path = ops_->join(pass.directory, name);

    if (sanitizer_.is_system_file(name)) {
        safename_log(fmt::format("engine: excluded {}", path));
        return RenameResult::excluded(name, path, timing.finish_now());
    }

    std::string target = sanitizer_.sanitize(name);
    if (target == name) {
        return RenameResult::already_safe(name, path, timing.finish_now());
    }
    std::string target_path = ops_->join(pass.directory, target);

    auto present = ops_->exists(target_path);
    if (present.is_err()) {
        safename_log(fmt::format("engine: exists {} failed: {}", target_path, present.error));
        return RenameResult::failed(name, path, ops_->failure_kind(), present.error,
                                    timing.finish_now(), target);
    }

    // The target can "exist" only because the filesystem folds it onto this
    // very file (normalization- or case-insensitive names)
    bool same_object = false;
    if (present.value) {
        if (!pass.listed.count(target)) {
            auto same = ops_->same_file(path, target_path);
            if (same.is_err()) {
                safename_log(fmt::format("engine: compare {} failed: {}", path, same.error));
                return RenameResult::failed(name, path, ops_->failure_kind(), same.error,
                                            timing.finish_now(), target);
            }
            same_object = same.value;
        }
        if (!same_object) return resolve_collision(name, path, target, target_path, timing);
    }

    if (pass.dry_run) {
        // Two sources mapping to one free name still collide once both are applied
        auto claim = pass.claimed.find(target);
        if (claim != pass.claimed.end()) {
            return resolve_collision(name, path, target, claim->second, timing);
        }
        pass.claimed[target] = path;
        safename_log(fmt::format("engine: would rename {} -> {}", path, target));
        return RenameResult::would_rename(name, path, target, target_path, timing.finish_now());
    }

    auto mv = same_object ? move_through_temp(pass, path, target)
                          : ops_->move(path, target_path);
    if (mv.is_err()) {
        safename_log(fmt::format("engine: move {} failed: {}", path, mv.error));
        return RenameResult::failed(name, path, ops_->failure_kind(), mv.error,
                                    timing.finish_now(), target);
    }
    safename_log(fmt::format("engine: renamed {} -> {}", path, target));

    SidecarEntry entry{name, target, "", hasher_->algorithm_name()};
    auto hash = hash_file(target_path);
    if (hash.is_err()) {
        // The mapping is still recorded so the rename can be traced back
        audit = entry;
        safename_log(fmt::format("engine: hash {} failed: {}", target_path, hash.error));
        auto done = RenameResult::renamed_to(name, path, target, target_path, "",
                                             hasher_->algorithm_name(), timing.finish_now());
        return RenameResult::unaudited(done, ErrorKind::HashFailure,
                                       fmt::format("renamed but not hashed: {}", hash.error));
    }

    entry.hash = hash.value;
    audit = entry;
    return RenameResult::renamed_to(name, path, target, target_path, hash.value,
                                    hasher_->algorithm_name(), timing.finish_now());
}

RenameResult RenameEngine::resolve_collision(const std::string& name, const std::string& path,
                                             const std::string& target,
                                             const std::string& existing_path,
                                             const OperationTiming& timing) {
    auto src = hash_file(path);
    if (src.is_err()) {
        return RenameResult::failed(name, path, ErrorKind::HashFailure, src.error,
                                    timing.finish_now(), target);
    }
    auto dst = hash_file(existing_path);
    if (dst.is_err()) {
        return RenameResult::failed(name, path, ErrorKind::HashFailure, dst.error,
                                    timing.finish_now(), target);
    }

    if (src.value == dst.value) {
        safename_log(fmt::format("engine: collision {} -> {} identical ({})",
                                 path, target, hasher_->algorithm_name()));
        return RenameResult::collision_match(name, path, target, src.value,
                                             hasher_->algorithm_name(), timing.finish_now());
    }

    std::string msg = fmt::format("'{}' already exists with different content ({} {} vs {})",
                                  target, hasher_->algorithm_name(),
                                  src.value.substr(0, 12), dst.value.substr(0, 12));
    safename_log(fmt::format("engine: collision {}: {}", path, msg));
    return RenameResult::collision_conflict(name, path, target, msg, timing.finish_now());
}

Result<void> RenameEngine::move_through_temp(const DirectoryPass& pass, const std::string& path,
                                             const std::string& target) {
    std::string temp_path = ops_->join(pass.directory, target + RENAME_TMP_SUFFIX);
    std::string target_path = ops_->join(pass.directory, target);

    auto first = ops_->move(path, temp_path);
    if (first.is_err()) return first;
    auto second = ops_->move(temp_path, target_path);
    if (second.is_ok()) return second;

    auto back = ops_->move(temp_path, path);
    if (back.is_err()) {
        return Result<void>::Err(fmt::format("{}; file left at {}", second.error, temp_path));
    }
    return second;
}

Result<std::string> RenameEngine::hash_file(const std::string& path) {
    auto stored = ops_->stored_hash(path, hasher_->algorithm_name());
    if (stored.is_ok() && stored.value) return Result<std::string>::Ok(*stored.value);
    if (stored.is_err()) {
        safename_log(fmt::format("engine: no stored hash for {}, reading content: {}",
                                 path, stored.error));
    }

    auto stream = ops_->open_for_read(path);
    if (stream.is_err()) return Result<std::string>::Err(stream.error);
    auto digest = hasher_->compute_hash(*stream.value);
    if (digest.is_err()) {
        return Result<std::string>::Err(fmt::format("{}: {}", path, digest.error));
    }
    return digest;
}
