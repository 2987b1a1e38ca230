#include "rclone_operations.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <cctype>

using json = nlohmann::json;

namespace {

// Streams `rclone cat` stdout; the exit code is checked in finish().
class RcloneCatStream : public ByteStream {
public:
    RcloneCatStream(platform::ProcessHandle handle, std::string command)
        : handle_(std::move(handle)), command_(std::move(command)) {}

    Result<std::size_t> read(char* buf, std::size_t len) override {
        long n = handle_.read_stdout(buf, len);
        if (n < 0) return Result<std::size_t>::Err(fmt::format("pipe read failed: {}", command_));
        return Result<std::size_t>::Ok(static_cast<std::size_t>(n));
    }

    Result<void> finish() override {
        int code = handle_.wait();
        safename_log(fmt::format("rclone: $ {} | exit {} (streamed)", command_, code));
        if (code != 0) {
            return Result<void>::Err(fmt::format("`{}` exited with code {}", command_, code));
        }
        return Result<void>::Ok();
    }

private:
    platform::ProcessHandle handle_;
    std::string command_;
};

std::size_t hex_length(const std::string& algorithm) {
    if (algorithm == "md5") return 32;
    if (algorithm == "sha256") return 64;
    return 0;
}

// "remote:dir/file.txt" -> "file.txt"
std::string remote_leaf(const std::string& path) {
    auto pos = path.find_last_of("/:");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool is_not_found(const ProcessOutput& r) {
    return r.exit_code == RCLONE_EXIT_DIR_NOT_FOUND ||
           r.exit_code == RCLONE_EXIT_FILE_NOT_FOUND;
}

} // namespace

RcloneFileOperations::RcloneFileOperations(const std::string& binary)
    : binary_(binary.empty() ? DEFAULT_RCLONE_BINARY : binary) {
}

ProcessOutput RcloneFileOperations::run_rclone(const std::vector<std::string>& args,
                                               const std::string& stdin_data) {
    auto r = platform::run_process(binary_, args, stdin_data);
    safename_log_tool("rclone", format_command(binary_, args), r);
    return r;
}

std::string RcloneFileOperations::describe_failure(const std::vector<std::string>& args,
                                                   const ProcessOutput& r) const {
    std::string detail = r.get_output();
    trim(detail);
    if (r.exit_code == EXEC_FAILED_EXIT_CODE && detail.empty()) {
        detail = fmt::format("could not execute '{}'", binary_);
    }
    return fmt::format("`{}` failed (exit {}){}", format_command(binary_, args),
                       r.exit_code, detail.empty() ? "" : ": " + detail);
}

// ── Pre-flight ──────────────────────────────────────────────

Result<void> RcloneFileOperations::preflight(const std::string& root) {
    std::vector<std::string> args = {"version"};
    auto r = run_rclone(args);
    if (r.exit_code == EXEC_FAILED_EXIT_CODE) {
        return Result<void>::Err(fmt::format(
            "rclone not found: '{}' could not be executed (install rclone or set --rclone)",
            binary_));
    }
    if (r.failed()) {
        return Result<void>::Err(describe_failure(args, r));
    }

    auto listing = list_entries(root);
    if (listing.is_err()) {
        return Result<void>::Err(fmt::format("cannot list remote root {}: {}", root, listing.error));
    }
    return Result<void>::Ok();
}

// ── Listing ─────────────────────────────────────────────────

Result<std::vector<DirEntry>> RcloneFileOperations::parse_lsjson(const std::string& output) {
    using R = Result<std::vector<DirEntry>>;
    std::vector<DirEntry> entries;
    try {
        json root = json::parse(output);
        if (!root.is_array()) return R::Err("lsjson output is not an array");
        for (const auto& item : root) {
            if (!item.is_object() || !item.contains("Name") || !item["Name"].is_string()) {
                return R::Err("lsjson entry without a Name");
            }
            DirEntry e;
            e.name = item["Name"].get<std::string>();
            e.is_directory = item.value("IsDir", false);
            entries.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        return R::Err(fmt::format("unparsable lsjson output: {}", e.what()));
    }
    return R::Ok(std::move(entries));
}

Result<std::vector<DirEntry>> RcloneFileOperations::list_entries(const std::string& directory) {
    std::vector<std::string> args = {"lsjson", directory};
    auto r = run_rclone(args);
    if (r.failed()) {
        return Result<std::vector<DirEntry>>::Err(describe_failure(args, r));
    }
    auto parsed = parse_lsjson(r.stdout_data);
    if (parsed.is_err()) {
        return Result<std::vector<DirEntry>>::Err(
            fmt::format("{}: {}", format_command(binary_, args), parsed.error));
    }
    return parsed;
}

Result<bool> RcloneFileOperations::exists(const std::string& path) {
    std::vector<std::string> args = {"lsjson", "--stat", path};
    auto r = run_rclone(args);
    if (r.success()) return Result<bool>::Ok(true);
    if (is_not_found(r)) return Result<bool>::Ok(false);
    return Result<bool>::Err(describe_failure(args, r));
}

Result<std::string> RcloneFileOperations::parse_stat_name(const std::string& output) {
    try {
        json item = json::parse(output);
        if (!item.is_object() || !item.contains("Name") || !item["Name"].is_string()) {
            return Result<std::string>::Err("lsjson --stat output without a Name");
        }
        return Result<std::string>::Ok(item["Name"].get<std::string>());
    } catch (const json::exception& e) {
        return Result<std::string>::Err(fmt::format("unparsable lsjson --stat output: {}", e.what()));
    }
}

Result<bool> RcloneFileOperations::same_file(const std::string& a, const std::string& b) {
    if (a == b) return Result<bool>::Ok(true);

    // A remote that ignores case or normalization answers a stat of `b` with
    // the object stored under `a`'s name
    std::vector<std::string> args = {"lsjson", "--stat", b};
    auto r = run_rclone(args);
    if (is_not_found(r)) return Result<bool>::Ok(false);
    if (r.failed()) return Result<bool>::Err(describe_failure(args, r));

    auto name = parse_stat_name(r.stdout_data);
    if (name.is_err()) {
        return Result<bool>::Err(fmt::format("{}: {}", format_command(binary_, args), name.error));
    }
    std::string leaf_a = remote_leaf(a);
    return Result<bool>::Ok(name.value == leaf_a && name.value != remote_leaf(b));
}

// ── Mutations ───────────────────────────────────────────────

Result<void> RcloneFileOperations::move(const std::string& from, const std::string& to) {
    // moveto overwrites, so the destination is checked first
    auto present = exists(to);
    if (present.is_err()) return Result<void>::Err(present.error);
    if (present.value) {
        return Result<void>::Err(fmt::format("destination already exists: {}", to));
    }

    std::vector<std::string> args = {"moveto", from, to};
    auto r = run_rclone(args);
    if (r.failed()) return Result<void>::Err(describe_failure(args, r));
    return Result<void>::Ok();
}

Result<void> RcloneFileOperations::replace(const std::string& from, const std::string& to) {
    std::vector<std::string> args = {"moveto", from, to};
    auto r = run_rclone(args);
    if (r.failed()) return Result<void>::Err(describe_failure(args, r));
    return Result<void>::Ok();
}

Result<void> RcloneFileOperations::write_text(const std::string& path, const std::string& data) {
    std::vector<std::string> args = {"rcat", path};
    auto r = run_rclone(args, data);
    if (r.failed()) return Result<void>::Err(describe_failure(args, r));
    return Result<void>::Ok();
}

// ── Reads ───────────────────────────────────────────────────

Result<std::unique_ptr<ByteStream>> RcloneFileOperations::open_for_read(const std::string& path) {
    using R = Result<std::unique_ptr<ByteStream>>;
    std::vector<std::string> args = {"cat", path};
    auto handle = platform::spawn_reader(binary_, args);
    if (!handle.valid()) {
        return R::Err(fmt::format("could not start `{}`", format_command(binary_, args)));
    }
    return R::Ok(std::make_unique<RcloneCatStream>(std::move(handle),
                                                   format_command(binary_, args)));
}

std::optional<std::string> RcloneFileOperations::parse_hashsum(const std::string& output,
                                                               const std::string& algorithm) {
    std::size_t want = hex_length(algorithm);
    std::string line = output.substr(0, output.find('\n'));
    std::string field = line.substr(0, line.find_first_of(" \t"));
    if (want == 0 || field.size() != want) return std::nullopt;

    std::string digest;
    for (char c : field) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        digest += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return digest;
}

Result<std::optional<std::string>> RcloneFileOperations::stored_hash(const std::string& path,
                                                                     const std::string& algorithm) {
    using R = Result<std::optional<std::string>>;
    std::vector<std::string> args = algorithm == "md5"
        ? std::vector<std::string>{"md5sum", path}
        : std::vector<std::string>{"hashsum", algorithm, path};
    auto r = run_rclone(args);
    if (r.failed()) return R::Err(describe_failure(args, r));
    return R::Ok(parse_hashsum(r.stdout_data, algorithm));
}

Result<std::optional<std::string>> RcloneFileOperations::read_text(const std::string& path) {
    using R = Result<std::optional<std::string>>;
    auto present = exists(path);
    if (present.is_err()) return R::Err(present.error);
    if (!present.value) return R::Ok(std::nullopt);

    std::vector<std::string> args = {"cat", path};
    auto r = run_rclone(args);
    if (r.failed()) return R::Err(describe_failure(args, r));
    return R::Ok(r.stdout_data);
}

std::string RcloneFileOperations::join(const std::string& directory, const std::string& name) const {
    if (directory.empty()) return name;
    char last = directory.back();
    if (last == ':' || last == '/') return directory + name;
    return directory + "/" + name;
}
