#pragma once

#include <operations/file_operations.hpp>
#include <core/constants.hpp>

// Remote backend: every primitive is one rclone subprocess.
// Paths look like "remote:dir/sub/file.txt".
class RcloneFileOperations : public FileOperations {
public:
    explicit RcloneFileOperations(const std::string& binary = DEFAULT_RCLONE_BINARY);

    Result<void> preflight(const std::string& root) override;
    Result<std::vector<DirEntry>> list_entries(const std::string& directory) override;
    Result<bool> exists(const std::string& path) override;
    Result<bool> same_file(const std::string& a, const std::string& b) override;
    Result<void> move(const std::string& from, const std::string& to) override;
    Result<std::unique_ptr<ByteStream>> open_for_read(const std::string& path) override;
    Result<std::optional<std::string>> stored_hash(const std::string& path,
                                                   const std::string& algorithm) override;

    Result<std::optional<std::string>> read_text(const std::string& path) override;
    Result<void> write_text(const std::string& path, const std::string& data) override;
    Result<void> replace(const std::string& from, const std::string& to) override;

    std::string join(const std::string& directory, const std::string& name) const override;

    ErrorKind failure_kind() const override { return ErrorKind::RemoteToolFailure; }
    std::string backend_name() const override { return "rclone"; }

    const std::string& binary() const { return binary_; }

    // Parse `rclone lsjson` output into entries (Name, IsDir).
    static Result<std::vector<DirEntry>> parse_lsjson(const std::string& output);

    // Name field of `rclone lsjson --stat` output (a single object).
    static Result<std::string> parse_stat_name(const std::string& output);

    // First field of `rclone md5sum` / `rclone hashsum` output. nullopt when
    // the backend has no stored hash (blank or non-hex field).
    static std::optional<std::string> parse_hashsum(const std::string& output,
                                                    const std::string& algorithm);

private:
    ProcessOutput run_rclone(const std::vector<std::string>& args,
                             const std::string& stdin_data = "");
    std::string describe_failure(const std::vector<std::string>& args,
                                 const ProcessOutput& r) const;

    std::string binary_;
};
