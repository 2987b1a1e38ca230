#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.safename/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load a specific file. A missing file yields defaults.
    static Result<Config> load_from(const fs::path& path);

    // Parse YAML text. Unknown keys are ignored; bad values are errors.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::string& rclone() const { return rclone_; }
    std::size_t hash_chunk_size() const { return hash_chunk_size_; }
    const std::string& local_hash() const { return local_hash_; }
    const std::string& remote_hash() const { return remote_hash_; }
    const std::string& log_file() const { return log_file_; }
    const std::vector<std::string>& exclude() const { return exclude_; }

public:
    Config() = default;

private:
    std::string rclone_ = DEFAULT_RCLONE_BINARY;
    std::size_t hash_chunk_size_ = HASH_CHUNK_SIZE;
    std::string local_hash_ = DEFAULT_LOCAL_HASH;
    std::string remote_hash_ = DEFAULT_REMOTE_HASH;
    std::string log_file_;               // empty: keep the default log location
    std::vector<std::string> exclude_;
};

fs::path get_global_config_dir();
fs::path get_global_config_path();
