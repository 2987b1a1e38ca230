#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

static bool valid_hash_name(const std::string& name) {
    return name == "md5" || name == "sha256";
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".safename";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<Config> Config::load_global() {
    return load_from(get_global_config_path());
}

Result<Config> Config::load_from(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto r = parse(ss.str());
    if (r.is_err()) {
        return Result<Config>::Err(path.string() + ": " + r.error);
    }
    return r;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;

        // Empty file
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config must be a mapping of keys to values");
        }

        config.rclone_ = root["rclone"].as<std::string>(DEFAULT_RCLONE_BINARY);
        config.local_hash_ = root["local_hash"].as<std::string>(DEFAULT_LOCAL_HASH);
        config.remote_hash_ = root["remote_hash"].as<std::string>(DEFAULT_REMOTE_HASH);
        config.log_file_ = root["log_file"].as<std::string>("");

        long chunk = root["hash_chunk_size"].as<long>(static_cast<long>(HASH_CHUNK_SIZE));
        if (chunk <= 0) {
            return Result<Config>::Err("hash_chunk_size must be a positive number of bytes");
        }
        config.hash_chunk_size_ = static_cast<std::size_t>(chunk);

        if (!valid_hash_name(config.local_hash_)) {
            return Result<Config>::Err("local_hash must be md5 or sha256, got '" +
                                       config.local_hash_ + "'");
        }
        if (!valid_hash_name(config.remote_hash_)) {
            return Result<Config>::Err("remote_hash must be md5 or sha256, got '" +
                                       config.remote_hash_ + "'");
        }

        if (root["exclude"]) {
            if (root["exclude"].IsSequence()) {
                config.exclude_ = root["exclude"].as<std::vector<std::string>>(std::vector<std::string>());
            } else if (root["exclude"].IsScalar()) {
                config.exclude_.push_back(root["exclude"].as<std::string>());
            }
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }
}
