#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstddef>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <managers/rename_engine.hpp>

// Settings that shape an engine. Filled from config, then CLI flags.
struct EngineOptions {
    std::string rclone_binary = DEFAULT_RCLONE_BINARY;
    std::string local_hash = DEFAULT_LOCAL_HASH;
    std::string remote_hash = DEFAULT_REMOTE_HASH;
    std::size_t hash_chunk_size = HASH_CHUNK_SIZE;
    std::vector<std::string> exclude;
};

class EngineFactory {
public:
    // "<remote>:<path>" where <remote> is non-empty, has no path separator and
    // is not a single drive letter. "gdrive:Photos" is remote; "C:/x",
    // "\\server\share" and "/home/u" are local.
    static bool is_remote_path(const std::string& path);

    // Local: LocalFileOperations + local_hash. Remote: RcloneFileOperations + remote_hash.
    // Touches nothing under path; fails only on an unknown hash algorithm.
    static Result<std::unique_ptr<RenameEngine>> create_from_path(const std::string& path,
                                                                  const EngineOptions& options = {});
};
