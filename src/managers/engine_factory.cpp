#include "engine_factory.hpp"
#include <operations/local_operations.hpp>
#include <operations/rclone_operations.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cctype>

bool EngineFactory::is_remote_path(const std::string& path) {
    auto colon = path.find(':');
    if (colon == std::string::npos || colon == 0) return false;

    std::string name = path.substr(0, colon);
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return false;
    }
    if (name.size() == 1 && std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return true;
}

Result<std::unique_ptr<RenameEngine>> EngineFactory::create_from_path(const std::string& path,
                                                                      const EngineOptions& options) {
    using R = Result<std::unique_ptr<RenameEngine>>;
    bool remote = is_remote_path(path);

    const std::string& algorithm = remote ? options.remote_hash : options.local_hash;
    auto hasher = make_hash_computer(algorithm, options.hash_chunk_size);
    if (hasher.is_err()) return R::Err(hasher.error);

    std::unique_ptr<FileOperations> ops;
    if (remote) {
        ops = std::make_unique<RcloneFileOperations>(options.rclone_binary);
    } else {
        ops = std::make_unique<LocalFileOperations>();
    }

    safename_log(fmt::format("factory: {} -> {} backend, {} hash",
                             path, ops->backend_name(), algorithm));
    return R::Ok(std::make_unique<RenameEngine>(std::move(ops), std::move(hasher.value),
                                                FilenameSanitizer(options.exclude)));
}
