#include "local_operations.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

fs::path native(const std::string& path) {
    return fs::u8path(path);
}

char separator_for(const std::string& directory) {
    bool has_back = directory.find('\\') != std::string::npos;
    bool has_fwd = directory.find('/') != std::string::npos;
    if (has_back && !has_fwd) return '\\';
    if (has_fwd) return '/';
#ifdef _WIN32
    return '\\';
#else
    return '/';
#endif
}

} // namespace

Result<void> LocalFileOperations::preflight(const std::string& root) {
    std::error_code ec;
    auto st = fs::status(native(root), ec);
    if (st.type() == fs::file_type::not_found) {
        return Result<void>::Err(fmt::format("directory not found: {}", root));
    }
    if (ec) {
        return Result<void>::Err(fmt::format("cannot access {}: {}", root, ec.message()));
    }
    if (!fs::is_directory(st)) {
        return Result<void>::Err(fmt::format("not a directory: {}", root));
    }
    return Result<void>::Ok();
}

Result<std::vector<DirEntry>> LocalFileOperations::list_entries(const std::string& directory) {
    std::vector<DirEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(native(directory), ec);
    if (ec) {
        return Result<std::vector<DirEntry>>::Err(
            fmt::format("cannot list {}: {}", directory, ec.message()));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        DirEntry e;
        e.name = it->path().filename().u8string();

        std::error_code type_ec;
        auto own = it->symlink_status(type_ec);
        if (type_ec) {
            e.error = fmt::format("cannot stat {}: {}", join(directory, e.name), type_ec.message());
        } else if (fs::is_symlink(own)) {
            e.is_symlink = true;
            auto target = it->status(type_ec);
            if (target.type() == fs::file_type::not_found) {
                // Dangling: the link itself is just a name to rename
            } else if (type_ec) {
                e.error = fmt::format("cannot resolve link {}: {}", join(directory, e.name),
                                      type_ec.message());
            } else {
                e.is_directory = fs::is_directory(target);
            }
        } else {
            e.is_directory = fs::is_directory(own);
        }
        entries.push_back(std::move(e));
    }
    if (ec) {
        return Result<std::vector<DirEntry>>::Err(
            fmt::format("cannot list {}: {}", directory, ec.message()));
    }
    return Result<std::vector<DirEntry>>::Ok(std::move(entries));
}

Result<bool> LocalFileOperations::exists(const std::string& path) {
    std::error_code ec;
    // symlink_status: a dangling link still occupies the name
    auto st = fs::symlink_status(native(path), ec);
    if (st.type() == fs::file_type::not_found) return Result<bool>::Ok(false);
    if (ec) {
        return Result<bool>::Err(fmt::format("cannot stat {}: {}", path, ec.message()));
    }
    return Result<bool>::Ok(true);
}

Result<bool> LocalFileOperations::same_file(const std::string& a, const std::string& b) {
    if (a == b) return Result<bool>::Ok(true);

    // A link and its target are two names, not one
    std::error_code ec;
    for (const auto* p : {&a, &b}) {
        auto st = fs::symlink_status(native(*p), ec);
        if (st.type() == fs::file_type::not_found) return Result<bool>::Ok(false);
        if (ec) {
            return Result<bool>::Err(fmt::format("cannot stat {}: {}", *p, ec.message()));
        }
        if (fs::is_symlink(st)) return Result<bool>::Ok(false);
    }

    bool same = fs::equivalent(native(a), native(b), ec);
    if (ec) {
        return Result<bool>::Err(fmt::format("cannot compare {} and {}: {}", a, b, ec.message()));
    }
    return Result<bool>::Ok(same);
}

Result<void> LocalFileOperations::move(const std::string& from, const std::string& to) {
    auto r = platform::rename_no_replace(native(from), native(to));
    if (r.is_err()) {
        return Result<void>::Err(fmt::format("move {} -> {} failed: {}", from, to, r.error));
    }
    return r;
}

Result<std::unique_ptr<ByteStream>> LocalFileOperations::open_for_read(const std::string& path) {
    using R = Result<std::unique_ptr<ByteStream>>;
    auto in = std::make_unique<std::ifstream>(native(path), std::ios::binary);
    if (!*in) {
        return R::Err(fmt::format("cannot open {}", path));
    }
    return R::Ok(std::make_unique<IStreamByteStream>(std::move(in)));
}

Result<std::optional<std::string>> LocalFileOperations::read_text(const std::string& path) {
    using R = Result<std::optional<std::string>>;
    auto present = exists(path);
    if (present.is_err()) return R::Err(present.error);
    if (!present.value) return R::Ok(std::nullopt);

    std::ifstream in(native(path), std::ios::binary);
    if (!in) return R::Err(fmt::format("cannot open {}", path));
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return R::Err(fmt::format("read error on {}", path));
    return R::Ok(ss.str());
}

Result<void> LocalFileOperations::write_text(const std::string& path, const std::string& data) {
    std::ofstream out(native(path), std::ios::binary | std::ios::trunc);
    if (!out) return Result<void>::Err(fmt::format("cannot write {}", path));
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) return Result<void>::Err(fmt::format("write error on {}", path));
    return Result<void>::Ok();
}

Result<void> LocalFileOperations::replace(const std::string& from, const std::string& to) {
    auto r = platform::replace_file(native(from), native(to));
    if (r.is_err()) {
        return Result<void>::Err(fmt::format("replace {} -> {} failed: {}", from, to, r.error));
    }
    return r;
}

std::string LocalFileOperations::join(const std::string& directory, const std::string& name) const {
    if (directory.empty()) return name;
    char last = directory.back();
    if (last == '/' || last == '\\') return directory + name;
    return directory + separator_for(directory) + name;
}
