#include "platform.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <random>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <fcntl.h>
#  include <stdio.h>
#  ifdef __linux__
#    include <sys/syscall.h>
#    ifndef RENAME_NOREPLACE
#      define RENAME_NOREPLACE (1 << 0)
#    endif
#  endif
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_path(const std::string& prefix) {
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^ std::random_device{}());
    std::uniform_int_distribution<int> dist(100000, 999999);
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

Result<void> rename_no_replace(const fs::path& from, const fs::path& to) {
#ifdef _WIN32
    if (!MoveFileExW(from.wstring().c_str(), to.wstring().c_str(), 0)) {
        DWORD err = GetLastError();
        if (err == ERROR_ALREADY_EXISTS || err == ERROR_FILE_EXISTS) {
            return Result<void>::Err("destination already exists: " + to.string());
        }
        return Result<void>::Err(std::system_category().message(static_cast<int>(err)));
    }
    return Result<void>::Ok();
#else
#  if defined(__linux__) && defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
    if (syscall(SYS_renameat2, AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(),
                RENAME_NOREPLACE) == 0) {
        return Result<void>::Ok();
    }
    if (errno == EEXIST) {
        return Result<void>::Err("destination already exists: " + to.string());
    }
    // Filesystems without renameat2 support fall through to link+unlink
    if (errno != EINVAL && errno != ENOSYS) {
        return Result<void>::Err(std::strerror(errno));
    }
#  endif
    if (link(from.c_str(), to.c_str()) != 0) {
        if (errno == EEXIST) {
            return Result<void>::Err("destination already exists: " + to.string());
        }
        // No hard links (FAT, some network mounts): check then rename
        std::error_code ec;
        if (fs::exists(to, ec)) {
            return Result<void>::Err("destination already exists: " + to.string());
        }
        fs::rename(from, to, ec);
        if (ec) return Result<void>::Err(ec.message());
        return Result<void>::Ok();
    }
    if (unlink(from.c_str()) != 0) {
        std::string err = std::strerror(errno);
        unlink(to.c_str());
        return Result<void>::Err(err);
    }
    return Result<void>::Ok();
#endif
}

Result<void> replace_file(const fs::path& from, const fs::path& to) {
#ifdef _WIN32
    if (!MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        return Result<void>::Err(std::system_category().message(static_cast<int>(GetLastError())));
    }
    return Result<void>::Ok();
#else
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) return Result<void>::Err(ec.message());
    return Result<void>::Ok();
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
