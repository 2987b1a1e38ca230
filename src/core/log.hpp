#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fmt/chrono.h>

// Debug log shared by every component. Each line is opened, appended and
// closed on its own so an interrupted run keeps everything written so far.

inline std::string& safename_log_path() {
    static std::string path = (platform::temp_dir() / "safename.log").string();
    return path;
}

// Redirect the debug log (from config or --log-file). Empty keeps the default.
inline void set_safename_log_path(const std::string& path) {
    if (path.empty()) return;
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    safename_log_path() = path;
}

namespace detail {

// "2026-10-18 14:03:12.417"
inline std::string log_stamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::tm local = fmt::localtime(std::chrono::system_clock::to_time_t(now));
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local, static_cast<int>(ms));
}

inline std::string clip(const std::string& s) {
    if (s.size() <= LOG_OUTPUT_TRUNCATE) return s;
    return s.substr(0, LOG_OUTPUT_TRUNCATE) + "...";
}

} // namespace detail

inline void safename_log(const std::string& msg) {
    std::ofstream out(safename_log_path(), std::ios::app);
    if (out) out << detail::log_stamp() << "  " << msg << "\n";
}

// One external tool call: command line, exit code and clipped output.
inline void safename_log_tool(const std::string& tool, const std::string& cmd,
                              const ProcessOutput& r) {
    safename_log(fmt::format("{}: $ {}", tool, cmd));
    safename_log(fmt::format("{}: exit {} | {} bytes out | {}", tool, r.exit_code,
                             r.stdout_data.size(), detail::clip(r.stdout_data)));
    if (!r.stderr_data.empty()) {
        safename_log(fmt::format("{}: stderr | {}", tool, detail::clip(r.stderr_data)));
    }
}
