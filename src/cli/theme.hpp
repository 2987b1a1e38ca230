#pragma once

#include <string>
#include <fmt/format.h>

// Terminal styling for safename's report. Everything returns a ready-to-print
// line (or fragment) so callers just stream it to std::cout.
namespace theme {

namespace color {
    const std::string ACCENT  = "\033[38;2;62;120;178m";    // #3E78B2
    const std::string HEADING = "\033[38;2;128;99;58m";     // #80633A
    const std::string TRACE   = "\033[38;2;80;80;80m";
    const std::string RED     = "\033[91m";
    const std::string GREEN   = "\033[92m";
    const std::string YELLOW  = "\033[93m";
    const std::string BOLD    = "\033[1m";
    const std::string DIM     = "\033[2m";
    const std::string RESET   = "\033[0m";
}

// Width of the key column in summary rows
constexpr int KV_KEY_WIDTH = 14;
constexpr int RULE_WIDTH = 48;

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }
inline std::string red(const std::string& s)    { return paint(color::RED, s); }
inline std::string yellow(const std::string& s) { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < RULE_WIDTH; i++) line += "\xe2\x94\x80";   // U+2500
    return "  " + dim(line) + "\n";
}

// Name, version and tagline. Never clears the screen; output is often piped.
inline std::string banner(const std::string& version) {
    return fmt::format("\n{}  safename{}\n{}\n\n",
                       color::ACCENT + color::BOLD, color::RESET,
                       dim(fmt::format("  v{} \xc2\xb7 cross-platform safe filenames", version)))
           + rule();
}

inline std::string section(const std::string& title) {
    return fmt::format("\n  {}\n\n", paint(color::HEADING + color::BOLD, title));
}

// ── Per-line markers ────────────────────────────────────

namespace detail {
inline std::string marked(const std::string& code, const char* mark, const std::string& msg) {
    return fmt::format("    {}{}{} {}\n", code, mark, color::RESET, msg);
}
} // namespace detail

inline std::string ok(const std::string& msg)   { return detail::marked(color::GREEN, "+", msg); }
inline std::string fail(const std::string& msg) { return detail::marked(color::RED, "x", msg); }
inline std::string info(const std::string& msg) { return detail::marked(color::ACCENT, "~", msg); }
inline std::string step(const std::string& msg) { return detail::marked(color::HEADING, ">", msg); }
inline std::string warn(const std::string& msg) { return detail::marked(color::YELLOW, "!", msg); }

// Low-key trace line, e.g. a directory being entered or an untouched file
inline std::string log(const std::string& msg) {
    return paint(color::TRACE, "    \xc2\xb7 " + msg) + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return fmt::format("    {}{}\n", dim(fmt::format("{:<{}}", key, KV_KEY_WIDTH)), value);
}

} // namespace theme
