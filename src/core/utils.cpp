#include "utils.hpp"
#include <chrono>
#include <ctime>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    std::string out = program;
    for (const auto& a : args) {
        out += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos) {
            out += '"';
            for (char c : a) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
        } else {
            out += a;
        }
    }
    return out;
}
