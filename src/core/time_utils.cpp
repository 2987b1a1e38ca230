#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>

// Cross-platform ISO timestamp parsing (YYYY-MM-DDTHH:MM:SS)
static bool parse_iso(const char* s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    return !ss.fail();
}

std::string format_elapsed(double seconds) {
    if (seconds < 0) return "-";

    if (seconds < 10.0) {
        return fmt::format("{:.2f}s", seconds);
    }

    int total = static_cast<int>(seconds);
    int hours = total / 3600;
    int mins = (total % 3600) / 60;
    int secs = total % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    struct tm tm_buf = {};
    if (!parse_iso(iso_time.c_str(), &tm_buf)) {
        return "?";
    }

    // Format as "8:13pm" (12-hour with am/pm)
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    // "08:13PM" → "8:13pm"
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}
