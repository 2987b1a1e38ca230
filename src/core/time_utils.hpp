#pragma once

#include <string>

// Format an elapsed duration in seconds for display.
// Returns "2h35m", "14m22s", "8s", or "0.42s" below ten seconds; "-" for negative input.
std::string format_elapsed(double seconds);

// Format an ISO timestamp (YYYY-MM-DDTHH:MM:SS) as a 12-hour clock time ("8:13pm").
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
