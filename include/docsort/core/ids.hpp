#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace docsort {

using Clock = std::chrono::system_clock;

// Random RFC 4122 version 4 identifier in canonical 8-4-4-4-12 form.
std::string generate_uuid();

// UTC timestamp with millisecond precision, e.g. 2024-05-01T10:15:30.250Z
std::string to_iso8601(Clock::time_point tp);
std::optional<Clock::time_point> parse_iso8601(const std::string& text);

// Seconds since the epoch as a double, the unit used for file mtimes.
double to_epoch_seconds(Clock::time_point tp);
Clock::time_point from_epoch_seconds(double seconds);

} // namespace docsort
