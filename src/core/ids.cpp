#include "docsort/core/ids.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace docsort {

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<std::uint8_t, 16> id{};
    for (auto& b : id) {
        b = static_cast<std::uint8_t>(rng());
    }

    // RFC4122 variant + version 4
    id[6] = static_cast<std::uint8_t>((id[6] & 0x0F) | 0x40);
    id[8] = static_cast<std::uint8_t>((id[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
    }
    return oss.str();
}

std::string to_iso8601(Clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);

    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buffer, millis);
    return out;
}

std::optional<Clock::time_point> parse_iso8601(const std::string& text) {
    std::tm utc{};
    int millis = 0;
    const int fields = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                                   &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                                   &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &millis);
    if (fields < 6) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;

    const std::time_t secs = timegm(&utc);
    return Clock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

double to_epoch_seconds(Clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

Clock::time_point from_epoch_seconds(double seconds) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
}

} // namespace docsort
