#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace auditlog {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

struct CalendarDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    bool operator==(const CalendarDate& o) const { return year == o.year && month == o.month && day == o.day; }
};

Timestamp now();

// "2024-01-01"
std::string formatDate(const CalendarDate& date);

// "2024-01-01T09:30:00+00:00", with ".ffffff" when the microseconds are non-zero.
std::string formatTimestamp(Timestamp ts);

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.f{1,6}]" with an optional "Z" or
// "+00:00" suffix. Other offsets are rejected.
std::optional<Timestamp> parseTimestamp(std::string_view text);

} // namespace auditlog
