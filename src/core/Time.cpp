#include "auditlog/Time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace auditlog {

namespace {

bool readInt(std::string_view text, size_t& pos, size_t digits, int& out) {
    if (pos + digits > text.size()) return false;
    int v = 0;
    for (size_t i = 0; i < digits; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += digits;
    return true;
}

bool expectChar(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string formatDate(const CalendarDate& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", date.year, date.month, date.day);
    return buf;
}

std::string formatTimestamp(Timestamp ts) {
    auto secs = std::chrono::floor<std::chrono::seconds>(ts);
    auto micros = (ts - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[48];
    if (micros != 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(micros));
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d+00:00",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
    return buf;
}

std::optional<Timestamp> parseTimestamp(std::string_view text) {
    size_t pos = 0;
    std::tm tm{};
    int year = 0, month = 0, day = 0;
    if (!readInt(text, pos, 4, year) || !expectChar(text, pos, '-') ||
        !readInt(text, pos, 2, month) || !expectChar(text, pos, '-') ||
        !readInt(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;

    long long micros = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        int hour = 0, minute = 0, second = 0;
        if (!readInt(text, pos, 2, hour) || !expectChar(text, pos, ':') ||
            !readInt(text, pos, 2, minute) || !expectChar(text, pos, ':') ||
            !readInt(text, pos, 2, second)) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 6) {
                    micros = micros * 10 + (text[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (size_t i = digits; i < 6; ++i) micros *= 10;
        }
    }

    std::string_view rest = text.substr(pos);
    if (!(rest.empty() || rest == "Z" || rest == "+00:00")) return std::nullopt;

    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::from_time_t(t)) +
           std::chrono::microseconds(micros);
}

} // namespace auditlog
