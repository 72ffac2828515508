/**
 * @file TimeFormat.cpp
 * @brief Implementation of the ISO-8601 helpers.
 */

#include "domain/common/TimeFormat.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace glucosetrail::domain {

namespace {

std::string formatUtc(Timestamp ts, const char* pattern) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch());
    // Round towards negative infinity so pre-epoch instants format correctly.
    if (std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()) < seconds) {
        seconds -= std::chrono::seconds(1);
    }
    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, pattern);
    return out.str();
}

bool readDigits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

std::string FormatIso8601(Timestamp ts) {
    return formatUtc(ts, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatIso8601NoZone(Timestamp ts) {
    return formatUtc(ts, "%Y-%m-%dT%H:%M:%S");
}

std::optional<Timestamp> ParseIso8601(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) return std::nullopt;
    ++pos;
    if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !readDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::chrono::milliseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int scale = 100;
        int millis = 0;
        bool any = false;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
            any = true;
        }
        if (!any) return std::nullopt;
        fraction = std::chrono::milliseconds(millis);
    }

    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!readDigits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (!readDigits(text, pos, 2, om)) return std::nullopt;
            offset = std::chrono::hours(oh) + std::chrono::minutes(om);
            if (zone == '-') offset = -offset;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);

    return Timestamp(std::chrono::seconds(t)) + fraction - offset;
}

std::int64_t ToEpochMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp FromEpochMillis(std::int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

} // namespace glucosetrail::domain
