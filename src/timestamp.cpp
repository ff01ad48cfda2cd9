/**
 * @file timestamp.cpp
 * @brief ISO-8601 parsing/formatting and local-time bucketing helpers.
 */

#include "timestamp.hpp"
#include <cctype>
#include <cstdio>

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (Howard Hinnant's days_from_civil)
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(y + (month <= 2));
}

int daysInMonth(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return DAYS[month - 1];
}

/// Read exactly `width` digits starting at pos
bool readDigits(const std::string& s, size_t& pos, size_t width, int& value) {
    if (pos + width > s.size()) return false;
    value = 0;
    for (size_t i = 0; i < width; i++) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += width;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    pos++;
    return true;
}

/// Local wall-clock milliseconds since epoch (instant shifted by the offset)
int64_t localEpochMs(const Timestamp& ts) {
    return ts.epochMs + static_cast<int64_t>(ts.offsetMinutes) * TimeConst::MS_PER_MINUTE;
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

}  // namespace

bool parseTimestamp(const std::string& text, Timestamp& out) {
    // Trim surrounding whitespace
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    const std::string s = text.substr(begin, end - begin);

    size_t pos = 0;
    int year, month, day, hour = 0, minute = 0, second = 0, millis = 0;

    if (!readDigits(s, pos, 4, year) || !expect(s, pos, '-') ||
        !readDigits(s, pos, 2, month) || !expect(s, pos, '-') ||
        !readDigits(s, pos, 2, day)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) return false;

    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != ' ') return false;
        pos++;
        if (!readDigits(s, pos, 2, hour) || !expect(s, pos, ':') ||
            !readDigits(s, pos, 2, minute)) {
            return false;
        }
        if (pos < s.size() && s[pos] == ':') {
            pos++;
            if (!readDigits(s, pos, 2, second)) return false;
            if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                pos++;
                // Fraction: keep millisecond precision, ignore further digits
                int digits = 0;
                int scale = 100;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                    if (digits < 3) {
                        millis += (s[pos] - '0') * scale;
                        scale /= 10;
                    }
                    digits++;
                    pos++;
                }
                if (digits == 0) return false;
            }
        }
    }
    if (hour > 23 || minute > 59 || second > 60) return false;

    int offset = 0;
    bool hasOffset = false;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            pos++;
            hasOffset = true;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int sign = (s[pos] == '-') ? -1 : 1;
            pos++;
            int offH, offM = 0;
            if (!readDigits(s, pos, 2, offH)) return false;
            if (pos < s.size() && s[pos] == ':') pos++;
            if (pos < s.size() && !readDigits(s, pos, 2, offM)) return false;
            if (offH > 23 || offM > 59) return false;
            offset = sign * (offH * 60 + offM);
            hasOffset = true;
        } else {
            return false;
        }
    }
    if (pos != s.size()) return false;

    out = makeTimestamp(year, month, day, hour, minute, second, offset, hasOffset);
    out.epochMs += millis;
    return true;
}

Timestamp makeTimestamp(int year, int month, int day, int hour, int minute, int second,
                        int offsetMinutes, bool hasOffset) {
    Timestamp ts;
    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t localMs = days * TimeConst::MS_PER_DAY +
                      hour * TimeConst::MS_PER_HOUR +
                      minute * TimeConst::MS_PER_MINUTE +
                      second * TimeConst::MS_PER_SECOND;
    ts.epochMs = localMs - static_cast<int64_t>(offsetMinutes) * TimeConst::MS_PER_MINUTE;
    ts.offsetMinutes = offsetMinutes;
    ts.hasOffset = hasOffset;
    return ts;
}

std::string formatTimestamp(const Timestamp& ts) {
    int64_t local = localEpochMs(ts);
    int64_t days = floorDiv(local, TimeConst::MS_PER_DAY);
    int64_t msOfDay = local - days * TimeConst::MS_PER_DAY;

    int year, month, day;
    civilFromDays(days, year, month, day);

    int hour = static_cast<int>(msOfDay / TimeConst::MS_PER_HOUR);
    int minute = static_cast<int>((msOfDay / TimeConst::MS_PER_MINUTE) % 60);
    int second = static_cast<int>((msOfDay / TimeConst::MS_PER_SECOND) % 60);
    int millis = static_cast<int>(msOfDay % TimeConst::MS_PER_SECOND);

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                  year, month, day, hour, minute, second, millis);
    std::string result(buf);

    if (ts.hasOffset) {
        int off = ts.offsetMinutes;
        char sign = off < 0 ? '-' : '+';
        if (off < 0) off = -off;
        std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, off / 60, off % 60);
        result += buf;
    }
    return result;
}

int localHour(const Timestamp& ts) {
    return static_cast<int>(localMsOfDay(ts) / TimeConst::MS_PER_HOUR);
}

int64_t localMsOfDay(const Timestamp& ts) {
    int64_t local = localEpochMs(ts);
    return local - floorDiv(local, TimeConst::MS_PER_DAY) * TimeConst::MS_PER_DAY;
}

std::string localDate(const Timestamp& ts) {
    int year, month, day;
    civilFromDays(floorDiv(localEpochMs(ts), TimeConst::MS_PER_DAY), year, month, day);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::string compactDate(const Timestamp& ts) {
    std::string date = localDate(ts);
    return date.substr(0, 4) + date.substr(5, 2) + date.substr(8, 2);
}

double minutesBetween(const Timestamp& a, const Timestamp& b) {
    return static_cast<double>(b.epochMs - a.epochMs) / static_cast<double>(TimeConst::MS_PER_MINUTE);
}
