/**
 * @file timestamp.hpp
 * @brief ISO-8601 timestamps with a UTC offset.
 *
 * Observation logs carry local wall-clock timestamps with an optional
 * offset ("2025-07-28T21:15:04.120+09:00"). Ordering and elapsed time use
 * the absolute instant; hour-of-day and calendar-date bucketing use the
 * local wall clock the observation was recorded in.
 */

#pragma once

#include <cstdint>
#include <string>

/// Calendar constants used by time bucketing
namespace TimeConst {
    constexpr int64_t MS_PER_SECOND = 1000;
    constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
    constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
    constexpr int64_t MS_PER_DAY = 24 * MS_PER_HOUR;
    constexpr int HOURS_PER_DAY = 24;
    constexpr double MINUTES_PER_HOUR = 60.0;
    constexpr double MINUTES_PER_DAY = 1440.0;
}

/**
 * @struct Timestamp
 * @brief Absolute instant plus the UTC offset it was recorded with.
 */
struct Timestamp {
    int64_t epochMs = 0;        ///< Milliseconds since 1970-01-01T00:00:00Z
    int offsetMinutes = 0;      ///< Local offset from UTC (+540 for +09:00)
    bool hasOffset = false;     ///< False for naive timestamps (treated as UTC wall clock)

    bool operator<(const Timestamp& other) const { return epochMs < other.epochMs; }
    bool operator==(const Timestamp& other) const { return epochMs == other.epochMs; }
    bool operator!=(const Timestamp& other) const { return epochMs != other.epochMs; }
};

/**
 * @brief Parse "YYYY-MM-DD[T| ]HH:MM[:SS[.fff...]][Z|+HH:MM|-HH:MM|+HHMM]".
 * @return false if the text is not a valid timestamp (out holds no meaningful value)
 */
bool parseTimestamp(const std::string& text, Timestamp& out);

/// Format as ISO-8601 with millisecond precision; the offset is written when present
std::string formatTimestamp(const Timestamp& ts);

/// Build a timestamp from local wall-clock fields
Timestamp makeTimestamp(int year, int month, int day, int hour, int minute, int second,
                        int offsetMinutes = 0, bool hasOffset = false);

/// Hour of day (0-23) on the local wall clock
int localHour(const Timestamp& ts);

/// Local calendar date as "YYYY-MM-DD"
std::string localDate(const Timestamp& ts);

/// Local calendar date as "YYYYMMDD" (used in daily file names)
std::string compactDate(const Timestamp& ts);

/// Milliseconds since local midnight of the same local date
int64_t localMsOfDay(const Timestamp& ts);

/// Elapsed minutes from a to b (negative if b is earlier)
double minutesBetween(const Timestamp& a, const Timestamp& b);
