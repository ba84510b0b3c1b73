/**
 * @file Timestamp.hpp
 * @brief ISO-8601 parsing/formatting helpers shared by the analytics components.
 */

#pragma once

#include <chrono>
#include <string>

namespace healthiq::domain {

using TimePoint = std::chrono::system_clock::time_point;
using Hours = std::chrono::hours;

/** @brief Length of one analytics day. */
constexpr Hours kDay{24};

/** @brief Years accepted by ParseIsoTimestamp; all fit the clock's nanosecond range. */
constexpr int kMinTimestampYear = 1900;
constexpr int kMaxTimestampYear = 2200;

/** @brief Upper bound for any day-count window (about ten years). */
constexpr int kMaxWindowDays = 3650;

/**
 * @brief Parses an ISO-8601 date-time.
 *
 * Accepted forms: YYYY-MM-DD, YYYY-MM-DDTHH:MM, YYYY-MM-DDTHH:MM:SS[.fraction],
 * each optionally followed by 'Z' or a +HH[:MM] / -HH[:MM] offset. A missing
 * offset is read as UTC. A space may replace the 'T'.
 *
 * @throws MalformedEventError on any deviation from the grammar, an impossible date,
 *         or a year outside [kMinTimestampYear, kMaxTimestampYear].
 */
TimePoint ParseIsoTimestamp(const std::string& iso);

/** @brief Formats as YYYY-MM-DDTHH:MM:SS.mmmZ (UTC, millisecond precision). */
std::string FormatIsoTimestamp(TimePoint tp);

/** @brief Fractional number of days from @p from to @p to (negative if to < from). */
double DaysBetween(TimePoint from, TimePoint to);

} // namespace healthiq::domain
