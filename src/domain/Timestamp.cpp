/**
 * @file Timestamp.cpp
 * @brief Implementation of the ISO-8601 helpers.
 */

#include "domain/Timestamp.hpp"
#include "domain/AnalyticsErrors.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace healthiq::domain {

namespace {

// Howard Hinnant's civil calendar algorithms (proleptic Gregorian, days since 1970-01-01).
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void CivilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

bool IsLeap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeap(y)) return 29;
    return kDays[m - 1];
}

class IsoScanner {
public:
    explicit IsoScanner(const std::string& text) : m_text(text) {}

    bool atEnd() const { return m_pos >= m_text.size(); }
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++m_pos;
        return true;
    }

    // Reads exactly @p width digits.
    bool digits(size_t width, int& out) {
        if (m_pos + width > m_text.size()) return false;
        int value = 0;
        for (size_t i = 0; i < width; ++i) {
            char c = m_text[m_pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        m_pos += width;
        out = value;
        return true;
    }

    // Reads a run of digits as milliseconds (extra precision truncated).
    bool fraction(int& millis) {
        size_t count = 0;
        int value = 0;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            if (count < 3) value = value * 10 + (peek() - '0');
            ++count;
            ++m_pos;
        }
        if (count == 0) return false;
        for (size_t i = count; i < 3; ++i) value *= 10;
        millis = value;
        return true;
    }

private:
    const std::string& m_text;
    size_t m_pos = 0;
};

[[noreturn]] void Reject(const std::string& iso) {
    throw MalformedEventError("Malformed ISO-8601 timestamp: '" + iso + "'");
}

} // namespace

TimePoint ParseIsoTimestamp(const std::string& iso) {
    IsoScanner scan(iso);
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0, millis = 0;
    int offsetMinutes = 0;

    if (!scan.digits(4, year) || !scan.consume('-') ||
        !scan.digits(2, month) || !scan.consume('-') ||
        !scan.digits(2, day)) {
        Reject(iso);
    }
    if (year < kMinTimestampYear || year > kMaxTimestampYear) {
        throw MalformedEventError("Timestamp year out of range [" + std::to_string(kMinTimestampYear) + ", " +
                                  std::to_string(kMaxTimestampYear) + "]: '" + iso + "'");
    }
    if (month < 1 || month > 12) Reject(iso);
    if (day < 1 || static_cast<unsigned>(day) > DaysInMonth(year, static_cast<unsigned>(month))) Reject(iso);

    if (!scan.atEnd()) {
        if (!scan.consume('T') && !scan.consume(' ')) Reject(iso);
        if (!scan.digits(2, hour) || !scan.consume(':') || !scan.digits(2, minute)) Reject(iso);
        if (scan.consume(':')) {
            if (!scan.digits(2, second)) Reject(iso);
            if (scan.consume('.') && !scan.fraction(millis)) Reject(iso);
        }
        if (hour > 23 || minute > 59 || second > 59) Reject(iso);

        if (scan.consume('Z')) {
            // UTC
        } else if (scan.peek() == '+' || scan.peek() == '-') {
            int sign = scan.peek() == '-' ? -1 : 1;
            scan.consume(scan.peek());
            int offHours = 0, offMins = 0;
            if (!scan.digits(2, offHours)) Reject(iso);
            if (scan.consume(':')) {
                if (!scan.digits(2, offMins)) Reject(iso);
            } else if (!scan.atEnd()) {
                if (!scan.digits(2, offMins)) Reject(iso);
            }
            if (offHours > 23 || offMins > 59) Reject(iso);
            offsetMinutes = sign * (offHours * 60 + offMins);
        }
        if (!scan.atEnd()) Reject(iso);
    }

    int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    auto sinceEpoch = std::chrono::hours(days * 24)
                    + std::chrono::hours(hour)
                    + std::chrono::minutes(minute - offsetMinutes)
                    + std::chrono::seconds(second)
                    + std::chrono::milliseconds(millis);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(sinceEpoch));
}

std::string FormatIsoTimestamp(TimePoint tp) {
    using namespace std::chrono;
    const int64_t totalMs = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    int64_t days = totalMs / 86400000;
    int64_t msOfDay = totalMs % 86400000;
    if (msOfDay < 0) {
        msOfDay += 86400000;
        --days;
    }

    int64_t y = 0;
    unsigned m = 0, d = 0;
    CivilFromDays(days, y, m, d);

    const int64_t hh = msOfDay / 3600000;
    const int64_t mm = (msOfDay / 60000) % 60;
    const int64_t ss = (msOfDay / 1000) % 60;
    const int64_t ms = msOfDay % 1000;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(hh), static_cast<long long>(mm),
                  static_cast<long long>(ss), static_cast<long long>(ms));
    return buf;
}

double DaysBetween(TimePoint from, TimePoint to) {
    std::chrono::duration<double, std::ratio<86400>> span = to - from;
    return span.count();
}

} // namespace healthiq::domain
