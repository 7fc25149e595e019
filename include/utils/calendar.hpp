#ifndef HARVESTER_CALENDAR_HPP
#define HARVESTER_CALENDAR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace harvester {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    std::string toString() const;   // YYYY-MM-DD

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

// Half-open UTC interval [start, end) in epoch seconds covering one local day
struct DayBounds {
    int64_t start = 0;
    int64_t end = 0;

    bool contains(int64_t epoch_seconds) const {
        return epoch_seconds >= start && epoch_seconds < end;
    }
};

namespace calendar {

// Accepts "YYYY-MM-DD" and the front end's "DD.MM.YYYY"
std::optional<CalendarDate> parseDate(const std::string& text);

bool isValid(const CalendarDate& date);

int64_t daysFromCivil(const CalendarDate& date);
CalendarDate civilFromDays(int64_t days);
CalendarDate addDays(const CalendarDate& date, int64_t days);

// tz_offset_minutes is the fixed local offset from UTC (e.g. +60 for UTC+1)
DayBounds dayBounds(const CalendarDate& date, int tz_offset_minutes);
CalendarDate dateOf(int64_t epoch_seconds, int tz_offset_minutes);
CalendarDate today(int tz_offset_minutes);

// Every date strictly after `last` and strictly before `today`
std::vector<CalendarDate> missedDates(const CalendarDate& last, const CalendarDate& today);

int64_t nowEpochSeconds();
std::string formatUtc(int64_t epoch_seconds);   // YYYY-MM-DD HH:MM:SS

} // namespace calendar

} // namespace harvester

#endif // HARVESTER_CALENDAR_HPP
