#include "../../include/utils/calendar.hpp"
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace harvester {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

bool isLeap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeap(year)) return 29;
    return kDays[month - 1];
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

} // namespace

std::string CalendarDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

namespace calendar {

std::optional<CalendarDate> parseDate(const std::string& text) {
    CalendarDate date;
    char tail = '\0';
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &date.year, &date.month, &date.day, &tail) == 3 ||
        std::sscanf(text.c_str(), "%2d.%2d.%4d%c", &date.day, &date.month, &date.year, &tail) == 3) {
        if (isValid(date)) {
            return date;
        }
    }
    return std::nullopt;
}

bool isValid(const CalendarDate& date) {
    if (date.year < 1970 || date.year > 9999) return false;
    if (date.month < 1 || date.month > 12) return false;
    return date.day >= 1 && date.day <= daysInMonth(date.year, date.month);
}

// Howard Hinnant's days_from_civil / civil_from_days
int64_t daysFromCivil(const CalendarDate& date) {
    int64_t y = date.year;
    const int64_t m = date.month;
    const int64_t d = date.day;
    y -= m <= 2 ? 1 : 0;
    const int64_t era = floorDiv(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate civilFromDays(int64_t days) {
    days += 719468;
    const int64_t era = floorDiv(days, 146097);
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    CalendarDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

CalendarDate addDays(const CalendarDate& date, int64_t days) {
    return civilFromDays(daysFromCivil(date) + days);
}

DayBounds dayBounds(const CalendarDate& date, int tz_offset_minutes) {
    DayBounds bounds;
    bounds.start = daysFromCivil(date) * kSecondsPerDay - static_cast<int64_t>(tz_offset_minutes) * 60;
    bounds.end = bounds.start + kSecondsPerDay;
    return bounds;
}

CalendarDate dateOf(int64_t epoch_seconds, int tz_offset_minutes) {
    const int64_t local = epoch_seconds + static_cast<int64_t>(tz_offset_minutes) * 60;
    return civilFromDays(floorDiv(local, kSecondsPerDay));
}

CalendarDate today(int tz_offset_minutes) {
    return dateOf(nowEpochSeconds(), tz_offset_minutes);
}

std::vector<CalendarDate> missedDates(const CalendarDate& last, const CalendarDate& today) {
    std::vector<CalendarDate> dates;
    for (CalendarDate current = addDays(last, 1); current < today; current = addDays(current, 1)) {
        dates.push_back(current);
    }
    return dates;
}

int64_t nowEpochSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatUtc(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace calendar

} // namespace harvester
