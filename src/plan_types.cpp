#include "plan_types.h"

#include <ctime>

namespace planboard {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

std::tm to_local_tm(TimePoint tp) {
    auto tt = Clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

bool is_valid_date(int year, int month, int day) {
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    int max_day = kDaysInMonth[month - 1];
    if (month == 2 && is_leap_year(year)) {
        max_day = 29;
    }
    return day <= max_day;
}

std::optional<TimePoint> combine(const Date& date, const TimeOfDay& time) {
    if (!is_valid_date(date.year, date.month, date.day)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = date.month - 1;
    tm.tm_mday = date.day;
    tm.tm_hour = time.hour;
    tm.tm_min = time.minute;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;  // 由系统决定夏令时

    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(t);
}

Date local_date(TimePoint tp) {
    std::tm tm = to_local_tm(tp);
    return Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

TimeOfDay local_time_of_day(TimePoint tp) {
    std::tm tm = to_local_tm(tp);
    return TimeOfDay(tm.tm_hour, tm.tm_min);
}

} // namespace planboard
