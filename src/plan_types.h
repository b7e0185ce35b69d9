#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace planboard {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * 日历日期（本地时间，无时区）
 */
struct Date {
    int year = 0;
    int month = 0;  // 1-12
    int day = 0;    // 1-31

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
};

struct TimeOfDay {
    int hour = 0;    // 0-23
    int minute = 0;  // 0-59

    TimeOfDay() = default;
    TimeOfDay(int h, int m) : hour(h), minute(m) {}

    int minutes_since_midnight() const { return hour * 60 + minute; }

    bool operator==(const TimeOfDay& other) const {
        return hour == other.hour && minute == other.minute;
    }
    bool operator!=(const TimeOfDay& other) const { return !(*this == other); }
    bool operator<(const TimeOfDay& other) const {
        return minutes_since_midnight() < other.minutes_since_midnight();
    }
};

/**
 * 计划中的一个事件
 *
 * start_time/end_time 始终保留；start/end 仅在所属日期有效时存在。
 */
struct Event {
    TimeOfDay start_time;
    TimeOfDay end_time;
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    std::string description;

    // 是否可以放到时间轴上（所属日期有效）
    bool is_placed() const { return start.has_value() && end.has_value(); }

    bool operator==(const Event& other) const {
        return start_time == other.start_time && end_time == other.end_time &&
               start == other.start && end == other.end &&
               description == other.description;
    }
    bool operator!=(const Event& other) const { return !(*this == other); }
};

/**
 * 一天的日程块：标题行 + 该块内的事件（文件顺序）
 */
struct DaySchedule {
    std::optional<Date> date;
    std::string header;
    std::vector<Event> events;

    bool operator==(const DaySchedule& other) const {
        return date == other.date && header == other.header && events == other.events;
    }
    bool operator!=(const DaySchedule& other) const { return !(*this == other); }
};

/**
 * 解析结果：按文件顺序排列的日程块，只读
 */
class ParseResult {
public:
    using const_iterator = std::vector<DaySchedule>::const_iterator;

    ParseResult() = default;
    explicit ParseResult(std::vector<DaySchedule> days) : days_(std::move(days)) {}

    size_t size() const { return days_.size(); }
    const DaySchedule& operator[](size_t index) const { return days_[index]; }

    const_iterator begin() const { return days_.begin(); }
    const_iterator end() const { return days_.end(); }

    bool operator==(const ParseResult& other) const { return days_ == other.days_; }
    bool operator!=(const ParseResult& other) const { return !(*this == other); }

private:
    std::vector<DaySchedule> days_;
};

// ==================== 本地时间辅助函数 ====================

/**
 * 公历日期是否合法（含闰年）
 */
bool is_valid_date(int year, int month, int day);

/**
 * 将本地日期 + 时刻组合为 time_point
 * 日期非法时返回 std::nullopt
 */
std::optional<TimePoint> combine(const Date& date, const TimeOfDay& time);

/**
 * time_point 对应的本地日期
 */
Date local_date(TimePoint tp);

/**
 * time_point 对应的本地时刻（忽略秒）
 */
TimeOfDay local_time_of_day(TimePoint tp);

} // namespace planboard
