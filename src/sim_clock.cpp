#include "sim_clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace planboard {

TimePoint projected_now(TimePoint anchor, TimePoint simulated_start, TimePoint real_now) {
    return simulated_start + (real_now - anchor);
}

std::optional<TimePoint> parse_simulated_start(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M");
    if (ss.fail()) {
        return std::nullopt;
    }
    // 不允许多余内容
    ss >> std::ws;
    if (!ss.eof()) {
        return std::nullopt;
    }

    Date date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return combine(date, TimeOfDay(tm.tm_hour, tm.tm_min));
}

TimePoint truncate_to_minute(TimePoint tp) {
    // 本地时区偏移都是整分钟，直接按 epoch 截断即可
    return std::chrono::floor<std::chrono::minutes>(tp);
}

} // namespace planboard
