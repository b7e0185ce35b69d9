#pragma once

#include "plan_types.h"

#include <optional>
#include <string>

namespace planboard {

/**
 * 模拟时间 = 模拟起点 + (真实当前时间 - 真实锚点)
 */
TimePoint projected_now(TimePoint anchor, TimePoint simulated_start, TimePoint real_now);

/**
 * 模拟时钟：从指定起点开始，以真实速度前进
 */
class SimulatedClock {
public:
    SimulatedClock(TimePoint anchor, TimePoint simulated_start)
        : anchor_(anchor), simulated_start_(simulated_start) {}

    TimePoint now(TimePoint real_now) const {
        return projected_now(anchor_, simulated_start_, real_now);
    }

private:
    TimePoint anchor_;
    TimePoint simulated_start_;
};

/**
 * 解析 "YYYY-MM-DD HH:MM"（本地时间）
 * 格式或日期非法时返回 std::nullopt
 */
std::optional<TimePoint> parse_simulated_start(const std::string& text);

/**
 * 去掉秒及以下部分（按本地时间）
 */
TimePoint truncate_to_minute(TimePoint tp);

} // namespace planboard
