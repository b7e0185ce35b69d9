#pragma once

#include "plan_types.h"
#include "schedule_evaluator.h"
#include "sim_clock.h"

#include <optional>

namespace planboard {

struct DashboardOptions {
    EvaluatorOptions evaluator;
    std::optional<SimulatedClock> clock;  // 为空时使用系统时间
};

/**
 * 运行 ncurses 仪表盘，每分钟刷新一次，直到用户按 q 退出
 */
void run_dashboard(const ParseResult& plan, const DashboardOptions& options);

} // namespace planboard
