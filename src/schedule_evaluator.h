#pragma once

#include "plan_types.h"

#include <chrono>
#include <optional>
#include <vector>

namespace planboard {

struct EvaluatorOptions {
    // 从 upcoming/next 中去掉描述含 "break"（不区分大小写）的事件
    bool exclude_breaks = false;
};

/**
 * 某一时刻的求值结果
 */
struct Evaluation {
    std::optional<Event> current;               // start <= now < end
    std::optional<Event> next;                  // upcoming 的第一个
    std::vector<Event> upcoming;                // start > now，按开始时间升序
    std::optional<std::chrono::minutes> remaining;  // current 剩余整分钟（向下取整）
};

/**
 * 按文件顺序查找日期为 date 的日程块
 *
 * 同一日期出现多个标题时返回第一个；日期为空的块永远不会匹配。
 * @return 未找到时返回 nullptr
 */
const DaySchedule* find_day(const ParseResult& result, const Date& date);

/**
 * 当天可放到时间轴上的事件，按开始时间稳定排序（不修改原顺序）
 */
std::vector<Event> sorted_events(const DaySchedule& day);

/**
 * 求当前事件与下一个事件
 * day 为 nullptr 时所有结果为空
 */
Evaluation evaluate(const DaySchedule* day, TimePoint now,
                    const EvaluatorOptions& options = EvaluatorOptions());

/**
 * 描述中是否包含 "break"（不区分大小写）
 */
bool is_break(const Event& event);

/**
 * 剩余整分钟数 floor((end - now) / 1min)
 */
std::chrono::minutes remaining_minutes(const Event& event, TimePoint now);

} // namespace planboard
