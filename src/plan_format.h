#pragma once

#include "plan_types.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace planboard {

// 主视图中事件名称所占的显示宽度
constexpr size_t EVENT_NAME_WIDTH = 20;

// 剩余时间少于该值时使用提醒颜色
constexpr int URGENT_MINUTES = 15;

// "09:00 AM"
std::string format_clock(const TimeOfDay& time);

// "09:00 AM - 10:15 AM"
std::string format_time_range(const Event& event);

// "09:00 AM - 10:15 AM: Write report [Q2]"
std::string format_event(const Event& event);

/**
 * 去掉描述中 '[' 或 '(' 之后的附加信息
 * "Write report [Q2] (desk)" -> "Write report"
 */
std::string short_description(const std::string& description);

/**
 * 主视图一行：名称补齐到 EVENT_NAME_WIDTH，再跟时间范围
 */
std::string format_event_main(const Event& event);

// "45 minutes"
std::string format_remaining(std::chrono::minutes remaining);

bool is_urgent(std::chrono::minutes remaining);

// "Monday, April 07, 2025 09:30 AM"
std::string format_now(TimePoint now);

} // namespace planboard
