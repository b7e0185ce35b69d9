#pragma once

#include "plan_types.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace planboard {

/**
 * 计划文件无法打开或读取
 */
class FileUnavailable : public std::runtime_error {
public:
    explicit FileUnavailable(const std::string& path)
        : std::runtime_error("Plan file '" + path + "' not found."), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * 解析计划文本，返回按文件顺序排列的日程块
 *
 * 文本格式：
 *   Monday, April 7th, 2025 - No Gym
 *   9:00 AM → 10:15 AM: Write report
 *
 * 从不因内容格式错误而失败：无法解析的日期置空，无法解析的事件行丢弃。
 */
ParseResult parse_plan(const std::string& text);

/**
 * 读取并解析计划文件
 * @throws FileUnavailable 文件无法打开或读取
 */
ParseResult load_plan_file(const std::string& path);

// 以下函数供测试与渲染层复用

/**
 * 解析 "9:00 AM" 形式的 12 小时制时刻
 */
std::optional<TimeOfDay> parse_clock_time(const std::string& text);

/**
 * 去掉日期中的序数后缀 (st/nd/rd/th)，返回数字部分
 */
std::string strip_ordinal_suffix(const std::string& day_token);

/**
 * 英文完整月份名 -> 1-12，不区分大小写；无法识别返回 0
 */
int month_from_name(const std::string& name);

} // namespace planboard
