#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace planboard {

/**
 * 命令行参数错误（未知选项、缺少参数值）
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct AppConfig {
    std::string plan_path;
    std::optional<std::string> simulate;  // "YYYY-MM-DD HH:MM"
    bool exclude_breaks = false;
    bool show_help = false;
};

// 环境变量名
constexpr const char* ENV_PLAN_FILE = "plan_file_address";
constexpr const char* ENV_HIDE_BREAKS = "PLANBOARD_HIDE_BREAKS";
constexpr const char* DEFAULT_PLAN_FILE = "plan.txt";

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * 通过 std::getenv 读取环境变量
 */
std::optional<std::string> system_env(const std::string& name);

/**
 * 解析命令行参数（不含程序名）
 *
 * --plan PATH        计划文件，默认取环境变量 plan_file_address，否则 plan.txt
 * --simulate TIME    模拟当前时间 "YYYY-MM-DD HH:MM"
 * --hide-breaks      "下一个事件" 跳过描述含 break 的事件
 * -h, --help
 *
 * @throws ConfigError 未知选项或缺少参数值
 */
AppConfig parse_args(const std::vector<std::string>& args,
                     const EnvLookup& env = system_env);

void print_usage(const char* prog_name);

} // namespace planboard
