#include "app_config.h"

#include <cstdlib>
#include <iostream>

namespace planboard {

namespace {

bool is_truthy(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// 支持 "--flag value" 与 "--flag=value"
std::string take_value(const std::vector<std::string>& args, size_t& i,
                       const std::string& flag) {
    const std::string& arg = args[i];
    if (arg.size() > flag.size() && arg.compare(0, flag.size(), flag) == 0 &&
        arg[flag.size()] == '=') {
        return arg.substr(flag.size() + 1);
    }
    if (i + 1 >= args.size()) {
        throw ConfigError("Option " + flag + " requires a value");
    }
    return args[++i];
}

bool matches(const std::string& arg, const std::string& flag) {
    return arg == flag || (arg.compare(0, flag.size() + 1, flag + "=") == 0);
}

} // namespace

std::optional<std::string> system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

AppConfig parse_args(const std::vector<std::string>& args, const EnvLookup& env) {
    AppConfig config;
    config.plan_path = DEFAULT_PLAN_FILE;

    if (auto plan = env(ENV_PLAN_FILE)) {
        if (!plan->empty()) {
            config.plan_path = *plan;
        }
    }
    if (auto hide = env(ENV_HIDE_BREAKS)) {
        config.exclude_breaks = is_truthy(*hide);
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (matches(arg, "--plan")) {
            config.plan_path = take_value(args, i, "--plan");
        } else if (matches(arg, "--simulate")) {
            config.simulate = take_value(args, i, "--simulate");
        } else if (arg == "--hide-breaks") {
            config.exclude_breaks = true;
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }
    return config;
}

void print_usage(const char* prog_name) {
    std::cout << "planboard - Plan Scheduler in the terminal (refreshes every minute)\n\n"
              << "Usage: " << prog_name << " [--plan PATH] [--simulate \"YYYY-MM-DD HH:MM\"] [--hide-breaks]\n\n"
              << "Options:\n"
              << "  --plan PATH       Path to the plan file (default from env var '"
              << ENV_PLAN_FILE << "', else " << DEFAULT_PLAN_FILE << ")\n"
              << "  --simulate TIME   Simulate current datetime e.g. '2025-04-07 09:30'\n"
              << "  --hide-breaks     Skip events containing \"break\" when showing what is next\n"
              << "                    (also enabled by " << ENV_HIDE_BREAKS << "=1)\n"
              << "  -h, --help        Show this help message\n\n"
              << "Keys:\n"
              << "  t       - Show today's full schedule\n"
              << "  r       - Refresh now\n"
              << "  q       - Quit (back to main view from the full schedule)\n";
}

} // namespace planboard
