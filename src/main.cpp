#include "app_config.h"
#include "dashboard_view.h"
#include "plan_parser.h"
#include "sim_clock.h"

#include <iostream>
#include <string>
#include <vector>

using namespace planboard;

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    ParseResult plan;
    try {
        plan = load_plan_file(config.plan_path);
    } catch (const FileUnavailable& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    DashboardOptions options;
    options.evaluator.exclude_breaks = config.exclude_breaks;

    if (config.simulate) {
        auto real_now = Clock::now();
        auto start = parse_simulated_start(*config.simulate);
        if (!start) {
            std::cerr << "Warning: invalid --simulate value '" << *config.simulate
                      << "', using the current time" << std::endl;
            start = truncate_to_minute(real_now);
        }
        options.clock = SimulatedClock(real_now, *start);
    }

    try {
        run_dashboard(plan, options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
