#include "sim_clock.h"
#include <chrono>
#include <iostream>

using namespace planboard;
using namespace std::chrono;

int main() {
    std::cout << "=== planboard Simulated Clock Test ===" << std::endl;

    TimePoint sim_start = *combine(Date(2025, 4, 7), TimeOfDay(9, 30));
    TimePoint anchor = *combine(Date(2026, 1, 1), TimeOfDay(12, 0));

    // Test 1: projected_now
    std::cout << "\n[Test 1] Projected time..." << std::endl;
    if (projected_now(anchor, sim_start, anchor) == sim_start &&
        projected_now(anchor, sim_start, anchor + minutes(45)) == sim_start + minutes(45)) {
        std::cout << "  ✓ Simulated time advances at wall-clock rate" << std::endl;
    } else {
        std::cout << "  ✗ projected_now arithmetic wrong" << std::endl;
        return 1;
    }

    // Test 2: SimulatedClock
    std::cout << "\n[Test 2] SimulatedClock..." << std::endl;
    SimulatedClock clock(anchor, sim_start);
    TimePoint later = clock.now(anchor + seconds(90));
    if (later == sim_start + seconds(90) && truncate_to_minute(later) == sim_start + minutes(1)) {
        std::cout << "  ✓ Clock projects and truncates" << std::endl;
    } else {
        std::cout << "  ✗ SimulatedClock wrong" << std::endl;
        return 1;
    }

    // Test 3: 解析 --simulate 的值
    std::cout << "\n[Test 3] Parsing simulated start..." << std::endl;
    auto parsed = parse_simulated_start("2025-04-07 09:30");
    if (parsed && *parsed == sim_start && local_date(*parsed) == Date(2025, 4, 7) &&
        local_time_of_day(*parsed) == TimeOfDay(9, 30)) {
        std::cout << "  ✓ Parsed 2025-04-07 09:30" << std::endl;
    } else {
        std::cout << "  ✗ Failed to parse a valid value" << std::endl;
        return 1;
    }

    if (!parse_simulated_start("tomorrow") &&
        !parse_simulated_start("2025-02-30 10:00") &&
        !parse_simulated_start("2025-04-07 09:30 extra") &&
        !parse_simulated_start("")) {
        std::cout << "  ✓ Invalid values rejected" << std::endl;
    } else {
        std::cout << "  ✗ Invalid value accepted" << std::endl;
        return 1;
    }

    std::cout << "\n=== All simulated clock tests passed! ===" << std::endl;
    return 0;
}
