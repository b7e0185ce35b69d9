#include "plan_parser.h"
#include "schedule_evaluator.h"
#include <chrono>
#include <iostream>
#include <string>

using namespace planboard;

namespace {

const char* kPlan =
    "Monday, April 7th, 2025 - No Gym\n"
    "9:00 AM → 10:15 AM: Write report\n"
    "11:00 AM → 12:00 PM: Review";

TimePoint at(int hour, int minute, int second = 0) {
    return *combine(Date(2025, 4, 7), TimeOfDay(hour, minute)) + std::chrono::seconds(second);
}

bool check(bool ok, const std::string& pass_msg, const std::string& fail_msg) {
    std::cout << (ok ? "  ✓ " : "  ✗ ") << (ok ? pass_msg : fail_msg) << std::endl;
    return ok;
}

bool has_description(const std::optional<Event>& ev, const std::string& description) {
    return ev && ev->description == description;
}

} // namespace

int main() {
    std::cout << "=== planboard Schedule Evaluator Test ===" << std::endl;

    auto plan = parse_plan(kPlan);
    const DaySchedule* today = find_day(plan, Date(2025, 4, 7));
    if (!check(today != nullptr, "Found 2025-04-07", "Day lookup failed")) {
        return 1;
    }

    // Test 1: 进行中的事件
    std::cout << "\n[Test 1] In-progress event at 09:30..." << std::endl;
    auto eval = evaluate(today, at(9, 30));
    bool in_progress = has_description(eval.current, "Write report") &&
                       eval.remaining && eval.remaining->count() == 45 &&
                       has_description(eval.next, "Review");
    if (!check(in_progress, "current=Write report, 45 minutes left, next=Review", "Wrong evaluation at 09:30")) {
        return 1;
    }

    // Test 2: 两个事件之间的空档
    std::cout << "\n[Test 2] Gap at 10:30..." << std::endl;
    eval = evaluate(today, at(10, 30));
    if (!check(!eval.current && !eval.remaining && has_description(eval.next, "Review"),
               "No current, next=Review", "Wrong evaluation in gap")) {
        return 1;
    }

    // Test 3: 没有匹配的日期
    std::cout << "\n[Test 3] No schedule for the date..." << std::endl;
    const DaySchedule* missing = find_day(plan, Date(2025, 4, 8));
    eval = evaluate(missing, at(9, 30) + std::chrono::hours(24));
    if (!check(missing == nullptr && !eval.current && !eval.next && eval.upcoming.empty(),
               "Day, current and next are all absent", "Expected empty evaluation")) {
        return 1;
    }

    // Test 4: 半开区间 [start, end)
    std::cout << "\n[Test 4] Half-open containment..." << std::endl;
    bool at_start = has_description(evaluate(today, at(9, 0)).current, "Write report");
    auto just_before_end = evaluate(today, at(10, 14, 59));
    bool before_end = has_description(just_before_end.current, "Write report") &&
                      just_before_end.remaining->count() == 0;
    bool at_end = !evaluate(today, at(10, 15)).current;
    if (!check(at_start && before_end && at_end, "Current at start, not at end", "Containment wrong")) {
        return 1;
    }

    // Test 5: 剩余分钟向下取整
    std::cout << "\n[Test 5] Remaining minutes floor..." << std::endl;
    eval = evaluate(today, at(9, 30, 30));
    if (!check(eval.remaining && eval.remaining->count() == 44, "44 minutes at 09:30:30", "Remaining not floored")) {
        return 1;
    }

    // Test 6: 最后一个事件之后没有 next
    std::cout << "\n[Test 6] Nothing after the last event..." << std::endl;
    eval = evaluate(today, at(12, 0));
    bool after_last = !eval.current && !eval.next && eval.upcoming.empty();
    eval = evaluate(today, at(8, 0));
    bool before_first = !eval.current && has_description(eval.next, "Write report") &&
                        eval.upcoming.size() == 2;
    if (!check(after_last && before_first, "next is the earliest future event, absent at the end",
               "Nearest-next wrong")) {
        return 1;
    }

    // Test 7: 排序不依赖文件顺序，也不修改原顺序
    std::cout << "\n[Test 7] Unsorted file order..." << std::endl;
    auto unsorted = parse_plan(
        "Monday, April 7th, 2025\n"
        "3:00 PM → 4:00 PM: Late\n"
        "9:00 AM → 10:00 AM: Early\n"
        "1:00 PM → 2:00 PM: Middle\n");
    const DaySchedule* unsorted_day = find_day(unsorted, Date(2025, 4, 7));
    auto sorted = sorted_events(*unsorted_day);
    eval = evaluate(unsorted_day, at(10, 30));
    bool unsorted_ok = sorted.size() == 3 &&
                       sorted[0].description == "Early" &&
                       sorted[1].description == "Middle" &&
                       sorted[2].description == "Late" &&
                       unsorted_day->events[0].description == "Late" &&
                       has_description(eval.next, "Middle");
    if (!check(unsorted_ok, "Sorted by start, stored order untouched", "Sorting wrong")) {
        return 1;
    }

    // Test 8: 重叠事件取最早开始的，开始相同按文件顺序
    std::cout << "\n[Test 8] Overlapping events..." << std::endl;
    auto overlap = parse_plan(
        "Monday, April 7th, 2025\n"
        "10:00 AM → 11:00 AM: Second start\n"
        "9:00 AM → 12:00 PM: Long block\n"
        "9:00 AM → 9:45 AM: Same start later in file\n"
        "1:00 PM → 2:00 PM: Lunch A\n"
        "1:00 PM → 1:30 PM: Lunch B\n");
    const DaySchedule* overlap_day = find_day(overlap, Date(2025, 4, 7));
    bool overlap_ok = has_description(evaluate(overlap_day, at(9, 30)).current, "Long block") &&
                      has_description(evaluate(overlap_day, at(10, 30)).current, "Long block") &&
                      has_description(evaluate(overlap_day, at(12, 30)).next, "Lunch A");
    if (!check(overlap_ok, "Earliest start wins, ties by file order", "Overlap tie-break wrong")) {
        return 1;
    }

    // Test 9: exclude_breaks
    std::cout << "\n[Test 9] Break filtering..." << std::endl;
    auto breaks = parse_plan(
        "Monday, April 7th, 2025\n"
        "9:00 AM → 10:00 AM: Focus\n"
        "10:00 AM → 10:15 AM: Coffee Break\n"
        "10:15 AM → 10:30 AM: BREAKOUT call\n"
        "10:30 AM → 11:00 AM: Email\n");
    const DaySchedule* breaks_day = find_day(breaks, Date(2025, 4, 7));
    auto with_breaks = evaluate(breaks_day, at(9, 30));
    EvaluatorOptions options;
    options.exclude_breaks = true;
    auto without_breaks = evaluate(breaks_day, at(9, 30), options);
    auto during_break = evaluate(breaks_day, at(10, 5), options);
    bool breaks_ok = has_description(with_breaks.next, "Coffee Break") &&
                     with_breaks.upcoming.size() == 3 &&
                     has_description(without_breaks.next, "Email") &&
                     without_breaks.upcoming.size() == 1 &&
                     has_description(during_break.current, "Coffee Break") &&
                     has_description(during_break.next, "Email");
    if (!check(breaks_ok, "Breaks skipped only when requested", "Break filtering wrong")) {
        return 1;
    }

    // Test 10: 重复日期取第一个，日期为空的块不匹配
    std::cout << "\n[Test 10] Duplicate and undated days..." << std::endl;
    auto dup = parse_plan(
        "Monday, February 31st, 2025\n"
        "9:00 AM → 10:00 AM: Undated\n"
        "Monday, April 7th, 2025 - first\n"
        "9:00 AM → 10:00 AM: A\n"
        "Monday, April 7th, 2025 - second\n"
        "9:00 AM → 10:00 AM: B\n");
    const DaySchedule* first = find_day(dup, Date(2025, 4, 7));
    bool dup_ok = first != nullptr &&
                  first->header == "Monday, April 7th, 2025 - first" &&
                  has_description(evaluate(first, at(9, 30)).current, "A") &&
                  sorted_events(dup[0]).empty();
    if (!check(dup_ok, "First match in file order; undated never matches", "Lookup wrong")) {
        return 1;
    }

    std::cout << "\n=== All schedule evaluator tests passed! ===" << std::endl;
    return 0;
}
