#include "schedule_evaluator.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace planboard {

const DaySchedule* find_day(const ParseResult& result, const Date& date) {
    for (const auto& day : result) {
        if (day.date && *day.date == date) {
            return &day;
        }
    }
    return nullptr;
}

std::vector<Event> sorted_events(const DaySchedule& day) {
    std::vector<Event> events;
    events.reserve(day.events.size());
    for (const auto& ev : day.events) {
        if (ev.is_placed()) {
            events.push_back(ev);
        }
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const Event& a, const Event& b) { return *a.start < *b.start; });
    return events;
}

bool is_break(const Event& event) {
    std::string lower = event.description;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("break") != std::string::npos;
}

std::chrono::minutes remaining_minutes(const Event& event, TimePoint now) {
    auto left = *event.end - now;
    return std::chrono::floor<std::chrono::minutes>(left);
}

Evaluation evaluate(const DaySchedule* day, TimePoint now, const EvaluatorOptions& options) {
    Evaluation result;
    if (day == nullptr) {
        return result;
    }

    auto events = sorted_events(*day);

    // 已按开始时间排好序，第一个命中的就是最早开始的
    for (const auto& ev : events) {
        if (*ev.start <= now && now < *ev.end) {
            result.current = ev;
            break;
        }
    }

    for (const auto& ev : events) {
        if (*ev.start <= now) continue;
        if (options.exclude_breaks && is_break(ev)) continue;
        result.upcoming.push_back(ev);
    }

    if (!result.upcoming.empty()) {
        result.next = result.upcoming.front();
    }
    if (result.current) {
        result.remaining = remaining_minutes(*result.current, now);
    }
    return result;
}

} // namespace planboard
