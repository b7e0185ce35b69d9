#include "plan_format.h"
#include "utils/unicode.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace planboard {

std::string format_clock(const TimeOfDay& time) {
    int hour12 = time.hour % 12;
    if (hour12 == 0) hour12 = 12;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d %s", hour12, time.minute,
                  time.hour < 12 ? "AM" : "PM");
    return buf;
}

std::string format_time_range(const Event& event) {
    return format_clock(event.start_time) + " - " + format_clock(event.end_time);
}

std::string format_event(const Event& event) {
    return format_time_range(event) + ": " + event.description;
}

std::string short_description(const std::string& description) {
    size_t cut = description.find_first_of("[(");
    std::string head = description.substr(0, cut);

    size_t start = 0;
    while (start < head.size() && std::isspace(static_cast<unsigned char>(head[start]))) ++start;
    size_t end = head.size();
    while (end > start && std::isspace(static_cast<unsigned char>(head[end - 1]))) --end;
    return head.substr(start, end - start);
}

std::string format_event_main(const Event& event) {
    return utf8::pad_to_width(short_description(event.description), EVENT_NAME_WIDTH) +
           format_time_range(event);
}

std::string format_remaining(std::chrono::minutes remaining) {
    return std::to_string(remaining.count()) + " minutes";
}

bool is_urgent(std::chrono::minutes remaining) {
    return remaining.count() < URGENT_MINUTES;
}

std::string format_now(TimePoint now) {
    auto tt = Clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%A, %B %d, %Y %I:%M %p");
    return oss.str();
}

} // namespace planboard
