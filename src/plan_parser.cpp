#include "plan_parser.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>

namespace planboard {

namespace {

// libstdc++ 的 regex 按字符递归：只匹配行首的有界前缀，不能出现无上限的重复

// 例: "Monday, April 7th, 2025 - No Gym"，年份之后的内容不参与匹配
const std::regex& day_header_pattern() {
    static const std::regex pattern(
        R"(([A-Za-z]{1,9}),\s{1,16}([A-Za-z]{1,9})\s{1,16}(\d{1,2}(?:st|nd|rd|th)?),\s{1,16}(\d{4}))");
    return pattern;
}

// 例: "9:00 AM → 10:15 AM: Task details"，冒号之后是描述
const std::regex& event_prefix_pattern() {
    static const std::regex pattern(
        R"((\d{1,2}:\d{2}\s{0,16}(?:AM|PM))\s{0,16}→\s{0,16}(\d{1,2}:\d{2}\s{0,16}(?:AM|PM)):)");
    return pattern;
}

// 只在行首匹配
bool match_prefix(const std::string &line, std::smatch &m, const std::regex &pattern) {
    return std::regex_search(line, m, pattern, std::regex_constants::match_continuous);
}

// 去掉首尾空白
std::string trim(const std::string &s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// 月份名 + 日 + 年 -> 日期；任何一部分非法都返回 std::nullopt
std::optional<Date> parse_header_date(const std::string &month_str,
                                      const std::string &day_token,
                                      const std::string &year_str) {
    int month = month_from_name(month_str);
    if (month == 0) {
        return std::nullopt;
    }

    std::string day_digits = strip_ordinal_suffix(day_token);
    if (day_digits.empty() ||
        !std::all_of(day_digits.begin(), day_digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    int day = std::stoi(day_digits);
    int year = std::stoi(year_str);
    if (!is_valid_date(year, month, day)) {
        return std::nullopt;
    }
    return Date(year, month, day);
}

Event make_event(const std::optional<Date> &date, const TimeOfDay &start_time,
                 const TimeOfDay &end_time, const std::string &description) {
    Event event;
    event.start_time = start_time;
    event.end_time = end_time;
    event.description = description;
    if (date) {
        event.start = combine(*date, start_time);
        event.end = combine(*date, end_time);
    }
    return event;
}

} // namespace

std::optional<TimeOfDay> parse_clock_time(const std::string &text) {
    // 小时与 AM/PM 之间至少一个空白
    static const std::regex pattern(R"(^(\d{1,2}):(\d{2})\s{1,16}(AM|PM)$)");

    std::smatch m;
    std::string value = trim(text);
    if (!std::regex_match(value, m, pattern)) {
        return std::nullopt;
    }

    int hour = std::stoi(m[1].str());
    int minute = std::stoi(m[2].str());
    if (hour < 1 || hour > 12 || minute > 59) {
        return std::nullopt;
    }

    // 12 AM = 0 点, 12 PM = 12 点
    hour %= 12;
    if (m[3].str() == "PM") {
        hour += 12;
    }
    return TimeOfDay(hour, minute);
}

std::string strip_ordinal_suffix(const std::string &day_token) {
    static const std::regex suffix(R"(st|nd|rd|th)");
    return std::regex_replace(day_token, suffix, "");
}

int month_from_name(const std::string &name) {
    static const char *const kMonths[] = {
        "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december"
    };

    std::string lower = to_lower(name);
    for (int i = 0; i < 12; ++i) {
        if (lower == kMonths[i]) {
            return i + 1;
        }
    }
    return 0;
}

ParseResult parse_plan(const std::string &text) {
    std::vector<DaySchedule> days;
    std::optional<DaySchedule> current_day;

    std::istringstream iss(text);
    std::string raw_line;
    while (std::getline(iss, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        std::smatch header;
        if (match_prefix(line, header, day_header_pattern())) {
            // 新的标题行：结束上一个日程块
            if (current_day) {
                days.push_back(std::move(*current_day));
            }

            // group 1 为星期，不参与校验
            DaySchedule day;
            day.date = parse_header_date(header[2].str(), header[3].str(), header[4].str());
            day.header = line;
            current_day = std::move(day);
            continue;
        }

        std::smatch ev;
        if (!current_day || !match_prefix(line, ev, event_prefix_pattern())) {
            continue;
        }
        std::string description = trim(ev.suffix().str());
        if (description.empty()) {
            continue;
        }

        auto start_time = parse_clock_time(ev[1].str());
        auto end_time = parse_clock_time(ev[2].str());
        if (!start_time || !end_time) {
            continue;
        }
        // 结束必须晚于开始
        if (!(*start_time < *end_time)) {
            continue;
        }

        current_day->events.push_back(
            make_event(current_day->date, *start_time, *end_time, description));
    }

    if (current_day) {
        days.push_back(std::move(*current_day));
    }
    return ParseResult(std::move(days));
}

ParseResult load_plan_file(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw FileUnavailable(path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw FileUnavailable(path);
    }
    return parse_plan(content);
}

} // namespace planboard
