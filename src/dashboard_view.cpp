#include "dashboard_view.h"

#include "input_handler.h"
#include "plan_format.h"
#include "utils/unicode.h"

#include <curses.h>
#include <chrono>
#include <clocale>
#include <string>
#include <vector>

namespace planboard {

namespace {

enum ColorPairs {
    TITLE_TEXT = 1,     // 标题与分隔线
    NORMAL_TEXT,        // 普通文本
    IN_PROGRESS_TEXT,   // 进行中的事件
    UPCOMING_TEXT,      // 即将开始的事件
    REMAINING_TEXT,     // 剩余时间
    URGENT_TEXT,        // 剩余时间 < 15 分钟
    DIM_TEXT            // 按键提示、状态信息
};

const int DIVIDER_WIDTH = 40;
const int POLL_INTERVAL_MS = 200;

void init_colors() {
    if (has_colors()) {
        start_color();
        use_default_colors(); // Use terminal's default background

        init_pair(TITLE_TEXT, COLOR_CYAN, -1);
        init_pair(NORMAL_TEXT, COLOR_WHITE, -1);
        init_pair(IN_PROGRESS_TEXT, COLOR_GREEN, -1);
        init_pair(UPCOMING_TEXT, COLOR_YELLOW, -1);
        init_pair(REMAINING_TEXT, COLOR_MAGENTA, -1);
        init_pair(URGENT_TEXT, COLOR_BLUE, -1);
        init_pair(DIM_TEXT, COLOR_BLACK, -1);
    }
}

// 在 (y, x) 输出一行文本，超出屏幕宽度的部分截掉
void draw_text(int y, int x, const std::string& text, int color_pair, bool bold = false) {
    int height, width;
    getmaxyx(stdscr, height, width);
    if (y < 0 || y >= height || x >= width) {
        return;
    }

    std::string visible = utf8::truncate_to_width(text, static_cast<size_t>(width - x));
    attr_t attrs = COLOR_PAIR(color_pair) | (bold ? A_BOLD : A_NORMAL);
    attron(attrs);
    mvprintw(y, x, "%s", visible.c_str());
    attroff(attrs);
}

void draw_footer(ViewMode mode, const std::string& status) {
    int height = getmaxy(stdscr);

    std::string footer = InputHandler::key_hint(mode);
    if (!status.empty()) {
        footer += "  " + status;
    }
    draw_text(height - 1, 0, footer, DIM_TEXT);
}

// 事件标题 + 事件行，返回下一行位置
int draw_event_block(int line, const std::string& heading, const Event& event, int color) {
    draw_text(line, 0, heading, color, true);
    line += 1;
    draw_text(line, 2, format_event_main(event), color);
    return line + 2;
}

void render_main_view(TimePoint now, const DaySchedule* today, const Evaluation& eval) {
    clear();
    int line = 0;

    draw_text(line, 0, "Plan Scheduler", TITLE_TEXT, true);
    line += 1;
    draw_text(line, 0, "Current Date & Time: " + format_now(now), NORMAL_TEXT);
    line += 1;
    draw_text(line, 0, std::string(DIVIDER_WIDTH, '='), TITLE_TEXT);
    line += 2;

    if (today == nullptr) {
        draw_text(line, 0, "No schedule found for today.", NORMAL_TEXT);
        return;
    }

    if (eval.current) {
        draw_text(line, 0, ">> In-progress event:", IN_PROGRESS_TEXT, true);
        line += 1;
        draw_text(line, 2, format_event_main(*eval.current), IN_PROGRESS_TEXT);
        line += 1;

        const std::string label = "Time remaining:     ";
        draw_text(line, 2, label, IN_PROGRESS_TEXT);
        int color = is_urgent(*eval.remaining) ? URGENT_TEXT : REMAINING_TEXT;
        draw_text(line, 2 + static_cast<int>(label.size()), format_remaining(*eval.remaining), color);
        line += 2;

        if (eval.next) {
            draw_event_block(line, "Next upcoming event:", *eval.next, NORMAL_TEXT);
        } else {
            draw_text(line, 0, "No further events for today.", NORMAL_TEXT);
        }
        return;
    }

    if (eval.upcoming.empty()) {
        draw_text(line, 0, "No event currently in progress.", NORMAL_TEXT);
        return;
    }

    line = draw_event_block(line, "Upcoming event:", eval.upcoming[0], UPCOMING_TEXT);
    if (eval.upcoming.size() > 1) {
        draw_event_block(line, "Next upcoming event:", eval.upcoming[1], NORMAL_TEXT);
    }
}

void render_full_schedule_view(const DaySchedule* today) {
    clear();
    int line = 0;

    draw_text(line, 0, "Today's Full Schedule", TITLE_TEXT, true);
    line += 1;
    draw_text(line, 0, std::string(DIVIDER_WIDTH, '='), TITLE_TEXT);
    line += 2;

    if (today == nullptr) {
        draw_text(line, 0, "No schedule found for today.", NORMAL_TEXT);
        return;
    }

    for (const auto& ev : sorted_events(*today)) {
        draw_text(line, 2, format_event(ev), NORMAL_TEXT);
        line += 1;
    }
}

// initscr/endwin 配对，异常退出时也能恢复终端
class CursesSession {
public:
    CursesSession() {
        // 让 ncurses 按当前终端 locale 处理 UTF-8
        std::setlocale(LC_ALL, "");

        initscr();
        init_colors();
        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        curs_set(0);
        timeout(POLL_INTERVAL_MS);
    }

    ~CursesSession() {
        endwin();
    }

    CursesSession(const CursesSession&) = delete;
    CursesSession& operator=(const CursesSession&) = delete;
};

TimePoint current_time(const DashboardOptions& options) {
    auto real_now = Clock::now();
    if (options.clock) {
        return truncate_to_minute(options.clock->now(real_now));
    }
    return truncate_to_minute(real_now);
}

} // namespace

void run_dashboard(const ParseResult& plan, const DashboardOptions& options) {
    CursesSession session;

    InputHandler input;
    std::string status;
    input.set_status_callback([&status](const std::string& msg) { status = msg; });

    ViewMode mode = ViewMode::MAIN;
    bool running = true;

    while (running) {
        TimePoint now = current_time(options);
        const DaySchedule* today = find_day(plan, local_date(now));

        if (mode == ViewMode::FULL_SCHEDULE) {
            render_full_schedule_view(today);
        } else {
            render_main_view(now, today, evaluate(today, now, options.evaluator));
        }
        draw_footer(mode, status);
        refresh();
        status = std::string();

        // 等到下一个整分钟，期间每 200ms 检查一次按键
        auto wall = Clock::now();
        auto next_minute = std::chrono::floor<std::chrono::minutes>(wall) + std::chrono::minutes(1);
        while (Clock::now() < next_minute) {
            int ch = getch();
            InputResult result = input.handle_key(mode, ch);
            if (result.action == Action::QUIT) {
                running = false;
                break;
            }
            mode = InputHandler::apply(mode, result.action);
            if (result.redraw) {
                break;
            }
        }
    }
}

} // namespace planboard
