#include "input_handler.h"

#include <utility>

namespace planboard {

namespace {

constexpr int KEY_ESCAPE = 27;

} // namespace

InputResult InputHandler::handle_key(ViewMode mode, int ch) const {
    InputResult result;
    result.action = Action::NONE;
    result.redraw = false;

    if (ch < 0) {
        return result;  // 超时，无按键
    }

    switch (mode) {
        case ViewMode::MAIN:
            switch (ch) {
                case 'q':
                case 'Q':
                    result.action = Action::QUIT;
                    break;
                case 't':
                case 'T':
                    result.action = Action::SHOW_FULL;
                    result.redraw = true;
                    break;
                case 'r':
                case 'R':
                    result.action = Action::REFRESH;
                    result.redraw = true;
                    break;
            }
            break;
        case ViewMode::FULL_SCHEDULE:
            switch (ch) {
                case 'q':
                case 'Q':
                case KEY_ESCAPE:
                    result.action = Action::SHOW_MAIN;
                    result.redraw = true;
                    break;
                case 'r':
                case 'R':
                    result.action = Action::REFRESH;
                    result.redraw = true;
                    break;
            }
            break;
    }

    if (result.action == Action::REFRESH && status_callback_) {
        status_callback_("Refreshing...");
    }
    return result;
}

ViewMode InputHandler::apply(ViewMode mode, Action action) {
    switch (action) {
        case Action::SHOW_FULL:
            return ViewMode::FULL_SCHEDULE;
        case Action::SHOW_MAIN:
            return ViewMode::MAIN;
        default:
            return mode;
    }
}

std::string InputHandler::key_hint(ViewMode mode) {
    if (mode == ViewMode::FULL_SCHEDULE) {
        return "[q:Back r:Refresh]";
    }
    return "[q:Exit t:Today r:Refresh]";
}

void InputHandler::set_status_callback(std::function<void(const std::string&)> callback) {
    status_callback_ = std::move(callback);
}

} // namespace planboard
