#pragma once

#include <functional>
#include <string>

namespace planboard {

enum class ViewMode {
    MAIN,           // 当前/下一个事件
    FULL_SCHEDULE   // 今天的全部事件
};

enum class Action {
    NONE,
    QUIT,
    SHOW_FULL,
    SHOW_MAIN,
    REFRESH
};

struct InputResult {
    Action action;
    bool redraw;    // 是否需要立即重绘（不等到下一分钟）
};

/**
 * 按键 -> 动作
 *
 * 主视图:   q 退出, t 完整日程, r 刷新
 * 完整日程: q/ESC 返回主视图, r 刷新
 *
 * 视图模式由调用方持有并传入，这里不保存状态。
 */
class InputHandler {
public:
    InputResult handle_key(ViewMode mode, int ch) const;

    /**
     * 动作作用于视图模式后的结果
     */
    static ViewMode apply(ViewMode mode, Action action);

    /**
     * 状态栏上显示的按键提示
     */
    static std::string key_hint(ViewMode mode);

    void set_status_callback(std::function<void(const std::string&)> callback);

private:
    std::function<void(const std::string&)> status_callback_;
};

} // namespace planboard
