#include "input_handler.h"
#include <iostream>
#include <string>

using namespace planboard;

int main() {
    std::cout << "=== planboard Input Handler Test ===" << std::endl;

    InputHandler handler;

    // Test 1: 主视图按键
    std::cout << "\n[Test 1] Main view keys..." << std::endl;
    if (handler.handle_key(ViewMode::MAIN, 'q').action == Action::QUIT &&
        handler.handle_key(ViewMode::MAIN, 't').action == Action::SHOW_FULL &&
        handler.handle_key(ViewMode::MAIN, 'x').action == Action::NONE &&
        handler.handle_key(ViewMode::MAIN, -1).action == Action::NONE) {
        std::cout << "  ✓ q quits, t opens full schedule" << std::endl;
    } else {
        std::cout << "  ✗ Main view mapping wrong" << std::endl;
        return 1;
    }

    // Test 2: 完整日程视图中 q 返回而不是退出
    std::cout << "\n[Test 2] Full schedule keys..." << std::endl;
    InputResult back = handler.handle_key(ViewMode::FULL_SCHEDULE, 'q');
    if (back.action == Action::SHOW_MAIN && back.redraw &&
        handler.handle_key(ViewMode::FULL_SCHEDULE, 27).action == Action::SHOW_MAIN &&
        handler.handle_key(ViewMode::FULL_SCHEDULE, 't').action == Action::NONE) {
        std::cout << "  ✓ q/ESC go back to the main view" << std::endl;
    } else {
        std::cout << "  ✗ Full schedule mapping wrong" << std::endl;
        return 1;
    }

    // Test 3: 视图切换
    std::cout << "\n[Test 3] View transitions..." << std::endl;
    if (InputHandler::apply(ViewMode::MAIN, Action::SHOW_FULL) == ViewMode::FULL_SCHEDULE &&
        InputHandler::apply(ViewMode::FULL_SCHEDULE, Action::SHOW_MAIN) == ViewMode::MAIN &&
        InputHandler::apply(ViewMode::FULL_SCHEDULE, Action::REFRESH) == ViewMode::FULL_SCHEDULE &&
        InputHandler::apply(ViewMode::MAIN, Action::NONE) == ViewMode::MAIN) {
        std::cout << "  ✓ Mode follows actions" << std::endl;
    } else {
        std::cout << "  ✗ Mode transitions wrong" << std::endl;
        return 1;
    }

    // Test 4: 刷新时的状态回调
    std::cout << "\n[Test 4] Status callback..." << std::endl;
    std::string status;
    handler.set_status_callback([&status](const std::string& msg) { status = msg; });
    InputResult refresh = handler.handle_key(ViewMode::MAIN, 'r');
    if (refresh.action == Action::REFRESH && refresh.redraw && status == "Refreshing...") {
        std::cout << "  ✓ Refresh reports status" << std::endl;
    } else {
        std::cout << "  ✗ Refresh status missing" << std::endl;
        return 1;
    }

    std::cout << "\n=== All input handler tests passed! ===" << std::endl;
    return 0;
}
