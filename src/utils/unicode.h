#pragma once
#include <string>
#include <cstddef>

namespace planboard {
namespace utf8 {

/**
 * 字符串在终端上的显示宽度
 * ASCII=1, 2-byte=1, 3-byte(CJK、箭头等)=2, 4-byte(emoji)=2
 */
size_t display_width(const std::string& text);

/**
 * 截取到不超过 max_width 的显示宽度，不会截断多字节字符
 */
std::string truncate_to_width(const std::string& text, size_t max_width);

/**
 * 右侧补空格到 target_width 显示宽度；已超出则原样返回
 */
std::string pad_to_width(const std::string& text, size_t target_width);

} // namespace utf8
} // namespace planboard
