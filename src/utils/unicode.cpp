#include "unicode.h"

namespace planboard {
namespace utf8 {

namespace {

size_t char_width(unsigned char lead) {
    if ((lead & 0xF0) == 0xE0 || (lead & 0xF8) == 0xF0) {
        return 2;
    }
    return 1;
}

// pos 处 UTF-8 字符的字节长度
size_t char_byte_length(const std::string& text, size_t pos) {
    if (pos >= text.length()) return 0;

    unsigned char c = text[pos];
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1; // Invalid, treat as single byte
}

} // namespace

size_t display_width(const std::string& text) {
    size_t width = 0;
    for (size_t i = 0; i < text.length(); ) {
        width += char_width(static_cast<unsigned char>(text[i]));
        i += char_byte_length(text, i);
    }
    return width;
}

std::string truncate_to_width(const std::string& text, size_t max_width) {
    std::string result;
    size_t current_width = 0;

    for (size_t i = 0; i < text.length(); ) {
        size_t byte_len = char_byte_length(text, i);
        size_t w = char_width(static_cast<unsigned char>(text[i]));
        if (current_width + w > max_width) {
            break;
        }
        result.append(text, i, byte_len);
        current_width += w;
        i += byte_len;
    }
    return result;
}

std::string pad_to_width(const std::string& text, size_t target_width) {
    size_t current_width = display_width(text);
    if (current_width >= target_width) return text;
    return text + std::string(target_width - current_width, ' ');
}

} // namespace utf8
} // namespace planboard
