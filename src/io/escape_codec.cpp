/**
 * @file escape_codec.cpp
 * @brief Реализация экранирования служебных символов
 */

#include "escape_codec.hpp"
#include "text_utils.hpp"

namespace lsetwatch::io {

std::string escapeText(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        if (isReservedChar(c)) {
            result += kEscapeSentinel;
            result += std::to_string(static_cast<unsigned char>(c));
        } else {
            result += c;
        }
    }

    return result;
}

std::string unescapeText(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != kEscapeSentinel) {
            result += c;
            ++i;
            continue;
        }

        // Самый длинный префикс цифр (<= 3), код которого в пределах ASCII
        size_t digits = 0;
        int code = 0;
        int accepted_code = 0;
        size_t accepted_digits = 0;
        while (digits < kMaxEscapeDigits && i + 1 + digits < text.size() &&
               isAsciiDigit(text[i + 1 + digits])) {
            code = code * 10 + (text[i + 1 + digits] - '0');
            ++digits;
            if (code <= kMaxEscapedCode) {
                accepted_code = code;
                accepted_digits = digits;
            }
        }

        if (accepted_digits == 0) {
            result += c;
            ++i;
            continue;
        }

        result += static_cast<char>(accepted_code);
        i += 1 + accepted_digits;
    }

    return result;
}

} // namespace lsetwatch::io
