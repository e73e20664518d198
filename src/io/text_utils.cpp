/**
 * @file text_utils.cpp
 * @brief Утилиты для работы с текстом строк файла (ASCII, UTF-8 BOM)
 */

#include "text_utils.hpp"

namespace lsetwatch::io {

namespace {

constexpr bool isAsciiSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

} // namespace

std::string_view stripUtf8Bom(std::string_view input) noexcept {
    if (input.size() >= 3 &&
        static_cast<unsigned char>(input[0]) == 0xEF &&
        static_cast<unsigned char>(input[1]) == 0xBB &&
        static_cast<unsigned char>(input[2]) == 0xBF) {
        return input.substr(3);
    }
    return input;
}

std::string_view trimAscii(std::string_view input) noexcept {
    size_t start = 0;
    while (start < input.size() && isAsciiSpace(input[start])) {
        ++start;
    }
    size_t end = input.size();
    while (end > start && isAsciiSpace(input[end - 1])) {
        --end;
    }
    return input.substr(start, end - start);
}

std::string asciiToLower(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (char c : input) {
        if (c >= 'A' && c <= 'Z') {
            out.push_back(static_cast<char>(c + ('a' - 'A')));
        } else {
            out.push_back(c);
        }
    }

    return out;
}

} // namespace lsetwatch::io
