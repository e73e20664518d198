/**
 * @file text_utils.hpp
 * @brief Утилиты для работы с текстом строк файла (ASCII, UTF-8 BOM)
 */

#pragma once

#include <string>
#include <string_view>

namespace lsetwatch::io {

/**
 * @brief Проверка ASCII-цифры (без учёта локали)
 */
[[nodiscard]] constexpr bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

/**
 * @brief Удаление UTF-8 BOM в начале строки
 */
[[nodiscard]] std::string_view stripUtf8Bom(std::string_view input) noexcept;

/**
 * @brief Удаление пробельных символов ASCII по краям
 */
[[nodiscard]] std::string_view trimAscii(std::string_view input) noexcept;

/**
 * @brief Перевод ASCII-букв в нижний регистр (остальные байты без изменений)
 */
[[nodiscard]] std::string asciiToLower(std::string_view input);

} // namespace lsetwatch::io
