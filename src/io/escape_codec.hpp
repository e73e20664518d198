/**
 * @file escape_codec.hpp
 * @brief Экранирование служебных символов строки Lsetwatch
 *
 * Символы `;`, `"` и `|` заменяются на управляющий символ BEL (0x07),
 * за которым следует десятичный код символа: `;` -> "\a59".
 */

#pragma once

#include <string>
#include <string_view>

namespace lsetwatch::io {

/// Управляющий символ, открывающий экранированную последовательность
constexpr char kEscapeSentinel = '\a';

/// Наибольший код, который может быть восстановлен из последовательности
constexpr int kMaxEscapedCode = 127;

/// Наибольшее число цифр кода в последовательности
constexpr size_t kMaxEscapeDigits = 3;

/**
 * @brief Проверка, что символ требует экранирования (`;`, `"`, `|`)
 */
[[nodiscard]] constexpr bool isReservedChar(char c) noexcept {
    return c == ';' || c == '"' || c == '|';
}

/**
 * @brief Экранирование строки
 *
 * Все остальные символы (включая не-ASCII) копируются без изменений.
 */
[[nodiscard]] std::string escapeText(std::string_view text);

/**
 * @brief Восстановление экранированной строки
 *
 * После BEL берётся самая длинная последовательность из не более чем
 * трёх цифр, значение которой не превышает 127; оставшиеся цифры
 * считаются обычным текстом. Так "\a591" даёт ";1", а "\a1241" даёт "|1".
 * BEL без следующей цифры остаётся в тексте как есть.
 */
[[nodiscard]] std::string unescapeText(std::string_view text);

} // namespace lsetwatch::io
