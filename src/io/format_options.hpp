/**
 * @file format_options.hpp
 * @brief Параметры чтения и записи файлов Lsetwatch
 *
 * Локаль и шаблон даты передаются явно каждому читателю/писателю,
 * глобальная локаль процесса не используется.
 */

#pragma once

#include "value_codec.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace lsetwatch::io {

/**
 * @brief Представление чисел и дат в файле
 */
struct FormatOptions {
    std::string locale;                        ///< Идентификатор локали (en_NZ.utf8, de_DE); пусто: '.'
    std::optional<char> decimal_separator;     ///< Явный десятичный разделитель (важнее локали)
    std::string date_format = kDefaultDateFormat;  ///< Шаблон даты
};

/**
 * @brief Опции чтения
 */
struct ReadOptions {
    FormatOptions format;                      ///< Представление чисел и дат
    std::optional<bool> has_header;            ///< Первая строка является заголовком (nullopt: автоопределение)
};

/**
 * @brief Опции записи
 */
struct WriteOptions {
    FormatOptions format;                      ///< Представление чисел и дат
    bool include_header = true;                ///< Записать заголовок
};

/**
 * @brief Десятичный разделитель для локали
 *
 * Учитывается код языка (и для некоторых локалей код региона).
 * Пустая строка, "C", "POSIX" и неизвестные локали дают '.'.
 */
[[nodiscard]] char decimalSeparatorForLocale(std::string_view locale);

/**
 * @brief Итоговый формат значений
 * @throws std::invalid_argument Некорректный шаблон даты или разделитель
 */
[[nodiscard]] ValueFormat resolveValueFormat(const FormatOptions& options);

} // namespace lsetwatch::io
