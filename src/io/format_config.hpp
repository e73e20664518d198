/**
 * @file format_config.hpp
 * @brief Загрузка и сохранение параметров формата в JSON
 *
 * Пример:
 * @code{.json}
 * {
 *   "locale": "de_DE.utf8",
 *   "date_format": "%d.%m.%Y",
 *   "has_header": true,
 *   "include_header": true
 * }
 * @endcode
 */

#pragma once

#include "format_options.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace lsetwatch::io {

/**
 * @brief Ошибка файла параметров
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Параметры формата из JSON-строки
 *
 * Отсутствующие ключи получают значения по умолчанию.
 * @throws ConfigError При ошибке парсинга или неверном типе значения
 */
[[nodiscard]] FormatOptions formatOptionsFromJson(const std::string& json);

/**
 * @brief Параметры формата в JSON-строку
 */
[[nodiscard]] std::string formatOptionsToJson(const FormatOptions& options, int indent = 2);

/**
 * @brief Опции чтения из файла параметров
 * @throws ConfigError
 */
[[nodiscard]] ReadOptions loadReadOptions(const std::filesystem::path& path);

/**
 * @brief Опции записи из файла параметров
 * @throws ConfigError
 */
[[nodiscard]] WriteOptions loadWriteOptions(const std::filesystem::path& path);

/**
 * @brief Сохранение параметров формата в файл
 * @throws ConfigError
 */
void saveFormatOptions(const FormatOptions& options, const std::filesystem::path& path);

} // namespace lsetwatch::io
