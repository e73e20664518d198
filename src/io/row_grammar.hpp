/**
 * @file row_grammar.hpp
 * @brief Разбиение и сборка строк файла Lsetwatch
 *
 * Разделитель колонок `;`, конец записи CRLF, кавычки и escape-символы
 * на уровне строки не используются. Отсутствие `;` в значениях
 * обеспечивает экранирование на уровне колонок (escape_codec.hpp).
 */

#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace lsetwatch::io {

/// Разделитель колонок
constexpr char kColumnDelimiter = ';';

/// Конец записи
constexpr std::string_view kRecordTerminator = "\r\n";

/**
 * @brief Разбиение строки на колонки (без учёта кавычек)
 *
 * Строка из N разделителей всегда даёт N + 1 колонку.
 */
[[nodiscard]] std::vector<std::string> splitRecord(std::string_view line);

/**
 * @brief Сборка строки из колонок (без конца записи)
 *
 * @param fields Значения колонок
 * @param line Номер строки для сообщения об ошибке
 * @throws GrammarError Если значение содержит `;`, CR или LF
 */
[[nodiscard]] std::string joinRecord(const std::vector<std::string>& fields, size_t line);

/**
 * @brief Чтение одной строки (CRLF или LF, завершающий CR отбрасывается)
 * @return false, если поток исчерпан
 */
bool readRecordLine(std::istream& input, std::string& line);

} // namespace lsetwatch::io
