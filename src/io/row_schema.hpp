/**
 * @file row_schema.hpp
 * @brief Описание колонок файла Lsetwatch
 *
 * Статическая упорядоченная таблица колонок: имя, тип, значение по
 * умолчанию и функции чтения/записи. Используется и при чтении, и при записи.
 * Порядок колонок совпадает с заголовком, который выгружает Lsetwatch.
 */

#pragma once

#include "model/lsetwatch_row.hpp"
#include "value_codec.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsetwatch::io {

using namespace lsetwatch::model;

/// Число колонок файла
constexpr size_t kColumnCount = 42;

/**
 * @brief Тип значения колонки
 */
enum class ColumnKind {
    RequiredText,   ///< Обязательная строка без экранирования
    EscapedText,    ///< Необязательная строка с экранированием
    Integer,        ///< Целое число
    Decimal,        ///< Десятичное число (разделитель по локали)
    Enumeration,    ///< Код закрытого перечисления
    Date,           ///< Дата по шаблону
    Flag,           ///< 0/1
    List,           ///< Список через `|`
    Timestamp       ///< Секунды UNIX-времени
};

/**
 * @brief Описание одной колонки
 */
struct ColumnDescriptor {
    std::string_view name;          ///< Имя колонки в заголовке
    ColumnKind kind;                ///< Тип значения
    bool required;                  ///< Пустое значение недопустимо
    std::string_view default_text;  ///< Запись значения по умолчанию ("" если отсутствует)

    /// Чтение текста колонки в поле записи
    /// @throws ValueError Некорректный текст
    void (*decode)(std::string_view raw, const ValueFormat& format, LsetwatchRow& row);

    /// Запись поля в текст колонки
    /// @throws ValueError Значение не может быть записано
    std::string (*encode)(const LsetwatchRow& row, const ValueFormat& format);
};

/// Текст колонок одной строки в каноническом порядке
using RawRecord = std::array<std::string, kColumnCount>;

/**
 * @brief Таблица колонок в каноническом порядке
 */
[[nodiscard]] const std::array<ColumnDescriptor, kColumnCount>& rowSchema() noexcept;

/**
 * @brief Позиция колонки по имени
 */
[[nodiscard]] std::optional<size_t> findColumn(std::string_view name) noexcept;

/**
 * @brief Имена колонок в каноническом порядке
 */
[[nodiscard]] std::vector<std::string> headerNames();

/**
 * @brief Разбор колонок одной строки
 *
 * @param raw Текст колонок в каноническом порядке
 * @param format Формат чисел и дат
 * @param line Номер строки файла (для ошибки)
 * @throws CoercionError Первая колонка, которая не приводится к своему типу
 */
[[nodiscard]] LsetwatchRow decodeRow(const RawRecord& raw, const ValueFormat& format, size_t line);

/**
 * @brief Запись полей в текст колонок
 * @throws CoercionError Обязательное поле пусто или значение не может быть записано
 */
[[nodiscard]] RawRecord encodeRow(const LsetwatchRow& row, const ValueFormat& format, size_t line);

} // namespace lsetwatch::io
