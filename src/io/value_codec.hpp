/**
 * @file value_codec.hpp
 * @brief Преобразование текста колонок в типизированные значения и обратно
 *
 * Пустая колонка означает отсутствие значения (или значение по
 * умолчанию для Defaulted). Некорректный непустой текст вызывает ValueError,
 * без подстановки значения по умолчанию.
 */

#pragma once

#include "model/lsetwatch_row.hpp"
#include "escape_codec.hpp"
#include "list_codec.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace lsetwatch::io {

using namespace lsetwatch::model;

/// Формат даты Lsetwatch по умолчанию (день/месяц/год)
constexpr const char* kDefaultDateFormat = "%d/%m/%Y";

/**
 * @brief Параметры представления чисел и дат
 */
struct ValueFormat {
    char decimal_separator = '.';                  ///< Десятичный разделитель
    std::string date_format = kDefaultDateFormat;  ///< Шаблон даты (%d %m %Y %y %%)
};

/**
 * @brief Значение не приводится к типу колонки
 */
class ValueError : public std::runtime_error {
public:
    explicit ValueError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Проверка шаблона даты
 * @throws std::invalid_argument Неизвестная директива или шаблон без дня/месяца/года
 */
void validateDateFormat(std::string_view pattern);

// === Примитивы ===

/**
 * @brief Строгий разбор целого (необязательный '-' и ASCII-цифры)
 */
[[nodiscard]] std::optional<long long> parseInteger(std::string_view text) noexcept;

/**
 * @brief Строгий разбор десятичного числа с заданным разделителем
 *
 * Допускается необязательный '-', цифры и не более одного разделителя.
 * Разделители групп разрядов не поддерживаются.
 */
[[nodiscard]] std::optional<double> parseDecimal(std::string_view text, char decimal_separator);

/**
 * @brief Кратчайшая запись числа, однозначно восстанавливающая значение
 * @throws ValueError Для NaN и бесконечности
 */
[[nodiscard]] std::string formatDecimal(double value, char decimal_separator);

/**
 * @brief Разбор даты по шаблону
 */
[[nodiscard]] std::optional<Date> parseDate(std::string_view text, std::string_view pattern);

/**
 * @brief Форматирование даты по шаблону
 */
[[nodiscard]] std::string formatDate(const Date& date, std::string_view pattern);

// === Колонки ===

[[nodiscard]] std::string decodeRequiredText(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeRequiredText(const std::string& value, const ValueFormat& format);

/**
 * @brief Необязательная строка с экранированием
 *
 * При записи CR и LF также заменяются последовательностями с кодом.
 */
[[nodiscard]] std::optional<std::string> decodeEscapedText(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeEscapedText(const std::optional<std::string>& value, const ValueFormat& format);

[[nodiscard]] std::optional<int> decodeOptionalInt(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeOptionalInt(const std::optional<int>& value, const ValueFormat& format);

[[nodiscard]] std::optional<double> decodeDecimal(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeDecimal(const std::optional<double>& value, const ValueFormat& format);

[[nodiscard]] std::optional<Date> decodeDate(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeDate(const std::optional<Date>& value, const ValueFormat& format);

[[nodiscard]] std::optional<bool> decodeFlag(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeFlag(const std::optional<bool>& value, const ValueFormat& format);

/**
 * @brief Список: пустая колонка даёт пустой список, иначе decodeList()
 */
[[nodiscard]] StringList decodeStringList(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeStringList(const StringList& value, const ValueFormat& format);

/**
 * @brief Секунды UNIX-времени (UTC), колонка обязательна
 */
[[nodiscard]] Timestamp decodeTimestamp(std::string_view raw, const ValueFormat& format);
[[nodiscard]] std::string encodeTimestamp(const Timestamp& value, const ValueFormat& format);

namespace detail {

[[nodiscard]] int parseIntColumn(std::string_view raw);

template <typename E>
[[nodiscard]] E parseEnumColumn(std::string_view raw) {
    auto code = parseInteger(raw);
    if (!code.has_value()) {
        throw ValueError("ожидается целый код " + std::string(EnumTraits<E>::name));
    }
    auto value = enumFromCode<E>(*code);
    if (!value.has_value()) {
        throw ValueError("код " + std::to_string(*code) + " вне допустимого набора " +
                         std::string(EnumTraits<E>::name));
    }
    return *value;
}

template <typename E>
[[nodiscard]] std::string formatEnumColumn(E value) {
    int code = enumCode(value);
    if (code < 0) {
        throw ValueError("значение вне таблицы кодов " + std::string(EnumTraits<E>::name));
    }
    return std::to_string(code);
}

} // namespace detail

template <typename E>
[[nodiscard]] std::optional<E> decodeOptionalEnum(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        return std::nullopt;
    }
    return detail::parseEnumColumn<E>(raw);
}

template <typename E>
[[nodiscard]] std::string encodeOptionalEnum(const std::optional<E>& value, const ValueFormat&) {
    if (!value.has_value()) {
        return "";
    }
    return detail::formatEnumColumn(*value);
}

/**
 * @brief Колонка со значением по умолчанию (целое или перечисление)
 */
template <typename D>
[[nodiscard]] D decodeDefaulted(std::string_view raw, const ValueFormat&) {
    using T = typename D::value_type;
    if (raw.empty()) {
        return D::absent();
    }
    if constexpr (std::is_enum_v<T>) {
        return D{detail::parseEnumColumn<T>(raw)};
    } else {
        return D{static_cast<T>(detail::parseIntColumn(raw))};
    }
}

template <typename D>
[[nodiscard]] std::string encodeDefaulted(const D& value, const ValueFormat&) {
    using T = typename D::value_type;
    if (!value.isExplicit()) {
        return "";
    }
    if constexpr (std::is_enum_v<T>) {
        return detail::formatEnumColumn(value.value());
    } else {
        return std::to_string(value.value());
    }
}

} // namespace lsetwatch::io
