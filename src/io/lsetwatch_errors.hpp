/**
 * @file lsetwatch_errors.hpp
 * @brief Ошибки чтения и записи файлов Lsetwatch
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace lsetwatch::io {

/**
 * @brief Ошибка формата с номером строки файла
 */
class FormatError : public std::runtime_error {
public:
    FormatError(const std::string& message, size_t line = 0)
        : std::runtime_error(message)
        , line_(line) {}

    /// Номер строки файла (с 1), 0 если строка неизвестна
    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/**
 * @brief Строка не разбивается на ожидаемые колонки
 *
 * Также используется для некорректного заголовка и для поля,
 * которое при записи содержало бы разделитель или перевод строки.
 */
class GrammarError : public FormatError {
public:
    GrammarError(const std::string& message, size_t line = 0)
        : FormatError("Строка " + std::to_string(line) + ": " + message, line) {}
};

/**
 * @brief Значение колонки не приводится к типу колонки
 */
class CoercionError : public FormatError {
public:
    CoercionError(const std::string& reason,
                  size_t line,
                  std::string column,
                  std::string raw_value)
        : FormatError("Строка " + std::to_string(line) + ", колонка " + column +
                      ": некорректное значение \"" + raw_value + "\" (" + reason + ")",
                      line)
        , column_(std::move(column))
        , raw_value_(std::move(raw_value)) {}

    /// Имя колонки
    [[nodiscard]] const std::string& column() const noexcept { return column_; }

    /// Исходный текст колонки
    [[nodiscard]] const std::string& rawValue() const noexcept { return raw_value_; }

private:
    std::string column_;
    std::string raw_value_;
};

/**
 * @brief Ошибка потока ввода-вывода
 */
class StreamError : public std::runtime_error {
public:
    explicit StreamError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace lsetwatch::io
