/**
 * @file lsetwatch_writer.hpp
 * @brief Запись файлов импорта Lsetwatch
 *
 * Колонки всегда записываются в стандартном порядке, каждая запись
 * завершается CRLF.
 */

#pragma once

#include "model/lsetwatch_row.hpp"
#include "format_options.hpp"
#include "lsetwatch_errors.hpp"
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace lsetwatch::io {

using namespace lsetwatch::model;

/**
 * @brief Последовательная запись записей в поток
 *
 * Поток не принадлежит писателю и должен жить дольше него.
 */
class LsetwatchWriter {
public:
    /**
     * @brief Создание писателя; заголовок записывается сразу
     *
     * @throws StreamError Ошибка потока
     * @throws std::invalid_argument Некорректные параметры формата
     */
    explicit LsetwatchWriter(std::ostream& output, const WriteOptions& options = {});

    LsetwatchWriter(const LsetwatchWriter&) = delete;
    LsetwatchWriter& operator=(const LsetwatchWriter&) = delete;

    /**
     * @brief Запись одной строки
     *
     * @throws CoercionError Обязательное поле пусто или значение не записывается
     * @throws GrammarError Значение содержит разделитель или перевод строки
     * @throws StreamError Ошибка потока
     */
    void write(const LsetwatchRow& row);

    /// Число записанных строк файла (включая заголовок)
    [[nodiscard]] size_t lineNumber() const noexcept { return line_; }

private:
    void writeLine(const std::vector<std::string>& fields);

    std::ostream& output_;
    ValueFormat format_;
    size_t line_ = 0;
};

/**
 * @brief Запись последовательности записей
 *
 * @param output Поток для записи
 * @param rows Записи в порядке записи
 * @param options Опции записи
 * @throws FormatError Первая ошибка с номером строки
 * @throws StreamError Ошибка потока
 */
void writeLsetwatch(std::ostream& output,
                    std::span<const LsetwatchRow> rows,
                    const WriteOptions& options = {});

} // namespace lsetwatch::io
