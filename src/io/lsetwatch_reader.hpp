/**
 * @file lsetwatch_reader.hpp
 * @brief Чтение файлов экспорта Lsetwatch
 *
 * Строки читаются по одной по мере запроса. Заголовок (если есть)
 * задаёт соответствие колонок файла колонкам таблицы, порядок колонок
 * во входном файле может быть любым.
 *
 * Пример:
 * @code
 * std::ifstream file("sets.csv", std::ios::binary);
 * LsetwatchReader reader(file, {.format = {.locale = "de_DE"}});
 * for (const auto& row : reader) {
 *     std::cout << row.number << '-' << row.version << '\n';
 * }
 * @endcode
 */

#pragma once

#include "model/lsetwatch_row.hpp"
#include "format_options.hpp"
#include "lsetwatch_errors.hpp"
#include <cstddef>
#include <istream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace lsetwatch::io {

using namespace lsetwatch::model;

/**
 * @brief Последовательное чтение записей из потока
 *
 * Поток не принадлежит читателю и должен жить дольше него.
 * Последовательность однопроходная: после исчерпания повторно не читается.
 */
class LsetwatchReader {
public:
    /**
     * @brief Входной итератор по записям
     */
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = LsetwatchRow;
        using difference_type = std::ptrdiff_t;
        using pointer = const LsetwatchRow*;
        using reference = const LsetwatchRow&;

        Iterator() = default;
        explicit Iterator(LsetwatchReader* reader);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& a, const Iterator& b) noexcept {
            return a.reader_ == b.reader_;
        }

    private:
        LsetwatchReader* reader_ = nullptr;
        std::optional<LsetwatchRow> current_;
    };

    /**
     * @brief Создание читателя и разбор заголовка
     *
     * @param input Поток с содержимым файла
     * @param options Опции чтения
     * @throws GrammarError Некорректный заголовок
     * @throws StreamError Ошибка потока
     * @throws std::invalid_argument Некорректные параметры формата
     */
    explicit LsetwatchReader(std::istream& input, const ReadOptions& options = {});

    LsetwatchReader(const LsetwatchReader&) = delete;
    LsetwatchReader& operator=(const LsetwatchReader&) = delete;

    /**
     * @brief Следующая запись
     *
     * @return Запись или nullopt, если поток исчерпан
     * @throws GrammarError Неверное число колонок
     * @throws CoercionError Значение колонки не приводится к типу
     * @throws StreamError Ошибка потока
     */
    [[nodiscard]] std::optional<LsetwatchRow> next();

    /// Номер последней прочитанной строки файла (с 1)
    [[nodiscard]] size_t lineNumber() const noexcept { return line_; }

    /// Файл содержит заголовок
    [[nodiscard]] bool hasHeader() const noexcept { return has_header_; }

    /// Имена колонок в порядке файла
    [[nodiscard]] std::vector<std::string> columns() const;

    /// Замечания о структуре файла (порядок колонок, отсутствующие колонки)
    [[nodiscard]] const std::vector<std::string>& diagnostics() const noexcept {
        return diagnostics_;
    }

    [[nodiscard]] Iterator begin() { return Iterator(this); }
    [[nodiscard]] Iterator end() noexcept { return Iterator(); }

private:
    bool readNonBlankLine(std::string& line);
    void processHeader(const std::vector<std::string>& tokens);

    std::istream& input_;
    ValueFormat format_;
    std::vector<size_t> positions_;           ///< Колонка файла -> индекс в таблице колонок
    std::optional<std::string> pending_line_; ///< Первая строка данных без заголовка
    std::vector<std::string> diagnostics_;
    size_t line_ = 0;
    bool has_header_ = false;
};

/**
 * @brief Чтение всех записей потока
 *
 * @param input Поток с содержимым файла
 * @param options Опции чтения
 * @return Записи в порядке файла
 * @throws FormatError Первая ошибка разбора с номером строки
 * @throws StreamError Ошибка потока
 */
[[nodiscard]] RowList readLsetwatch(std::istream& input, const ReadOptions& options = {});

} // namespace lsetwatch::io
