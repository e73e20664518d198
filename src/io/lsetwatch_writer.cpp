/**
 * @file lsetwatch_writer.cpp
 * @brief Реализация записи файлов импорта Lsetwatch
 */

#include "lsetwatch_writer.hpp"
#include "row_grammar.hpp"
#include "row_schema.hpp"

namespace lsetwatch::io {

LsetwatchWriter::LsetwatchWriter(std::ostream& output, const WriteOptions& options)
    : output_(output)
    , format_(resolveValueFormat(options.format)) {

    if (options.include_header) {
        writeLine(headerNames());
    }
}

void LsetwatchWriter::write(const LsetwatchRow& row) {
    auto raw = encodeRow(row, format_, line_ + 1);
    writeLine(std::vector<std::string>(raw.begin(), raw.end()));
}

void LsetwatchWriter::writeLine(const std::vector<std::string>& fields) {
    auto line = joinRecord(fields, line_ + 1);

    output_ << line << kRecordTerminator;
    if (!output_) {
        throw StreamError("Ошибка записи строки " + std::to_string(line_ + 1));
    }
    ++line_;
}

void writeLsetwatch(std::ostream& output,
                    std::span<const LsetwatchRow> rows,
                    const WriteOptions& options) {
    LsetwatchWriter writer(output, options);
    for (const auto& row : rows) {
        writer.write(row);
    }
    output.flush();
    if (!output) {
        throw StreamError("Ошибка записи потока");
    }
}

} // namespace lsetwatch::io
