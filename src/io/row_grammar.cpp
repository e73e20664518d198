/**
 * @file row_grammar.cpp
 * @brief Реализация разбиения и сборки строк файла Lsetwatch
 */

#include "row_grammar.hpp"
#include "lsetwatch_errors.hpp"

namespace lsetwatch::io {

std::vector<std::string> splitRecord(std::string_view line) {
    std::vector<std::string> result;

    size_t start = 0;
    while (true) {
        size_t pos = line.find(kColumnDelimiter, start);
        if (pos == std::string_view::npos) {
            result.emplace_back(line.substr(start));
            break;
        }
        result.emplace_back(line.substr(start, pos - start));
        start = pos + 1;
    }

    return result;
}

std::string joinRecord(const std::vector<std::string>& fields, size_t line) {
    std::string result;

    for (size_t i = 0; i < fields.size(); ++i) {
        const auto& field = fields[i];
        if (field.find_first_of(";\r\n") != std::string::npos) {
            throw GrammarError("значение колонки " + std::to_string(i + 1) +
                               " содержит разделитель или перевод строки", line);
        }
        if (i > 0) {
            result += kColumnDelimiter;
        }
        result += field;
    }

    return result;
}

bool readRecordLine(std::istream& input, std::string& line) {
    if (!std::getline(input, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

} // namespace lsetwatch::io
