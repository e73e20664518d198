/**
 * @file lsetwatch_reader.cpp
 * @brief Реализация чтения файлов экспорта Lsetwatch
 */

#include "lsetwatch_reader.hpp"
#include "row_grammar.hpp"
#include "row_schema.hpp"
#include "text_utils.hpp"
#include <algorithm>

namespace lsetwatch::io {

namespace {

std::string normalizeHeaderToken(std::string_view token) {
    return asciiToLower(trimAscii(token));
}

bool looksLikeHeader(const std::vector<std::string>& tokens) {
    return std::all_of(tokens.begin(), tokens.end(), [](const std::string& token) {
        return findColumn(normalizeHeaderToken(token)).has_value();
    });
}

} // anonymous namespace

// === Итератор ===

LsetwatchReader::Iterator::Iterator(LsetwatchReader* reader)
    : reader_(reader) {
    ++*this;
}

LsetwatchReader::Iterator& LsetwatchReader::Iterator::operator++() {
    current_ = reader_->next();
    if (!current_.has_value()) {
        reader_ = nullptr;
    }
    return *this;
}

// === Читатель ===

LsetwatchReader::LsetwatchReader(std::istream& input, const ReadOptions& options)
    : input_(input)
    , format_(resolveValueFormat(options.format)) {

    std::string first;
    if (!readNonBlankLine(first)) {
        return;
    }
    first = std::string(stripUtf8Bom(first));

    auto tokens = splitRecord(first);
    has_header_ = options.has_header.value_or(looksLikeHeader(tokens));

    if (!options.has_header.has_value()) {
        diagnostics_.push_back(has_header_
            ? "Строка " + std::to_string(line_) + ": заголовок определён автоматически"
            : "Строка " + std::to_string(line_) + ": заголовок не найден, используется стандартный порядок колонок");
    }

    if (has_header_) {
        processHeader(tokens);
    } else {
        positions_.resize(kColumnCount);
        for (size_t i = 0; i < kColumnCount; ++i) {
            positions_[i] = i;
        }
        pending_line_ = std::move(first);
    }
}

bool LsetwatchReader::readNonBlankLine(std::string& line) {
    while (readRecordLine(input_, line)) {
        ++line_;
        if (!trimAscii(line).empty()) {
            return true;
        }
    }

    if (input_.bad()) {
        throw StreamError("Ошибка чтения потока после строки " + std::to_string(line_));
    }
    return false;
}

void LsetwatchReader::processHeader(const std::vector<std::string>& tokens) {
    const auto& schema = rowSchema();
    std::vector<bool> seen(kColumnCount, false);

    positions_.reserve(tokens.size());
    for (const auto& token : tokens) {
        auto name = normalizeHeaderToken(token);
        auto index = findColumn(name);
        if (!index.has_value()) {
            throw GrammarError("неизвестная колонка заголовка \"" + std::string(trimAscii(token)) + "\"",
                               line_);
        }
        if (seen[*index]) {
            throw GrammarError("повторяющаяся колонка заголовка \"" + name + "\"", line_);
        }
        seen[*index] = true;
        positions_.push_back(*index);
    }

    std::vector<std::string> missing;
    for (size_t i = 0; i < kColumnCount; ++i) {
        if (seen[i]) {
            continue;
        }
        if (schema[i].required) {
            throw GrammarError("в заголовке нет обязательной колонки \"" +
                               std::string(schema[i].name) + "\"", line_);
        }
        missing.emplace_back(schema[i].name);
    }

    if (!missing.empty()) {
        std::string list;
        for (const auto& name : missing) {
            if (!list.empty()) list += ", ";
            list += name;
        }
        diagnostics_.push_back("Строка " + std::to_string(line_) +
                               ": отсутствуют колонки (читаются как пустые): " + list);
    }

    if (!std::is_sorted(positions_.begin(), positions_.end())) {
        diagnostics_.push_back("Строка " + std::to_string(line_) +
                               ": порядок колонок отличается от стандартного");
    }
}

std::optional<LsetwatchRow> LsetwatchReader::next() {
    std::string line;
    if (pending_line_.has_value()) {
        line = std::move(*pending_line_);
        pending_line_.reset();
    } else if (!readNonBlankLine(line)) {
        return std::nullopt;
    }

    auto fields = splitRecord(line);
    if (fields.size() != positions_.size()) {
        throw GrammarError("ожидается колонок: " + std::to_string(positions_.size()) +
                           ", получено: " + std::to_string(fields.size()), line_);
    }

    RawRecord raw;
    for (size_t i = 0; i < fields.size(); ++i) {
        raw[positions_[i]] = std::move(fields[i]);
    }

    return decodeRow(raw, format_, line_);
}

std::vector<std::string> LsetwatchReader::columns() const {
    const auto& schema = rowSchema();
    std::vector<std::string> names;
    names.reserve(positions_.size());
    for (size_t index : positions_) {
        names.emplace_back(schema[index].name);
    }
    return names;
}

RowList readLsetwatch(std::istream& input, const ReadOptions& options) {
    LsetwatchReader reader(input, options);

    RowList rows;
    while (auto row = reader.next()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

} // namespace lsetwatch::io
