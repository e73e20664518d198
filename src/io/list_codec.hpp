/**
 * @file list_codec.hpp
 * @brief Кодирование списков строк в одно поле через `|`
 */

#pragma once

#include "model/lsetwatch_row.hpp"
#include <string>
#include <string_view>

namespace lsetwatch::io {

using namespace lsetwatch::model;

/// Разделитель элементов списка
constexpr char kListSeparator = '|';

/**
 * @brief Объединение элементов через `|`
 *
 * Элементы не экранируются: `|` внутри элемента неотличим от
 * разделителя, и такой список не восстанавливается при чтении
 * (так же ведёт себя сам Lsetwatch). Пустой список даёт пустую строку.
 */
[[nodiscard]] std::string encodeList(const StringList& items);

/**
 * @brief Разбиение поля по `|`
 *
 * Пустая строка даёт список из одного пустого элемента, а не пустой список.
 */
[[nodiscard]] StringList decodeList(std::string_view text);

} // namespace lsetwatch::io
