/**
 * @file list_codec.cpp
 * @brief Реализация кодирования списков строк
 */

#include "list_codec.hpp"

namespace lsetwatch::io {

std::string encodeList(const StringList& items) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result += kListSeparator;
        }
        result += items[i];
    }
    return result;
}

StringList decodeList(std::string_view text) {
    StringList items;

    size_t start = 0;
    while (true) {
        size_t pos = text.find(kListSeparator, start);
        if (pos == std::string_view::npos) {
            items.emplace_back(text.substr(start));
            break;
        }
        items.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }

    return items;
}

} // namespace lsetwatch::io
