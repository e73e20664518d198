/**
 * @file format_options.cpp
 * @brief Разрешение параметров представления чисел и дат
 */

#include "format_options.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace lsetwatch::io {

namespace {

// Языки, в которых десятичный разделитель запятая
constexpr std::array<std::string_view, 38> kCommaLanguages = {
    "be", "bg", "bs", "ca", "cs", "da", "de", "el", "es", "et",
    "eu", "fi", "fo", "fr", "gl", "hr", "hu", "id", "is", "it",
    "ka", "kk", "lt", "lv", "mk", "nb", "nl", "nn", "no", "pl",
    "pt", "ro", "ru", "sk", "sl", "sr", "sv", "tr"
};

// Регионы, где при "запятой" языка используется точка
constexpr std::array<std::string_view, 5> kPeriodRegions = {
    "de_ch", "de_li", "it_ch", "es_mx", "es_us"
};

} // anonymous namespace

char decimalSeparatorForLocale(std::string_view locale) {
    // Отбрасываем кодировку и модификатор: de_DE.UTF-8@euro -> de_DE
    auto name = trimAscii(locale);
    name = name.substr(0, name.find_first_of(".@"));

    std::string normalized = asciiToLower(name);
    std::replace(normalized.begin(), normalized.end(), '-', '_');

    if (normalized.empty() || normalized == "c" || normalized == "posix") {
        return '.';
    }

    if (std::find(kPeriodRegions.begin(), kPeriodRegions.end(), normalized) != kPeriodRegions.end()) {
        return '.';
    }

    std::string_view language = std::string_view(normalized).substr(0, normalized.find('_'));
    if (std::find(kCommaLanguages.begin(), kCommaLanguages.end(), language) != kCommaLanguages.end()) {
        return ',';
    }

    return '.';
}

ValueFormat resolveValueFormat(const FormatOptions& options) {
    ValueFormat format;
    format.decimal_separator = options.decimal_separator.value_or(
        decimalSeparatorForLocale(options.locale));
    format.date_format = options.date_format;

    const char sep = format.decimal_separator;
    if (sep == ';' || sep == '-' || isAsciiDigit(sep) || sep == '\r' || sep == '\n') {
        throw std::invalid_argument(std::string("Недопустимый десятичный разделитель: '") + sep + "'");
    }
    validateDateFormat(format.date_format);

    return format;
}

} // namespace lsetwatch::io
