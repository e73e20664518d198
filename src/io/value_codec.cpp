/**
 * @file value_codec.cpp
 * @brief Реализация преобразования текста колонок в значения
 */

#include "value_codec.hpp"
#include "text_utils.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

namespace lsetwatch::io {

namespace {

/**
 * @brief Чтение от min_digits до max_digits ASCII-цифр начиная с pos
 */
std::optional<int> readDigits(std::string_view text, size_t& pos,
                              size_t min_digits, size_t max_digits) {
    size_t count = 0;
    int value = 0;
    while (count < max_digits && pos < text.size() && isAsciiDigit(text[pos])) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
        ++count;
    }
    if (count < min_digits) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief CR и LF в виде последовательностей с кодом
 *
 * Перед цифрой код дополняется нулями до трёх знаков: "\a10" + "1"
 * читался бы как код 101.
 */
std::string escapeLineBreaks(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\r' && c != '\n') {
            result += c;
            continue;
        }
        bool digit_follows = i + 1 < text.size() && isAsciiDigit(text[i + 1]);
        result += kEscapeSentinel;
        result += digit_follows ? (c == '\r' ? "013" : "010") : (c == '\r' ? "13" : "10");
    }

    return result;
}

} // anonymous namespace

void validateDateFormat(std::string_view pattern) {
    bool has_day = false;
    bool has_month = false;
    bool has_year = false;

    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == ';' || c == '\r' || c == '\n') {
            throw std::invalid_argument("Шаблон даты содержит разделитель строки: " +
                                        std::string(pattern));
        }
        if (c != '%') {
            continue;
        }
        if (i + 1 >= pattern.size()) {
            throw std::invalid_argument("Шаблон даты оканчивается на '%': " + std::string(pattern));
        }
        switch (pattern[++i]) {
            case 'd': has_day = true; break;
            case 'm': has_month = true; break;
            case 'Y':
            case 'y': has_year = true; break;
            case '%': break;
            default:
                throw std::invalid_argument("Неподдерживаемая директива '%" +
                                            std::string(1, pattern[i]) +
                                            "' в шаблоне даты: " + std::string(pattern));
        }
    }

    if (!has_day || !has_month || !has_year) {
        throw std::invalid_argument("Шаблон даты должен содержать день, месяц и год: " +
                                    std::string(pattern));
    }
}

std::optional<long long> parseInteger(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }

    size_t start = (text.front() == '-') ? 1 : 0;
    if (start == text.size()) {
        return std::nullopt;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (!isAsciiDigit(text[i])) {
            return std::nullopt;
        }
    }

    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseDecimal(std::string_view text, char decimal_separator) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::string normalized;
    normalized.reserve(text.size());
    bool seen_separator = false;
    bool seen_digit = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '-' && i == 0) {
            normalized += c;
        } else if (isAsciiDigit(c)) {
            normalized += c;
            seen_digit = true;
        } else if (c == decimal_separator && !seen_separator) {
            normalized += '.';
            seen_separator = true;
        } else {
            return std::nullopt;
        }
    }

    if (!seen_digit) {
        return std::nullopt;
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(normalized.data(), normalized.data() + normalized.size(), value);
    if (ec != std::errc{} || ptr != normalized.data() + normalized.size()) {
        return std::nullopt;
    }
    return value;
}

std::string formatDecimal(double value, char decimal_separator) {
    if (!std::isfinite(value)) {
        throw ValueError("число не конечно");
    }

    // Запись в фиксированной форме без экспоненты занимает не более ~330 символов
    std::array<char, 512> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                   value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        throw ValueError("не удалось записать число");
    }

    std::string result(buffer.data(), ptr);
    if (decimal_separator != '.') {
        for (char& c : result) {
            if (c == '.') c = decimal_separator;
        }
    }
    return result;
}

std::optional<Date> parseDate(std::string_view text, std::string_view pattern) {
    std::optional<int> day;
    std::optional<int> month;
    std::optional<int> year;

    size_t pos = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char p = pattern[i];
        if (p != '%') {
            if (pos >= text.size() || text[pos] != p) {
                return std::nullopt;
            }
            ++pos;
            continue;
        }

        if (i + 1 >= pattern.size()) {
            return std::nullopt;
        }

        switch (pattern[++i]) {
            case 'd':
                day = readDigits(text, pos, 1, 2);
                if (!day) return std::nullopt;
                break;
            case 'm':
                month = readDigits(text, pos, 1, 2);
                if (!month) return std::nullopt;
                break;
            case 'Y':
                year = readDigits(text, pos, 1, 4);
                if (!year) return std::nullopt;
                break;
            case 'y': {
                auto yy = readDigits(text, pos, 1, 2);
                if (!yy) return std::nullopt;
                // POSIX: 69-99 -> 1969-1999, 00-68 -> 2000-2068
                year = (*yy >= 69) ? 1900 + *yy : 2000 + *yy;
                break;
            }
            case '%':
                if (pos >= text.size() || text[pos] != '%') {
                    return std::nullopt;
                }
                ++pos;
                break;
            default:
                return std::nullopt;
        }
    }

    if (pos != text.size() || !day || !month || !year) {
        return std::nullopt;
    }

    Date date{std::chrono::year{*year},
              std::chrono::month{static_cast<unsigned>(*month)},
              std::chrono::day{static_cast<unsigned>(*day)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string formatDate(const Date& date, std::string_view pattern) {
    std::ostringstream ss;
    ss << std::setfill('0');

    for (size_t i = 0; i < pattern.size(); ++i) {
        char p = pattern[i];
        if (p != '%' || i + 1 >= pattern.size()) {
            ss << p;
            continue;
        }

        switch (pattern[++i]) {
            case 'd': ss << std::setw(2) << static_cast<unsigned>(date.day()); break;
            case 'm': ss << std::setw(2) << static_cast<unsigned>(date.month()); break;
            case 'Y': ss << std::setw(4) << static_cast<int>(date.year()); break;
            case 'y': ss << std::setw(2) << (static_cast<int>(date.year()) % 100); break;
            case '%': ss << '%'; break;
            default: ss << '%' << pattern[i]; break;
        }
    }

    return ss.str();
}

// === Колонки ===

std::string decodeRequiredText(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        throw ValueError("обязательная колонка пуста");
    }
    return std::string(raw);
}

std::string encodeRequiredText(const std::string& value, const ValueFormat&) {
    if (value.empty()) {
        throw ValueError("обязательная колонка пуста");
    }
    return value;
}

std::optional<std::string> decodeEscapedText(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        return std::nullopt;
    }
    return unescapeText(raw);
}

std::string encodeEscapedText(const std::optional<std::string>& value, const ValueFormat&) {
    if (!value.has_value()) {
        return "";
    }
    return escapeLineBreaks(escapeText(*value));
}

namespace detail {

int parseIntColumn(std::string_view raw) {
    auto value = parseInteger(raw);
    if (!value.has_value()) {
        throw ValueError("ожидается целое число");
    }
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        throw ValueError("целое число вне допустимого диапазона");
    }
    return static_cast<int>(*value);
}

} // namespace detail

std::optional<int> decodeOptionalInt(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        return std::nullopt;
    }
    return detail::parseIntColumn(raw);
}

std::string encodeOptionalInt(const std::optional<int>& value, const ValueFormat&) {
    if (!value.has_value()) {
        return "";
    }
    return std::to_string(*value);
}

std::optional<double> decodeDecimal(std::string_view raw, const ValueFormat& format) {
    if (raw.empty()) {
        return std::nullopt;
    }
    auto value = parseDecimal(raw, format.decimal_separator);
    if (!value.has_value()) {
        throw ValueError(std::string("ожидается десятичное число с разделителем '") +
                         format.decimal_separator + "'");
    }
    return value;
}

std::string encodeDecimal(const std::optional<double>& value, const ValueFormat& format) {
    if (!value.has_value()) {
        return "";
    }
    return formatDecimal(*value, format.decimal_separator);
}

std::optional<Date> decodeDate(std::string_view raw, const ValueFormat& format) {
    if (raw.empty()) {
        return std::nullopt;
    }
    auto date = parseDate(raw, format.date_format);
    if (!date.has_value()) {
        throw ValueError("дата не соответствует шаблону " + format.date_format);
    }
    return date;
}

std::string encodeDate(const std::optional<Date>& value, const ValueFormat& format) {
    if (!value.has_value()) {
        return "";
    }
    if (!value->ok()) {
        throw ValueError("некорректная дата");
    }
    return formatDate(*value, format.date_format);
}

std::optional<bool> decodeFlag(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        return std::nullopt;
    }
    if (raw == "0") {
        return false;
    }
    if (raw == "1") {
        return true;
    }
    throw ValueError("ожидается 0 или 1");
}

std::string encodeFlag(const std::optional<bool>& value, const ValueFormat&) {
    if (!value.has_value()) {
        return "";
    }
    return *value ? "1" : "0";
}

StringList decodeStringList(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        return {};
    }
    return decodeList(raw);
}

std::string encodeStringList(const StringList& value, const ValueFormat&) {
    return encodeList(value);
}

Timestamp decodeTimestamp(std::string_view raw, const ValueFormat&) {
    if (raw.empty()) {
        throw ValueError("обязательная колонка пуста");
    }
    auto seconds = parseInteger(raw);
    if (!seconds.has_value()) {
        throw ValueError("ожидается число секунд UNIX-времени");
    }
    return Timestamp{std::chrono::seconds{*seconds}};
}

std::string encodeTimestamp(const Timestamp& value, const ValueFormat&) {
    return std::to_string(value.time_since_epoch().count());
}

} // namespace lsetwatch::io
