/**
 * @file test_value_codec.cpp
 * @brief Юнит-тесты преобразования значений колонок
 */

#include <doctest/doctest.h>
#include "io/value_codec.hpp"
#include <chrono>
#include <limits>
#include <stdexcept>

using namespace lsetwatch::io;
using namespace std::chrono;

namespace {

const ValueFormat kPeriod{'.', "%d/%m/%Y"};
const ValueFormat kComma{',', "%d.%m.%Y"};

} // namespace

TEST_CASE("Integer parsing is strict") {
    CHECK(parseInteger("100") == 100);
    CHECK(parseInteger("-7") == -7);
    CHECK(parseInteger("0") == 0);

    CHECK_FALSE(parseInteger("").has_value());
    CHECK_FALSE(parseInteger("-").has_value());
    CHECK_FALSE(parseInteger("+1").has_value());
    CHECK_FALSE(parseInteger(" 1").has_value());
    CHECK_FALSE(parseInteger("1.0").has_value());
    CHECK_FALSE(parseInteger("99999999999999999999").has_value());
}

TEST_CASE("Decimal parsing follows the configured separator") {
    CHECK(parseDecimal("1,1", ',').value() == doctest::Approx(1.1));
    CHECK(parseDecimal("1.1", '.').value() == doctest::Approx(1.1));
    CHECK(parseDecimal("437,71", ',').value() == doctest::Approx(437.71));
    CHECK(parseDecimal("-0.5", '.').value() == doctest::Approx(-0.5));
    CHECK(parseDecimal("10", '.').value() == doctest::Approx(10.0));

    // Другой разделитель не является разделителем групп
    CHECK_FALSE(parseDecimal("1,1", '.').has_value());
    CHECK_FALSE(parseDecimal("1.1", ',').has_value());
    CHECK_FALSE(parseDecimal("1.000,5", ',').has_value());

    CHECK_FALSE(parseDecimal("", '.').has_value());
    CHECK_FALSE(parseDecimal("-", '.').has_value());
    CHECK_FALSE(parseDecimal("1.2.3", '.').has_value());
    CHECK_FALSE(parseDecimal("1e5", '.').has_value());
    CHECK_FALSE(parseDecimal("nan", '.').has_value());
}

TEST_CASE("Decimal formatting uses the shortest fixed notation") {
    CHECK(formatDecimal(10.0, '.') == "10");
    CHECK(formatDecimal(4.5, '.') == "4.5");
    CHECK(formatDecimal(216.3538, '.') == "216.3538");
    CHECK(formatDecimal(437.71, '.') == "437.71");
    CHECK(formatDecimal(437.71, ',') == "437,71");
    CHECK(formatDecimal(-0.9, ',') == "-0,9");
    CHECK(formatDecimal(1e20, '.') == "100000000000000000000");

    CHECK_THROWS_AS((void)formatDecimal(std::numeric_limits<double>::infinity(), '.'), ValueError);
    CHECK_THROWS_AS((void)formatDecimal(std::numeric_limits<double>::quiet_NaN(), '.'), ValueError);
}

TEST_CASE("Date parsing by pattern") {
    CHECK(parseDate("06/06/2023", "%d/%m/%Y") == year{2023} / June / day{6});
    CHECK(parseDate("06.06.2023", "%d.%m.%Y") == year{2023} / June / day{6});
    CHECK(parseDate("2023-12-30", "%Y-%m-%d") == year{2023} / December / day{30});
    CHECK(parseDate("6/6/2023", "%d/%m/%Y") == year{2023} / June / day{6});
    CHECK(parseDate("08/12/23", "%d/%m/%y") == year{2023} / December / day{8});
    CHECK(parseDate("08/12/75", "%d/%m/%y") == year{1975} / December / day{8});

    CHECK_FALSE(parseDate("06.06.2023", "%d/%m/%Y").has_value());
    CHECK_FALSE(parseDate("31/02/2023", "%d/%m/%Y").has_value());
    CHECK_FALSE(parseDate("06/06/2023x", "%d/%m/%Y").has_value());
    CHECK_FALSE(parseDate("06/06", "%d/%m/%Y").has_value());
}

TEST_CASE("Date formatting by pattern") {
    CHECK(formatDate(year{2020} / January / day{1}, "%d/%m/%Y") == "01/01/2020");
    CHECK(formatDate(year{2023} / June / day{1}, "%d.%m.%Y") == "01.06.2023");
    CHECK(formatDate(year{2022} / March / day{10}, "%Y-%m-%d") == "2022-03-10");
    CHECK(formatDate(year{2005} / March / day{10}, "%d/%m/%y") == "10/03/05");
    CHECK(formatDate(year{2005} / March / day{10}, "%d%%%m%%%Y") == "10%03%2005");
}

TEST_CASE("Date pattern validation") {
    CHECK_NOTHROW(validateDateFormat("%d/%m/%Y"));
    CHECK_NOTHROW(validateDateFormat("%Y-%m-%d"));
    CHECK_NOTHROW(validateDateFormat("%d.%m.%y"));

    CHECK_THROWS_AS(validateDateFormat("%d/%m"), std::invalid_argument);
    CHECK_THROWS_AS(validateDateFormat("%d/%m/%Y %H"), std::invalid_argument);
    CHECK_THROWS_AS(validateDateFormat("%d;%m;%Y"), std::invalid_argument);
    CHECK_THROWS_AS(validateDateFormat("%d/%m/%Y%"), std::invalid_argument);
}

TEST_CASE("Empty column decodes to absence") {
    CHECK_FALSE(decodeEscapedText("", kPeriod).has_value());
    CHECK_FALSE(decodeOptionalInt("", kPeriod).has_value());
    CHECK_FALSE(decodeDecimal("", kPeriod).has_value());
    CHECK_FALSE(decodeDate("", kPeriod).has_value());
    CHECK_FALSE(decodeFlag("", kPeriod).has_value());
    CHECK_FALSE(decodeOptionalEnum<SetState>("", kPeriod).has_value());
    CHECK(decodeStringList("", kPeriod).empty());
}

TEST_CASE("Same decimal text depends on the separator") {
    CHECK(decodeDecimal("1,1", kComma).value() == doctest::Approx(1.1));
    CHECK_THROWS_AS((void)decodeDecimal("1,1", kPeriod), ValueError);
}

TEST_CASE("Date column is independent of the decimal separator") {
    ValueFormat comma_slash{',', "%d/%m/%Y"};
    CHECK(decodeDate("06/06/2023", kPeriod) == year{2023} / June / day{6});
    CHECK(decodeDate("06/06/2023", comma_slash) == year{2023} / June / day{6});
    CHECK_THROWS_AS((void)decodeDate("2023-06-06", kPeriod), ValueError);
}

TEST_CASE("Required text rejects empty value") {
    CHECK(decodeRequiredText("3178", kPeriod) == "3178");
    CHECK_THROWS_AS((void)decodeRequiredText("", kPeriod), ValueError);
    CHECK_THROWS_AS((void)encodeRequiredText("", kPeriod), ValueError);
}

TEST_CASE("Escaped text column") {
    CHECK(decodeEscapedText("category with semicolon \a59", kPeriod) == "category with semicolon ;");
    CHECK(encodeEscapedText(std::string("note with \";\""), kPeriod) == "note with \a34\a59\a34");
    CHECK(encodeEscapedText(std::nullopt, kPeriod).empty());
}

TEST_CASE("Flag column accepts only 0 and 1") {
    CHECK(decodeFlag("1", kPeriod) == true);
    CHECK(decodeFlag("0", kPeriod) == false);
    CHECK_THROWS_AS((void)decodeFlag("2", kPeriod), ValueError);
    CHECK_THROWS_AS((void)decodeFlag("true", kPeriod), ValueError);

    CHECK(encodeFlag(true, kPeriod) == "1");
    CHECK(encodeFlag(false, kPeriod) == "0");
}

TEST_CASE("Enumeration column rejects codes outside the closed set") {
    CHECK(decodeOptionalEnum<SetState>("2", kPeriod) == SetState::Opened);
    CHECK(decodeOptionalEnum<SetState>("12", kPeriod) == SetState::Lost);
    CHECK_THROWS_AS((void)decodeOptionalEnum<SetState>("13", kPeriod), ValueError);
    CHECK_THROWS_AS((void)decodeOptionalEnum<SetState>("-1", kPeriod), ValueError);
    CHECK_THROWS_AS((void)decodeOptionalEnum<CashbackType>("3", kPeriod), ValueError);
    CHECK_THROWS_AS((void)decodeOptionalEnum<ItemCondition>("x", kPeriod), ValueError);

    CHECK(encodeOptionalEnum<ItemCondition>(ItemCondition::UsedComplete, kPeriod) == "4");
}

TEST_CASE("Defaulted column remembers an empty column") {
    using ItemCount = Defaulted<int, 1>;
    using Template = Defaulted<SetTemplate, SetTemplate::FreeConfiguration>;

    auto items = decodeDefaulted<ItemCount>("", kPeriod);
    CHECK(items.value() == 1);
    CHECK_FALSE(items.isExplicit());
    CHECK(encodeDefaulted(items, kPeriod).empty());

    auto explicit_items = decodeDefaulted<ItemCount>("2", kPeriod);
    CHECK(explicit_items == 2);
    CHECK(encodeDefaulted(explicit_items, kPeriod) == "2");

    // Значение по умолчанию, заданное явно, записывается
    CHECK(encodeDefaulted(ItemCount{}, kPeriod) == "1");
    CHECK(items == ItemCount{});

    auto tmpl = decodeDefaulted<Template>("", kPeriod);
    CHECK(tmpl == SetTemplate::FreeConfiguration);
    CHECK(encodeDefaulted(Template{}, kPeriod) == "0");
    CHECK(decodeDefaulted<Template>("3", kPeriod) == SetTemplate::Sold);
    CHECK_THROWS_AS((void)decodeDefaulted<Template>("6", kPeriod), ValueError);
}

TEST_CASE("Timestamp column is whole UTC seconds") {
    auto ts = decodeTimestamp("1702112924", kPeriod);
    CHECK(ts.time_since_epoch().count() == 1702112924);
    CHECK(year_month_day{floor<days>(ts)} == year{2023} / December / day{9});
    CHECK(encodeTimestamp(ts, kPeriod) == "1702112924");

    CHECK_THROWS_AS((void)decodeTimestamp("", kPeriod), ValueError);
    CHECK_THROWS_AS((void)decodeTimestamp("1702112924.5", kPeriod), ValueError);
}

TEST_CASE("Enumeration tables map codes both ways") {
    CHECK(enumFromCode<SetTemplate>(3) == SetTemplate::Sold);
    CHECK_FALSE(enumFromCode<SetTemplate>(6).has_value());
    CHECK(enumCode(AccessoryStatus::Incomplete) == 5);
    CHECK(enumCode(CashbackType::PaybackPoints) == 2);
    CHECK(enumLabel(SetState::Opened) == "opened");
    CHECK(enumLabel(ItemCondition::UsedComplete) == "used, complete");
}

TEST_CASE("Escaped text column writes line breaks with the sentinel") {
    CHECK(encodeEscapedText(std::string("a\nb"), kPeriod) == "a\a10b");
    CHECK(encodeEscapedText(std::string("a\r\nb"), kPeriod) == "a\a13\a10b");
    CHECK(encodeEscapedText(std::string("a\n1"), kPeriod) == "a\a0101");
    CHECK(decodeEscapedText("a\a0101", kPeriod) == "a\n1");
    CHECK(decodeEscapedText("a\a13\a10b", kPeriod) == "a\r\nb");

    // Экранирование самого кодека остаётся прежним
    CHECK(escapeText("a\nb") == "a\nb");
}
