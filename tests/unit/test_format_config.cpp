/**
 * @file test_format_config.cpp
 * @brief Юнит-тесты файлов параметров формата
 */

#include <doctest/doctest.h>
#include "io/format_config.hpp"
#include <filesystem>
#include <fstream>

using namespace lsetwatch::io;

TEST_CASE("Format options from JSON") {
    auto options = formatOptionsFromJson(R"({
        "locale": "de_DE.utf8",
        "decimal_separator": ",",
        "date_format": "%d.%m.%Y"
    })");

    CHECK(options.locale == "de_DE.utf8");
    REQUIRE(options.decimal_separator.has_value());
    CHECK(*options.decimal_separator == ',');
    CHECK(options.date_format == "%d.%m.%Y");
}

TEST_CASE("Missing JSON keys keep defaults") {
    auto options = formatOptionsFromJson("{}");
    CHECK(options.locale.empty());
    CHECK_FALSE(options.decimal_separator.has_value());
    CHECK(options.date_format == "%d/%m/%Y");

    options = formatOptionsFromJson(R"({"decimal_separator": null})");
    CHECK_FALSE(options.decimal_separator.has_value());
}

TEST_CASE("Invalid JSON is reported as ConfigError") {
    CHECK_THROWS_AS((void)formatOptionsFromJson("{"), ConfigError);
    CHECK_THROWS_AS((void)formatOptionsFromJson("[]"), ConfigError);
    CHECK_THROWS_AS((void)formatOptionsFromJson(R"({"locale": 5})"), ConfigError);
    CHECK_THROWS_AS((void)formatOptionsFromJson(R"({"decimal_separator": ",."})"), ConfigError);
}

TEST_CASE("Format options JSON round trip") {
    FormatOptions options;
    options.locale = "fr_FR";
    options.decimal_separator = ',';
    options.date_format = "%Y-%m-%d";

    auto restored = formatOptionsFromJson(formatOptionsToJson(options));
    CHECK(restored.locale == options.locale);
    CHECK(restored.decimal_separator == options.decimal_separator);
    CHECK(restored.date_format == options.date_format);
}

TEST_CASE("Read and write options from a file") {
    auto path = std::filesystem::temp_directory_path() / "lsetwatch_format_config_test.json";

    FormatOptions format;
    format.locale = "de_DE.utf8";
    format.date_format = "%d.%m.%Y";
    saveFormatOptions(format, path);

    auto read_options = loadReadOptions(path);
    CHECK(read_options.format.locale == "de_DE.utf8");
    CHECK(read_options.format.date_format == "%d.%m.%Y");
    CHECK_FALSE(read_options.has_header.has_value());

    auto write_options = loadWriteOptions(path);
    CHECK(write_options.format.locale == "de_DE.utf8");
    CHECK(write_options.include_header);

    {
        std::ofstream ofs(path);
        ofs << R"({"has_header": false, "include_header": false})";
    }
    read_options = loadReadOptions(path);
    REQUIRE(read_options.has_header.has_value());
    CHECK_FALSE(*read_options.has_header);
    CHECK_FALSE(loadWriteOptions(path).include_header);

    std::filesystem::remove(path);
}

TEST_CASE("Missing options file is reported as ConfigError") {
    auto path = std::filesystem::temp_directory_path() / "lsetwatch_no_such_config.json";
    std::filesystem::remove(path);
    CHECK_THROWS_AS((void)loadReadOptions(path), ConfigError);
}
