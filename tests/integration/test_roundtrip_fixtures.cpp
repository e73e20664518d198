/**
 * @file test_roundtrip_fixtures.cpp
 * @brief Интеграционные тесты: чтение и повторная запись файлов экспорта
 */

#include <doctest/doctest.h>
#include "io/format_config.hpp"
#include "io/lsetwatch_reader.hpp"
#include "io/lsetwatch_writer.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace lsetwatch::io;

namespace {

std::filesystem::path makeSourcePath(const std::string& relative) {
    return std::filesystem::path(LSETWATCH_SOURCE_DIR) / relative;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    REQUIRE(file.good());
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string rewrite(const std::string& content, const FormatOptions& format) {
    std::istringstream input(content);
    ReadOptions read_options;
    read_options.format = format;
    auto rows = readLsetwatch(input, read_options);

    std::ostringstream output;
    WriteOptions write_options;
    write_options.format = format;
    writeLsetwatch(output, rows, write_options);
    return output.str();
}

} // namespace

TEST_CASE("en_NZ export is reproduced byte for byte") {
    auto content = readFile(makeSourcePath("tests/fixtures/lsetwatch_en_nz.csv"));

    FormatOptions format;
    format.locale = "en_NZ.utf8";
    CHECK(rewrite(content, format) == content);
}

TEST_CASE("de_DE export with options file is reproduced byte for byte") {
    auto content = readFile(makeSourcePath("tests/fixtures/lsetwatch_de_de.csv"));
    auto read_options = loadReadOptions(makeSourcePath("tests/fixtures/lsetwatch_de_de.json"));

    std::istringstream input(content);
    auto rows = readLsetwatch(input, read_options);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].purchase.price == 437.71);
    CHECK(rows[0].purchase.shipping == 1.1);

    auto write_options = loadWriteOptions(makeSourcePath("tests/fixtures/lsetwatch_de_de.json"));
    std::ostringstream output;
    writeLsetwatch(output, rows, write_options);
    CHECK(output.str() == content);
}

TEST_CASE("Export with unescaped pipe and semicolon in a list is rejected") {
    std::ifstream file(makeSourcePath("tests/fixtures/lsetwatch_observed_pipe.csv"), std::ios::binary);
    REQUIRE(file.good());

    LsetwatchReader reader(file);
    try {
        (void)reader.next();
        FAIL("GrammarError expected");
    } catch (const GrammarError& e) {
        CHECK(e.line() == 2);
    }
}

TEST_CASE("Fixture rows survive a change of locale") {
    auto content = readFile(makeSourcePath("tests/fixtures/lsetwatch_en_nz.csv"));

    FormatOptions nz;
    nz.locale = "en_NZ.utf8";
    FormatOptions de;
    de.locale = "de_DE.utf8";
    de.date_format = "%d.%m.%Y";

    std::istringstream original_input(content);

    ReadOptions nz_read;
    nz_read.format = nz;
    auto original = readLsetwatch(original_input, nz_read);

    std::ostringstream de_output;
    WriteOptions de_write;
    de_write.format = de;
    writeLsetwatch(de_output, original, de_write);

    ReadOptions de_read;
    de_read.format = de;
    std::istringstream de_input(de_output.str());
    CHECK(readLsetwatch(de_input, de_read) == original);
    CHECK(de_output.str().find("437,71") != std::string::npos);
    CHECK(de_output.str().find("06.06.2023") != std::string::npos);
}
