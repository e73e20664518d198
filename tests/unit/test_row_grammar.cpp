/**
 * @file test_row_grammar.cpp
 * @brief Юнит-тесты разбиения строк
 */

#include <doctest/doctest.h>
#include "io/row_grammar.hpp"
#include "io/lsetwatch_errors.hpp"
#include <sstream>

using namespace lsetwatch::io;

TEST_CASE("Split keeps empty columns") {
    CHECK(splitRecord("a;b;c") == std::vector<std::string>{"a", "b", "c"});
    CHECK(splitRecord(";;") == std::vector<std::string>{"", "", ""});
    CHECK(splitRecord("") == std::vector<std::string>{""});
    CHECK(splitRecord("a;") == std::vector<std::string>{"a", ""});
}

TEST_CASE("Split does not treat quotes specially") {
    CHECK(splitRecord("\"a;b\";c") == std::vector<std::string>{"\"a", "b\"", "c"});
}

TEST_CASE("Join puts delimiters between columns") {
    CHECK(joinRecord({"a", "", "c"}, 1) == "a;;c");
    CHECK(joinRecord({""}, 1).empty());
    CHECK(joinRecord({"\a59", "x"}, 1) == "\a59;x");
}

TEST_CASE("Join rejects values that would break the grammar") {
    CHECK_THROWS_AS((void)joinRecord({"a;b"}, 3), GrammarError);
    CHECK_THROWS_AS((void)joinRecord({"a\nb"}, 3), GrammarError);
    CHECK_THROWS_AS((void)joinRecord({"a\rb"}, 3), GrammarError);

    try {
        (void)joinRecord({"ok", "bad;"}, 7);
        FAIL("GrammarError expected");
    } catch (const GrammarError& e) {
        CHECK(e.line() == 7);
    }
}

TEST_CASE("Record lines end with CRLF or LF") {
    std::istringstream input("first\r\nsecond\nthird");
    std::string line;

    REQUIRE(readRecordLine(input, line));
    CHECK(line == "first");
    REQUIRE(readRecordLine(input, line));
    CHECK(line == "second");
    REQUIRE(readRecordLine(input, line));
    CHECK(line == "third");
    CHECK_FALSE(readRecordLine(input, line));
}
