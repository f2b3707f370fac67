#include <catch2/catch_test_macros.hpp>
#include <sf/cursor.h>

using sf::ByteCursor;

TEST_CASE("peek does not advance, consume does", "[cursor]") {
    ByteCursor c("ab");
    REQUIRE(c.peek() == 'a');
    REQUIRE(c.peek() == 'a');
    REQUIRE(c.offset() == 0);
    REQUIRE(c.consume() == 'a');
    REQUIRE(c.consume() == 'b');
    REQUIRE(c.atEnd());
    REQUIRE_FALSE(c.peek().has_value());
    REQUIRE_FALSE(c.consume().has_value());
    REQUIRE(c.offset() == 2);
}

TEST_CASE("consumeWhile returns a slice of the input", "[cursor]") {
    std::string input = "12345abc";
    ByteCursor c(input);
    auto digits = c.consumeWhile([](char ch) { return ch >= '0' && ch <= '9'; });
    REQUIRE(digits == "12345");
    REQUIRE(digits.data() == input.data());
    REQUIRE(c.peek() == 'a');

    auto none = c.consumeWhile([](char ch) { return ch == 'z'; });
    REQUIRE(none.empty());
    REQUIRE(c.offset() == 5);
}

TEST_CASE("whitespace helpers", "[cursor]") {
    ByteCursor c("  \t x");
    c.skipSpaces();
    REQUIRE(c.peek() == '\t');
    c.skipOWS();
    REQUIRE(c.peek() == 'x');
    REQUIRE_FALSE(c.remainingIsOnlyOptionalWhitespace());
    c.consume();
    REQUIRE(c.remainingIsOnlyOptionalWhitespace());

    ByteCursor t("x \t ");
    t.consume();
    REQUIRE(t.remainingIsOnlyOptionalWhitespace());

    ByteCursor n("x \n");
    n.consume();
    REQUIRE_FALSE(n.remainingIsOnlyOptionalWhitespace());
}
