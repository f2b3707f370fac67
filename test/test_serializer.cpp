#include <catch2/catch_test_macros.hpp>
#include <sf/parser.h>
#include <sf/serializer.h>

using namespace sf;

TEST_CASE("Serialize bare items", "[serializer]") {
    REQUIRE(dump_bare_item(BareItem(42)) == "42");
    REQUIRE(dump_bare_item(BareItem(int64_t(-999999999999999))) == "-999999999999999");
    REQUIRE(dump_bare_item(BareItem(Decimal(1500, -3))) == "1.5");
    REQUIRE(dump_bare_item(BareItem(Decimal(-2, 0))) == "-2.0");
    REQUIRE(dump_bare_item(BareItem("say \"hi\" \\o/")) == R"("say \"hi\" \\o/")");
    REQUIRE(dump_bare_item(BareItem(Token("text/plain"))) == "text/plain");
    REQUIRE(dump_bare_item(BareItem(ByteSequence::fromBytes("hello"))) == ":aGVsbG8=:");
    REQUIRE(dump_bare_item(BareItem(true)) == "?1");
    REQUIRE(dump_bare_item(BareItem(false)) == "?0");
}

TEST_CASE("Unrepresentable values are rejected", "[serializer]") {
    REQUIRE_THROWS_AS(dump_bare_item(BareItem(int64_t(1000000000000000))), SerializeError);
    REQUIRE_THROWS_AS(dump_bare_item(BareItem(Decimal(1000000000000, 0))), SerializeError);
    REQUIRE_THROWS_AS(dump_bare_item(BareItem("line\nbreak")), SerializeError);
    REQUIRE_THROWS_AS(dump_bare_item(BareItem(Token("1abc"))), SerializeError);
    REQUIRE_THROWS_AS(dump_bare_item(BareItem(Token("a b"))), SerializeError);
    REQUIRE_THROWS_AS(dump_bare_item(BareItem(Token(""))), SerializeError);

    Parameters bad;
    bad.insert_or_assign("Upper", BareItem(1));
    REQUIRE_THROWS_AS(dump_parameters(bad), SerializeError);
}

TEST_CASE("Serialize parameters", "[serializer][parameters]") {
    Parameters p;
    p.insert_or_assign("a", BareItem(true));
    p.insert_or_assign("b", BareItem(false));
    p.insert_or_assign("c", BareItem(Token("x")));
    REQUIRE(dump_parameters(p) == ";a;b=?0;c=x");
    REQUIRE(dump_item(Item(BareItem(1), p)) == "1;a;b=?0;c=x");
}

TEST_CASE("Serialize lists and inner lists", "[serializer][list]") {
    List list;
    list.push_back(Item(BareItem(Token("sugar"))));
    std::vector<Item> members = {Item(BareItem(1)), Item(BareItem(2))};
    Parameters lp;
    lp.insert_or_assign("q", BareItem(Decimal(5, -1)));
    list.push_back(InnerList(members, lp));
    list.push_back(InnerList());
    REQUIRE(dump_list(list) == "sugar, (1 2);q=0.5, ()");
    REQUIRE(dump_list(List{}).empty());
}

TEST_CASE("Serialize dictionaries", "[serializer][dictionary]") {
    Dictionary dict;
    dict.insert_or_assign("a", Item(BareItem(1)));
    Parameters x;
    x.insert_or_assign("x", BareItem(true));
    dict.insert_or_assign("b", Item(BareItem(true), x));
    dict.insert_or_assign("c", InnerList({Item(BareItem(1)), Item(BareItem(2))}));
    dict.insert_or_assign("d", Item(BareItem(false)));
    REQUIRE(dump_dictionary(dict) == "a=1, b;x, c=(1 2), d=?0");
}

TEST_CASE("Parsed fields serialize canonically", "[serializer]") {
    REQUIRE(dump_list(parse_list("1 ,\t2,(  a   b  );p=1.50")) == "1, 2, (a b);p=1.5");
    REQUIRE(dump_dictionary(parse_dictionary("a=?1, b=2, a=3")) == "a=3, b=2");
    REQUIRE(dump_dictionary(parse_dictionary("a=?1;x")) == "a;x");
    REQUIRE(dump_item(parse_item(":aGVsbG8:")) == ":aGVsbG8=:");
    REQUIRE(dump_item(parse_item("  \"x\";k=\"v\"  ")) == "\"x\";k=\"v\"");
}

TEST_CASE("Serialized output parses back to the same value", "[serializer]") {
    std::string text = "a=(1 2.5 \"s\");p=tok, b=:AQID:;q, c=?0";
    Dictionary first = parse_dictionary(text);
    Dictionary second = parse_dictionary(dump_dictionary(first));
    REQUIRE(first == second);
}
