#include <catch2/catch_test_macros.hpp>
#include <sf/ordered_map.h>
#include <string>
#include <type_traits>

using Map = sf::OrderedMap<std::string, int>;

TEST_CASE("OrderedMap basic operations", "[ordered_map]") {
    Map m;
    REQUIRE(m.empty());

    m.insert_or_assign("one", 1);
    m.insert_or_assign("two", 2);
    m["three"] = 3;

    REQUIRE(m.size() == 3);
    REQUIRE(m.contains("one"));
    REQUIRE(m.count("two") == 1);
    REQUIRE(m.count("four") == 0);
    STATIC_REQUIRE(std::is_same<decltype(m.count("one")), decltype(m.size())>::value);
    REQUIRE(m.at("three") == 3);
    REQUIRE_THROWS_AS(m.at("four"), std::out_of_range);
    REQUIRE(m.find("four") == m.end());
    REQUIRE(m.find("two")->second == 2);
}

TEST_CASE("OrderedMap iterates in insertion order", "[ordered_map]") {
    Map m;
    m.insert_or_assign("zebra", 1);
    m.insert_or_assign("apple", 2);
    m.insert_or_assign("mango", 3);

    std::vector<std::string> expected = {"zebra", "apple", "mango"};
    REQUIRE(m.keys() == expected);

    std::vector<int> values;
    for (auto const& p : m) values.push_back(p.second);
    REQUIRE(values == std::vector<int>{1, 2, 3});
}

TEST_CASE("Overwriting a key keeps its first position", "[ordered_map]") {
    Map m;
    REQUIRE(m.insert_or_assign("a", 1));
    REQUIRE(m.insert_or_assign("b", 2));
    REQUIRE_FALSE(m.insert_or_assign("a", 10));

    REQUIRE(m.size() == 2);
    REQUIRE(m.keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(m.at("a") == 10);

    m["b"] = 20;
    REQUIRE(m.keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(m.at("b") == 20);
}

TEST_CASE("OrderedMap equality depends on order", "[ordered_map]") {
    Map ab{{"a", 1}, {"b", 2}};
    Map ba{{"b", 2}, {"a", 1}};
    Map ab2;
    ab2["a"] = 1;
    ab2["b"] = 2;

    REQUIRE(ab == ab2);
    REQUIRE(ab != ba);
}

TEST_CASE("Initializer list with duplicate keys keeps the last value", "[ordered_map]") {
    Map m{{"x", 1}, {"y", 2}, {"x", 3}};
    REQUIRE(m.size() == 2);
    REQUIRE(m.keys().front() == "x");
    REQUIRE(m.at("x") == 3);
}
