// Data model for HTTP structured field values (RFC 8941)
#pragma once

#include <sf/ordered_map.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sf {

// Integers are limited to 15 decimal digits.
constexpr int64_t kMaxInteger = 999999999999999;
constexpr int64_t kMinInteger = -999999999999999;

// Exact fixed-point decimal: value = mantissa * 10^exponent, exponent in [-3, 0].
struct Decimal {
    int64_t mantissa = 0;
    int8_t exponent = 0;

    Decimal() = default;
    // Throws std::invalid_argument when e is outside [-3, 0].
    Decimal(int64_t m, int8_t e) : mantissa(m), exponent(e) {
        if (e < -3 or e > 0) throw std::invalid_argument("decimal exponent must be in [-3, 0]");
    }

    // Parses "[-]digits[.digits]"; throws std::invalid_argument on anything else
    // or on more than three fractional digits.
    static Decimal fromString(const std::string& text);

    double toDouble() const noexcept;
    // Shortest form with at least one fractional digit, e.g. "1.5", "-0.25", "3.0".
    std::string toString() const;

    // Integer part, truncated toward zero.
    int64_t integerPart() const noexcept;

    // Compares numeric value, so 1.5 == 1.500.
    bool operator==(const Decimal& rhs) const noexcept;
    bool operator!=(const Decimal& rhs) const noexcept { return !(*this == rhs); }
};

struct Token {
    std::string value;

    Token() = default;
    explicit Token(std::string v) : value(std::move(v)) {}
    bool operator==(const Token& rhs) const noexcept { return value == rhs.value; }
    bool operator!=(const Token& rhs) const noexcept { return value != rhs.value; }
};

// Keeps the base64 text exactly as it appeared in the field next to the
// decoded bytes.
struct ByteSequence {
    std::string encoded;
    std::string data;

    ByteSequence() = default;
    ByteSequence(std::string enc, std::string bytes) : encoded(std::move(enc)), data(std::move(bytes)) {}
    static ByteSequence fromBytes(const std::string& bytes);

    // Equality is on the decoded payload.
    bool operator==(const ByteSequence& rhs) const noexcept { return data == rhs.data; }
    bool operator!=(const ByteSequence& rhs) const noexcept { return data != rhs.data; }
};

struct BareItem {
    enum class Type { Boolean, Integer, Decimal, String, Token, ByteSequence };

    std::variant<bool, int64_t, Decimal, std::string, Token, ByteSequence> v;

    BareItem() : v(false) {}
    BareItem(bool b) : v(b) {}
    BareItem(int64_t n) : v(n) {}
    BareItem(int n) : v(int64_t(n)) {}
    BareItem(const Decimal& d) : v(d) {}
    BareItem(const char* s) : v(std::string(s)) {}
    BareItem(const std::string& s) : v(s) {}
    BareItem(std::string&& s) : v(std::move(s)) {}
    BareItem(const Token& t) : v(t) {}
    BareItem(Token&& t) : v(std::move(t)) {}
    BareItem(const ByteSequence& b) : v(b) {}
    BareItem(ByteSequence&& b) : v(std::move(b)) {}

    Type type() const noexcept { return static_cast<Type>(v.index()); }

    bool isBoolean() const noexcept { return std::holds_alternative<bool>(v); }
    bool isInteger() const noexcept { return std::holds_alternative<int64_t>(v); }
    bool isDecimal() const noexcept { return std::holds_alternative<Decimal>(v); }
    bool isString() const noexcept { return std::holds_alternative<std::string>(v); }
    bool isToken() const noexcept { return std::holds_alternative<Token>(v); }
    bool isByteSequence() const noexcept { return std::holds_alternative<ByteSequence>(v); }

    bool asBoolean() const { return std::get<bool>(v); }
    int64_t asInteger() const { return std::get<int64_t>(v); }
    const Decimal& asDecimal() const { return std::get<Decimal>(v); }
    const std::string& asString() const { return std::get<std::string>(v); }
    const Token& asToken() const { return std::get<Token>(v); }
    const ByteSequence& asByteSequence() const { return std::get<ByteSequence>(v); }

    bool operator==(const BareItem& o) const { return v == o.v; }
    bool operator!=(const BareItem& o) const { return !(*this == o); }
};

const char* to_string(BareItem::Type type) noexcept;

using Parameters = OrderedMap<std::string, BareItem>;

struct Item {
    BareItem bareItem;
    Parameters parameters;

    Item() = default;
    Item(BareItem b) : bareItem(std::move(b)) {}
    Item(BareItem b, Parameters p) : bareItem(std::move(b)), parameters(std::move(p)) {}

    bool operator==(const Item& o) const { return bareItem == o.bareItem && parameters == o.parameters; }
    bool operator!=(const Item& o) const { return !(*this == o); }
};

struct InnerList {
    std::vector<Item> bareInnerList;
    Parameters parameters;

    InnerList() = default;
    InnerList(std::vector<Item> items) : bareInnerList(std::move(items)) {}
    InnerList(std::vector<Item> items, Parameters p)
        : bareInnerList(std::move(items)), parameters(std::move(p)) {}

    bool operator==(const InnerList& o) const {
        return bareInnerList == o.bareInnerList && parameters == o.parameters;
    }
    bool operator!=(const InnerList& o) const { return !(*this == o); }
};

struct ItemOrInnerList {
    std::variant<Item, InnerList> v;

    ItemOrInnerList() = default;
    ItemOrInnerList(Item item) : v(std::move(item)) {}
    ItemOrInnerList(InnerList list) : v(std::move(list)) {}

    bool isItem() const noexcept { return std::holds_alternative<Item>(v); }
    bool isInnerList() const noexcept { return std::holds_alternative<InnerList>(v); }
    const Item& asItem() const { return std::get<Item>(v); }
    const InnerList& asInnerList() const { return std::get<InnerList>(v); }

    bool operator==(const ItemOrInnerList& o) const { return v == o.v; }
    bool operator!=(const ItemOrInnerList& o) const { return !(*this == o); }
};

using List = std::vector<ItemOrInnerList>;
using Dictionary = OrderedMap<std::string, ItemOrInnerList>;

}  // namespace sf
