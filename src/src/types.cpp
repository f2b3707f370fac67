#include <sf/types.h>
#include <sf/encoding.h>
#include <cctype>
#include <stdexcept>

namespace sf {

namespace {
    const int64_t kPow10[] = {1, 10, 100, 1000};

    // mantissa scaled to three fractional digits
    int64_t scaled(const Decimal& d) { return d.mantissa * kPow10[3 + d.exponent]; }
}

Decimal Decimal::fromString(const std::string& text) {
    size_t i = 0;
    bool negative = false;
    if (i < text.size() and text[i] == '-') {
        negative = true;
        ++i;
    }
    int64_t m = 0;
    int int_digits = 0;
    while (i < text.size() and std::isdigit(static_cast<unsigned char>(text[i]))) {
        if (++int_digits > 12) throw std::invalid_argument("decimal integer part too long: " + text);
        m = m * 10 + (text[i++] - '0');
    }
    if (int_digits == 0) throw std::invalid_argument("invalid decimal: " + text);
    int frac_digits = 0;
    if (i < text.size() and text[i] == '.') {
        ++i;
        while (i < text.size() and std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (++frac_digits > 3) throw std::invalid_argument("too many fractional digits: " + text);
            m = m * 10 + (text[i++] - '0');
        }
        if (frac_digits == 0) throw std::invalid_argument("invalid decimal: " + text);
    }
    if (i != text.size()) throw std::invalid_argument("invalid decimal: " + text);
    return Decimal(negative ? -m : m, static_cast<int8_t>(-frac_digits));
}

double Decimal::toDouble() const noexcept {
    return static_cast<double>(mantissa) / static_cast<double>(kPow10[-exponent]);
}

int64_t Decimal::integerPart() const noexcept { return mantissa / kPow10[-exponent]; }

std::string Decimal::toString() const {
    int64_t value = scaled(*this);
    std::string out;
    if (value < 0) {
        out.push_back('-');
        value = -value;
    }
    out += std::to_string(value / 1000);
    int64_t frac = value % 1000;
    std::string digits = std::to_string(1000 + frac).substr(1);
    while (digits.size() > 1 and digits.back() == '0') digits.pop_back();
    out.push_back('.');
    out += digits;
    return out;
}

bool Decimal::operator==(const Decimal& rhs) const noexcept { return scaled(*this) == scaled(rhs); }

ByteSequence ByteSequence::fromBytes(const std::string& bytes) { return ByteSequence(base64_encode(bytes), bytes); }

const char* to_string(BareItem::Type type) noexcept {
    switch (type) {
        case BareItem::Type::Boolean: return "boolean";
        case BareItem::Type::Integer: return "integer";
        case BareItem::Type::Decimal: return "decimal";
        case BareItem::Type::String: return "string";
        case BareItem::Type::Token: return "token";
        case BareItem::Type::ByteSequence: return "byte sequence";
    }
    return "unknown";
}

}  // namespace sf
