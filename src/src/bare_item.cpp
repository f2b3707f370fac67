#include <sf/bare_item.h>
#include <sf/encoding.h>

namespace sf {

namespace {
    bool is_digit(char c) { return '0' <= c and c <= '9'; }
    bool is_lcalpha(char c) { return 'a' <= c and c <= 'z'; }
    bool is_alpha(char c) { return is_lcalpha(c) or ('A' <= c and c <= 'Z'); }

    int64_t to_int64(std::string_view digits) {
        int64_t v = 0;
        for (char c : digits) v = v * 10 + (c - '0');
        return v;
    }

    std::string describe(char c) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 or u > 0x7e) {
            static const char hex[] = "0123456789abcdef";
            return std::string("byte 0x") + hex[u >> 4] + hex[u & 0xF];
        }
        return std::string("'") + c + "'";
    }
}

bool is_tchar(char c) noexcept {
    if (is_alpha(c) or is_digit(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool is_key_start(char c) noexcept { return is_lcalpha(c) or c == '*'; }

bool is_key_char(char c) noexcept {
    return is_lcalpha(c) or is_digit(c) or c == '_' or c == '-' or c == '.' or c == '*';
}

void throw_parse_error(ErrorKind kind, const ByteCursor& cursor, const std::string& detail) {
    throw ParseError(kind, cursor.offset(), format_parse_error(kind, detail, cursor.input(), cursor.offset()));
}

BareItem parse_bare_item(ByteCursor& cursor) {
    auto c = cursor.peek();
    if (not c) throw_parse_error(ErrorKind::UnexpectedEnd, cursor, "expected a bare item");
    if (*c == '-' or is_digit(*c)) return parse_integer_or_decimal(cursor);
    if (*c == '"') return parse_string(cursor);
    if (is_alpha(*c) or *c == '*') return parse_token(cursor);
    if (*c == ':') return parse_byte_sequence(cursor);
    if (*c == '?') return parse_boolean(cursor);
    throw_parse_error(ErrorKind::UnexpectedCharacter, cursor, describe(*c) + " cannot start a bare item");
}

BareItem parse_integer_or_decimal(ByteCursor& cursor) {
    bool negative = false;
    if (cursor.peek() == '-') {
        cursor.consume();
        negative = true;
    }
    auto c = cursor.peek();
    if (not c or not is_digit(*c)) throw_parse_error(ErrorKind::InvalidNumber, cursor, "expected a digit");

    std::string_view int_digits = cursor.consumeWhile(is_digit);
    if (int_digits.size() > 15)
        throw_parse_error(ErrorKind::NumberTooLong, cursor, "integers are limited to 15 digits");

    if (cursor.peek() != '.') {
        int64_t v = to_int64(int_digits);
        return BareItem(negative ? -v : v);
    }

    if (int_digits.size() > 12)
        throw_parse_error(ErrorKind::NumberTooLong, cursor, "decimals are limited to 12 integer digits");
    cursor.consume();
    std::string_view frac_digits = cursor.consumeWhile(is_digit);
    if (frac_digits.empty())
        throw_parse_error(ErrorKind::InvalidNumber, cursor, "expected a digit after '.'");
    if (frac_digits.size() > 3)
        throw_parse_error(ErrorKind::InvalidNumber, cursor, "decimals are limited to 3 fractional digits");

    int64_t mantissa = to_int64(int_digits);
    for (char d : frac_digits) mantissa = mantissa * 10 + (d - '0');
    return BareItem(Decimal(negative ? -mantissa : mantissa, static_cast<int8_t>(-static_cast<int>(frac_digits.size()))));
}

std::string parse_string(ByteCursor& cursor) {
    if (cursor.consume() != '"') throw_parse_error(ErrorKind::InvalidString, cursor, "expected '\"'");
    std::string out;
    while (true) {
        auto c = cursor.consume();
        if (not c) throw_parse_error(ErrorKind::InvalidString, cursor, "unterminated string");
        if (*c == '"') {
            auto next = cursor.peek();
            if (next and *next != ';' and *next != ',' and *next != ')' and *next != ' ' and *next != '\t')
                throw_parse_error(ErrorKind::InvalidString, cursor, describe(*next) + " after closing '\"'");
            return out;
        }
        if (*c == '\\') {
            auto e = cursor.consume();
            if (not e) throw_parse_error(ErrorKind::InvalidString, cursor, "unterminated escape sequence");
            if (*e != '"' and *e != '\\')
                throw_parse_error(ErrorKind::InvalidString, cursor, "only \\\" and \\\\ may be escaped");
            out.push_back(*e);
            continue;
        }
        unsigned char u = static_cast<unsigned char>(*c);
        if (u < 0x20 or u > 0x7e)
            throw_parse_error(ErrorKind::InvalidString, cursor, describe(*c) + " is not allowed in a string");
        out.push_back(*c);
    }
}

Token parse_token(ByteCursor& cursor) {
    auto c = cursor.peek();
    if (not c or not (is_alpha(*c) or *c == '*'))
        throw_parse_error(ErrorKind::UnexpectedCharacter, cursor, "expected a token");
    std::string_view text = cursor.consumeWhile([](char ch) { return is_tchar(ch) or ch == ':' or ch == '/'; });
    return Token(std::string(text));
}

ByteSequence parse_byte_sequence(ByteCursor& cursor) {
    if (cursor.consume() != ':') throw_parse_error(ErrorKind::InvalidBinary, cursor, "expected ':'");
    std::string_view content = cursor.consumeWhile([](char ch) { return ch != ':'; });
    if (cursor.atEnd()) throw_parse_error(ErrorKind::InvalidBinary, cursor, "missing closing ':'");
    if (not is_valid_base64(content))
        throw_parse_error(ErrorKind::InvalidBinary, cursor, "byte sequence is not valid base64");
    cursor.consume();
    return ByteSequence(std::string(content), base64_decode(content));
}

bool parse_boolean(ByteCursor& cursor) {
    if (cursor.consume() != '?') throw_parse_error(ErrorKind::InvalidBoolean, cursor, "expected '?'");
    auto c = cursor.consume();
    if (c == '1') return true;
    if (c == '0') return false;
    throw_parse_error(ErrorKind::InvalidBoolean, cursor, "expected '0' or '1' after '?'");
}

std::string parse_key(ByteCursor& cursor) {
    auto c = cursor.peek();
    if (not c) throw_parse_error(ErrorKind::UnexpectedEnd, cursor, "expected a key");
    if (not is_key_start(*c))
        throw_parse_error(ErrorKind::InvalidKey, cursor, "keys must start with a lowercase letter or '*'");
    return std::string(cursor.consumeWhile(is_key_char));
}

}  // namespace sf
