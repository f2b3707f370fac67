#include <sf/serializer.h>
#include <sf/bare_item.h>
#include <sf/encoding.h>
#include <sf/error.h>
#include <sstream>

namespace sf {

namespace {
    void emit_key(std::ostringstream& out, const std::string& key) {
        if (key.empty() or not is_key_start(key[0]))
            throw SerializeError("invalid key '" + key + "'");
        for (char c : key) {
            if (not is_key_char(c)) throw SerializeError("invalid key '" + key + "'");
        }
        out << key;
    }

    void emit_string(std::ostringstream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            unsigned char u = static_cast<unsigned char>(c);
            if (u < 0x20 or u > 0x7e) throw SerializeError("strings may only contain printable ASCII");
            if (c == '"' or c == '\\') out << '\\';
            out << c;
        }
        out << '"';
    }

    void emit_token(std::ostringstream& out, const Token& token) {
        const std::string& t = token.value;
        bool ok = not t.empty() and (('a' <= t[0] and t[0] <= 'z') or ('A' <= t[0] and t[0] <= 'Z') or t[0] == '*');
        for (char c : t) {
            if (not (is_tchar(c) or c == ':' or c == '/')) ok = false;
        }
        if (not ok) throw SerializeError("invalid token '" + t + "'");
        out << t;
    }

    void emit_decimal(std::ostringstream& out, const Decimal& d) {
        if (d.exponent < -3 or d.exponent > 0) throw SerializeError("decimal exponent out of range");
        int64_t ip = d.integerPart();
        if (ip > 999999999999 or ip < -999999999999)
            throw SerializeError("decimal integer part is limited to 12 digits");
        out << d.toString();
    }

    void emit_bare_item(std::ostringstream& out, const BareItem& item) {
        switch (item.type()) {
            case BareItem::Type::Boolean:
                out << (item.asBoolean() ? "?1" : "?0");
                break;
            case BareItem::Type::Integer: {
                int64_t n = item.asInteger();
                if (n > kMaxInteger or n < kMinInteger) throw SerializeError("integer out of range");
                out << n;
                break;
            }
            case BareItem::Type::Decimal:
                emit_decimal(out, item.asDecimal());
                break;
            case BareItem::Type::String:
                emit_string(out, item.asString());
                break;
            case BareItem::Type::Token:
                emit_token(out, item.asToken());
                break;
            case BareItem::Type::ByteSequence:
                out << ':' << base64_encode(item.asByteSequence().data) << ':';
                break;
        }
    }

    void emit_parameters(std::ostringstream& out, const Parameters& params) {
        for (auto const& p : params) {
            out << ';';
            emit_key(out, p.first);
            if (p.second.isBoolean() and p.second.asBoolean()) continue;
            out << '=';
            emit_bare_item(out, p.second);
        }
    }

    void emit_item(std::ostringstream& out, const Item& item) {
        emit_bare_item(out, item.bareItem);
        emit_parameters(out, item.parameters);
    }

    void emit_inner_list(std::ostringstream& out, const InnerList& list) {
        out << '(';
        for (size_t i = 0; i < list.bareInnerList.size(); ++i) {
            if (i > 0) out << ' ';
            emit_item(out, list.bareInnerList[i]);
        }
        out << ')';
        emit_parameters(out, list.parameters);
    }

    void emit_member(std::ostringstream& out, const ItemOrInnerList& member) {
        if (member.isInnerList())
            emit_inner_list(out, member.asInnerList());
        else
            emit_item(out, member.asItem());
    }
}

std::string dump_bare_item(const BareItem& item) {
    std::ostringstream out;
    emit_bare_item(out, item);
    return out.str();
}

std::string dump_parameters(const Parameters& params) {
    std::ostringstream out;
    emit_parameters(out, params);
    return out.str();
}

std::string dump_item(const Item& item) {
    std::ostringstream out;
    emit_item(out, item);
    return out.str();
}

std::string dump_inner_list(const InnerList& list) {
    std::ostringstream out;
    emit_inner_list(out, list);
    return out.str();
}

std::string dump_list(const List& list) {
    std::ostringstream out;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out << ", ";
        emit_member(out, list[i]);
    }
    return out.str();
}

std::string dump_dictionary(const Dictionary& dict) {
    std::ostringstream out;
    bool first = true;
    for (auto const& p : dict) {
        if (not first) out << ", ";
        first = false;
        emit_key(out, p.first);
        const ItemOrInnerList& member = p.second;
        // a true item is written as the bare key followed by its parameters
        if (member.isItem() and member.asItem().bareItem.isBoolean() and member.asItem().bareItem.asBoolean()) {
            emit_parameters(out, member.asItem().parameters);
            continue;
        }
        out << '=';
        emit_member(out, member);
    }
    return out.str();
}

}  // namespace sf
