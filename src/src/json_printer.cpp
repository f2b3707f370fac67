#include <sf/json.h>
#include <sf/encoding.h>
#include <sstream>

namespace sf {

namespace {
    void emit_json_string(std::ostringstream& out, const std::string& s) {
        static const char hex[] = "0123456789abcdef";
        out << '"';
        for (char c : s) {
            unsigned char u = static_cast<unsigned char>(c);
            if (c == '"' or c == '\\') {
                out << '\\' << c;
            } else if (u < 0x20) {
                out << "\\u00" << hex[u >> 4] << hex[u & 0xF];
            } else {
                out << c;
            }
        }
        out << '"';
    }

    void emit_typed(std::ostringstream& out, const char* type, const std::string& value) {
        out << "{\"__type\":\"" << type << "\",\"value\":";
        emit_json_string(out, value);
        out << '}';
    }

    void emit_bare(std::ostringstream& out, const BareItem& item) {
        switch (item.type()) {
            case BareItem::Type::Boolean: out << (item.asBoolean() ? "true" : "false"); break;
            case BareItem::Type::Integer: out << item.asInteger(); break;
            case BareItem::Type::Decimal: out << item.asDecimal().toString(); break;
            case BareItem::Type::String: emit_json_string(out, item.asString()); break;
            case BareItem::Type::Token: emit_typed(out, "token", item.asToken().value); break;
            case BareItem::Type::ByteSequence:
                emit_typed(out, "binary", base32_encode(item.asByteSequence().data));
                break;
        }
    }

    void emit_params(std::ostringstream& out, const Parameters& params) {
        out << '{';
        bool first = true;
        for (auto const& p : params) {
            if (not first) out << ',';
            first = false;
            emit_json_string(out, p.first);
            out << ':';
            emit_bare(out, p.second);
        }
        out << '}';
    }

    void emit_item(std::ostringstream& out, const Item& item) {
        out << '[';
        emit_bare(out, item.bareItem);
        out << ',';
        emit_params(out, item.parameters);
        out << ']';
    }

    void emit_inner_list(std::ostringstream& out, const InnerList& list) {
        out << "[[";
        for (size_t i = 0; i < list.bareInnerList.size(); ++i) {
            if (i > 0) out << ',';
            emit_item(out, list.bareInnerList[i]);
        }
        out << "],";
        emit_params(out, list.parameters);
        out << ']';
    }

    void emit_member(std::ostringstream& out, const ItemOrInnerList& member) {
        if (member.isInnerList())
            emit_inner_list(out, member.asInnerList());
        else
            emit_item(out, member.asItem());
    }
}

std::string to_json(const BareItem& item) {
    std::ostringstream out;
    emit_bare(out, item);
    return out.str();
}

std::string to_json(const Parameters& params) {
    std::ostringstream out;
    emit_params(out, params);
    return out.str();
}

std::string to_json(const Item& item) {
    std::ostringstream out;
    emit_item(out, item);
    return out.str();
}

std::string to_json(const InnerList& list) {
    std::ostringstream out;
    emit_inner_list(out, list);
    return out.str();
}

std::string to_json(const ItemOrInnerList& member) {
    std::ostringstream out;
    emit_member(out, member);
    return out.str();
}

std::string to_json(const List& list) {
    std::ostringstream out;
    out << '[';
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out << ',';
        emit_member(out, list[i]);
    }
    out << ']';
    return out.str();
}

std::string to_json(const Dictionary& dict) {
    std::ostringstream out;
    out << '{';
    bool first = true;
    for (auto const& p : dict) {
        if (not first) out << ',';
        first = false;
        emit_json_string(out, p.first);
        out << ':';
        emit_member(out, p.second);
    }
    out << '}';
    return out.str();
}

}  // namespace sf
