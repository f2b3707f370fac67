#include <sf/parser.h>
#include <sf/bare_item.h>

namespace sf {

Parameters Parser::parseParameters() {
    Parameters params;
    while (cursor_.peek() == ';') {
        cursor_.consume();
        cursor_.skipSpaces();
        std::string key = parse_key(cursor_);
        BareItem value(true);
        if (cursor_.peek() == '=') {
            cursor_.consume();
            value = parse_bare_item(cursor_);
        }
        params.insert_or_assign(key, std::move(value));
    }
    return params;
}

Item Parser::parseItem() {
    BareItem bare = parse_bare_item(cursor_);
    Parameters params = parseParameters();
    return Item(std::move(bare), std::move(params));
}

InnerList Parser::parseInnerList() {
    if (cursor_.consume() != '(') throw_parse_error(ErrorKind::InvalidInnerList, cursor_, "expected '('");
    std::vector<Item> items;
    while (true) {
        cursor_.skipSpaces();
        auto c = cursor_.peek();
        if (not c) throw_parse_error(ErrorKind::InvalidInnerList, cursor_, "missing closing ')'");
        if (*c == ')') {
            cursor_.consume();
            Parameters params = parseParameters();
            return InnerList(std::move(items), std::move(params));
        }
        items.push_back(parseItem());
        auto next = cursor_.peek();
        if (not next) throw_parse_error(ErrorKind::InvalidInnerList, cursor_, "missing closing ')'");
        if (*next != ' ' and *next != ')')
            throw_parse_error(ErrorKind::InvalidInnerList, cursor_, "inner list members must be separated by a space");
    }
}

ItemOrInnerList Parser::parseItemOrInnerList() {
    if (cursor_.peek() == '(') return ItemOrInnerList(parseInnerList());
    return ItemOrInnerList(parseItem());
}

bool Parser::parseMemberSeparator() {
    cursor_.skipOWS();
    if (cursor_.atEnd()) return false;
    if (cursor_.peek() != ',')
        throw_parse_error(ErrorKind::TrailingGarbage, cursor_, "expected ',' between members");
    cursor_.consume();
    cursor_.skipOWS();
    if (cursor_.atEnd()) throw_parse_error(ErrorKind::UnexpectedEnd, cursor_, "trailing ','");
    return true;
}

void Parser::finish() {
    if (cursor_.remainingIsOnlyOptionalWhitespace()) return;
    cursor_.skipOWS();
    throw_parse_error(ErrorKind::TrailingGarbage, cursor_);
}

Item Parser::parseItemField() {
    cursor_.skipSpaces();
    Item item = parseItem();
    finish();
    return item;
}

List Parser::parseListField() {
    cursor_.skipSpaces();
    List list;
    if (cursor_.atEnd()) return list;
    do {
        list.push_back(parseItemOrInnerList());
    } while (parseMemberSeparator());
    finish();
    return list;
}

Dictionary Parser::parseDictionaryField() {
    cursor_.skipSpaces();
    Dictionary dict;
    if (cursor_.atEnd()) return dict;
    do {
        std::string key = parse_key(cursor_);
        if (cursor_.peek() == '=') {
            cursor_.consume();
            dict.insert_or_assign(key, parseItemOrInnerList());
        } else {
            Parameters params = parseParameters();
            dict.insert_or_assign(key, ItemOrInnerList(Item(BareItem(true), std::move(params))));
        }
    } while (parseMemberSeparator());
    finish();
    return dict;
}

Item parse_item(std::string_view text) { return Parser(text).parseItemField(); }

List parse_list(std::string_view text) { return Parser(text).parseListField(); }

Dictionary parse_dictionary(std::string_view text) { return Parser(text).parseDictionaryField(); }

std::optional<Item> try_parse_item(std::string_view text) {
    try {
        return parse_item(text);
    } catch (const ParseError&) {
        return std::nullopt;
    }
}

std::optional<List> try_parse_list(std::string_view text) {
    try {
        return parse_list(text);
    } catch (const ParseError&) {
        return std::nullopt;
    }
}

std::optional<Dictionary> try_parse_dictionary(std::string_view text) {
    try {
        return parse_dictionary(text);
    } catch (const ParseError&) {
        return std::nullopt;
    }
}

}  // namespace sf
