// Structured field value parser (RFC 8941)
#pragma once

#include <sf/cursor.h>
#include <sf/error.h>
#include <sf/types.h>

#include <optional>
#include <string_view>

namespace sf {

// One parser instance parses one field value. The input is borrowed for the
// duration of the call only: all returned values own their data.
//
// If a field appears on several lines, the caller joins them with ", "
// before parsing.
class Parser {
  public:
    explicit Parser(std::string_view input) noexcept : cursor_(input) {}

    // Each throws ParseError on any violation; nothing is returned then.
    Item parseItemField();
    List parseListField();
    Dictionary parseDictionaryField();

    // Building blocks, exposed for testing.
    Parameters parseParameters();
    Item parseItem();
    InnerList parseInnerList();
    ItemOrInnerList parseItemOrInnerList();

    size_t offset() const noexcept { return cursor_.offset(); }

  private:
    void finish();
    // Member separator for lists and dictionaries. Returns false at end of input.
    bool parseMemberSeparator();

    ByteCursor cursor_;
};

Item parse_item(std::string_view text);
List parse_list(std::string_view text);
Dictionary parse_dictionary(std::string_view text);

// Report failure as an absent value.
std::optional<Item> try_parse_item(std::string_view text);
std::optional<List> try_parse_list(std::string_view text);
std::optional<Dictionary> try_parse_dictionary(std::string_view text);

}  // namespace sf
