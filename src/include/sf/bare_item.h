// Lexer for bare items and keys. These are the building blocks of sf::Parser
// and are exposed for callers that embed structured values in other grammars.
#pragma once

#include <sf/cursor.h>
#include <sf/error.h>
#include <sf/types.h>

#include <string>

namespace sf {

bool is_tchar(char c) noexcept;
bool is_key_start(char c) noexcept;
bool is_key_char(char c) noexcept;

// Parses one bare item starting at the cursor; throws ParseError.
BareItem parse_bare_item(ByteCursor& cursor);

BareItem parse_integer_or_decimal(ByteCursor& cursor);
std::string parse_string(ByteCursor& cursor);
Token parse_token(ByteCursor& cursor);
ByteSequence parse_byte_sequence(ByteCursor& cursor);
bool parse_boolean(ByteCursor& cursor);

// Parameter and dictionary keys.
std::string parse_key(ByteCursor& cursor);

[[noreturn]] void throw_parse_error(ErrorKind kind, const ByteCursor& cursor, const std::string& detail = "");

}  // namespace sf
