#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sf {

enum class ErrorKind {
    UnexpectedCharacter,
    InvalidNumber,
    NumberTooLong,
    InvalidString,
    InvalidKey,
    InvalidInnerList,
    InvalidBinary,
    InvalidBoolean,
    UnexpectedEnd,
    TrailingGarbage
};

const char* to_string(ErrorKind kind) noexcept;

// Thrown by every parse entry point. The offset is the byte position in the
// input at which the violation was detected.
class ParseError : public std::runtime_error {
  public:
    ParseError(ErrorKind kind, size_t offset, const std::string& message)
        : std::runtime_error(message), kind_(kind), offset_(offset) {}

    ErrorKind kind() const noexcept { return kind_; }
    size_t offset() const noexcept { return offset_; }

  private:
    ErrorKind kind_;
    size_t offset_;
};

// Thrown when a value cannot be represented as a structured field.
struct SerializeError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Builds the message carried by ParseError: description, offset, the input
// and a caret under the offending byte.
std::string format_parse_error(ErrorKind kind, const std::string& detail, std::string_view input,
                               size_t offset);

}  // namespace sf
