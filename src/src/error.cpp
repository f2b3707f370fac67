#include <sf/error.h>
#include <sstream>

namespace sf {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnexpectedCharacter: return "unexpected character";
        case ErrorKind::InvalidNumber: return "invalid number";
        case ErrorKind::NumberTooLong: return "number too long";
        case ErrorKind::InvalidString: return "invalid string";
        case ErrorKind::InvalidKey: return "invalid key";
        case ErrorKind::InvalidInnerList: return "invalid inner list";
        case ErrorKind::InvalidBinary: return "invalid byte sequence";
        case ErrorKind::InvalidBoolean: return "invalid boolean";
        case ErrorKind::UnexpectedEnd: return "unexpected end of input";
        case ErrorKind::TrailingGarbage: return "trailing characters after field value";
    }
    return "unknown error";
}

std::string format_parse_error(ErrorKind kind, const std::string& detail, std::string_view input,
                               size_t offset) {
    std::ostringstream ss;
    ss << to_string(kind);
    if (!detail.empty()) ss << ": " << detail;
    ss << " (offset " << offset << ")";

    // field values are single line; keep long ones readable around the offset
    size_t start = 0;
    size_t end = input.size();
    if (offset > 40) start = offset - 40;
    if (end - start > 80) end = start + 80;
    std::string line;
    for (size_t k = start; k < end; ++k) {
        unsigned char c = static_cast<unsigned char>(input[k]);
        line.push_back((c < 0x20 || c > 0x7e) ? '.' : static_cast<char>(c));
    }
    size_t caret_pos = offset - start;
    if (caret_pos > line.size()) caret_pos = line.size();
    ss << "\n" << (start > 0 ? "..." : "") << line << "\n";
    ss << std::string(caret_pos + (start > 0 ? 3 : 0), ' ') << '^';
    return ss.str();
}

}  // namespace sf
