// RFC 4648 helpers used for byte sequences
#pragma once

#include <string>
#include <string_view>

namespace sf {

// True when text uses the standard base64 alphabet with well-formed padding.
// Unpadded input is accepted as long as its length is possible for base64.
bool is_valid_base64(std::string_view text) noexcept;

// Throws std::invalid_argument when !is_valid_base64(text).
std::string base64_decode(std::string_view text);

std::string base64_encode(std::string_view bytes);

// Upper-case RFC 4648 base32 with '=' padding. This is the encoding the
// conformance fixtures use for expected binary values.
std::string base32_encode(std::string_view bytes);

}  // namespace sf
