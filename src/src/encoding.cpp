#include <sf/encoding.h>
#include <cstdint>
#include <stdexcept>

namespace sf {

namespace {
    const char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    const char kBase32Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

    int base64_value(char c) {
        if ('A' <= c and c <= 'Z') return c - 'A';
        if ('a' <= c and c <= 'z') return 26 + (c - 'a');
        if ('0' <= c and c <= '9') return 52 + (c - '0');
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }
}

bool is_valid_base64(std::string_view text) noexcept {
    size_t data_len = text.size();
    while (data_len > 0 and text[data_len - 1] == '=') --data_len;
    size_t padding = text.size() - data_len;
    if (padding > 2) return false;
    for (size_t k = 0; k < data_len; ++k) {
        if (base64_value(text[k]) < 0) return false;
    }
    if (padding > 0 and text.size() % 4 != 0) return false;
    // a single leftover character cannot encode a whole byte
    if (data_len % 4 == 1) return false;
    return true;
}

std::string base64_decode(std::string_view text) {
    if (not is_valid_base64(text)) throw std::invalid_argument("invalid base64 input");
    std::string out;
    out.reserve(text.size() / 4 * 3 + 2);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        if (c == '=') break;
        buffer = (buffer << 6) | static_cast<uint32_t>(base64_value(c));
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

std::string base64_encode(std::string_view bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t k = 0;
    while (k + 3 <= bytes.size()) {
        uint32_t n = (static_cast<uint8_t>(bytes[k]) << 16) | (static_cast<uint8_t>(bytes[k + 1]) << 8) |
                     static_cast<uint8_t>(bytes[k + 2]);
        out.push_back(kBase64Chars[(n >> 18) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 12) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 6) & 0x3F]);
        out.push_back(kBase64Chars[n & 0x3F]);
        k += 3;
    }
    size_t rest = bytes.size() - k;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[k]) << 16;
        out.push_back(kBase64Chars[(n >> 18) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[k]) << 16) | (static_cast<uint8_t>(bytes[k + 1]) << 8);
        out.push_back(kBase64Chars[(n >> 18) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 12) & 0x3F]);
        out.push_back(kBase64Chars[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string base32_encode(std::string_view bytes) {
    std::string out;
    uint64_t buffer = 0;
    int bits = 0;
    for (char c : bytes) {
        buffer = (buffer << 8) | static_cast<uint8_t>(c);
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Chars[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) out.push_back(kBase32Chars[(buffer << (5 - bits)) & 0x1F]);
    while (out.size() % 8 != 0) out.push_back('=');
    return out;
}

}  // namespace sf
