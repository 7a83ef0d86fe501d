#include "common/Base64.hpp"

#include <cstdint>

namespace Base64 {

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int valueOf(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string encode(const std::vector<unsigned char>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        size_t remaining = data.size() - i;
        uint32_t a = data[i++];
        uint32_t b = remaining > 1 ? data[i++] : 0;
        uint32_t c = remaining > 2 ? data[i++] : 0;
        uint32_t triple = (a << 16) | (b << 8) | c;

        result += kAlphabet[(triple >> 18) & 0x3F];
        result += kAlphabet[(triple >> 12) & 0x3F];
        result += remaining > 1 ? kAlphabet[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? kAlphabet[triple & 0x3F] : '=';
    }
    return result;
}

bool decode(const std::string& text, std::vector<unsigned char>& out) {
    out.clear();
    out.reserve(text.size() / 4 * 3);

    uint32_t accum = 0;
    int bits = 0;
    int padding = 0;
    size_t symbols = 0;
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        // Data after padding is malformed
        if (padding > 0) return false;
        int v = valueOf(c);
        if (v < 0) return false;
        ++symbols;
        accum = (accum << 6) | (uint32_t)v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((unsigned char)((accum >> bits) & 0xFF));
        }
    }
    if (padding > 2 || symbols % 4 == 1) return false;
    return true;
}

}  // namespace Base64
