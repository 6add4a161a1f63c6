#include "hex.hpp"
#include <stdexcept>

static const char kDigits[] = "0123456789abcdef";

static int hex_value(unsigned char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space((unsigned char)s[b])) ++b;
    while (e > b && is_space((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

std::vector<uint8_t> hex_decode(const std::string& text) {
    std::string s = trim(text);
    if (s.size() % 2 != 0)
        throw std::invalid_argument("Odd number of hex digits");

    std::vector<uint8_t> out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        int hi = hex_value((unsigned char)s[i]);
        int lo = hex_value((unsigned char)s[i + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("Invalid hex character");
        out.push_back((uint8_t)((hi << 4) | lo));
    }
    return out;
}

bool is_hex_string(const std::string& text, size_t digits) {
    std::string s = trim(text);
    if (s.size() != digits) return false;
    for (unsigned char c : s)
        if (hex_value(c) < 0) return false;
    return true;
}
