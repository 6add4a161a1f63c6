#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Lowercase hex, no separators.
std::string hex_encode(const uint8_t* data, size_t len);
inline std::string hex_encode(const std::vector<uint8_t>& data) {
    return hex_encode(data.data(), data.size());
}

// Accepts upper or lower case. Surrounding whitespace is ignored; anything
// else that is not a hex digit, or an odd digit count, throws std::invalid_argument.
std::vector<uint8_t> hex_decode(const std::string& text);

// True when `text` (whitespace-trimmed) is exactly `digits` hex characters.
bool is_hex_string(const std::string& text, size_t digits);
