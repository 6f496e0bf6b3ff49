#pragma once

#include <cstdint>
#include <string>

namespace diyanet {

// Unicode case folding of a UTF-8 string (Latin, Greek and Cyrillic blocks).
// Bytes that are not valid UTF-8 are copied through unchanged.
std::string casefold(const std::string& text);

bool iequals(const std::string& a, const std::string& b);

std::string trim(const std::string& text);

bool is_blank(const std::string& text);

// application/x-www-form-urlencoded encoding of a single key or value
std::string url_encode(const std::string& text);

bool is_valid_utf8(const std::string& text);

// Appends the UTF-8 encoding of a code point
void append_utf8(std::string& out, uint32_t code_point);

} // namespace diyanet
