#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace docchunk {

std::string trim_copy(const std::string &s);
std::string to_lower(std::string s);
bool starts_with(const std::string &s, const std::string &prefix);

// Number of code points in a UTF-8 string. Continuation bytes are not counted.
size_t utf8_length(const std::string &s);

// Byte length of the code point starting at s[pos] (1 for invalid lead bytes).
size_t utf8_char_width(const std::string &s, size_t pos);

// Copy of bytes with every invalid UTF-8 sequence removed.
std::string sanitize_utf8(const std::string &bytes);

// Lowercase hex MD5 of bytes.
std::string md5_hex(const std::string &bytes);

std::vector<std::string> split_whitespace(const std::string &s);

// Strip each line, drop empty ones, rejoin with '\n'.
std::string clean_ocr_text(const std::string &text);

// Whole file as bytes. Throws std::runtime_error when unreadable.
std::string read_file(const std::string &path);

} // namespace docchunk
