#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kbindexer::utf8 {

// Byte offset of each code point in `text`, followed by a sentinel equal to
// text.size(). Malformed sequences count as one code point per byte.
std::vector<std::size_t> code_point_offsets(std::string_view text);

std::size_t length(std::string_view text);

bool is_valid(std::string_view text);

// Code points of `text`; each malformed byte decodes to U+FFFD.
std::u32string decode(std::string_view text);

// Unicode White_Space, plus the U+001C..U+001F separators.
bool is_whitespace(char32_t code_point);

// True when `text` is empty or holds only whitespace code points.
bool is_blank(std::string_view text);

// Reinterprets ISO-8859-1 bytes as UTF-8.
std::string from_latin1(std::string_view text);

}  // namespace kbindexer::utf8
