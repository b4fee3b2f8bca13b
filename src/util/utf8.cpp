#include "util/utf8.hpp"

#include <algorithm>

namespace kbindexer::utf8 {
namespace {

std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 0;
}

bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the well-formed sequence starting at `pos`, or 0 if malformed.
std::size_t valid_sequence_at(std::string_view text, std::size_t pos) {
    const auto len = sequence_length(static_cast<unsigned char>(text[pos]));
    if (len == 0 || pos + len > text.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < len; ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[pos + i]))) {
            return 0;
        }
    }
    return len;
}

}  // namespace

std::vector<std::size_t> code_point_offsets(std::string_view text) {
    std::vector<std::size_t> offsets;
    offsets.reserve(text.size() + 1);
    std::size_t pos = 0;
    while (pos < text.size()) {
        offsets.push_back(pos);
        const auto len = valid_sequence_at(text, pos);
        pos += (len == 0) ? 1 : len;
    }
    offsets.push_back(text.size());
    return offsets;
}

std::size_t length(std::string_view text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto len = valid_sequence_at(text, pos);
        pos += (len == 0) ? 1 : len;
        ++count;
    }
    return count;
}

bool is_valid(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto len = valid_sequence_at(text, pos);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::u32string decode(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto len = valid_sequence_at(text, pos);
        if (len == 0) {
            out.push_back(U'\uFFFD');
            ++pos;
            continue;
        }
        const auto lead = static_cast<unsigned char>(text[pos]);
        char32_t code_point = (len == 1) ? lead : lead & (0x7F >> len);
        for (std::size_t i = 1; i < len; ++i) {
            code_point = (code_point << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
        }
        out.push_back(code_point);
        pos += len;
    }
    return out;
}

bool is_whitespace(char32_t c) {
    return (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20) || c == 0x85 || c == 0xA0 || c == 0x1680 ||
           (c >= 0x2000 && c <= 0x200A) || c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F ||
           c == 0x3000;
}

bool is_blank(std::string_view text) {
    const auto code_points = decode(text);
    return std::all_of(code_points.begin(), code_points.end(), is_whitespace);
}

std::string from_latin1(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 2);
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

}  // namespace kbindexer::utf8
