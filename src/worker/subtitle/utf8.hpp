#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace utf8 {

// Decodes UTF-8 into code points. Malformed bytes decode to U+FFFD one byte at a time.
std::u32string decode(std::string_view s);

void append(std::string& out, char32_t cp);
std::string encode(std::u32string_view s);

// Last code point of s and the number of bytes it occupies. {0, 0} for empty input.
struct Tail {
    char32_t cp = 0;
    size_t bytes = 0;
};
Tail last(std::string_view s);

// First code point of s, or 0 for empty input.
char32_t first(std::string_view s);

bool is_whitespace(char32_t cp);

// Han, Hiragana, Katakana and Hangul: each code point is one word.
bool is_cjk(char32_t cp);

// Unicode letters and digits, the characters that make a token a word.
bool is_alnum(char32_t cp);

bool is_ascii_alnum(char32_t cp);

// CJK code points count one each; everything else is split on whitespace and
// every token holding a letter or digit counts once.
size_t mixed_script_word_count(std::string_view text);

} // namespace utf8
