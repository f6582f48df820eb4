//
//  utf8_text.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace narrationforge {

// Best-effort UTF-8 -> UTF-32. Invalid sequences become U+FFFD.
std::u32string utf8_to_u32(std::string_view s);

// UTF-32 -> UTF-8.
std::string u32_to_utf8(std::u32string_view s);

// Encoded size of a single code point.
size_t utf8_width(char32_t cp);

// Number of code points (what captions count as "characters").
size_t utf8_char_count(std::string_view s);

// Length in bytes of the longest prefix of `s` that ends on a code point boundary
// and is no longer than `max_bytes`.
size_t utf8_prefix_within(std::string_view s, size_t max_bytes);

// First `max_chars` code points of `s`.
std::string utf8_prefix_chars(std::string_view s, size_t max_chars);

bool is_space(char32_t cp);
bool is_hangul_syllable(char32_t cp);
inline bool is_ascii_digit(char32_t cp) { return cp >= U'0' && cp <= U'9'; }

// Strip leading/trailing whitespace (see is_space).
std::u32string trim(std::u32string_view s);
std::string trim(std::string_view s);

}  // namespace narrationforge
