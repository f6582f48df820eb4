//
//  utf8_text.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "utf8_text.hpp"

#include <cstdint>

namespace narrationforge {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Size of the sequence introduced by lead byte `c0`; 1 for stray bytes.
inline size_t sequence_length(unsigned char c0) {
    if (c0 < 0x80) return 1;
    if ((c0 >> 5) == 0x6) return 2;
    if ((c0 >> 4) == 0xE) return 3;
    if ((c0 >> 3) == 0x1E) return 4;
    return 1;
}

}  // namespace

std::u32string utf8_to_u32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());

    const auto *p = reinterpret_cast<const unsigned char *>(s.data());
    const auto *end = p + s.size();

    while (p < end) {
        unsigned char c0 = *p;
        size_t len = sequence_length(c0);
        if (len == 1) {
            out.push_back(c0 < 0x80 ? static_cast<char32_t>(c0) : kReplacementChar);
            ++p;
            continue;
        }
        if (static_cast<size_t>(end - p) < len) {
            out.push_back(kReplacementChar);
            break;
        }
        uint32_t cp = 0;
        bool valid = true;
        if (len == 2) {
            cp = c0 & 0x1F;
        } else if (len == 3) {
            cp = c0 & 0x0F;
        } else {
            cp = c0 & 0x07;
        }
        for (size_t k = 1; k < len; ++k) {
            if (!is_continuation(p[k])) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (p[k] & 0x3F);
        }
        if (!valid) {
            out.push_back(kReplacementChar);
            ++p;
            continue;
        }
        // Reject overlong forms, surrogates and out-of-range scalars.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            cp = kReplacementChar;
        }
        out.push_back(static_cast<char32_t>(cp));
        p += len;
    }
    return out;
}

std::string u32_to_utf8(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t ch : s) {
        auto cp = static_cast<uint32_t>(ch);
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            cp = kReplacementChar;
        }
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

size_t utf8_width(char32_t cp) {
    if (cp < 0x80) return 1;
    if (cp < 0x800) return 2;
    if (cp < 0x10000) return 3;
    return 4;
}

size_t utf8_char_count(std::string_view s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if (!is_continuation(c)) {
            ++count;
        }
    }
    return count;
}

size_t utf8_prefix_within(std::string_view s, size_t max_bytes) {
    if (s.size() <= max_bytes) {
        return s.size();
    }
    size_t cut = max_bytes;
    // Back up to the start of the code point that straddles the limit.
    while (cut > 0 && is_continuation(static_cast<unsigned char>(s[cut]))) {
        --cut;
    }
    return cut;
}

std::string utf8_prefix_chars(std::string_view s, size_t max_chars) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(s[i]))) {
            if (seen == max_chars) {
                return std::string(s.substr(0, i));
            }
            ++seen;
        }
    }
    return std::string(s);
}

bool is_space(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\v' ||
           cp == U'\f' || cp == 0x00A0 || cp == 0x3000;
}

bool is_hangul_syllable(char32_t cp) { return cp >= 0xAC00 && cp <= 0xD7A3; }

std::u32string trim(std::u32string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::u32string(s.substr(b, e - b));
}

std::string trim(std::string_view s) { return u32_to_utf8(trim(utf8_to_u32(s))); }

}  // namespace narrationforge
