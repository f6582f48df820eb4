//
//  korean_numerals.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "korean_numerals.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

#include "logging.hpp"
#include "utf8_text.hpp"

namespace narrationforge {

namespace {

struct Numeral {
    std::u32string_view word;
    unsigned value;
};

// Dictionary order is significant: longer forms of the same value come first.
constexpr Numeral kNativeTens[] = {
    {U"열", 10},   {U"스물", 20}, {U"서른", 30}, {U"마흔", 40}, {U"쉰", 50},
    {U"예순", 60}, {U"일흔", 70}, {U"여든", 80}, {U"아흔", 90},
};

constexpr Numeral kNativeOnes[] = {
    {U"하나", 1}, {U"둘", 2},   {U"셋", 3},   {U"넷", 4}, {U"다섯", 5}, {U"여섯", 6}, {U"일곱", 7},
    {U"여덟", 8}, {U"아홉", 9}, {U"한", 1}, {U"두", 2}, {U"세", 3},   {U"네", 4},
};

// Native ones that take a counter directly (`세 명`).
constexpr Numeral kNativeCounted[] = {
    {U"한", 1},   {U"두", 2},   {U"세", 3},   {U"네", 4},   {U"다섯", 5},
    {U"여섯", 6}, {U"일곱", 7}, {U"여덟", 8}, {U"아홉", 9}, {U"열", 10},
};

constexpr Numeral kSinoTens[] = {
    {U"이십", 20}, {U"삼십", 30}, {U"사십", 40}, {U"오십", 50},
    {U"육십", 60}, {U"칠십", 70}, {U"팔십", 80}, {U"구십", 90},
};

constexpr Numeral kSinoOnes[] = {
    {U"일", 1}, {U"이", 2}, {U"삼", 3}, {U"사", 4}, {U"오", 5},
    {U"육", 6}, {U"칠", 7}, {U"팔", 8}, {U"구", 9},
};

constexpr std::u32string_view kSinoDigitChars = U"영일이삼사오육칠팔구";
constexpr std::u32string_view kTensCounters = U"살세명개번년월일시분";
constexpr std::u32string_view kSpacingCounters = U"년월일살세명개번시분초";
constexpr std::u32string_view kStandaloneFollowers = U"만원명개년번살세분초시";
constexpr char32_t kTen = 0xC2ED;          // 십
constexpr char32_t kHundred = 0xBC31;      // 백
constexpr char32_t kThousand = 0xCC9C;     // 천
constexpr char32_t kTenThousand = 0xB9CC;  // 만
constexpr size_t kMaxDigitRun = 15;

// Counters after a native ones word; multi-char entries are matched as a unit.
constexpr std::u32string_view kOnesCounters[] = {U"시간", U"명", U"개", U"번", U"살",
                                                 U"분",   U"달", U"해"};

inline bool contains(std::u32string_view set, char32_t cp) {
    return set.find(cp) != std::u32string_view::npos;
}

inline bool starts_with_at(const std::u32string &s, size_t pos, std::u32string_view word) {
    return s.compare(pos, word.size(), word) == 0;
}

// A numeral word only counts when it starts a word.
inline bool at_word_start(const std::u32string &s, size_t pos) {
    return pos == 0 || !is_hangul_syllable(s[pos - 1]);
}

std::u32string digits(unsigned long long v) {
    const std::string ascii = std::to_string(v);
    return std::u32string(ascii.begin(), ascii.end());
}

std::u32string replace_all(std::u32string s, std::u32string_view from, std::u32string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::u32string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

// Replace every `word` at position p for which `accept(s, p, word.size())` holds.
template <typename Accept>
std::u32string replace_where(std::u32string s, std::u32string_view word, std::u32string_view to,
                             Accept accept) {
    size_t pos = 0;
    while ((pos = s.find(word, pos)) != std::u32string::npos) {
        if (accept(s, pos, word.size())) {
            s.replace(pos, word.size(), to);
            pos += to.size();
        } else {
            pos += 1;
        }
    }
    return s;
}

size_t skip_spaces(const std::u32string &s, size_t pos) {
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }
    return pos;
}

std::u32string native_tens_ones(const std::u32string &in) {
    std::u32string s = in;
    for (const auto &ten : kNativeTens) {
        for (const auto &one : kNativeOnes) {
            std::u32string pattern(ten.word);
            pattern += one.word;
            s = replace_where(std::move(s), pattern, digits(ten.value + one.value),
                              [](const std::u32string &t, size_t p, size_t) {
                                  return at_word_start(t, p);
                              });
        }
    }
    return s;
}

std::u32string native_tens(const std::u32string &in) {
    std::u32string s = in;
    for (const auto &ten : kNativeTens) {
        s = replace_where(std::move(s), ten.word, digits(ten.value),
                          [](const std::u32string &t, size_t p, size_t n) {
                              if (!at_word_start(t, p)) {
                                  return false;
                              }
                              // `열 수` is a verb form, not ten.
                              const size_t next = skip_spaces(t, p + n);
                              return next == t.size() || !is_hangul_syllable(t[next]) ||
                                     contains(kTensCounters, t[next]);
                          });
    }
    return s;
}

std::u32string native_ones_counter(const std::u32string &in) {
    std::u32string s = in;
    for (const auto &one : kNativeCounted) {
        s = replace_where(std::move(s), one.word, digits(one.value),
                          [](const std::u32string &t, size_t p, size_t n) {
                              if (!at_word_start(t, p)) {
                                  return false;
                              }
                              const size_t next = skip_spaces(t, p + n);
                              return std::any_of(std::begin(kOnesCounters), std::end(kOnesCounters),
                                                 [&](std::u32string_view c) {
                                                     return starts_with_at(t, next, c);
                                                 });
                          });
    }
    return s;
}

// Runs such as phone numbers (`일일구`), only when the run is a token of its own.
std::u32string sino_digit_run(const std::u32string &s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (!contains(kSinoDigitChars, s[i]) || !at_word_start(s, i)) {
            out.push_back(s[i++]);
            continue;
        }
        size_t j = i;
        while (j < s.size() && contains(kSinoDigitChars, s[j])) {
            ++j;
        }
        const size_t len = j - i;
        const bool token_end = j == s.size() || !is_hangul_syllable(s[j]);
        if (len >= 2 && len <= 4 && token_end) {
            for (size_t k = i; k < j; ++k) {
                out.push_back(U'0' + static_cast<char32_t>(kSinoDigitChars.find(s[k])));
            }
        } else {
            out.append(s, i, len);
        }
        i = j;
    }
    return out;
}

std::u32string sino_tens(const std::u32string &in) {
    std::u32string s = in;
    for (const auto &ten : kSinoTens) {
        for (const auto &one : kSinoOnes) {
            std::u32string pattern(ten.word);
            pattern += one.word;
            s = replace_all(std::move(s), pattern, digits(ten.value + one.value));
        }
    }
    for (const auto &ten : kSinoTens) {
        s = replace_all(std::move(s), ten.word, digits(ten.value));
    }
    for (const auto &one : kSinoOnes) {
        std::u32string pattern(1, kTen);
        pattern += one.word;
        s = replace_all(std::move(s), pattern, digits(10 + one.value));
    }
    const std::u32string ten_word(1, kTen);
    return replace_where(std::move(s), ten_word, digits(10),
                         [](const std::u32string &t, size_t p, size_t n) {
                             if (!at_word_start(t, p)) {
                                 return false;
                             }
                             const size_t next = p + n;
                             return next == t.size() || !is_hangul_syllable(t[next]) ||
                                    contains(kStandaloneFollowers, t[next]);
                         });
}

// `N<unit>M` -> N*mult+M, `N<unit>` -> N*mult, a standalone `<unit>` -> mult.
std::u32string apply_large_unit(const std::u32string &s, char32_t unit, unsigned long long mult) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != unit) {
            out.push_back(s[i++]);
            continue;
        }
        // Digits already emitted directly before the unit.
        size_t lead = 0;
        while (lead < out.size() && is_ascii_digit(out[out.size() - 1 - lead])) {
            ++lead;
        }
        size_t j = i + 1;
        while (j < s.size() && is_ascii_digit(s[j])) {
            ++j;
        }
        const size_t trail = j - (i + 1);
        if (lead > kMaxDigitRun || trail > kMaxDigitRun) {
            out.push_back(s[i++]);
            continue;
        }
        if (lead > 0) {
            const std::string n(out.end() - static_cast<std::ptrdiff_t>(lead), out.end());
            unsigned long long value = std::stoull(n) * mult;
            if (trail > 0) {
                value += std::stoull(std::string(s.begin() + static_cast<std::ptrdiff_t>(i + 1),
                                                 s.begin() + static_cast<std::ptrdiff_t>(j)));
            }
            out.resize(out.size() - lead);
            out += digits(value);
            i = j;
            continue;
        }
        const bool standalone =
            trail == 0 && at_word_start(s, i) &&
            (i + 1 == s.size() || !is_hangul_syllable(s[i + 1]) ||
             contains(kStandaloneFollowers, s[i + 1]));
        if (standalone) {
            out += digits(mult);
        } else {
            out.push_back(s[i]);
        }
        ++i;
    }
    return out;
}

std::u32string large_units(const std::u32string &in) {
    // Hundreds first so that `2천5백` becomes `2천500` and then `2500`.
    return apply_large_unit(apply_large_unit(in, kHundred, 100), kThousand, 1000);
}

std::u32string spacing(const std::u32string &s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (!is_ascii_digit(s[i])) {
            out.push_back(s[i++]);
            continue;
        }
        while (i < s.size() && is_ascii_digit(s[i])) {
            out.push_back(s[i++]);
        }
        // digits [space] 만|천|백 [space] 원|명|개
        size_t j = skip_spaces(s, i);
        if (j < s.size() &&
            (s[j] == kTenThousand || s[j] == kThousand || s[j] == kHundred)) {
            size_t k = skip_spaces(s, j + 1);
            if (k < s.size() && (s[k] == U'원' || s[k] == U'명' || s[k] == U'개')) {
                out.push_back(s[j]);
                out.push_back(s[k]);
                i = k + 1;
                continue;
            }
        }
        // digits space+ counter
        if (j > i && j < s.size() && contains(kSpacingCounters, s[j])) {
            i = j;
        }
    }
    return out;
}

}  // namespace

const std::vector<NumeralRule> &numeral_rules() {
    static const std::vector<NumeralRule> rules = {
        {"native-tens-ones", &native_tens_ones},
        {"native-tens", &native_tens},
        {"native-ones-counter", &native_ones_counter},
        {"sino-digit-run", &sino_digit_run},
        {"sino-tens", &sino_tens},
        {"large-units", &large_units},
        {"spacing", &spacing},
    };
    return rules;
}

std::string apply_numeral_rule(std::string_view name, std::string_view text) {
    for (const auto &rule : numeral_rules()) {
        if (name == rule.name) {
            return u32_to_utf8(rule.apply(utf8_to_u32(text)));
        }
    }
    NF_LOG("warn", "unknown numeral rule '" << name << "'");
    return std::string(text);
}

std::string convert_spoken_numerals(std::string_view text) {
    std::u32string s = utf8_to_u32(text);
    for (const auto &rule : numeral_rules()) {
        s = rule.apply(s);
    }
    return u32_to_utf8(s);
}

}  // namespace narrationforge
