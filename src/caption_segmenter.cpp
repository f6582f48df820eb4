//
//  caption_segmenter.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption_segmenter.hpp"

#include "logging.hpp"
#include "utf8_text.hpp"

namespace narrationforge {

namespace {

inline bool is_caption_terminal(char32_t cp) {
    return cp == U'.' || cp == U'!' || cp == U'?' || cp == 0x3002 /* 。 */;
}

constexpr char32_t kGo = 0xACE0;    // 고
constexpr char32_t kMyeo = 0xBA70;  // 며
constexpr char32_t kMyeon = 0xBA74; // 면
constexpr char32_t kSeo = 0xC11C;   // 서
constexpr char32_t kNeun = 0xB294;  // 는
constexpr char32_t kDe = 0xB370;    // 데

// Length of the connector starting at `i`, 0 when there is none. The connector
// includes its trailing whitespace.
size_t connector_length_at(const std::u32string &s, size_t i) {
    auto spaces_from = [&](size_t k) {
        size_t n = 0;
        while (k + n < s.size() && is_space(s[k + n])) {
            ++n;
        }
        return n;
    };
    if (s[i] == U',') {
        return 1 + spaces_from(i + 1);
    }
    if (i == 0 || !is_hangul_syllable(s[i - 1])) {
        return 0;
    }
    if (s[i] == kGo || s[i] == kMyeo || s[i] == kMyeon || s[i] == kSeo) {
        const size_t n = spaces_from(i + 1);
        return n > 0 ? 1 + n : 0;
    }
    if (s[i] == kNeun && i + 1 < s.size() && s[i + 1] == kDe) {
        const size_t n = spaces_from(i + 2);
        return n > 0 ? 2 + n : 0;
    }
    return 0;
}

void push_trimmed(std::vector<std::string> &out, std::u32string_view s) {
    auto t = trim(s);
    if (!t.empty()) {
        out.push_back(u32_to_utf8(t));
    }
}

}  // namespace

std::vector<std::string> split_caption_sentences(std::string_view text) {
    std::vector<std::string> out;
    const std::u32string all = utf8_to_u32(text);
    size_t line_start = 0;
    while (line_start <= all.size()) {
        size_t line_end = all.find(U'\n', line_start);
        if (line_end == std::u32string::npos) {
            line_end = all.size();
        }
        const std::u32string line = trim(std::u32string_view(all).substr(line_start, line_end - line_start));
        size_t start = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            if (is_caption_terminal(line[i])) {
                push_trimmed(out, std::u32string_view(line).substr(start, i + 1 - start));
                start = i + 1;
            }
        }
        if (start < line.size()) {
            push_trimmed(out, std::u32string_view(line).substr(start));
        }
        line_start = line_end + 1;
    }
    return out;
}

std::vector<std::string> split_at_connectors(std::string_view unit, size_t max_chars) {
    const std::u32string s = utf8_to_u32(unit);

    // Alternating text pieces and connectors; connectors always stick to the left.
    std::vector<std::string> out;
    std::u32string current;
    std::u32string piece;
    auto take_piece = [&]() {
        if (piece.empty()) {
            return;
        }
        if (current.size() + piece.size() <= max_chars) {
            current += piece;
        } else {
            push_trimmed(out, current);
            current = piece;
        }
        piece.clear();
    };

    size_t i = 0;
    while (i < s.size()) {
        const size_t n = connector_length_at(s, i);
        if (n == 0) {
            piece.push_back(s[i++]);
            continue;
        }
        take_piece();
        current.append(s, i, n);
        i += n;
    }
    take_piece();
    push_trimmed(out, current);
    return out;
}

std::vector<std::string> split_at_words(std::string_view unit, size_t max_chars) {
    std::vector<std::u32string> words;
    std::u32string word;
    for (char32_t cp : utf8_to_u32(unit)) {
        if (is_space(cp)) {
            if (!word.empty()) {
                words.push_back(std::move(word));
                word.clear();
            }
        } else {
            word.push_back(cp);
        }
    }
    if (!word.empty()) {
        words.push_back(std::move(word));
    }

    std::vector<std::string> out;
    std::u32string current;
    auto flush = [&]() {
        if (!current.empty()) {
            out.push_back(u32_to_utf8(current));
            current.clear();
        }
    };
    for (auto &w : words) {
        if (w.size() > max_chars) {
            flush();
            NF_LOG("debug", "captions: hard cutting " << w.size() << " char word");
            for (size_t k = 0; k < w.size(); k += max_chars) {
                out.push_back(u32_to_utf8(w.substr(k, max_chars)));
            }
            continue;
        }
        if (current.empty()) {
            current = std::move(w);
        } else if (current.size() + 1 + w.size() <= max_chars) {
            current.push_back(U' ');
            current += w;
        } else {
            flush();
            current = std::move(w);
        }
    }
    flush();
    return out;
}

std::vector<std::string> merge_short_units(const std::vector<std::string> &units,
                                           const CaptionConfig &config) {
    if (units.size() <= 1) {
        return units;
    }
    auto join = [&](const std::string &a, const std::string &b) {
        std::string combined = a + " " + b;
        if (utf8_char_count(combined) <= config.max_chars) {
            return combined;
        }
        return a + "\n" + b;
    };

    std::vector<std::string> merged;
    size_t i = 0;
    while (i < units.size()) {
        const std::string &current = units[i];
        if (utf8_char_count(current) >= config.min_chars) {
            merged.push_back(current);
            ++i;
            continue;
        }
        if (i + 1 < units.size()) {
            merged.push_back(join(current, units[i + 1]));
            i += 2;
        } else if (!merged.empty()) {
            std::string prev = std::move(merged.back());
            merged.pop_back();
            merged.push_back(join(prev, current));
            ++i;
        } else {
            merged.push_back(current);
            ++i;
        }
    }
    return merged;
}

std::vector<CaptionUnit> segment_captions(std::string_view text, const CaptionConfig &config_in) {
    CaptionConfig config = config_in;
    if (config.max_chars == 0) {
        NF_LOG("warn", "captions: max_chars 0 is unusable; using " << kCaptionMaxChars);
        config.max_chars = kCaptionMaxChars;
    }

    std::vector<std::string> stage;
    for (auto &sentence : split_caption_sentences(text)) {
        if (utf8_char_count(sentence) <= config.max_chars) {
            stage.push_back(std::move(sentence));
            continue;
        }
        auto parts = split_at_connectors(sentence, config.max_chars);
        stage.insert(stage.end(), parts.begin(), parts.end());
    }

    std::vector<std::string> fitted;
    for (auto &unit : stage) {
        if (utf8_char_count(unit) <= config.max_chars) {
            fitted.push_back(std::move(unit));
            continue;
        }
        auto parts = split_at_words(unit, config.max_chars);
        fitted.insert(fitted.end(), parts.begin(), parts.end());
    }

    auto texts = merge_short_units(fitted, config);

    if (texts.empty()) {
        auto trimmed = trim(text);
        if (!trimmed.empty()) {
            texts.push_back(utf8_prefix_chars(trimmed, config.max_chars));
        }
    }

    std::vector<CaptionUnit> units;
    units.reserve(texts.size());
    for (auto &t : texts) {
        units.push_back(CaptionUnit{std::move(t), {}});
    }
    NF_LOG("debug", "captions: " << units.size() << " units (max " << config.max_chars
                                 << ", min " << config.min_chars << ")");
    return units;
}

}  // namespace narrationforge
