//
//  synthesis_text.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "synthesis_text.hpp"

#include "utf8_text.hpp"

namespace narrationforge {

namespace {

constexpr char32_t kDecimalWord = 0xC810;  // 점

std::u32string spell_out_decimals(const std::u32string &in) {
    std::u32string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == U'.' && i > 0 && i + 1 < in.size() && is_ascii_digit(in[i - 1]) &&
            is_ascii_digit(in[i + 1])) {
            out.push_back(kDecimalWord);
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

std::u32string space_after_commas(const std::u32string &in) {
    std::u32string out;
    out.reserve(in.size() + in.size() / 8);
    for (size_t i = 0; i < in.size(); ++i) {
        out.push_back(in[i]);
        if (in[i] == U',' && i + 1 < in.size() && !is_space(in[i + 1])) {
            out.push_back(U' ');
        }
    }
    return out;
}

// `,` followed by optional whitespace and one or more commas becomes a single `,`.
std::u32string collapse_comma_runs(const std::u32string &in) {
    std::u32string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        if (in[i] != U',') {
            out.push_back(in[i++]);
            continue;
        }
        size_t j = i + 1;
        while (j < in.size() && is_space(in[j])) {
            ++j;
        }
        if (j < in.size() && in[j] == U',') {
            while (j < in.size() && in[j] == U',') {
                ++j;
            }
            out.push_back(U',');
            i = j;
            continue;
        }
        out.push_back(in[i++]);
    }
    return out;
}

}  // namespace

std::string preprocess_for_synthesis(std::string_view text, const SynthesisTextOptions &options) {
    if (text.empty()) {
        return {};
    }
    std::u32string u = utf8_to_u32(text);
    if (options.spell_out_decimals) {
        u = spell_out_decimals(u);
    }
    u = space_after_commas(u);
    u = collapse_comma_runs(u);
    return u32_to_utf8(u);
}

std::string escape_markup(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

}  // namespace narrationforge
