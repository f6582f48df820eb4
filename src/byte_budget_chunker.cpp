//
//  byte_budget_chunker.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "byte_budget_chunker.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>

#include "logging.hpp"
#include "utf8_text.hpp"

namespace narrationforge {

namespace {

inline bool is_sentence_terminal(char32_t cp) {
    return cp == U'.' || cp == U'!' || cp == U'?' || cp == 0x3002 /* 。 */ ||
           cp == 0xFF01 /* ！ */ || cp == 0xFF1F /* ？ */ || cp == 0x2026 /* … */;
}

inline bool is_comma_separator(char32_t cp) {
    return cp == U',' || cp == 0xFF0C /* ， */ || cp == 0x3001 /* 、 */;
}

void emit_trimmed(std::vector<std::string> &out, std::u32string_view piece) {
    auto t = trim(restore_decimals(piece));
    if (!t.empty()) {
        out.push_back(u32_to_utf8(t));
    }
}

inline bool in_number_run(char32_t cp) { return is_ascii_digit(cp) || cp == kDecimalPlaceholder; }

// Placeholders go back to a one-byte '.' when emitted.
size_t restored_width(char32_t cp) { return cp == kDecimalPlaceholder ? 1 : utf8_width(cp); }

// A cut at `cut` that would land inside a `digit.digit` run moves to the start of
// the run when the run fits the budget on its own.
size_t decimal_safe_cut(const std::u32string &cps, size_t start, size_t cut, size_t byte_budget) {
    if (!in_number_run(cps[cut - 1]) || !in_number_run(cps[cut])) {
        return cut;
    }
    size_t run_begin = cut;
    while (run_begin > start && in_number_run(cps[run_begin - 1])) {
        --run_begin;
    }
    size_t run_end = cut;
    while (run_end < cps.size() && in_number_run(cps[run_end])) {
        ++run_end;
    }
    const bool has_decimal =
        std::find(cps.begin() + static_cast<std::ptrdiff_t>(run_begin),
                  cps.begin() + static_cast<std::ptrdiff_t>(run_end),
                  kDecimalPlaceholder) != cps.begin() + static_cast<std::ptrdiff_t>(run_end);
    if (!has_decimal || run_begin == start || run_end - run_begin > byte_budget) {
        return cut;
    }
    return run_begin;
}

size_t clamp_budget(size_t byte_budget) {
    if (byte_budget < kMinByteBudget) {
        NF_LOG("warn", "byte budget " << byte_budget << " below minimum; using "
                                      << kMinByteBudget);
        return kMinByteBudget;
    }
    return byte_budget;
}

}  // namespace

const std::vector<SplitStrategy> &split_strategy_order() {
    static const std::vector<SplitStrategy> order = {SplitStrategy::Sentence, SplitStrategy::Comma,
                                                     SplitStrategy::ForcedByte};
    return order;
}

const char *split_strategy_name(SplitStrategy strategy) {
    switch (strategy) {
        case SplitStrategy::Sentence:
            return "sentence";
        case SplitStrategy::Comma:
            return "comma";
        case SplitStrategy::ForcedByte:
            return "forced-byte";
    }
    return "unknown";
}

std::vector<std::string> apply_split_strategy(SplitStrategy strategy, std::string_view text,
                                              size_t byte_budget) {
    switch (strategy) {
        case SplitStrategy::Sentence:
            return split_sentences(text);
        case SplitStrategy::Comma:
            return split_at_commas(text, byte_budget);
        case SplitStrategy::ForcedByte:
            return split_by_bytes(text, byte_budget);
    }
    return {};
}

std::u32string protect_decimals(std::u32string_view text) {
    std::u32string out(text);
    for (size_t i = 1; i + 1 < out.size(); ++i) {
        if (out[i] == U'.' && is_ascii_digit(out[i - 1]) && is_ascii_digit(out[i + 1])) {
            out[i] = kDecimalPlaceholder;
        }
    }
    return out;
}

std::u32string restore_decimals(std::u32string_view text) {
    std::u32string out(text);
    std::replace(out.begin(), out.end(), kDecimalPlaceholder, U'.');
    return out;
}

std::vector<std::string> split_sentences(std::string_view text) {
    std::vector<std::string> sentences;
    const std::u32string protected_text = protect_decimals(utf8_to_u32(text));

    size_t start = 0;
    size_t i = 0;
    while (i < protected_text.size()) {
        if (!is_sentence_terminal(protected_text[i])) {
            ++i;
            continue;
        }
        // Keep runs such as "?!" or "..." with the sentence they close.
        while (i < protected_text.size() && is_sentence_terminal(protected_text[i])) {
            ++i;
        }
        emit_trimmed(sentences, std::u32string_view(protected_text).substr(start, i - start));
        start = i;
    }
    if (start < protected_text.size()) {
        emit_trimmed(sentences, std::u32string_view(protected_text).substr(start));
    }
    return sentences;
}

std::vector<std::string> split_at_commas(std::string_view sentence, size_t byte_budget) {
    const std::u32string text = utf8_to_u32(sentence);

    // Separator and its trailing whitespace stay with the left part.
    std::vector<std::u32string> parts;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_comma_separator(text[i])) {
            ++i;
            continue;
        }
        ++i;
        while (i < text.size() && is_space(text[i])) {
            ++i;
        }
        parts.emplace_back(text.substr(start, i - start));
        start = i;
    }
    if (start < text.size()) {
        parts.emplace_back(text.substr(start));
    }

    std::vector<std::string> pieces;
    std::string current;
    for (const auto &part : parts) {
        std::string encoded = u32_to_utf8(part);
        if (current.size() + encoded.size() <= byte_budget) {
            current += encoded;
            continue;
        }
        std::string flushed = trim(current);
        if (!flushed.empty()) {
            pieces.push_back(std::move(flushed));
        }
        current = std::move(encoded);
    }
    std::string flushed = trim(current);
    if (!flushed.empty()) {
        pieces.push_back(std::move(flushed));
    }
    return pieces;
}

std::vector<std::string> split_by_bytes(std::string_view text, size_t byte_budget) {
    byte_budget = clamp_budget(byte_budget);
    std::vector<std::string> pieces;
    const std::u32string cps = protect_decimals(utf8_to_u32(text));
    const std::u32string_view view(cps);
    size_t start = 0;
    size_t current_bytes = 0;
    for (size_t i = 0; i < cps.size(); ++i) {
        const size_t w = restored_width(cps[i]);
        if (current_bytes + w > byte_budget && i > start) {
            const size_t cut = decimal_safe_cut(cps, start, i, byte_budget);
            if (cut != i) {
                NF_LOG("debug", "forced cut moved before decimal at " << cut);
            }
            emit_trimmed(pieces, view.substr(start, cut - start));
            current_bytes = 0;
            for (size_t k = cut; k < i; ++k) {
                current_bytes += restored_width(cps[k]);
            }
            start = cut;
        }
        current_bytes += w;
    }
    if (start < cps.size()) {
        emit_trimmed(pieces, view.substr(start));
    }
    return pieces;
}

std::vector<std::string> pack_greedy(const std::vector<std::string> &pieces, size_t byte_budget) {
    std::vector<std::string> packed;
    std::string current;
    for (const auto &piece : pieces) {
        if (current.empty()) {
            current = piece;
        } else if (current.size() + 1 + piece.size() <= byte_budget) {
            current += ' ';
            current += piece;
        } else {
            packed.push_back(std::move(current));
            current = piece;
        }
    }
    if (!current.empty()) {
        packed.push_back(std::move(current));
    }
    return packed;
}

std::vector<std::string> split_to_budget(std::string_view sentence, size_t byte_budget) {
    byte_budget = clamp_budget(byte_budget);
    std::vector<std::string> pieces{std::string(sentence)};
    for (SplitStrategy strategy : split_strategy_order()) {
        if (strategy == SplitStrategy::Sentence) {
            continue;
        }
        const bool all_fit = std::all_of(pieces.begin(), pieces.end(), [&](const std::string &p) {
            return p.size() <= byte_budget;
        });
        if (all_fit) {
            break;
        }
        std::vector<std::string> next;
        for (auto &piece : pieces) {
            if (piece.size() <= byte_budget) {
                next.push_back(std::move(piece));
                continue;
            }
            NF_LOG("debug", "chunker: " << piece.size() << " byte piece exceeds " << byte_budget
                                        << "; applying " << split_strategy_name(strategy)
                                        << " split");
            auto refined = apply_split_strategy(strategy, piece, byte_budget);
            next.insert(next.end(), std::make_move_iterator(refined.begin()),
                        std::make_move_iterator(refined.end()));
        }
        pieces = std::move(next);
    }
    return pieces;
}

std::vector<TextChunk> chunk_text(std::string_view text, size_t byte_budget) {
    std::vector<TextChunk> chunks;
    if (text.empty()) {
        return chunks;
    }
    byte_budget = clamp_budget(byte_budget);

    std::vector<std::string> out;
    std::vector<std::string> pending;  // sentences that fit, waiting to be packed
    auto flush_pending = [&]() {
        auto packed = pack_greedy(pending, byte_budget);
        out.insert(out.end(), std::make_move_iterator(packed.begin()),
                   std::make_move_iterator(packed.end()));
        pending.clear();
    };

    for (auto &sentence : split_sentences(text)) {
        if (sentence.size() <= byte_budget) {
            pending.push_back(std::move(sentence));
            continue;
        }
        flush_pending();
        auto pieces = split_to_budget(sentence, byte_budget);
        out.insert(out.end(), std::make_move_iterator(pieces.begin()),
                   std::make_move_iterator(pieces.end()));
    }
    flush_pending();

    if (out.empty()) {
        std::string prefix = utf8_prefix_chars(text, kFallbackPrefixChars);
        prefix.resize(utf8_prefix_within(prefix, byte_budget));
        NF_LOG("warn", "chunker: no sentence produced; using " << prefix.size()
                                                               << " byte prefix as single chunk");
        out.push_back(std::move(prefix));
    }

    chunks.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        TextChunk c{};
        c.index = i;
        c.byte_length = out[i].size();
        c.text = std::move(out[i]);
        chunks.push_back(std::move(c));
    }
    NF_LOG("debug", "chunker: " << text.size() << " bytes -> " << chunks.size()
                                << " chunks (budget " << byte_budget << ")");
    return chunks;
}

std::vector<SceneChunk> build_chunks_for_scenes(const std::vector<SceneInput> &scenes,
                                                size_t byte_budget) {
    std::vector<SceneChunk> all_chunks;
    for (const auto &scene : scenes) {
        const std::string narration = trim(scene.narration);
        if (narration.empty()) {
            continue;
        }
        const std::string scene_id =
            scene.id.empty() ? "scene_" + std::to_string(all_chunks.size()) : scene.id;
        for (auto &chunk : chunk_text(narration, byte_budget)) {
            SceneChunk sc{};
            sc.scene_id = scene_id;
            sc.chunk_index = chunk.index;
            sc.sentences = split_sentences(chunk.text);
            sc.byte_length = chunk.byte_length;
            sc.text = std::move(chunk.text);
            all_chunks.push_back(std::move(sc));
        }
    }
    return all_chunks;
}

ChunkStats estimate_chunk_stats(const std::vector<SceneChunk> &chunks) {
    ChunkStats stats{};
    if (chunks.empty()) {
        return stats;
    }
    stats.total_chunks = chunks.size();
    stats.min_bytes = std::numeric_limits<size_t>::max();
    for (const auto &c : chunks) {
        stats.total_bytes += c.byte_length;
        stats.max_bytes = std::max(stats.max_bytes, c.byte_length);
        stats.min_bytes = std::min(stats.min_bytes, c.byte_length);
    }
    stats.avg_bytes = stats.total_bytes / chunks.size();
    return stats;
}

}  // namespace narrationforge
