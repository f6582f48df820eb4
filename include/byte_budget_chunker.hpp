//
//  byte_budget_chunker.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "scene_input.hpp"

namespace narrationforge {

// Provider limit for one synthesis request, markup included.
inline constexpr size_t kProviderHardCeilingBytes = 5000;
// Plain-text budget leaving headroom for pacing markup added later.
inline constexpr size_t kPlainTextChunkBudgetBytes = 2500;
// Budget for scene chunks that are never annotated.
inline constexpr size_t kSceneChunkBudgetBytes = 4800;
// Smallest usable budget: one code point of any width must fit.
inline constexpr size_t kMinByteBudget = 4;
// Bound on the prefix returned when nothing else could be produced.
inline constexpr size_t kFallbackPrefixChars = 1000;

// Stand-in for the period of a `digit.digit` run while sentences are cut.
inline constexpr char32_t kDecimalPlaceholder = 0xE000;

/// @ingroup api
/// A synthesis-safe slice of narration.
struct TextChunk {
    size_t index = 0;        ///< 0-based position in narration order
    std::string text;        ///< UTF-8 text, byte_length <= budget
    size_t byte_length = 0;  ///< UTF-8 size of text
};

/**
 * @brief Split tiers, applied in order until a piece fits the budget.
 *
 * Sentence: cut after terminal punctuation runs (. ! ? 。 ！ ？ …).
 * Comma: cut after comma-class separators (, ， 、) and pack greedily.
 * ForcedByte: cut at code point boundaries by size alone.
 */
enum class SplitStrategy { Sentence, Comma, ForcedByte };

const std::vector<SplitStrategy> &split_strategy_order();
const char *split_strategy_name(SplitStrategy strategy);

// Run a single tier on `text`. Only Comma and ForcedByte look at the budget.
std::vector<std::string> apply_split_strategy(SplitStrategy strategy, std::string_view text,
                                              size_t byte_budget);

// Decimal protection (reversible).
std::u32string protect_decimals(std::u32string_view text);
std::u32string restore_decimals(std::u32string_view text);

// Sentence tier: trimmed sentences, terminal punctuation attached, decimals intact.
std::vector<std::string> split_sentences(std::string_view text);

// Comma tier: pieces packed up to the budget; pieces may still exceed it when a
// single comma-free run is longer than the budget.
std::vector<std::string> split_at_commas(std::string_view sentence, size_t byte_budget);

// ForcedByte tier: every piece fits the budget (budget >= kMinByteBudget).
std::vector<std::string> split_by_bytes(std::string_view text, size_t byte_budget);

// Greedy single-space packing of pieces that each fit the budget.
std::vector<std::string> pack_greedy(const std::vector<std::string> &pieces, size_t byte_budget);

// Apply the tiers after Sentence to one oversized sentence.
std::vector<std::string> split_to_budget(std::string_view sentence, size_t byte_budget);

/**
 * @brief Chunk narration so every chunk encodes to at most `byte_budget` bytes.
 *
 * Empty input yields no chunks; any other input yields at least one.
 */
std::vector<TextChunk> chunk_text(std::string_view text,
                                  size_t byte_budget = kPlainTextChunkBudgetBytes);

/// Chunk bound to its scene (multi-scene requests).
struct SceneChunk {
    std::string scene_id;
    size_t chunk_index = 0;  ///< 0-based within its scene
    std::string text;
    std::vector<std::string> sentences;
    size_t byte_length = 0;
};

struct ChunkStats {
    size_t total_chunks = 0;
    size_t total_bytes = 0;
    size_t avg_bytes = 0;
    size_t max_bytes = 0;
    size_t min_bytes = 0;
};

// Scenes with blank narration are skipped.
std::vector<SceneChunk> build_chunks_for_scenes(const std::vector<SceneInput> &scenes,
                                                size_t byte_budget = kSceneChunkBudgetBytes);

ChunkStats estimate_chunk_stats(const std::vector<SceneChunk> &chunks);

}  // namespace narrationforge
