//
//  emotion_annotator.hpp
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

#include "byte_budget_chunker.hpp"

namespace narrationforge {

// Emotional sentences are read at this fraction of the base speaking rate.
inline constexpr double kEmotionRateFactor = 0.9;
// Slowest rate the provider accepts.
inline constexpr double kMinSpeakingRate = 0.25;

/// @ingroup api
/// What is actually sent to the provider for one chunk.
struct AnnotatedChunk {
    std::string content;     ///< plain text or a `<speak>` document
    bool is_markup = false;  ///< true when `content` is pacing markup
    size_t byte_length = 0;  ///< UTF-8 size of `content`, always < hard ceiling
};

// Trigger substrings (physical reactions, emotional states, intensifiers, loss words).
const std::vector<std::string> &emotion_lexicon();

// True when `text` contains any lexicon entry.
bool contains_emotion_trigger(std::string_view text);

// Rate used inside `<prosody>` for emotional sentences.
double emotion_rate(double base_rate);

/**
 * @brief Wrap emotional sentences of `chunk` in pacing markup.
 *
 * Chunks without triggers are returned unchanged. Markup that reaches `hard_ceiling`
 * is discarded in favour of the plain chunk; plain text that reaches it is truncated
 * at a code point boundary.
 */
AnnotatedChunk annotate(std::string_view chunk, double base_rate,
                        size_t hard_ceiling = kProviderHardCeilingBytes);

}  // namespace narrationforge
