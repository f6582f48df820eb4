//
//  caption_segmenter.hpp
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

namespace narrationforge {

// Caption widths in code points.
inline constexpr size_t kCaptionMaxChars = 35;
inline constexpr size_t kCaptionMaxCharsNarrow = 22;
inline constexpr size_t kCaptionMaxCharsVertical = 18;
inline constexpr size_t kCaptionMinChars = 10;

struct CaptionConfig {
    size_t max_chars = kCaptionMaxChars;  ///< per display line
    size_t min_chars = kCaptionMinChars;  ///< shorter units are merged with a neighbour
};

/// @ingroup api
/// One caption. `text` may hold two display lines joined by '\n'.
struct CaptionUnit {
    std::string text;
    std::string speaker;  ///< optional speaker tag, empty for the narrator
};

/**
 * @brief Cut narration into caption-sized units.
 *
 * Lines and sentence ends first, then clause connectors (comma, 고/며/면/서/는데),
 * then whitespace, then hard cuts. Units shorter than `min_chars` are merged with
 * a neighbour afterwards.
 */
std::vector<CaptionUnit> segment_captions(std::string_view text, const CaptionConfig &config = {});

// Lines, then sentence ends (. ! ? 。); trimmed, empties dropped.
std::vector<std::string> split_caption_sentences(std::string_view text);

// Re-split one unit longer than `max_chars` at clause connectors.
std::vector<std::string> split_at_connectors(std::string_view unit, size_t max_chars);

// Re-split one unit longer than `max_chars` at whitespace; words longer than
// `max_chars` are cut into `max_chars` slices.
std::vector<std::string> split_at_words(std::string_view unit, size_t max_chars);

// Merge post-pass over the final unit texts.
std::vector<std::string> merge_short_units(const std::vector<std::string> &units,
                                           const CaptionConfig &config);

}  // namespace narrationforge
