//
//  caption_formatter.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "caption_segmenter.hpp"
#include "timeline_estimator.hpp"

namespace narrationforge {

enum class CaptionStyle { Srt, Vtt };

// Speaker tag that is never printed.
inline constexpr std::string_view kNarratorTag = "나레이션";

// "srt" / "vtt" (case-insensitive).
std::optional<CaptionStyle> parse_caption_style(std::string_view name);

// HH:MM:SS,mmm (SRT) or HH:MM:SS.mmm (VTT), rounded to the nearest millisecond.
std::string format_timestamp(double seconds, CaptionStyle style);

// Caption text as displayed: numerals as digits, `[speaker] ` prefix when tagged.
std::string display_text(const CaptionUnit &unit);

/**
 * @brief Render captions.
 *
 * `timeline[i]` times `units[i]`; extra entries on either side are ignored.
 * VTT output starts with the `WEBVTT` header even when there are no units.
 */
std::string format_captions(const Timeline &timeline, const std::vector<CaptionUnit> &units,
                            CaptionStyle style);

}  // namespace narrationforge
