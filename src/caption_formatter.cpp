//
//  caption_formatter.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "caption_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "korean_numerals.hpp"
#include "logging.hpp"

namespace narrationforge {

std::optional<CaptionStyle> parse_caption_style(std::string_view name) {
    std::string lower(name);
    for (auto &c : lower) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "srt") return CaptionStyle::Srt;
    if (lower == "vtt" || lower == "webvtt") return CaptionStyle::Vtt;
    return std::nullopt;
}

std::string format_timestamp(double seconds, CaptionStyle style) {
    const long long total_ms = std::max(0LL, std::llround(seconds * 1000.0));
    const long long hours = total_ms / 3600000;
    const long long minutes = (total_ms / 60000) % 60;
    const long long secs = (total_ms / 1000) % 60;
    const long long millis = total_ms % 1000;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ":" << std::setw(2) << minutes << ":"
        << std::setw(2) << secs << (style == CaptionStyle::Srt ? ',' : '.') << std::setw(3)
        << millis;
    return oss.str();
}

std::string display_text(const CaptionUnit &unit) {
    std::string text = convert_spoken_numerals(unit.text);
    if (!unit.speaker.empty() && unit.speaker != kNarratorTag) {
        return "[" + unit.speaker + "] " + text;
    }
    return text;
}

std::string format_captions(const Timeline &timeline, const std::vector<CaptionUnit> &units,
                            CaptionStyle style) {
    if (timeline.size() != units.size()) {
        NF_LOG("warn", "captions: " << timeline.size() << " timeline entries for " << units.size()
                                    << " units; rendering the common prefix");
    }
    const size_t count = std::min(timeline.size(), units.size());

    std::ostringstream oss;
    if (style == CaptionStyle::Vtt) {
        oss << "WEBVTT\n";
        if (count == 0) {
            return oss.str();
        }
        oss << "\n";
    }
    for (size_t i = 0; i < count; ++i) {
        if (i != 0) {
            oss << "\n";
        }
        if (style == CaptionStyle::Srt) {
            oss << (i + 1) << "\n";
        }
        oss << format_timestamp(timeline[i].start, style) << " --> "
            << format_timestamp(timeline[i].end, style) << "\n"
            << display_text(units[i]) << "\n";
    }
    return oss.str();
}

}  // namespace narrationforge
