//
//  timeline_estimator.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timeline_estimator.hpp"

#include <algorithm>

#include "logging.hpp"
#include "utf8_text.hpp"

namespace narrationforge {

double seconds_per_char(const TimingMode &mode, size_t narration_chars) {
    if (mode.kind == TimingMode::Kind::RealDuration) {
        return mode.total_seconds / static_cast<double>(std::max<size_t>(1, narration_chars));
    }
    const double base = mode.base_chars_per_second > 0.0 ? mode.base_chars_per_second
                                                         : 1.0 / kDefaultSecondsPerChar;
    return (1.0 / base) * (1.0 - mode.speed * kSpeedStepFactor);
}

Timeline estimate_timeline(const std::vector<CaptionUnit> &units, const TimingMode &mode,
                           size_t narration_chars) {
    Timeline timeline;
    timeline.reserve(units.size());

    std::vector<size_t> lengths;
    lengths.reserve(units.size());
    size_t total_chars = 0;
    for (const auto &u : units) {
        lengths.push_back(utf8_char_count(u.text));
        total_chars += lengths.back();
    }
    if (mode.kind == TimingMode::Kind::RealDuration && narration_chars == 0) {
        narration_chars = total_chars;
    }
    const double per_char = seconds_per_char(mode, narration_chars);
    NF_LOG("debug", "timeline: " << units.size() << " units, " << per_char << " s/char ("
                                 << (mode.kind == TimingMode::Kind::RealDuration ? "real duration"
                                                                                 : "heuristic")
                                 << ")");

    double cursor = 0.0;
    for (size_t i = 0; i < units.size(); ++i) {
        double unit_per_char = per_char;
        if (mode.kind == TimingMode::Kind::RateHeuristic && mode.emotion_slowdown > 0.0 &&
            contains_emotion_trigger(units[i].text)) {
            unit_per_char /= mode.emotion_slowdown;
        }
        const double duration = std::clamp(static_cast<double>(lengths[i]) * unit_per_char,
                                           kMinUnitSeconds, kMaxUnitSeconds);
        TimelineEntry e{};
        e.id = i + 1;
        e.start = cursor;
        e.end = cursor + duration;
        timeline.push_back(e);
        cursor = e.end + kCaptionGapSeconds;
    }
    return timeline;
}

double count_spoken_syllables(std::string_view text) {
    size_t hangul = 0;
    size_t ascii_alnum = 0;
    for (char32_t cp : utf8_to_u32(text)) {
        if (is_hangul_syllable(cp)) {
            ++hangul;
        } else if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || is_ascii_digit(cp)) {
            ++ascii_alnum;
        }
    }
    return static_cast<double>(hangul) + static_cast<double>(ascii_alnum) * 0.5;
}

double syllables_per_second(std::string_view emotion) {
    if (emotion == "nostalgia") return 3.0;
    if (emotion == "warmth") return 3.2;
    if (emotion == "bittersweet") return 3.1;
    if (emotion == "comfort") return 3.2;
    return kDefaultSyllablesPerSecond;
}

double estimate_scene_duration(std::string_view narration, std::string_view emotion) {
    if (narration.empty()) {
        return kMinSceneSeconds;
    }
    const double d = count_spoken_syllables(narration) / syllables_per_second(emotion);
    return std::clamp(d, kMinSceneSeconds, kMaxSceneSeconds);
}

std::vector<SceneTimelineEntry> estimate_scene_timeline(const std::vector<SceneInput> &scenes) {
    std::vector<SceneTimelineEntry> out;
    out.reserve(scenes.size());
    double cursor = 0.0;
    for (size_t i = 0; i < scenes.size(); ++i) {
        const auto &scene = scenes[i];
        SceneTimelineEntry e{};
        e.id = scene.id.empty() ? "scene" + std::to_string(i + 1) : scene.id;
        e.start = cursor;
        e.end = cursor + estimate_scene_duration(trim(scene.narration), scene.emotion);
        cursor = e.end;
        out.push_back(std::move(e));
    }
    return out;
}

}  // namespace narrationforge
