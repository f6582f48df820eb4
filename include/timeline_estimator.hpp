//
//  timeline_estimator.hpp
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

#include "caption_segmenter.hpp"
#include "emotion_annotator.hpp"
#include "scene_input.hpp"

namespace narrationforge {

inline constexpr double kMinUnitSeconds = 1.0;
inline constexpr double kMaxUnitSeconds = 10.0;
// Silence between consecutive captions.
inline constexpr double kCaptionGapSeconds = 0.2;
inline constexpr double kDefaultSecondsPerChar = 0.15;
// One step on the -5..5 speed scale changes the per-char time by 10%.
inline constexpr double kSpeedStepFactor = 0.1;

inline constexpr double kMinSceneSeconds = 3.0;
inline constexpr double kMaxSceneSeconds = 30.0;
inline constexpr double kDefaultSyllablesPerSecond = 3.2;

/**
 * @brief How per-character time is derived.
 *
 * RealDuration spreads a measured audio length over the narration characters.
 * RateHeuristic derives it from a base reading rate and the speed setting; units
 * with an emotion trigger are slowed by `emotion_slowdown` (a rate multiplier).
 */
struct TimingMode {
    enum class Kind { RealDuration, RateHeuristic };

    Kind kind = Kind::RateHeuristic;
    double total_seconds = 0.0;                                  ///< RealDuration
    double base_chars_per_second = 1.0 / kDefaultSecondsPerChar;  ///< RateHeuristic
    double emotion_slowdown = kEmotionRateFactor;                ///< RateHeuristic
    double speed = 0.0;                                          ///< RateHeuristic, -5..5

    static TimingMode real_duration(double seconds) {
        TimingMode m;
        m.kind = Kind::RealDuration;
        m.total_seconds = seconds;
        return m;
    }
    static TimingMode rate_heuristic(double speed = 0.0,
                                     double base_chars_per_second = 1.0 / kDefaultSecondsPerChar,
                                     double emotion_slowdown = kEmotionRateFactor) {
        TimingMode m;
        m.kind = Kind::RateHeuristic;
        m.speed = speed;
        m.base_chars_per_second = base_chars_per_second;
        m.emotion_slowdown = emotion_slowdown;
        return m;
    }
};

/// One caption slot in seconds. `id` is the 1-based unit index.
struct TimelineEntry {
    size_t id = 0;
    double start = 0.0;
    double end = 0.0;
};

using Timeline = std::vector<TimelineEntry>;

/**
 * @brief Place `units` back to back with a fixed gap.
 *
 * Each duration is `chars(unit) * per_char` clamped to [1, 10] s.
 *
 * @param narration_chars Character count used to spread a RealDuration; 0 means
 *        the sum of the unit lengths.
 */
Timeline estimate_timeline(const std::vector<CaptionUnit> &units, const TimingMode &mode,
                           size_t narration_chars = 0);

// Seconds per character before emotion adjustment and clamping.
double seconds_per_char(const TimingMode &mode, size_t narration_chars);

/// Scene slot of a multi-scene narration.
struct SceneTimelineEntry {
    std::string id;
    double start = 0.0;
    double end = 0.0;
};

// Hangul syllables plus half of the ASCII letters and digits.
double count_spoken_syllables(std::string_view text);

// Reading rate for a scene emotion tag (nostalgia is read slowest).
double syllables_per_second(std::string_view emotion);

// Scene duration clamped to [3, 30] s; 3 s for empty narration.
double estimate_scene_duration(std::string_view narration, std::string_view emotion);

// Scenes placed back to back without gap. Empty ids become `scene<n>` (1-based).
std::vector<SceneTimelineEntry> estimate_scene_timeline(const std::vector<SceneInput> &scenes);

}  // namespace narrationforge
