//
//  narrationforge.hpp
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

#include "audio_merger.hpp"
#include "byte_budget_chunker.hpp"
#include "caption_formatter.hpp"
#include "caption_segmenter.hpp"
#include "narration_status.hpp"
#include "scene_input.hpp"
#include "synthesis_pipeline.hpp"
#include "timeline_estimator.hpp"

namespace narrationforge {

/// @defgroup api NarrationForge Public API
/// Public, supported C++ interfaces for preparing narration for synthesis and captioning.
/// @{

/**
 * @brief One narration job, either a single text or a list of scenes.
 *
 * Loaded from a JSON request file or a plain UTF-8 text file (see load_request()).
 */
struct NarrationRequest {
    std::string text;                ///< single narration; ignored when scenes are given
    std::vector<SceneInput> scenes;  ///< multi-scene narration
    VoiceSettings voice;
    double audio_duration = 0.0;  ///< measured audio length in seconds; 0 = estimate
    double base_chars_per_second = 1.0 / kDefaultSecondsPerChar;
    CaptionConfig captions;
    size_t byte_budget = 0;  ///< 0 = default for the request kind (2500 text, 4800 scenes)
    bool annotate_emotion = true;
    SynthesisTextOptions text_options;
};

/**
 * @brief Return the NarrationForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Parse a JSON request document.
NarrationStatus parse_request_json(std::string_view json_text,
                                   NarrationRequest &out);  ///< @ingroup api

/// Load a request from `path`: `.json` files are parsed as requests, anything else is
/// read as narration text.
NarrationStatus load_request(const std::string &path, NarrationRequest &out);  ///< @ingroup api

/// Chunks of a request. Plain-text requests report an empty scene id.
struct ChunkReport {
    NarrationStatus status;
    std::vector<SceneChunk> chunks;
    ChunkStats stats;
};

ChunkReport chunk_narration(const NarrationRequest &request);  ///< @ingroup api

/// Provider calls a request would make, without making them.
struct PlanReport {
    NarrationStatus status;
    std::vector<SynthesisRequest> requests;
};

PlanReport plan_narration(const NarrationRequest &request);  ///< @ingroup api

struct CaptionResult {
    NarrationStatus status;
    std::vector<CaptionUnit> units;
    Timeline timeline;
    std::string text;  ///< rendered SRT or VTT
};

/**
 * @brief Segment, time and render captions for a request.
 *
 * Uses the request's audio_duration when positive, otherwise the rate heuristic
 * driven by voice.speed and base_chars_per_second. Scene requests are segmented
 * per scene and tagged with the scene speaker.
 */
CaptionResult generate_captions(const NarrationRequest &request,
                                CaptionStyle style);  ///< @ingroup api

/// @overload plain text with explicit settings.
CaptionResult generate_captions(std::string_view text, CaptionStyle style,
                                const CaptionConfig &config = {}, double audio_duration = 0.0,
                                double speed = 0.0);  ///< @ingroup api

struct SceneTimelineReport {
    NarrationStatus status;
    std::vector<SceneTimelineEntry> scenes;
};

/// Scene slots from syllable counts; a plain-text request is one scene.
SceneTimelineReport scene_timeline(const NarrationRequest &request);  ///< @ingroup api

/// Synthesize a request through `provider` and merge the chunk audio with `encoder`.
SynthesisResult synthesize_request(const NarrationRequest &request, SynthesisProvider &provider,
                                   const ProviderContext &context,
                                   AudioEncoder &encoder);  ///< @ingroup api

/**
 * @brief Merge audio files into `output_path`.
 *
 * @param input_paths Audio files in playback order.
 * @param output_path Destination file.
 * @param encoder Concat-capable encoder; falls back to raw concatenation.
 * @param method Receives the merge method actually used.
 */
NarrationStatus merge_audio_files(const std::vector<std::string> &input_paths,
                                  const std::string &output_path, AudioEncoder &encoder,
                                  MergeMethod *method = nullptr);  ///< @ingroup api

/// @}

}  // namespace narrationforge
