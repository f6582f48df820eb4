//
//  synthesis_pipeline.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "audio_merger.hpp"
#include "byte_budget_chunker.hpp"
#include "narration_status.hpp"
#include "synthesis_text.hpp"

namespace narrationforge {

inline constexpr auto kProviderTimeout = std::chrono::seconds(90);
inline constexpr double kMinProviderRate = 0.25;
inline constexpr double kMaxProviderRate = 4.0;
inline constexpr const char *kDefaultVoice = "ko-KR-Neural2-C";
inline constexpr const char *kDefaultLanguageCode = "ko-KR";

/// Per-call provider credentials. Never stored by the library.
struct ProviderContext {
    std::string api_key;
    std::chrono::milliseconds timeout = kProviderTimeout;
};

struct VoiceSettings {
    std::string voice = kDefaultVoice;
    double speed = 0.0;  ///< multiplier in [0.1, 2.0] or a -5..5 step scale
    double pitch = 0.0;  ///< -5..5
};

struct SynthesisOptions {
    VoiceSettings voice;
    bool annotate_emotion = true;
    size_t byte_budget = kPlainTextChunkBudgetBytes;
    SynthesisTextOptions text;
    std::string audio_extension = "mp3";
};

/// One provider call.
struct SynthesisRequest {
    size_t chunk_index = 0;
    std::string content;
    bool is_markup = false;
    size_t byte_length = 0;
    std::string language_code;
    std::string voice;
    double speaking_rate = 1.0;
    double pitch = 0.0;
    bool markup_fallback = false;  ///< triggers present but markup did not fit
};

struct SynthesisResponse {
    int http_status = 0;
    bool timed_out = false;
    AudioBuffer audio;
    std::string body;  ///< error body for non-2xx answers
};

/// The TTS service. Implementations own the transport; tests script the answers.
class SynthesisProvider {
public:
    virtual ~SynthesisProvider() = default;
    virtual SynthesisResponse synthesize(const SynthesisRequest &request,
                                         const ProviderContext &context) = 0;
};

struct SynthesisStats {
    size_t total_chunks = 0;
    size_t markup_chunks = 0;
    size_t markup_fallbacks = 0;
    size_t provider_calls = 0;
};

struct SynthesisResult {
    NarrationStatus status;
    MergedAudio audio;
    SynthesisStats stats;
};

// Provider rate for a speed value: [0.1, 2.0] is a multiplier, 0 is 1.0, anything
// else is a -5..5 step scale. Clamped to [0.25, 4.0].
double provider_speaking_rate(double speed);

double provider_pitch(double pitch);

// `ko-KR-Neural2-C` -> `ko-KR`; names without a dash map to the default.
std::string language_code_for_voice(std::string_view voice);

// Chunk, clean up and annotate `text` without calling the provider.
std::vector<SynthesisRequest> plan_synthesis(std::string_view text,
                                             const SynthesisOptions &options = {});

/**
 * @brief Synthesize `text` chunk by chunk and merge the audio.
 *
 * Chunks are sent strictly in order. The first failing chunk aborts the request;
 * no further provider calls are made.
 */
SynthesisResult synthesize_narration(std::string_view text, const SynthesisOptions &options,
                                     SynthesisProvider &provider, const ProviderContext &context,
                                     AudioEncoder &encoder);

}  // namespace narrationforge
