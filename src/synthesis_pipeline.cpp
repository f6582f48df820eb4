//
//  synthesis_pipeline.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "synthesis_pipeline.hpp"

#include <algorithm>
#include <exception>

#include "emotion_annotator.hpp"
#include "logging.hpp"
#include "utf8_text.hpp"

namespace narrationforge {

namespace {

constexpr int kPitchScale = 4;

const char *kAuthorizationHint =
    "provider refused the request: check that the text-to-speech API is enabled for "
    "this project and that the API key is allowed to use it";

bool is_success(int http_status) { return http_status >= 200 && http_status < 300; }

}  // namespace

double provider_speaking_rate(double speed) {
    double rate = 1.0;
    if (speed >= 0.1 && speed <= 2.0) {
        rate = speed;
    } else if (speed != 0.0) {
        rate = 1.0 + speed * 0.1;
    }
    return std::clamp(rate, kMinProviderRate, kMaxProviderRate);
}

double provider_pitch(double pitch) { return pitch * kPitchScale; }

std::string language_code_for_voice(std::string_view voice) {
    const size_t first = voice.find('-');
    if (first == std::string_view::npos) {
        return kDefaultLanguageCode;
    }
    const size_t second = voice.find('-', first + 1);
    return std::string(voice.substr(0, second));
}

std::vector<SynthesisRequest> plan_synthesis(std::string_view text,
                                             const SynthesisOptions &options) {
    const std::string prepared = preprocess_for_synthesis(trim(text), options.text);
    const auto chunks = chunk_text(prepared, options.byte_budget);
    const double rate = provider_speaking_rate(options.voice.speed);
    const double pitch = provider_pitch(options.voice.pitch);
    const std::string language = language_code_for_voice(options.voice.voice);

    std::vector<SynthesisRequest> requests;
    requests.reserve(chunks.size());
    for (const auto &chunk : chunks) {
        SynthesisRequest r{};
        r.chunk_index = chunk.index;
        r.language_code = language;
        r.voice = options.voice.voice;
        r.speaking_rate = rate;
        r.pitch = pitch;
        if (options.annotate_emotion) {
            auto annotated = annotate(chunk.text, rate);
            r.markup_fallback = !annotated.is_markup && contains_emotion_trigger(chunk.text);
            r.is_markup = annotated.is_markup;
            r.byte_length = annotated.byte_length;
            r.content = std::move(annotated.content);
        } else {
            r.content = chunk.text;
            r.byte_length = chunk.byte_length;
        }
        requests.push_back(std::move(r));
    }
    return requests;
}

SynthesisResult synthesize_narration(std::string_view text, const SynthesisOptions &options,
                                     SynthesisProvider &provider, const ProviderContext &context,
                                     AudioEncoder &encoder) {
    SynthesisResult result{};
    if (trim(text).empty()) {
        result.status = make_status(false, "narration text is empty", StatusCode::InvalidInput);
        return result;
    }

    try {
        const auto t0 = std::chrono::steady_clock::now();
        const auto requests = plan_synthesis(text, options);
        result.stats.total_chunks = requests.size();
        NF_LOG("info", "synthesis: " << requests.size() << " chunks (budget "
                                     << options.byte_budget << ", rate "
                                     << (requests.empty() ? 1.0 : requests.front().speaking_rate)
                                     << ")");

        std::vector<AudioBuffer> buffers;
        buffers.reserve(requests.size());
        for (const auto &request : requests) {
            if (request.is_markup) {
                ++result.stats.markup_chunks;
            }
            if (request.markup_fallback) {
                ++result.stats.markup_fallbacks;
            }
            ++result.stats.provider_calls;
            auto response = provider.synthesize(request, context);
            if (response.timed_out) {
                result.status = make_status(
                    false,
                    "chunk " + std::to_string(request.chunk_index + 1) + "/" +
                        std::to_string(requests.size()) + " timed out after " +
                        std::to_string(context.timeout.count()) + " ms",
                    StatusCode::Timeout);
                NF_LOG("error", "synthesis: " << result.status.message);
                return result;
            }
            if (response.http_status == 401 || response.http_status == 403) {
                result.status = make_status(false, kAuthorizationHint, StatusCode::Authorization);
                NF_LOG("error", "synthesis: HTTP " << response.http_status << " on chunk "
                                                   << request.chunk_index);
                return result;
            }
            if (!is_success(response.http_status)) {
                result.status = make_status(false,
                                            "provider error (" +
                                                std::to_string(response.http_status) +
                                                "): " + response.body,
                                            StatusCode::ProviderFailure);
                NF_LOG("error", "synthesis: " << result.status.message);
                return result;
            }
            NF_LOG("debug", "synthesis: chunk " << request.chunk_index << " -> "
                                                << audio_preview(response.audio));
            buffers.push_back(std::move(response.audio));
        }

        result.audio = merge_audio(buffers, encoder, options.audio_extension);
        result.status = make_status(true);
        const auto t1 = std::chrono::steady_clock::now();
        NF_LOG("info", "synthesis: done, markup " << result.stats.markup_chunks << "/"
                                                  << result.stats.total_chunks << " chunks, "
                                                  << result.stats.markup_fallbacks
                                                  << " markup fallbacks, merge "
                                                  << merge_method_name(result.audio.method));
        NF_LOG("debug", "synthesis: took "
                            << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
                            << " ms");
    } catch (const std::exception &e) {
        result.status = make_status(false, std::string("internal error: ") + e.what(),
                                    StatusCode::Internal);
        NF_LOG("error", "synthesis: " << result.status.message);
    }
    return result;
}

}  // namespace narrationforge
