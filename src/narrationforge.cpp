//
//  narrationforge.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "narrationforge.hpp"
#include "narrationforge_version.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "utf8_text.hpp"

using json = nlohmann::json;

namespace narrationforge {

std::string version_string() { return NARRATIONFORGE_VERSION_DISPLAY; }

}  // namespace narrationforge

namespace {

using namespace narrationforge;

std::optional<std::string> read_text_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

std::optional<AudioBuffer> read_binary_file(const std::string &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        NF_LOG("error", "not a regular file: " << path);
        return std::nullopt;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        NF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    AudioBuffer out{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (f.bad()) {
        NF_LOG("error", "read failed for " << path);
        return std::nullopt;
    }
    return out;
}

bool has_scenes(const NarrationRequest &request) { return !request.scenes.empty(); }

// Reject requests that carry nothing to narrate.
NarrationStatus validate(const NarrationRequest &request) {
    if (has_scenes(request)) {
        for (const auto &scene : request.scenes) {
            if (!trim(scene.narration).empty()) {
                return make_status(true);
            }
        }
        return make_status(false, "all scenes have empty narration", StatusCode::InvalidInput);
    }
    if (trim(request.text).empty()) {
        return make_status(false, "narration text is empty", StatusCode::InvalidInput);
    }
    return make_status(true);
}

std::string joined_narration(const NarrationRequest &request) {
    if (!has_scenes(request)) {
        return request.text;
    }
    std::string out;
    for (const auto &scene : request.scenes) {
        auto t = trim(scene.narration);
        if (t.empty()) {
            continue;
        }
        if (!out.empty()) {
            out += "\n";
        }
        out += t;
    }
    return out;
}

SynthesisOptions synthesis_options(const NarrationRequest &request) {
    SynthesisOptions options;
    options.voice = request.voice;
    options.annotate_emotion = request.annotate_emotion;
    options.text = request.text_options;
    if (request.byte_budget > 0) {
        options.byte_budget = request.byte_budget;
    }
    return options;
}

TimingMode timing_mode(const NarrationRequest &request) {
    if (request.audio_duration > 0.0) {
        return TimingMode::real_duration(request.audio_duration);
    }
    return TimingMode::rate_heuristic(request.voice.speed, request.base_chars_per_second);
}

}  // namespace

namespace narrationforge {

NarrationStatus parse_request_json(std::string_view json_text, NarrationRequest &out) {
    try {
        const json j = json::parse(json_text);
        if (!j.is_object()) {
            return make_status(false, "request must be a JSON object", StatusCode::InvalidInput);
        }
        NarrationRequest req{};
        req.text = j.value("text", "");
        req.voice.voice = j.value("voice", std::string(kDefaultVoice));
        req.voice.speed = j.value("speed", 0.0);
        req.voice.pitch = j.value("pitch", 0.0);
        req.audio_duration = j.value("audio_duration", j.value("audioDuration", 0.0));
        req.base_chars_per_second = j.value("base_rate", 1.0 / kDefaultSecondsPerChar);
        req.captions.max_chars = j.value("max_chars", kCaptionMaxChars);
        req.captions.min_chars = j.value("min_chars", kCaptionMinChars);
        req.byte_budget = j.value("byte_budget", static_cast<size_t>(0));
        req.annotate_emotion = j.value("annotate_emotion", true);
        req.text_options.spell_out_decimals = j.value("spell_out_decimals", false);
        const std::string default_emotion = j.value("emotion", "");

        if (j.contains("scenes")) {
            if (!j["scenes"].is_array()) {
                return make_status(false, "'scenes' must be an array", StatusCode::InvalidInput);
            }
            req.scenes.reserve(j["scenes"].size());
            for (const auto &s : j["scenes"]) {
                if (!s.is_object()) {
                    return make_status(false, "scene entries must be objects",
                                       StatusCode::InvalidInput);
                }
                SceneInput scene{};
                // Numeric ids are accepted and kept as text.
                if (s.contains("id") && s["id"].is_number_integer()) {
                    scene.id = std::to_string(s["id"].get<long long>());
                } else {
                    scene.id = s.value("id", "");
                }
                scene.narration = s.value("narration", "");
                scene.emotion = s.value("emotion", default_emotion);
                scene.speaker = s.value("speaker", "");
                req.scenes.emplace_back(std::move(scene));
            }
        }
        auto status = validate(req);
        if (!status.ok) {
            return status;
        }
        out = std::move(req);
        return make_status(true);
    } catch (const json::exception &e) {
        return make_status(false, std::string("invalid request JSON: ") + e.what(),
                           StatusCode::InvalidInput);
    }
}

NarrationStatus load_request(const std::string &path, NarrationRequest &out) {
    auto content = read_text_file(path);
    if (!content) {
        return make_status(false, "failed to open " + path, StatusCode::InvalidInput);
    }
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".json") {
        return parse_request_json(*content, out);
    }
    NarrationRequest req{};
    req.text = std::move(*content);
    auto status = validate(req);
    if (!status.ok) {
        return status;
    }
    out = std::move(req);
    return make_status(true);
}

ChunkReport chunk_narration(const NarrationRequest &request) {
    ChunkReport report{};
    report.status = validate(request);
    if (!report.status.ok) {
        return report;
    }
    try {
        if (has_scenes(request)) {
            const size_t budget =
                request.byte_budget > 0 ? request.byte_budget : kSceneChunkBudgetBytes;
            report.chunks = build_chunks_for_scenes(request.scenes, budget);
        } else {
            const size_t budget =
                request.byte_budget > 0 ? request.byte_budget : kPlainTextChunkBudgetBytes;
            for (auto &chunk : chunk_text(trim(request.text), budget)) {
                SceneChunk sc{};
                sc.chunk_index = chunk.index;
                sc.sentences = split_sentences(chunk.text);
                sc.byte_length = chunk.byte_length;
                sc.text = std::move(chunk.text);
                report.chunks.push_back(std::move(sc));
            }
        }
        report.stats = estimate_chunk_stats(report.chunks);
    } catch (const std::exception &e) {
        report.status = make_status(false, std::string("internal error: ") + e.what(),
                                    StatusCode::Internal);
    }
    return report;
}

PlanReport plan_narration(const NarrationRequest &request) {
    PlanReport report{};
    report.status = validate(request);
    if (!report.status.ok) {
        return report;
    }
    try {
        report.requests = plan_synthesis(joined_narration(request), synthesis_options(request));
    } catch (const std::exception &e) {
        report.status = make_status(false, std::string("internal error: ") + e.what(),
                                    StatusCode::Internal);
    }
    return report;
}

CaptionResult generate_captions(const NarrationRequest &request, CaptionStyle style) {
    CaptionResult result{};
    result.status = validate(request);
    if (!result.status.ok) {
        return result;
    }
    try {
        const auto t0 = std::chrono::steady_clock::now();
        size_t narration_chars = 0;
        if (has_scenes(request)) {
            for (const auto &scene : request.scenes) {
                const auto narration = trim(scene.narration);
                if (narration.empty()) {
                    continue;
                }
                narration_chars += utf8_char_count(narration);
                for (auto &unit : segment_captions(narration, request.captions)) {
                    unit.speaker = scene.speaker;
                    result.units.push_back(std::move(unit));
                }
            }
        } else {
            narration_chars = utf8_char_count(request.text);
            result.units = segment_captions(request.text, request.captions);
        }
        result.timeline = estimate_timeline(result.units, timing_mode(request), narration_chars);
        result.text = format_captions(result.timeline, result.units, style);
        result.status = make_status(true);
        const auto t1 = std::chrono::steady_clock::now();
        NF_LOG("debug", "captions: " << result.units.size() << " units in "
                                     << std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0)
                                            .count()
                                     << " us");
    } catch (const std::exception &e) {
        result.status = make_status(false, std::string("internal error: ") + e.what(),
                                    StatusCode::Internal);
    }
    return result;
}

CaptionResult generate_captions(std::string_view text, CaptionStyle style,
                                const CaptionConfig &config, double audio_duration, double speed) {
    NarrationRequest request{};
    request.text = std::string(text);
    request.captions = config;
    request.audio_duration = audio_duration;
    request.voice.speed = speed;
    return generate_captions(request, style);
}

SceneTimelineReport scene_timeline(const NarrationRequest &request) {
    SceneTimelineReport report{};
    report.status = validate(request);
    if (!report.status.ok) {
        return report;
    }
    if (has_scenes(request)) {
        report.scenes = estimate_scene_timeline(request.scenes);
    } else {
        SceneInput single{};
        single.narration = request.text;
        report.scenes = estimate_scene_timeline({single});
    }
    return report;
}

SynthesisResult synthesize_request(const NarrationRequest &request, SynthesisProvider &provider,
                                   const ProviderContext &context, AudioEncoder &encoder) {
    SynthesisResult result{};
    result.status = validate(request);
    if (!result.status.ok) {
        return result;
    }
    return synthesize_narration(joined_narration(request), synthesis_options(request), provider,
                                context, encoder);
}

NarrationStatus merge_audio_files(const std::vector<std::string> &input_paths,
                                  const std::string &output_path, AudioEncoder &encoder,
                                  MergeMethod *method) {
    if (input_paths.empty()) {
        return make_status(false, "no input audio files", StatusCode::InvalidInput);
    }
    try {
        std::vector<AudioBuffer> buffers;
        buffers.reserve(input_paths.size());
        for (const auto &path : input_paths) {
            auto data = read_binary_file(path);
            if (!data) {
                return make_status(false, "failed to read " + path, StatusCode::InvalidInput);
            }
            buffers.push_back(std::move(*data));
        }
        auto ext = std::filesystem::path(input_paths.front()).extension().string();
        if (!ext.empty() && ext.front() == '.') {
            ext.erase(0, 1);
        }
        auto merged = merge_audio(buffers, encoder, ext.empty() ? "mp3" : ext);
        if (method != nullptr) {
            *method = merged.method;
        }

        std::ofstream out(output_path, std::ios::binary);
        if (!out.is_open()) {
            return make_status(false, "failed to open " + output_path, StatusCode::Internal);
        }
        out.write(reinterpret_cast<const char *>(merged.data.data()),
                  static_cast<std::streamsize>(merged.data.size()));
        if (!out.good()) {
            return make_status(false, "failed to write " + output_path, StatusCode::Internal);
        }
        return make_status(true);
    } catch (const std::exception &e) {
        return make_status(false, std::string("internal error: ") + e.what(),
                           StatusCode::Internal);
    }
}

}  // namespace narrationforge
