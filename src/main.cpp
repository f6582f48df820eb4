//
//  main.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging.hpp"
#include "narrationforge.hpp"
#include "narrationforge_version.hpp"
#include <nlohmann/json.hpp>

namespace {

struct CliOptions {
    std::string format = "srt";
    std::optional<double> duration;
    std::optional<double> speed;
    std::optional<size_t> max_chars;
    std::optional<size_t> min_chars;
    std::optional<size_t> budget;
    std::optional<double> base_rate;
    std::string ffmpeg = "ffmpeg";
};

void print_usage() {
    std::cerr << "NarrationForge " << NARRATIONFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage:\n"
              << "  narrationforge chunks <input.txt|request.json> [--budget BYTES]\n"
              << "  narrationforge plan <input.txt|request.json> [--budget BYTES] [--speed S]\n"
              << "  narrationforge captions <input.txt|request.json> [--format srt|vtt]\n"
              << "                 [--duration SEC] [--speed S] [--max-chars N] [--min-chars N]\n"
              << "                 [--base-rate CPS]\n"
              << "  narrationforge timeline <input.txt|request.json>\n"
              << "  narrationforge merge <output> <input1> [input2 ...] [--ffmpeg PATH]\n"
              << "Options:\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --format FMT        Caption format, srt (default) or vtt.\n"
              << "  --duration SEC      Measured audio length; captions are spread over it.\n"
              << "  --speed S           Speaking speed (multiplier 0.1-2.0 or -5..5 steps).\n"
              << "  --max-chars N       Caption line width in characters (default: 35).\n"
              << "  --min-chars N       Captions shorter than this are merged (default: 10).\n"
              << "  --budget BYTES      Chunk byte budget (default: 2500, scenes 4800).\n"
              << "  --base-rate CPS     Heuristic reading rate in characters per second.\n"
              << "  --ffmpeg PATH       ffmpeg executable used for merging (default: PATH lookup).\n"
              << "  --version           Print the version and exit.\n";
}

void apply_overrides(const CliOptions &cli, narrationforge::NarrationRequest &request) {
    if (cli.duration) request.audio_duration = *cli.duration;
    if (cli.speed) request.voice.speed = *cli.speed;
    if (cli.max_chars) request.captions.max_chars = *cli.max_chars;
    if (cli.min_chars) request.captions.min_chars = *cli.min_chars;
    if (cli.budget) request.byte_budget = *cli.budget;
    if (cli.base_rate) request.base_chars_per_second = *cli.base_rate;
}

int report_failure(const char *what, const narrationforge::NarrationStatus &status) {
    NF_LOG("error", "narrationforge: " << what << " failed ("
                                       << narrationforge::status_code_name(status.code)
                                       << "): " << status.message);
    return 1;
}

nlohmann::json stats_json(const narrationforge::ChunkStats &s) {
    nlohmann::json j;
    j["total_chunks"] = s.total_chunks;
    j["total_bytes"] = s.total_bytes;
    j["avg_bytes"] = s.avg_bytes;
    j["max_bytes"] = s.max_bytes;
    j["min_bytes"] = s.min_bytes;
    return j;
}

int run_chunks(const narrationforge::NarrationRequest &request) {
    auto report = narrationforge::chunk_narration(request);
    if (!report.status.ok) {
        return report_failure("chunking", report.status);
    }
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &c : report.chunks) {
        nlohmann::json jc;
        if (!c.scene_id.empty()) {
            jc["scene_id"] = c.scene_id;
        }
        jc["chunk_index"] = c.chunk_index;
        jc["text"] = c.text;
        jc["sentences"] = c.sentences;
        jc["byte_length"] = c.byte_length;
        chunks.push_back(jc);
    }
    nlohmann::json j;
    j["chunks"] = chunks;
    j["stats"] = stats_json(report.stats);
    std::cout << j.dump(2) << "\n";
    return 0;
}

int run_plan(const narrationforge::NarrationRequest &request) {
    auto report = narrationforge::plan_narration(request);
    if (!report.status.ok) {
        return report_failure("planning", report.status);
    }
    nlohmann::json requests = nlohmann::json::array();
    for (const auto &r : report.requests) {
        nlohmann::json jr;
        jr["chunk_index"] = r.chunk_index;
        jr["content"] = r.content;
        jr["is_markup"] = r.is_markup;
        jr["byte_length"] = r.byte_length;
        jr["language_code"] = r.language_code;
        jr["voice"] = r.voice;
        jr["speaking_rate"] = r.speaking_rate;
        jr["pitch"] = r.pitch;
        if (r.markup_fallback) {
            jr["markup_fallback"] = true;
        }
        requests.push_back(jr);
    }
    nlohmann::json j;
    j["requests"] = requests;
    std::cout << j.dump(2) << "\n";
    return 0;
}

int run_captions(const narrationforge::NarrationRequest &request, const std::string &format) {
    auto style = narrationforge::parse_caption_style(format);
    if (!style) {
        std::cerr << "Unknown caption format: " << format << "\n";
        return 2;
    }
    auto result = narrationforge::generate_captions(request, *style);
    if (!result.status.ok) {
        return report_failure("caption generation", result.status);
    }
    std::cout << result.text;
    return 0;
}

int run_timeline(const narrationforge::NarrationRequest &request) {
    auto report = narrationforge::scene_timeline(request);
    if (!report.status.ok) {
        return report_failure("timeline estimation", report.status);
    }
    nlohmann::json scenes = nlohmann::json::array();
    double total = 0.0;
    for (const auto &s : report.scenes) {
        nlohmann::json js;
        js["id"] = s.id;
        js["start"] = s.start;
        js["end"] = s.end;
        js["audio_filename"] = "audio/" + s.id + ".mp3";
        js["subtitle_filename"] = "subtitles/" + s.id + ".srt";
        scenes.push_back(js);
        total = s.end;
    }
    nlohmann::json j;
    j["timeline"] = scenes;
    j["total_duration"] = total;
    std::cout << j.dump(2) << "\n";
    return 0;
}

int run_merge(const std::vector<std::string> &positional, const CliOptions &cli) {
    if (positional.size() < 3) {
        std::cerr << "merge needs an output and at least one input. See --help for usage.\n";
        return 2;
    }
    const std::string output_path = positional[1];
    const std::vector<std::string> inputs(positional.begin() + 2, positional.end());
    narrationforge::FfmpegConcatEncoder encoder(cli.ffmpeg);
    narrationforge::MergeMethod method = narrationforge::MergeMethod::Empty;
    auto status = narrationforge::merge_audio_files(inputs, output_path, encoder, &method);
    if (!status.ok) {
        return report_failure("merge", status);
    }
    std::cout << "Wrote: " << output_path << " (" << narrationforge::merge_method_name(method)
              << ")\n";
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "NarrationForge " << NARRATIONFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    CliOptions cli;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--log-level" && has_value) {
                narrationforge::set_log_verbosity(narrationforge::parse_log_verbosity(argv[++i]));
            } else if (arg == "--format" && has_value) {
                cli.format = argv[++i];
            } else if (arg == "--duration" && has_value) {
                cli.duration = std::stod(argv[++i]);
            } else if (arg == "--speed" && has_value) {
                cli.speed = std::stod(argv[++i]);
            } else if (arg == "--max-chars" && has_value) {
                cli.max_chars = std::stoul(argv[++i]);
            } else if (arg == "--min-chars" && has_value) {
                cli.min_chars = std::stoul(argv[++i]);
            } else if (arg == "--budget" && has_value) {
                cli.budget = std::stoul(argv[++i]);
            } else if (arg == "--base-rate" && has_value) {
                cli.base_rate = std::stod(argv[++i]);
            } else if (arg == "--ffmpeg" && has_value) {
                cli.ffmpeg = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return 2;
            } else {
                positional.emplace_back(std::move(arg));
            }
        }
    } catch (const std::logic_error &e) {
        std::cerr << "Invalid numeric option value: " << e.what() << "\n";
        return 2;
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    const std::string command = positional[0];
    if (command == "merge") {
        return run_merge(positional, cli);
    }
    if (positional.size() != 2) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }

    narrationforge::NarrationRequest request;
    auto status = narrationforge::load_request(positional[1], request);
    if (!status.ok) {
        return report_failure("loading input", status);
    }
    apply_overrides(cli, request);

    if (command == "chunks") {
        return run_chunks(request);
    }
    if (command == "plan") {
        return run_plan(request);
    }
    if (command == "captions") {
        return run_captions(request, cli.format);
    }
    if (command == "timeline") {
        return run_timeline(request);
    }
    std::cerr << "Unknown command: " << command << "\n";
    return 2;
}
