// Whole-request scenarios through the public API: chunking a decimal sentence,
// display numerals, pacing markup, measured-duration captions, scene requests
// and audio file merging.
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "logging.hpp"
#include "narrationforge.hpp"
#include "test_utils.hpp"
#include "utf8_text.hpp"

using namespace narrationforge;
using test_utils::approx;
using test_utils::repeat;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[end_to_end_scenarios] FAIL: " << msg << "\n";
    }
    return cond;
}

class EchoProvider : public SynthesisProvider {
public:
    SynthesisResponse synthesize(const SynthesisRequest &request, const ProviderContext &) override {
        sent.push_back(request.content);
        SynthesisResponse r{};
        r.http_status = 200;
        r.audio = {static_cast<uint8_t>(request.chunk_index + 1)};
        return r;
    }
    std::vector<std::string> sent;
};

// Remembers its scratch directory, then fails so the merge falls back.
class FailingRecordingEncoder : public AudioEncoder {
public:
    std::string name() const override { return "failing-recorder"; }
    bool available() const override { return true; }
    std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &files,
                                      const std::filesystem::path &work_dir) override {
        work_dir_seen = work_dir;
        files_existed = !files.empty();
        for (const auto &f : files) {
            files_existed &= std::filesystem::exists(f);
        }
        return std::nullopt;
    }
    std::filesystem::path work_dir_seen;
    bool files_existed = false;
};

bool scenario_decimal_sentence() {
    NarrationRequest req;
    req.text = "안녕하세요. 저는 1.5톤 트럭을 운전합니다.";
    req.byte_budget = 20;
    auto report = chunk_narration(req);
    bool ok = check(report.status.ok, "chunking succeeds");
    ok &= check(report.chunks.size() >= 2, "at least two chunks at 20 bytes");
    bool whole_decimal = false;
    for (const auto &c : report.chunks) {
        ok &= check(c.byte_length <= 20, "chunk within 20 bytes: " + c.text);
        whole_decimal |= c.text.find("1.5") != std::string::npos;
    }
    ok &= check(whole_decimal, "1.5 kept inside one chunk");
    return ok;
}

bool scenario_display_numerals() {
    const std::string text = "할머니는 일흔여섯 살이 되셨다.";
    auto captions = generate_captions(text, CaptionStyle::Srt);
    bool ok = check(captions.status.ok, "captions succeed");
    ok &= check(captions.text.find("76살") != std::string::npos, "caption shows digits");
    ok &= check(captions.units.size() == 1 && captions.units[0].text == text,
                "caption unit keeps spoken text");

    NarrationRequest req;
    req.text = text;
    auto plan = plan_narration(req);
    ok &= check(plan.status.ok && plan.requests.size() == 1 &&
                    plan.requests[0].content.find("일흔여섯 살") != std::string::npos,
                "synthesis text keeps spoken numerals");
    return ok;
}

bool scenario_pacing_markup() {
    auto small = plan_synthesis("그날 눈물이 났다.");
    bool ok = check(small.size() == 1 && small[0].is_markup, "trigger sentence is markup");
    ok &= check(!small.empty() && small[0].content.find("<prosody rate=\"0.90\">") != std::string::npos,
                "prosody directive present");

    set_log_verbosity(LogVerbosity::Error);
    const std::string big = repeat("눈물이 났다. ", 140);
    auto requests = plan_synthesis(big);
    set_log_verbosity(LogVerbosity::Info);
    ok &= check(requests.size() == 2, "two plain-text chunks");
    if (requests.size() == 2) {
        ok &= check(requests[0].byte_length == 2483, "first chunk packs 138 sentences");
        ok &= check(!requests[0].is_markup && requests[0].markup_fallback,
                    "oversized markup replaced by plain text");
        ok &= check(requests[1].is_markup && !requests[1].markup_fallback, "small tail is markup");
    }
    for (const auto &r : requests) {
        ok &= check(r.byte_length < kProviderHardCeilingBytes, "below provider ceiling");
    }
    return ok;
}

bool scenario_measured_duration() {
    // 4 x 30 + 26 characters plus four separating spaces.
    std::string text;
    for (int i = 0; i < 4; ++i) {
        text += repeat("가", 29) + ". ";
    }
    text += repeat("가", 25) + ".";
    bool ok = check(utf8_char_count(text) == 150, "150 character narration");

    auto captions = generate_captions(text, CaptionStyle::Vtt, {}, 30.0);
    ok &= check(captions.status.ok && captions.units.size() == 5, "one caption per sentence");
    ok &= check(captions.text.rfind("WEBVTT\n\n", 0) == 0, "vtt header");
    for (size_t i = 0; i < captions.timeline.size() && i < captions.units.size(); ++i) {
        const double len = static_cast<double>(utf8_char_count(captions.units[i].text));
        const double expected = std::min(10.0, std::max(1.0, len * 0.2));
        ok &= check(approx(captions.timeline[i].end - captions.timeline[i].start, expected),
                    "duration of unit " + std::to_string(i));
        if (i > 0) {
            ok &= check(approx(captions.timeline[i].start,
                               captions.timeline[i - 1].end + kCaptionGapSeconds),
                        "gap before unit " + std::to_string(i));
        }
    }
    ok &= check(captions.text.find("00:00:00.000 --> 00:00:06.000") != std::string::npos,
                "first cue timing");
    return ok;
}

bool scenario_scene_request() {
    NarrationRequest req;
    req.scenes = {
        {"intro", "첫 장면의 이야기입니다.", "nostalgia", "민수"},
        {"outro", "마지막 장면의 이야기입니다.", "", std::string(kNarratorTag)},
    };

    auto captions = generate_captions(req, CaptionStyle::Srt);
    bool ok = check(captions.status.ok && captions.units.size() == 2, "one caption per scene");
    ok &= check(captions.text.find("[민수] 첫 장면의 이야기입니다.") != std::string::npos,
                "speaker tag shown");
    ok &= check(captions.text.find("[" + std::string(kNarratorTag) + "]") == std::string::npos,
                "narrator not tagged");

    auto timeline = scene_timeline(req);
    ok &= check(timeline.status.ok && timeline.scenes.size() == 2, "scene timeline");
    if (timeline.scenes.size() == 2) {
        ok &= check(timeline.scenes[0].id == "intro" &&
                        approx(timeline.scenes[1].start, timeline.scenes[0].end),
                    "scenes back to back");
    }

    EchoProvider provider;
    FailingRecordingEncoder encoder;
    req.byte_budget = 40;
    set_log_verbosity(LogVerbosity::Error);
    auto result = synthesize_request(req, provider, {}, encoder);
    set_log_verbosity(LogVerbosity::Info);
    ok &= check(result.status.ok, "scene synthesis succeeds: " + result.status.message);
    ok &= check(provider.sent.size() == 2, "one call per scene sentence");
    ok &= check(result.audio.method == MergeMethod::RawConcat, "failed encoder falls back");
    ok &= check(result.audio.data == AudioBuffer({1, 2}), "audio in chunk order");
    ok &= check(encoder.files_existed, "chunk files written before concat");
    ok &= check(!encoder.work_dir_seen.empty() && !std::filesystem::exists(encoder.work_dir_seen),
                "scratch directory removed after fallback");
    return ok;
}

bool scenario_merge_files() {
    const auto a = test_utils::scratch_path("narrationforge_e2e_a.mp3");
    const auto b = test_utils::scratch_path("narrationforge_e2e_b.mp3");
    const auto out = test_utils::scratch_path("narrationforge_e2e_out.mp3");
    test_utils::write_file(a, "AAA");
    test_utils::write_file(b, "BB");

    UnavailableEncoder encoder;
    MergeMethod method = MergeMethod::Empty;
    set_log_verbosity(LogVerbosity::Error);
    auto st = merge_audio_files({a.string(), b.string()}, out.string(), encoder, &method);
    bool ok = check(st.ok, "merge succeeds");
    ok &= check(method == MergeMethod::RawConcat, "raw fallback reported");
    const auto merged = test_utils::read_bytes(out);
    ok &= check(std::string(merged.begin(), merged.end()) == "AAABB", "files joined in order");

    auto missing = merge_audio_files({a.string(), "/nonexistent/narrationforge.mp3"}, out.string(),
                                     encoder);
    ok &= check(!missing.ok && missing.code == StatusCode::InvalidInput, "missing input");
    const auto dir = std::filesystem::temp_directory_path().string();
    auto directory = merge_audio_files({a.string(), dir}, out.string(), encoder);
    ok &= check(!directory.ok && directory.code == StatusCode::InvalidInput,
                "directory input rejected");
    ok &= check(directory.message == "failed to read " + dir, "directory input named");
    auto none = merge_audio_files({}, out.string(), encoder);
    ok &= check(!none.ok && none.code == StatusCode::InvalidInput, "no inputs");
    set_log_verbosity(LogVerbosity::Info);

    std::error_code ec;
    for (const auto &p : {a, b, out}) {
        std::filesystem::remove(p, ec);
    }
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= scenario_decimal_sentence();
    ok &= scenario_display_numerals();
    ok &= scenario_pacing_markup();
    ok &= scenario_measured_duration();
    ok &= scenario_scene_request();
    ok &= scenario_merge_files();
    return ok ? 0 : 1;
}
