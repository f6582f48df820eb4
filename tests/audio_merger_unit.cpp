// Audio merging: encoder success, every fallback path, scratch-dir cleanup and
// the child process helper used for ffmpeg.
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "audio_merger.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "test_utils.hpp"

using namespace narrationforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[audio_merger_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

// Records what it was handed and returns the files concatenated with a marker byte.
class RecordingEncoder : public AudioEncoder {
public:
    std::string name() const override { return "recording"; }
    bool available() const override { return true; }
    std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &files,
                                      const std::filesystem::path &work_dir) override {
        seen_files = files;
        seen_work_dir = work_dir;
        AudioBuffer out{0xEE};
        for (const auto &f : files) {
            auto bytes = test_utils::read_bytes(f);
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    std::vector<std::filesystem::path> seen_files;
    std::filesystem::path seen_work_dir;
};

class FailingEncoder : public AudioEncoder {
public:
    std::string name() const override { return "failing"; }
    bool available() const override { return true; }
    std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &,
                                      const std::filesystem::path &) override {
        return std::nullopt;
    }
};

class ThrowingEncoder : public AudioEncoder {
public:
    std::string name() const override { return "throwing"; }
    bool available() const override { return true; }
    std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &,
                                      const std::filesystem::path &) override {
        throw std::runtime_error("encoder exploded");
    }
};

const std::vector<AudioBuffer> kThreeBuffers = {{0x01, 0x02}, {0x03}, {0x04, 0x05, 0x06}};
const AudioBuffer kRawJoined = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06};

bool test_trivial_inputs() {
    RecordingEncoder enc;
    auto empty = merge_audio({}, enc);
    bool ok = check(empty.method == MergeMethod::Empty && empty.data.empty(), "no buffers");
    auto single = merge_audio(std::vector<AudioBuffer>{AudioBuffer{0x0A, 0x0B}}, enc);
    ok &= check(single.method == MergeMethod::Passthrough, "single buffer passthrough");
    ok &= check(single.data == AudioBuffer({0x0A, 0x0B}), "single buffer unchanged");
    ok &= check(enc.seen_files.empty(), "encoder not called for trivial inputs");
    ok &= check(std::string(merge_method_name(MergeMethod::RawConcat)) == "raw-concat", "names");
    return ok;
}

bool test_encoder_path() {
    RecordingEncoder enc;
    auto merged = merge_audio(kThreeBuffers, enc, "wav");
    bool ok = check(merged.method == MergeMethod::Encoder, "encoder used");
    AudioBuffer expected{0xEE};
    expected.insert(expected.end(), kRawJoined.begin(), kRawJoined.end());
    ok &= check(merged.data == expected, "encoder output returned");
    ok &= check(enc.seen_files.size() == 3, "one file per buffer");
    if (enc.seen_files.size() == 3) {
        ok &= check(enc.seen_files[0].filename() == "chunk_000.wav", "first chunk name");
        ok &= check(enc.seen_files[2].filename() == "chunk_002.wav", "ordered names");
    }
    ok &= check(!enc.seen_work_dir.empty() && !std::filesystem::exists(enc.seen_work_dir),
                "scratch directory removed after merge");
    return ok;
}

bool test_fallbacks() {
    set_log_verbosity(LogVerbosity::Warn);
    bool ok = true;

    UnavailableEncoder missing;
    MergedAudio a;
    auto log_a = test_utils::capture_stderr([&]() { a = merge_audio(kThreeBuffers, missing); });
    ok &= check(a.method == MergeMethod::RawConcat && a.data == kRawJoined,
                "unavailable encoder falls back");
    ok &= check(log_a.find("falling back to raw concatenation") != std::string::npos,
                "fallback logged");

    FailingEncoder failing;
    MergedAudio b;
    test_utils::capture_stderr([&]() { b = merge_audio(kThreeBuffers, failing); });
    ok &= check(b.method == MergeMethod::RawConcat && b.data == kRawJoined,
                "failed concat falls back");

    ThrowingEncoder throwing;
    MergedAudio c;
    auto log_c = test_utils::capture_stderr([&]() { c = merge_audio(kThreeBuffers, throwing); });
    ok &= check(c.method == MergeMethod::RawConcat && c.data == kRawJoined,
                "throwing encoder falls back");
    ok &= check(log_c.find("encoder exploded") != std::string::npos, "exception text logged");

    set_log_verbosity(LogVerbosity::Info);
    ok &= check(raw_concat({}).empty(), "raw concat of nothing");
    return ok;
}

bool test_on_disk_layout() {
    bool ok = check(testing::chunk_filename_for_test(7, "mp3") == "chunk_007.mp3", "zero padded");
    ok &= check(testing::chunk_filename_for_test(1234, "mp3") == "chunk_1234.mp3", "wide index");
    const std::string manifest =
        testing::concat_manifest_for_test({"/tmp/a.mp3", "/tmp/it's.mp3"});
    ok &= check(manifest == "file '/tmp/a.mp3'\nfile '/tmp/it'\\''s.mp3'\n",
                "manifest quoting, got: " + manifest);
    return ok;
}

bool test_scoped_temp_dir() {
    std::filesystem::path kept;
    {
        ScopedTempDir dir("narrationforge_unit");
        kept = dir.path();
        test_utils::write_file(dir.path() / "inner.bin", "x");
        if (!check(std::filesystem::is_directory(kept), "temp dir created")) {
            return false;
        }
    }
    return check(!std::filesystem::exists(kept), "temp dir removed with contents");
}

bool test_ffmpeg_encoder_with_script() {
    bool ok = true;
    FfmpegConcatEncoder absent("/nonexistent/bin/ffmpeg");
    ok &= check(!absent.available(), "missing executable is unavailable");

    // Stand-in that writes a fixed payload to its last argument (the output file).
    ScopedTempDir bin("narrationforge_fake_ffmpeg");
    const auto good = bin.path() / "ffmpeg_ok";
    const auto bad = bin.path() / "ffmpeg_fail";
    test_utils::write_file(good, "#!/bin/sh\nfor a; do out=\"$a\"; done\nprintf merged > \"$out\"\n");
    test_utils::write_file(bad, "#!/bin/sh\necho broken >&2\nexit 1\n");
    for (const auto &p : {good, bad}) {
        std::filesystem::permissions(p, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add);
    }

    FfmpegConcatEncoder fake(good.string());
    ok &= check(fake.available(), "script is available");
    auto merged = merge_audio(kThreeBuffers, fake);
    ok &= check(merged.method == MergeMethod::Encoder, "script concat succeeds");
    ok &= check(merged.data == AudioBuffer({'m', 'e', 'r', 'g', 'e', 'd'}), "script output read");

    set_log_verbosity(LogVerbosity::Error);
    FfmpegConcatEncoder failing(bad.string());
    auto fallback = merge_audio(kThreeBuffers, failing);
    set_log_verbosity(LogVerbosity::Info);
    ok &= check(fallback.method == MergeMethod::RawConcat && fallback.data == kRawJoined,
                "non-zero exit falls back");
    return ok;
}

bool test_audio_preview_logging() {
    bool ok = check(audio_preview({}) == "0 bytes empty", "empty preview");
    ok &= check(audio_preview({'I', 'D', '3', 0x04}) == "4 bytes id3 49 44 33 04", "id3 preview");
    ok &= check(audio_preview({0xFF, 0xFB, 0x90}) == "3 bytes mpeg-frame ff fb 90",
                "frame sync preview");
    const AudioBuffer long_riff{'R', 'I', 'F', 'F', 1, 2, 3, 4, 5, 6};
    ok &= check(audio_preview(long_riff) == "10 bytes riff 52 49 46 46 01 02 03 04",
                "preview stops after eight bytes");

    ok &= check(severity_for_tag("merge") == LogVerbosity::Debug, "component tags are debug");
    ok &= check(severity_for_tag("warning") == LogVerbosity::Warn, "warning alias");

    set_log_verbosity(LogVerbosity::Warn);
    const auto out = test_utils::capture_stderr([]() {
        NF_LOG("info", "hidden");
        NF_LOG("error", "merge broke");
    });
    set_log_verbosity(LogVerbosity::Info);
    ok &= check(out.find("hidden") == std::string::npos, "info filtered at warn");
    ok &= check(out.find("[NarrationForge][error][audio_merger_unit.cpp:") != std::string::npos,
                "error names the source basename");
    ok &= check(out.find("merge broke") != std::string::npos, "error message kept");
    return ok;
}

bool test_run_process() {
    bool ok = check(find_executable("sh").has_value(), "sh on PATH");
    ok &= check(!find_executable("narrationforge-no-such-tool").has_value(), "unknown tool");
    ok &= check(!find_executable("").has_value(), "empty name");

    auto exit3 = run_process({"/bin/sh", "-c", "exit 3"}, std::chrono::milliseconds(5000));
    ok &= check(exit3.launched && !exit3.timed_out && exit3.exit_code == 3, "exit code returned");

    const auto err_path = test_utils::scratch_path("narrationforge_stderr.txt");
    auto noisy = run_process({"/bin/sh", "-c", "echo oops >&2"}, std::chrono::milliseconds(5000),
                             err_path);
    const auto err = test_utils::read_bytes(err_path);
    ok &= check(noisy.exit_code == 0 && std::string(err.begin(), err.end()) == "oops\n",
                "stderr captured to file");
    std::error_code ec;
    std::filesystem::remove(err_path, ec);

    set_log_verbosity(LogVerbosity::Error);
    const auto t0 = std::chrono::steady_clock::now();
    auto slow = run_process({"/bin/sh", "-c", "sleep 5"}, std::chrono::milliseconds(100));
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    set_log_verbosity(LogVerbosity::Info);
    ok &= check(slow.launched && slow.timed_out, "child killed after deadline");
    ok &= check(elapsed < std::chrono::seconds(3), "timeout honoured");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_trivial_inputs();
    ok &= test_encoder_path();
    ok &= test_fallbacks();
    ok &= test_on_disk_layout();
    ok &= test_scoped_temp_dir();
    ok &= test_ffmpeg_encoder_with_script();
    ok &= test_run_process();
    ok &= test_audio_preview_logging();
    return ok ? 0 : 1;
}
