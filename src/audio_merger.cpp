//
//  audio_merger.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "audio_merger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "process_runner.hpp"

namespace narrationforge {

namespace {

bool write_file(const std::filesystem::path &p, const AudioBuffer &data) {
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) {
        NF_LOG("error", "open failed for " << p << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

std::optional<AudioBuffer> read_file(const std::filesystem::path &p) {
    std::ifstream f(p, std::ios::binary);
    if (!f.is_open()) {
        return std::nullopt;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (len <= 0) {
        return std::nullopt;
    }
    f.seekg(0, std::ios::beg);
    AudioBuffer buf(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(buf.data()), len);
    if (f.gcount() != len) {
        return std::nullopt;
    }
    return buf;
}

std::string chunk_filename(size_t index, const std::string &extension) {
    std::ostringstream oss;
    oss << "chunk_" << std::setw(3) << std::setfill('0') << index << "." << extension;
    return oss.str();
}

// Concat demuxer quoting: single quotes are closed, escaped and reopened.
std::string quote_for_manifest(const std::string &path) {
    std::string out;
    out.reserve(path.size() + 2);
    out.push_back('\'');
    for (char c : path) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string concat_manifest(const std::vector<std::filesystem::path> &files) {
    std::string manifest;
    for (const auto &f : files) {
        manifest += "file " + quote_for_manifest(f.string()) + "\n";
    }
    return manifest;
}

MergedAudio raw_fallback(const std::vector<AudioBuffer> &buffers, const std::string &reason) {
    NF_LOG("warn", "merge: " << reason << "; falling back to raw concatenation of "
                             << buffers.size() << " buffers");
    MergedAudio out{};
    out.data = raw_concat(buffers);
    out.method = MergeMethod::RawConcat;
    return out;
}

}  // namespace

const char *merge_method_name(MergeMethod method) {
    switch (method) {
        case MergeMethod::Empty:
            return "empty";
        case MergeMethod::Passthrough:
            return "passthrough";
        case MergeMethod::Encoder:
            return "encoder";
        case MergeMethod::RawConcat:
            return "raw-concat";
    }
    return "unknown";
}

FfmpegConcatEncoder::FfmpegConcatEncoder(std::string executable, std::chrono::milliseconds timeout)
    : executable_(find_executable(executable)), timeout_(timeout) {
    if (!executable_) {
        NF_LOG("debug", "ffmpeg: '" << executable << "' not found");
    }
}

bool FfmpegConcatEncoder::available() const { return executable_.has_value(); }

std::optional<AudioBuffer> FfmpegConcatEncoder::concat(
    const std::vector<std::filesystem::path> &files, const std::filesystem::path &work_dir) {
    if (!executable_) {
        return std::nullopt;
    }
    const auto list_path = work_dir / "concat_list.txt";
    {
        std::ofstream list(list_path);
        if (!list.is_open()) {
            NF_LOG("error", "open failed for " << list_path);
            return std::nullopt;
        }
        list << concat_manifest(files);
        if (!list.good()) {
            return std::nullopt;
        }
    }

    const auto ext = files.empty() ? std::string(".mp3") : files.front().extension().string();
    const auto out_path = work_dir / ("merged" + ext);
    const auto log_path = work_dir / "ffmpeg.log";
    const std::vector<std::string> argv = {
        executable_->string(), "-y",  "-f", "concat", "-safe", "0", "-i", list_path.string(),
        "-c",                  "copy", out_path.string()};

    const auto t0 = std::chrono::steady_clock::now();
    auto res = run_process(argv, timeout_, log_path);
    const auto t1 = std::chrono::steady_clock::now();
    NF_LOG("debug",
           "ffmpeg: concat of " << files.size() << " files took "
                                << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)
                                       .count()
                                << " ms");
    if (!res.launched) {
        NF_LOG("warn", "ffmpeg: could not be launched");
        return std::nullopt;
    }
    if (res.timed_out) {
        NF_LOG("warn", "ffmpeg: timed out after " << timeout_.count() << " ms");
        return std::nullopt;
    }
    if (res.exit_code != 0) {
        NF_LOG("warn", "ffmpeg: exit code " << res.exit_code << " (see " << log_path << ")");
        return std::nullopt;
    }
    auto merged = read_file(out_path);
    if (!merged) {
        NF_LOG("warn", "ffmpeg: output " << out_path << " missing or empty");
    }
    return merged;
}

ScopedTempDir::ScopedTempDir(const std::string &prefix) {
    auto templ = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
    if (::mkdtemp(templ.data()) == nullptr) {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + templ);
    }
    path_ = templ;
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        NF_LOG("warn", "failed to remove " << path_ << ": " << ec.message());
    }
}

AudioBuffer raw_concat(const std::vector<AudioBuffer> &buffers) {
    size_t total = 0;
    for (const auto &b : buffers) {
        total += b.size();
    }
    AudioBuffer out;
    out.reserve(total);
    for (const auto &b : buffers) {
        out.insert(out.end(), b.begin(), b.end());
    }
    return out;
}

MergedAudio merge_audio(const std::vector<AudioBuffer> &buffers, AudioEncoder &encoder,
                        const std::string &extension) {
    MergedAudio out{};
    if (buffers.empty()) {
        return out;
    }
    if (buffers.size() == 1) {
        out.data = buffers.front();
        out.method = MergeMethod::Passthrough;
        return out;
    }
    if (!encoder.available()) {
        return raw_fallback(buffers, encoder.name() + " not available");
    }

    try {
        ScopedTempDir work("narrationforge_merge");
        std::vector<std::filesystem::path> files;
        files.reserve(buffers.size());
        for (size_t i = 0; i < buffers.size(); ++i) {
            auto p = work.path() / chunk_filename(i, extension);
            if (!write_file(p, buffers[i])) {
                return raw_fallback(buffers, "writing " + p.string() + " failed");
            }
            NF_LOG("debug", "merge: " << p.filename() << " " << audio_preview(buffers[i]));
            files.push_back(std::move(p));
        }
        auto merged = encoder.concat(files, work.path());
        if (!merged) {
            return raw_fallback(buffers, encoder.name() + " concat failed");
        }
        out.data = std::move(*merged);
        out.method = MergeMethod::Encoder;
        NF_LOG("info", "merged " << buffers.size() << " chunks into " << out.data.size()
                                 << " bytes via " << encoder.name());
        return out;
    } catch (const std::exception &e) {
        return raw_fallback(buffers, std::string("exception: ") + e.what());
    }
}

}  // namespace narrationforge

#ifdef NARRATIONFORGE_TESTING
namespace narrationforge::testing {
std::string chunk_filename_for_test(size_t index, const std::string &extension) {
    return chunk_filename(index, extension);
}
std::string concat_manifest_for_test(const std::vector<std::filesystem::path> &files) {
    return concat_manifest(files);
}
}  // namespace narrationforge::testing
#endif
