//
//  audio_merger.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace narrationforge {

using AudioBuffer = std::vector<uint8_t>;

inline constexpr auto kEncoderTimeout = std::chrono::seconds(60);

enum class MergeMethod {
    Empty,        ///< no input buffers
    Passthrough,  ///< single buffer returned unchanged
    Encoder,      ///< stream-level concat by the encoder
    RawConcat,    ///< degraded: buffers appended byte by byte
};

const char *merge_method_name(MergeMethod method);

struct MergedAudio {
    AudioBuffer data;
    MergeMethod method = MergeMethod::Empty;
};

/// Concat-capable encoder; tests substitute their own.
class AudioEncoder {
public:
    virtual ~AudioEncoder() = default;

    virtual std::string name() const = 0;
    virtual bool available() const = 0;

    // Concatenate `files` in order into one buffer. `work_dir` is scratch space owned
    // by the caller. Returns nullopt on any failure.
    virtual std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &files,
                                              const std::filesystem::path &work_dir) = 0;
};

// ffmpeg concat demuxer with stream copy.
class FfmpegConcatEncoder : public AudioEncoder {
public:
    // `executable` is looked up on PATH unless it contains a '/'.
    explicit FfmpegConcatEncoder(std::string executable = "ffmpeg",
                                 std::chrono::milliseconds timeout = kEncoderTimeout);

    std::string name() const override { return "ffmpeg"; }
    bool available() const override;
    std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &files,
                                      const std::filesystem::path &work_dir) override;

private:
    std::optional<std::filesystem::path> executable_;
    std::chrono::milliseconds timeout_;
};

class UnavailableEncoder : public AudioEncoder {
public:
    std::string name() const override { return "unavailable"; }
    bool available() const override { return false; }
    std::optional<AudioBuffer> concat(const std::vector<std::filesystem::path> &,
                                      const std::filesystem::path &) override {
        return std::nullopt;
    }
};

/// Temporary directory removed when the object goes out of scope.
class ScopedTempDir {
public:
    // Throws std::system_error when the directory cannot be created.
    explicit ScopedTempDir(const std::string &prefix = "narrationforge");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Merge ordered audio buffers into one.
 *
 * Never fails: when the encoder is unavailable or errors out, the buffers are
 * concatenated in order and the result is flagged RawConcat.
 *
 * @param buffers Per-chunk audio in playback order.
 * @param encoder Concat-capable encoder.
 * @param extension File extension used for the chunk files (no dot).
 */
MergedAudio merge_audio(const std::vector<AudioBuffer> &buffers, AudioEncoder &encoder,
                        const std::string &extension = "mp3");

// Ordered byte concatenation.
AudioBuffer raw_concat(const std::vector<AudioBuffer> &buffers);

#ifdef NARRATIONFORGE_TESTING
// Test-only wrappers for the on-disk layout handed to the encoder.
namespace testing {
std::string chunk_filename_for_test(size_t index, const std::string &extension);
std::string concat_manifest_for_test(const std::vector<std::filesystem::path> &files);
}  // namespace testing
#endif

}  // namespace narrationforge
