//
//  logging.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <atomic>
#include <iomanip>

namespace narrationforge {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

constexpr size_t kPreviewBytes = 8;

bool starts_with(const std::vector<uint8_t> &data, std::string_view magic) {
    if (data.size() < magic.size()) {
        return false;
    }
    return std::equal(magic.begin(), magic.end(), data.begin(),
                      [](char m, uint8_t b) { return static_cast<uint8_t>(m) == b; });
}

const char *guess_container(const std::vector<uint8_t> &data) {
    if (data.empty()) {
        return "empty";
    }
    if (starts_with(data, "ID3")) {
        return "id3";
    }
    if (starts_with(data, "RIFF")) {
        return "riff";
    }
    if (starts_with(data, "OggS")) {
        return "ogg";
    }
    // MPEG audio frame sync: eleven set bits.
    if (data.size() >= 2 && data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) {
        return "mpeg-frame";
    }
    return "unknown";
}

std::string_view basename_of(const char *path) {
    std::string_view p(path ? path : "");
    const auto slash = p.find_last_of("/\\");
    return slash == std::string_view::npos ? p : p.substr(slash + 1);
}

}  // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(std::string_view name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

LogVerbosity severity_for_tag(std::string_view tag) {
    if (tag == "error" || tag == "warn" || tag == "warning" || tag == "info") {
        return parse_log_verbosity(tag);
    }
    return LogVerbosity::Debug;
}

std::string audio_preview(const std::vector<uint8_t> &data) {
    std::ostringstream oss;
    oss << data.size() << " bytes " << guess_container(data);
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(kPreviewBytes, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << ' ' << std::setw(2) << static_cast<unsigned int>(data[i]);
    }
    return oss.str();
}

namespace detail {

bool log_enabled(const char *level) {
    const auto sev = severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= g_log_level.load(std::memory_order_relaxed);
}

void log_line(const char *level, const std::string &msg, const char *file, int line,
              const char *func) {
    const std::string_view tag(level ? level : "");
    if (tag == "error") {
        std::cerr << "[NarrationForge][" << tag << "][" << basename_of(file) << ":" << line
                  << " " << func << "] " << msg << std::endl;
    } else {
        std::cerr << "[NarrationForge][" << tag << "] " << msg << std::endl;
    }
}

}  // namespace detail

}  // namespace narrationforge
