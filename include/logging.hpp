//
//  logging.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace narrationforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/JSON level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Severity of an NF_LOG tag. Only error/warn/info are named; chunker, merge,
// pipeline and any other tag log at Debug.
LogVerbosity severity_for_tag(std::string_view tag);

/// Short description of an audio payload for debug logs: byte count, the
/// container guessed from its first bytes, and a hex preview of them.
/// e.g. `1024 bytes id3 49 44 33 04 00 00 00 00`
std::string audio_preview(const std::vector<uint8_t> &data);

namespace detail {

bool log_enabled(const char *level);
void log_line(const char *level, const std::string &msg, const char *file, int line,
              const char *func);

}  // namespace detail

}  // namespace narrationforge

// Streaming log statement, e.g. `NF_LOG("warn", "budget " << n << " too small")`.
// Errors carry the source file, line and function.
#define NF_LOG(level, message)                                                       \
    do {                                                                             \
        if (narrationforge::detail::log_enabled(level)) {                            \
            std::ostringstream _nf_log_ss;                                           \
            _nf_log_ss << message;                                                   \
            narrationforge::detail::log_line(level, _nf_log_ss.str(), __FILE__,      \
                                             __LINE__, __func__);                    \
        }                                                                            \
    } while (0)
