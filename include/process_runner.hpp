//
//  process_runner.hpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace narrationforge {

struct ProcessResult {
    bool launched = false;   ///< fork/exec succeeded
    int exit_code = -1;      ///< valid when launched && !timed_out
    bool timed_out = false;  ///< child was killed after the deadline
};

// Resolve `name` against PATH. Names containing '/' are checked as given.
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief Run `argv` to completion or until `timeout` expires.
 *
 * stdin and stdout are bound to /dev/null; stderr goes to `stderr_path` when given
 * (otherwise /dev/null). The child is killed with SIGKILL on timeout.
 */
ProcessResult run_process(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
                          const std::filesystem::path &stderr_path = {});

}  // namespace narrationforge
