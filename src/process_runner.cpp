//
//  process_runner.cpp
//  NarrationForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "process_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <system_error>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include "logging.hpp"

namespace narrationforge {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

bool is_executable_file(const std::filesystem::path &p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

int open_or_null(const std::filesystem::path &path, int flags) {
    if (!path.empty()) {
        int fd = ::open(path.c_str(), flags | O_CREAT | O_TRUNC, 0644);
        if (fd >= 0) {
            return fd;
        }
    }
    return ::open("/dev/null", flags);
}

}  // namespace

std::optional<std::filesystem::path> find_executable(const std::string &name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::string path_list(path_env);
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) {
            end = path_list.size();
        }
        std::string dir = path_list.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

ProcessResult run_process(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
                          const std::filesystem::path &stderr_path) {
    ProcessResult result{};
    if (argv.empty()) {
        NF_LOG("error", "run_process: empty argument vector");
        return result;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv) {
        args.push_back(const_cast<char *>(a.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        NF_LOG("error", "fork failed errno=" << errno << " ("
                                             << std::generic_category().message(errno) << ")");
        return result;
    }
    if (pid == 0) {
        int in_fd = ::open("/dev/null", O_RDONLY);
        int out_fd = ::open("/dev/null", O_WRONLY);
        int err_fd = open_or_null(stderr_path, O_WRONLY);
        if (in_fd < 0 || out_fd < 0 || err_fd < 0 || ::dup2(in_fd, STDIN_FILENO) < 0 ||
            ::dup2(out_fd, STDOUT_FILENO) < 0 || ::dup2(err_fd, STDERR_FILENO) < 0) {
            _exit(127);
        }
        ::execvp(args[0], args.data());
        _exit(127);
    }

    result.launched = true;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w < 0 && errno != EINTR) {
            NF_LOG("error", "waitpid failed errno=" << errno << " ("
                                                    << std::generic_category().message(errno)
                                                    << ")");
            result.launched = false;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            NF_LOG("warn", argv[0] << " exceeded " << timeout.count() << "ms; killing pid " << pid);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            result.timed_out = true;
            return result;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        // execvp failure inside the child is reported as 127.
        if (result.exit_code == 127) {
            NF_LOG("warn", argv[0] << " exited with 127 (exec failure or command not found)");
        }
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

}  // namespace narrationforge
