/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/command_runner.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <system_error>

#include <unistd.h>

#include "include/log.hpp"
#include "include/shell_pipe.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;

namespace vantage::os {

std::string join_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty())
            out += ' ';
        if (arg.find_first_of(" \t\"") != std::string::npos) {
            out += std::format("\"{}\"", arg);
        } else {
            out += arg;
        }
    }
    return out;
}

bool ShellCommandRunner::has_program(std::string_view name) const {
    if (name.find('/') != std::string_view::npos) {
        return ::access(std::string(name).c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

    for (const auto& dir : split_list(path, ':')) {
        std::error_code ec;
        auto candidate = fs::path(dir) / name;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

bool ShellCommandRunner::is_privileged() const {
    return ::geteuid() == 0;
}

std::expected<CommandResult, std::string> ShellCommandRunner::run(const std::vector<std::string>& args,
                                                                  std::chrono::milliseconds timeout) {
    if (args.empty()) {
        return std::unexpected("Empty command");
    }

    Log::debug("exec: {}", join_command(args));

    try {
        ShellPipe pipe(args);
        CommandResult result;
        result.output = pipe.read_all(timeout);
        result.timed_out = pipe.timed_out();
        result.exit_code = pipe.wait();
        return result;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to run '{}': {}", args.front(), e.what()));
    }
}

}  // namespace vantage::os
