/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

#include <sys/types.h>

#include "config.hpp"
#include "file_descriptor.hpp"

namespace vantage::os {

// Child process with stdout and stderr merged into one pipe. The child is
// always reaped: by wait(), or by the destructor (SIGTERM, then SIGKILL).
class ShellPipe {
    FileDescriptor read_fd_;
    pid_t pid_ = -1;
    bool timed_out_ = false;

    void terminate() noexcept;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    // Reads until EOF, the timeout, or a stop request. On timeout or stop the
    // child is killed and timed_out() reports true.
    std::string read_all(std::chrono::milliseconds timeout = Config::COMMAND_TIMEOUT,
                         std::stop_token stop = {},
                         std::size_t max_output = Config::COMMAND_MAX_OUTPUT);

    // Blocks until the child exits. Returns its exit code, or 128 + signal.
    int wait();

    [[nodiscard]] bool timed_out() const noexcept { return timed_out_; }
};

}  // namespace vantage::os
