/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace vantage::os {

struct CommandResult {
    int exit_code = -1;
    std::string output;
    bool timed_out = false;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0 && !timed_out; }
};

// Seam between the DNS applier and the host's process table.
class CommandRunner {
   public:
    virtual ~CommandRunner() = default;

    [[nodiscard]] virtual bool has_program(std::string_view name) const = 0;
    [[nodiscard]] virtual bool is_privileged() const = 0;

    // Error only when the process could not be started at all.
    virtual std::expected<CommandResult, std::string> run(
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout = Config::COMMAND_TIMEOUT) = 0;
};

class ShellCommandRunner final : public CommandRunner {
   public:
    [[nodiscard]] bool has_program(std::string_view name) const override;
    [[nodiscard]] bool is_privileged() const override;

    std::expected<CommandResult, std::string> run(const std::vector<std::string>& args,
                                                  std::chrono::milliseconds timeout) override;
};

[[nodiscard]] std::string join_command(const std::vector<std::string>& args);

}  // namespace vantage::os
