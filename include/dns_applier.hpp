/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "command_runner.hpp"

namespace vantage::os {

enum class ApplyErrorKind {
    MechanismUnavailable,
    PermissionDenied,
    InvocationFailed,
    NoCandidate,
    Unsupported,
};

struct ApplyError {
    ApplyErrorKind kind = ApplyErrorKind::InvocationFailed;
    std::string detail;

    [[nodiscard]] std::string message() const;
};

[[nodiscard]] std::string_view to_string(ApplyErrorKind kind) noexcept;

// Makes one address the host's active resolver through a single
// configuration mechanism.
class DnsApplier {
   public:
    virtual ~DnsApplier() = default;

    [[nodiscard]] virtual std::string_view platform() const noexcept = 0;
    virtual std::expected<void, ApplyError> apply(std::string_view address) = 0;
};

// NetworkManager when it is running, systemd-resolved otherwise.
class LinuxDnsApplier final : public DnsApplier {
    CommandRunner& runner_;

    std::expected<void, ApplyError> apply_networkmanager(std::string_view address);
    std::expected<void, ApplyError> apply_resolved(std::string_view address);
    bool networkmanager_running();

   public:
    explicit LinuxDnsApplier(CommandRunner& runner) : runner_(runner) {}

    [[nodiscard]] std::string_view platform() const noexcept override { return "Linux"; }
    std::expected<void, ApplyError> apply(std::string_view address) override;
};

class MacDnsApplier final : public DnsApplier {
    CommandRunner& runner_;

   public:
    explicit MacDnsApplier(CommandRunner& runner) : runner_(runner) {}

    [[nodiscard]] std::string_view platform() const noexcept override { return "macOS"; }
    std::expected<void, ApplyError> apply(std::string_view address) override;
};

class WindowsDnsApplier final : public DnsApplier {
    CommandRunner& runner_;

   public:
    explicit WindowsDnsApplier(CommandRunner& runner) : runner_(runner) {}

    [[nodiscard]] std::string_view platform() const noexcept override { return "Windows"; }
    std::expected<void, ApplyError> apply(std::string_view address) override;
};

class UnsupportedDnsApplier final : public DnsApplier {
   public:
    [[nodiscard]] std::string_view platform() const noexcept override { return "Unsupported"; }
    std::expected<void, ApplyError> apply(std::string_view address) override;
};

// Picks the strategy for the platform this binary was built for.
[[nodiscard]] std::unique_ptr<DnsApplier> make_platform_applier(CommandRunner& runner);

// Prefixes `sudo -n` when the runner is not already privileged.
std::expected<std::vector<std::string>, ApplyError> with_privileges(CommandRunner& runner,
                                                                    std::vector<std::string> args);

// Maps a failed command to PermissionDenied or InvocationFailed.
[[nodiscard]] ApplyError classify_failure(const std::vector<std::string>& args, const CommandResult& result);

}  // namespace vantage::os
