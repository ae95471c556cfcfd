/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/dns_applier.hpp"

#include <array>
#include <format>

#include "include/utils.hpp"

namespace vantage::os {

namespace {

constexpr std::array kPermissionMarkers = {
    std::string_view("password is required"),
    std::string_view("a terminal is required"),
    std::string_view("not in the sudoers"),
    std::string_view("not allowed to"),
    std::string_view("not authorized"),
    std::string_view("insufficient privileges"),
    std::string_view("permission denied"),
    std::string_view("operation not permitted"),
    std::string_view("access is denied"),
    std::string_view("requires elevation"),
    std::string_view("must be root"),
};

std::string first_line(std::string_view text) {
    text = trim_sv(text);
    return trim(text.substr(0, text.find('\n')));
}

}  // namespace

std::string_view to_string(ApplyErrorKind kind) noexcept {
    switch (kind) {
        case ApplyErrorKind::MechanismUnavailable:
            return "Mechanism unavailable";
        case ApplyErrorKind::PermissionDenied:
            return "Permission denied";
        case ApplyErrorKind::InvocationFailed:
            return "Invocation failed";
        case ApplyErrorKind::NoCandidate:
            return "No candidate";
        case ApplyErrorKind::Unsupported:
            return "Unsupported platform";
    }
    return "Unknown";
}

std::string ApplyError::message() const {
    if (detail.empty())
        return std::string(to_string(kind));
    return std::format("{}: {}", to_string(kind), detail);
}

std::expected<std::vector<std::string>, ApplyError> with_privileges(CommandRunner& runner,
                                                                    std::vector<std::string> args) {
    if (runner.is_privileged())
        return args;

    if (!runner.has_program("sudo")) {
        return std::unexpected(ApplyError{ApplyErrorKind::PermissionDenied,
                                          "root privileges required and sudo is not installed"});
    }

    args.insert(args.begin(), {"sudo", "-n"});
    return args;
}

ApplyError classify_failure(const std::vector<std::string>& args, const CommandResult& result) {
    const std::string command = args.empty() ? std::string("command") : join_command(args);

    if (result.timed_out) {
        return ApplyError{ApplyErrorKind::InvocationFailed, std::format("'{}' timed out", command)};
    }

    for (auto marker : kPermissionMarkers) {
        if (contains_icase(result.output, marker)) {
            return ApplyError{ApplyErrorKind::PermissionDenied, first_line(result.output)};
        }
    }

    auto line = first_line(result.output);
    if (line.empty()) {
        return ApplyError{ApplyErrorKind::InvocationFailed,
                          std::format("'{}' exited with status {}", command, result.exit_code)};
    }
    return ApplyError{ApplyErrorKind::InvocationFailed,
                      std::format("'{}' exited with status {}: {}", command, result.exit_code, line)};
}

std::expected<void, ApplyError> UnsupportedDnsApplier::apply(std::string_view) {
    return std::unexpected(ApplyError{ApplyErrorKind::Unsupported,
                                      "system DNS configuration is not supported on this operating system"});
}

std::unique_ptr<DnsApplier> make_platform_applier(CommandRunner& runner) {
#if defined(__linux__)
    return std::make_unique<LinuxDnsApplier>(runner);
#elif defined(__APPLE__)
    return std::make_unique<MacDnsApplier>(runner);
#elif defined(_WIN32)
    return std::make_unique<WindowsDnsApplier>(runner);
#else
    (void)runner;
    return std::make_unique<UnsupportedDnsApplier>();
#endif
}

}  // namespace vantage::os
