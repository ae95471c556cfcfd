/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/dns_applier.hpp"

#include <format>
#include <optional>
#include <sstream>
#include <string>

#include "include/log.hpp"
#include "include/target.hpp"
#include "include/utils.hpp"

namespace vantage::os {

namespace {

struct ActiveConnection {
    std::string name;
    std::string type;
};

// `nmcli -t` escapes ':' inside fields as "\:".
std::optional<ActiveConnection> parse_connection_line(std::string_view line) {
    std::string name;
    std::size_t i = 0;
    for (; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            name += line[++i];
        } else if (line[i] == ':') {
            break;
        } else {
            name += line[i];
        }
    }
    if (name.empty() || i >= line.size())
        return std::nullopt;
    return ActiveConnection{name, std::string(line.substr(i + 1))};
}

std::optional<std::string> default_route_device(std::string_view routes) {
    std::istringstream words{std::string(routes)};
    std::string word;
    while (words >> word) {
        if (word == "dev" && (words >> word))
            return word;
    }
    return std::nullopt;
}

}  // namespace

bool LinuxDnsApplier::networkmanager_running() {
    if (!runner_.has_program("nmcli"))
        return false;

    auto status = runner_.run({"nmcli", "-t", "-f", "RUNNING", "general"});
    if (!status || !status->ok())
        return false;
    return trim(status->output) == "running";
}

std::expected<void, ApplyError> LinuxDnsApplier::apply(std::string_view address) {
    if (networkmanager_running()) {
        Log::debug("Applying {} through NetworkManager", address);
        return apply_networkmanager(address);
    }

    if (runner_.has_program("resolvectl")) {
        Log::debug("NetworkManager unavailable, applying {} through systemd-resolved", address);
        return apply_resolved(address);
    }

    return std::unexpected(ApplyError{
        ApplyErrorKind::MechanismUnavailable,
        "neither NetworkManager (nmcli) nor systemd-resolved (resolvectl) is available"});
}

std::expected<void, ApplyError> LinuxDnsApplier::apply_networkmanager(std::string_view address) {
    auto listing = runner_.run({"nmcli", "-t", "-f", "NAME,TYPE", "connection", "show", "--active"});
    if (!listing) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, listing.error()});
    }
    if (!listing->ok()) {
        return std::unexpected(classify_failure({"nmcli", "connection", "show"}, *listing));
    }

    std::optional<ActiveConnection> active;
    std::istringstream lines(listing->output);
    std::string line;
    while (std::getline(lines, line)) {
        auto conn = parse_connection_line(trim_sv(line));
        if (conn && conn->type.find("loopback") == std::string::npos) {
            active = std::move(conn);
            break;
        }
    }
    if (!active) {
        return std::unexpected(
            ApplyError{ApplyErrorKind::InvocationFailed, "no active network connection found via nmcli"});
    }

    const bool v6 = core::is_ipv6_address(address);
    const std::string dns_prop = v6 ? "ipv6.dns" : "ipv4.dns";
    const std::string ignore_prop = v6 ? "ipv6.ignore-auto-dns" : "ipv4.ignore-auto-dns";

    auto previous = runner_.run({"nmcli", "-g", dns_prop + "," + ignore_prop, "connection", "show", active->name});
    if (!previous) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, previous.error()});
    }
    if (!previous->ok()) {
        return std::unexpected(classify_failure({"nmcli", "-g", dns_prop, "connection", "show"}, *previous));
    }

    std::istringstream prev_lines(previous->output);
    std::string prev_dns, prev_ignore;
    std::getline(prev_lines, prev_dns);
    std::getline(prev_lines, prev_ignore);
    prev_dns = trim(prev_dns);
    prev_ignore = trim(prev_ignore);
    if (prev_ignore.empty())
        prev_ignore = "no";

    auto modify = with_privileges(runner_, {"nmcli", "connection", "modify", active->name,
                                            dns_prop, std::string(address), ignore_prop, "yes"});
    if (!modify)
        return std::unexpected(modify.error());

    auto modified = runner_.run(*modify);
    if (!modified) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, modified.error()});
    }
    if (!modified->ok()) {
        return std::unexpected(classify_failure(*modify, *modified));
    }

    auto up = with_privileges(runner_, {"nmcli", "connection", "up", active->name});
    if (!up)
        return std::unexpected(up.error());

    auto activated = runner_.run(*up);
    if (activated && activated->ok()) {
        Log::info("DNS for '{}' set to {}", active->name, address);
        return {};
    }

    ApplyError failure = activated ? classify_failure(*up, *activated)
                                   : ApplyError{ApplyErrorKind::InvocationFailed, activated.error()};

    auto restore = with_privileges(runner_, {"nmcli", "connection", "modify", active->name,
                                             dns_prop, prev_dns, ignore_prop, prev_ignore});
    if (restore) {
        auto restored = runner_.run(*restore);
        if (!restored || !restored->ok()) {
            Log::debug("Could not restore previous DNS settings on '{}'", active->name);
            failure.detail += " (previous settings could not be restored)";
        }
    }
    return std::unexpected(failure);
}

std::expected<void, ApplyError> LinuxDnsApplier::apply_resolved(std::string_view address) {
    if (!runner_.has_program("ip")) {
        return std::unexpected(
            ApplyError{ApplyErrorKind::MechanismUnavailable, "'ip' is required to find the default interface"});
    }

    std::vector<std::string> route_cmd = {"ip", "route", "show", "default"};
    if (core::is_ipv6_address(address))
        route_cmd = {"ip", "-6", "route", "show", "default"};

    auto routes = runner_.run(route_cmd);
    if (!routes) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, routes.error()});
    }
    if (!routes->ok()) {
        return std::unexpected(classify_failure(route_cmd, *routes));
    }

    auto device = default_route_device(routes->output);
    if (!device) {
        return std::unexpected(
            ApplyError{ApplyErrorKind::InvocationFailed, "could not find the default route interface"});
    }

    auto set_dns = with_privileges(runner_, {"resolvectl", "dns", *device, std::string(address)});
    if (!set_dns)
        return std::unexpected(set_dns.error());

    auto result = runner_.run(*set_dns);
    if (!result) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, result.error()});
    }
    if (!result->ok()) {
        return std::unexpected(classify_failure(*set_dns, *result));
    }

    auto flush = with_privileges(runner_, {"resolvectl", "flush-caches"});
    if (flush) {
        auto flushed = runner_.run(*flush);
        if (!flushed || !flushed->ok()) {
            Log::debug("resolvectl flush-caches failed; cached answers may persist");
        }
    }

    Log::info("DNS for {} set to {}", *device, address);
    return {};
}

}  // namespace vantage::os
