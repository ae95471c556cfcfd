/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/dns_applier.hpp"

#include <format>
#include <sstream>
#include <string>

#include "include/log.hpp"
#include "include/target.hpp"
#include "include/utils.hpp"

namespace vantage::os {

std::expected<void, ApplyError> WindowsDnsApplier::apply(std::string_view address) {
    if (!runner_.has_program("powershell") || !runner_.has_program("netsh")) {
        return std::unexpected(ApplyError{ApplyErrorKind::MechanismUnavailable, "powershell or netsh not found"});
    }

    // netsh has no sudo equivalent; the process itself must be elevated.
    if (!runner_.is_privileged()) {
        return std::unexpected(
            ApplyError{ApplyErrorKind::PermissionDenied, "run the terminal as Administrator"});
    }

    std::vector<std::string> query = {
        "powershell", "-NoProfile", "-Command",
        "Get-NetAdapter | Where-Object { $_.Status -eq 'Up' } | Select-Object -ExpandProperty Name"};

    auto adapters = runner_.run(query);
    if (!adapters) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, adapters.error()});
    }
    if (!adapters->ok()) {
        return std::unexpected(classify_failure(query, *adapters));
    }

    std::istringstream lines(adapters->output);
    std::string line;
    std::string adapter;
    while (std::getline(lines, line)) {
        adapter = trim(line);
        if (!adapter.empty())
            break;
    }
    if (adapter.empty()) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, "no active network adapter found"});
    }

    std::vector<std::string> set_dns;
    if (core::is_ipv6_address(address)) {
        set_dns = {"netsh", "interface", "ipv6", "set", "dnsservers",
                   std::format("name={}", adapter), "source=static", std::format("address={}", address)};
    } else {
        set_dns = {"netsh", "interface", "ip", "set", "dns",
                   std::format("name={}", adapter), "source=static", std::format("addr={}", address)};
    }

    auto result = runner_.run(set_dns);
    if (!result) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, result.error()});
    }
    if (!result->ok()) {
        return std::unexpected(classify_failure(set_dns, *result));
    }

    Log::info("DNS for '{}' set to {}", adapter, address);
    return {};
}

}  // namespace vantage::os
