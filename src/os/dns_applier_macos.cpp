/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/dns_applier.hpp"

#include <optional>
#include <sstream>
#include <string>

#include "include/log.hpp"
#include "include/utils.hpp"

namespace vantage::os {

std::expected<void, ApplyError> MacDnsApplier::apply(std::string_view address) {
    if (!runner_.has_program("networksetup")) {
        return std::unexpected(ApplyError{ApplyErrorKind::MechanismUnavailable, "networksetup not found"});
    }

    auto listing = runner_.run({"networksetup", "-listallnetworkservices"});
    if (!listing) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, listing.error()});
    }
    if (!listing->ok()) {
        return std::unexpected(classify_failure({"networksetup", "-listallnetworkservices"}, *listing));
    }

    std::optional<std::string> service;
    std::istringstream lines(listing->output);
    std::string line;
    std::getline(lines, line);  // header

    while (std::getline(lines, line)) {
        auto name = trim(line);
        // Disabled services are marked with a leading asterisk.
        if (name.empty() || name.starts_with('*'))
            continue;

        auto info = runner_.run({"networksetup", "-getinfo", name});
        if (info && info->ok() && info->output.find("IP address:") != std::string::npos) {
            service = name;
            break;
        }
    }

    if (!service) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, "no active network service found"});
    }

    auto set_dns = with_privileges(runner_, {"networksetup", "-setdnsservers", *service, std::string(address)});
    if (!set_dns)
        return std::unexpected(set_dns.error());

    auto result = runner_.run(*set_dns);
    if (!result) {
        return std::unexpected(ApplyError{ApplyErrorKind::InvocationFailed, result.error()});
    }
    if (!result->ok()) {
        return std::unexpected(classify_failure(*set_dns, *result));
    }

    Log::info("DNS for '{}' set to {}", *service, address);
    return {};
}

}  // namespace vantage::os
