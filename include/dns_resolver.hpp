/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "results.hpp"

namespace vantage::net {

struct ResolverOptions {
    long timeout_ms = Config::RESOLVER_TIMEOUT_MS;
    int tries = Config::RESOLVER_TRIES;
};

struct Resolution {
    std::vector<std::string> addresses;
    core::Milliseconds elapsed{};
};

// Sends queries to exactly one nameserver, ignoring /etc/hosts and the
// system resolver configuration. Not thread-safe; use one per probe.
class DnsResolver {
    struct Channel;

    std::string nameserver_;
    ResolverOptions options_;

   public:
    explicit DnsResolver(std::string nameserver, ResolverOptions options = {});

    [[nodiscard]] const std::string& nameserver() const noexcept { return nameserver_; }

    // A and AAAA lookup of `host`; elapsed covers the whole round trip.
    std::expected<Resolution, std::string> resolve(std::string_view host, std::stop_token stop = {});
};

}  // namespace vantage::net
