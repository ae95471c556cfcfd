/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <stop_token>
#include <string>

#include "config.hpp"
#include "dns_resolver.hpp"
#include "prober.hpp"

namespace vantage::net {

struct ProbeSettings {
    std::string test_domain{Config::DNS_TEST_DOMAIN};
    std::string throughput_url{Config::DNS_THROUGHPUT_URL};
    std::size_t dns_payload_bytes = Config::DNS_PAYLOAD_BYTES;
    std::size_t mirror_payload_bytes = Config::MIRROR_PAYLOAD_BYTES;
    ResolverOptions resolver;
};

// Real probes over the network.
//  - Dns: latency = lookup of the test domain through the target resolver;
//    throughput = bounded download from the throughput URL, with its host
//    pinned to the address that same resolver returned.
//  - Mirror: one bounded transfer; latency = connection setup time,
//    throughput = bytes / transfer time.
class NetworkProber final : public core::Prober {
    ProbeSettings settings_;

    std::expected<core::Measurement, std::string> probe_dns(const core::Target& target,
                                                            std::stop_token stop);
    std::expected<core::Measurement, std::string> probe_mirror(const core::Target& target,
                                                               std::stop_token stop);

   public:
    explicit NetworkProber(ProbeSettings settings = {}) : settings_(std::move(settings)) {}

    std::expected<core::Measurement, std::string> probe(const core::Target& target,
                                                        std::stop_token stop) override;

    [[nodiscard]] const ProbeSettings& settings() const noexcept { return settings_; }
};

// Formats a CURLOPT_RESOLVE entry, bracketing IPv6 addresses.
[[nodiscard]] std::string make_pin_entry(std::string_view host, int port, std::string_view address);

// Port implied by the URL's scheme or explicit ":port".
[[nodiscard]] int url_port(std::string_view url);

}  // namespace vantage::net
