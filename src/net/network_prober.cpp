/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/network_prober.hpp"

#include <exception>
#include <format>

#include "include/http_client.hpp"
#include "include/target.hpp"
#include "include/utils.hpp"

namespace vantage::net {

std::string make_pin_entry(std::string_view host, int port, std::string_view address) {
    if (core::is_ipv6_address(address)) {
        return std::format("{}:{}:[{}]", host, port, address);
    }
    return std::format("{}:{}:{}", host, port, address);
}

int url_port(std::string_view url) {
    auto scheme_end = url.find("://");
    const bool https = to_lower(url.substr(0, scheme_end)) == "https";
    int port = https ? 443 : 80;
    if (scheme_end == std::string_view::npos)
        return port;

    auto rest = url.substr(scheme_end + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::size_t colon;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        colon = (close != std::string_view::npos && close + 1 < authority.size() && authority[close + 1] == ':')
                    ? close + 1
                    : std::string_view::npos;
    } else {
        colon = authority.rfind(':');
    }

    if (colon != std::string_view::npos) {
        if (auto parsed = parse_number<int>(authority.substr(colon + 1)); parsed && *parsed > 0 && *parsed < 65536)
            port = *parsed;
    }
    return port;
}

std::expected<core::Measurement, std::string> NetworkProber::probe(const core::Target& target,
                                                                   std::stop_token stop) {
    try {
        return target.kind == core::TargetKind::Dns ? probe_dns(target, stop) : probe_mirror(target, stop);
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Probe setup failed: {}", e.what()));
    }
}

std::expected<core::Measurement, std::string> NetworkProber::probe_dns(const core::Target& target,
                                                                       std::stop_token stop) {
    DnsResolver resolver(target.id, settings_.resolver);

    auto latency = resolver.resolve(settings_.test_domain, stop);
    if (!latency) {
        return std::unexpected(std::format("Latency test failed: {}", latency.error()));
    }

    auto host = core::url_host(settings_.throughput_url);
    if (!host) {
        return std::unexpected(host.error());
    }

    auto route = resolver.resolve(*host, stop);
    if (!route) {
        return std::unexpected(std::format("Download test failed: {}", route.error()));
    }

    FetchOptions options;
    options.max_bytes = settings_.dns_payload_bytes;
    options.pinned_address = make_pin_entry(*host, url_port(settings_.throughput_url), route->addresses.front());

    HttpClient http;
    auto transfer = http.fetch_bounded(settings_.throughput_url, options, stop);
    if (!transfer) {
        return std::unexpected(std::format("Download test failed: {}", transfer.error()));
    }

    return core::Measurement{latency->elapsed, transfer->throughput_mbps()};
}

std::expected<core::Measurement, std::string> NetworkProber::probe_mirror(const core::Target& target,
                                                                          std::stop_token stop) {
    FetchOptions options;
    options.max_bytes = settings_.mirror_payload_bytes;

    HttpClient http;
    auto transfer = http.fetch_bounded(target.id, options, stop);
    if (!transfer) {
        return std::unexpected(transfer.error());
    }

    return core::Measurement{core::Milliseconds{transfer->connect_ms}, transfer->throughput_mbps()};
}

}  // namespace vantage::net
