/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/target.hpp"

#include <array>
#include <format>

#include <arpa/inet.h>
#include <netinet/in.h>

#include "include/utils.hpp"

namespace vantage::core {

std::string_view to_string(TargetKind kind) noexcept {
    switch (kind) {
        case TargetKind::Dns:
            return "DNS";
        case TargetKind::Mirror:
            return "Mirror";
    }
    return "Unknown";
}

bool is_ipv6_address(std::string_view text) {
    std::string buf(text);
    struct in6_addr addr6{};
    return ::inet_pton(AF_INET6, buf.c_str(), &addr6) == 1;
}

std::expected<Target, std::string> make_dns_target(std::string_view text, std::string_view label) {
    auto value = trim_sv(text);
    if (value.empty()) {
        return std::unexpected("Empty address");
    }

    std::string buf(value);
    std::array<char, INET6_ADDRSTRLEN> canonical{};
    struct in_addr addr4{};
    struct in6_addr addr6{};

    if (::inet_pton(AF_INET, buf.c_str(), &addr4) == 1) {
        ::inet_ntop(AF_INET, &addr4, canonical.data(), canonical.size());
    } else if (::inet_pton(AF_INET6, buf.c_str(), &addr6) == 1) {
        ::inet_ntop(AF_INET6, &addr6, canonical.data(), canonical.size());
    } else {
        return std::unexpected(std::format("Invalid IP address: {}", value));
    }

    return Target{canonical.data(), TargetKind::Dns, trim(label)};
}

std::expected<std::string, std::string> url_host(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(std::format("Missing scheme in URL: {}", url));
    }

    auto rest = url.substr(scheme_end + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));

    auto at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view host;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(std::format("Malformed IPv6 host in URL: {}", url));
        }
        host = authority.substr(1, close - 1);
    } else {
        host = authority.substr(0, authority.find(':'));
    }

    if (host.empty()) {
        return std::unexpected(std::format("Missing host in URL: {}", url));
    }
    return std::string(host);
}

std::expected<Target, std::string> make_mirror_target(std::string_view url, std::string_view label) {
    auto value = trim_sv(url);
    if (value.empty()) {
        return std::unexpected("Empty URL");
    }

    auto lowered = to_lower(value);
    if (!lowered.starts_with("http://") && !lowered.starts_with("https://")) {
        return std::unexpected(std::format("Unsupported URL (expected http:// or https://): {}", value));
    }

    if (value.find_first_of(" \t") != std::string_view::npos) {
        return std::unexpected(std::format("URL contains whitespace: {}", value));
    }

    auto host = url_host(value);
    if (!host) {
        return std::unexpected(host.error());
    }

    return Target{std::string(value), TargetKind::Mirror, trim(label)};
}

std::expected<Target, std::string> make_target(TargetKind kind,
                                               std::string_view text,
                                               std::string_view label) {
    return kind == TargetKind::Dns ? make_dns_target(text, label) : make_mirror_target(text, label);
}

TargetListParse parse_target_list(TargetKind kind, std::string_view text) {
    TargetListParse out;
    for (const auto& piece : split_list(text, ',')) {
        auto target = make_target(kind, piece);
        if (target) {
            out.targets.push_back(std::move(*target));
        } else {
            out.errors.push_back(target.error());
        }
    }
    return out;
}

}  // namespace vantage::core
