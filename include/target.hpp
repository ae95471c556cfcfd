/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vantage::core {

enum class TargetKind { Dns, Mirror };

// One endpoint under test. `id` is an IP address for Dns targets and an
// http(s) URL for Mirror targets.
struct Target {
    std::string id;
    TargetKind kind = TargetKind::Dns;
    std::string label;

    [[nodiscard]] std::string_view display_name() const noexcept {
        return label.empty() ? std::string_view(id) : std::string_view(label);
    }

    bool operator==(const Target&) const = default;
};

[[nodiscard]] std::string_view to_string(TargetKind kind) noexcept;

[[nodiscard]] bool is_ipv6_address(std::string_view text);

// Validates and canonicalises a DNS resolver address.
std::expected<Target, std::string> make_dns_target(std::string_view text, std::string_view label = {});

// Accepts http:// and https:// URLs with a non-empty host.
std::expected<Target, std::string> make_mirror_target(std::string_view url, std::string_view label = {});

std::expected<Target, std::string> make_target(TargetKind kind,
                                               std::string_view text,
                                               std::string_view label = {});

struct TargetListParse {
    std::vector<Target> targets;
    std::vector<std::string> errors;
};

// Parses a comma-separated list, keeping the valid entries and collecting
// one error message per rejected entry.
TargetListParse parse_target_list(TargetKind kind, std::string_view text);

// Extracts the host part of an http(s) URL, without brackets or port.
std::expected<std::string, std::string> url_host(std::string_view url);

}  // namespace vantage::core
