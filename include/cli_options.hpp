/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result_table.hpp"
#include "session.hpp"

struct CliOptions {
    // From --dns; always DNS resolvers.
    std::vector<std::string> dns_entries;
    // Positional arguments, read under the selected mode.
    std::vector<std::string> entries;
    std::optional<std::filesystem::path> file;
    vantage::core::Mode mode = vantage::core::Mode::Dns;
    std::optional<std::string> distro;
    vantage::core::RankPolicy rank = vantage::core::RankPolicy::LatencyFirst;
    vantage::core::SortSpec sort;
    bool batch = false;
    bool apply = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

std::expected<CliOptions, std::string> parse_args(const std::vector<std::string_view>& args);
