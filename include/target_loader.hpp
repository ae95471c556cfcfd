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
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "target.hpp"

namespace vantage::core {

struct LoadReport {
    std::vector<Target> targets;
    std::size_t skipped = 0;
    // One line per skipped row, for --verbose output.
    std::vector<std::string> problems;
};

// Header row required. The identifier column is "ip" for Dns and "url" for
// Mirror; "name" or "label" is optional. Rows that fail validation are
// skipped and counted.
std::expected<LoadReport, std::string> parse_csv(std::string_view text, TargetKind kind);

// Top-level array of objects carrying "ip" or "url" and an optional "name".
std::expected<LoadReport, std::string> parse_json(std::string_view text, TargetKind kind);

std::expected<LoadReport, std::string> load_csv(const std::filesystem::path& path, TargetKind kind);
std::expected<LoadReport, std::string> load_json(const std::filesystem::path& path, TargetKind kind);

// Dispatches on the extension: .json is JSON, everything else CSV.
std::expected<LoadReport, std::string> load_file(const std::filesystem::path& path, TargetKind kind);

// Splits one CSV record, honouring double quotes and "" escapes.
std::expected<std::vector<std::string>, std::string> split_csv_record(std::string_view line);

}  // namespace vantage::core
