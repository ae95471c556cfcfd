/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/cli_options.hpp"

#include <format>

#include "include/utils.hpp"

using vantage::core::Mode;
using vantage::core::RankPolicy;
using vantage::core::SortColumn;
using vantage::core::SortDirection;

namespace {

std::expected<SortColumn, std::string> parse_sort_column(std::string_view value) {
    auto key = to_lower(value);
    if (key == "ip" || key == "url" || key == "target")
        return SortColumn::Identifier;
    if (key == "latency")
        return SortColumn::Latency;
    if (key == "throughput" || key == "speed")
        return SortColumn::Throughput;
    if (key == "name")
        return SortColumn::Label;
    return std::unexpected(std::format("Unknown sort column '{}'", value));
}

}  // namespace

std::expected<CliOptions, std::string> parse_args(const std::vector<std::string_view>& args) {
    CliOptions opts;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        std::string_view inline_value;
        bool has_inline = false;

        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        auto value = [&]() -> std::expected<std::string_view, std::string> {
            if (has_inline)
                return inline_value;
            if (i + 1 >= args.size())
                return std::unexpected(std::format("Option '{}' needs a value", arg));
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.version = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--batch") {
            opts.batch = true;
        } else if (arg == "--apply") {
            opts.apply = true;
        } else if (arg == "--asc") {
            opts.sort.direction = SortDirection::Ascending;
        } else if (arg == "--desc") {
            opts.sort.direction = SortDirection::Descending;
        } else if (arg == "--dns") {
            auto v = value();
            if (!v)
                return std::unexpected(v.error());
            for (auto& entry : split_list(*v))
                opts.dns_entries.push_back(std::move(entry));
        } else if (arg == "--file") {
            auto v = value();
            if (!v)
                return std::unexpected(v.error());
            opts.file = std::filesystem::path(std::string(*v));
        } else if (arg == "--mode") {
            auto v = value();
            if (!v)
                return std::unexpected(v.error());
            auto key = to_lower(*v);
            if (key == "dns") {
                opts.mode = Mode::Dns;
            } else if (key == "mirror") {
                opts.mode = Mode::Mirror;
            } else {
                return std::unexpected(std::format("Unknown mode '{}'", *v));
            }
        } else if (arg == "--distro") {
            auto v = value();
            if (!v)
                return std::unexpected(v.error());
            opts.distro = std::string(*v);
        } else if (arg == "--rank") {
            auto v = value();
            if (!v)
                return std::unexpected(v.error());
            auto key = to_lower(*v);
            if (key == "latency") {
                opts.rank = RankPolicy::LatencyFirst;
            } else if (key == "throughput") {
                opts.rank = RankPolicy::ThroughputFirst;
            } else {
                return std::unexpected(std::format("Unknown rank policy '{}'", *v));
            }
        } else if (arg == "--sort") {
            auto v = value();
            if (!v)
                return std::unexpected(v.error());
            auto column = parse_sort_column(*v);
            if (!column)
                return std::unexpected(column.error());
            opts.sort.column = *column;
        } else if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", args[i]));
        } else {
            for (auto& entry : split_list(arg))
                opts.entries.push_back(std::move(entry));
        }
    }

    if (opts.apply && !opts.batch) {
        return std::unexpected("--apply is only valid together with --batch");
    }
    return opts;
}
