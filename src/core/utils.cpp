/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <string>

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool contains_icase(std::string_view haystack, std::string_view needle) {
    if (needle.empty())
        return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_list(std::string_view text, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos)
            pos = text.size();

        auto piece = trim_sv(text.substr(start, pos - start));
        if (!piece.empty())
            parts.emplace_back(piece);

        start = pos + 1;
    }
    return parts;
}

std::string truncate(std::string_view text, std::size_t max_len) {
    if (text.size() <= max_len)
        return std::string(text);
    if (max_len <= 3)
        return std::string(text.substr(0, max_len));
    return std::format("{}...", text.substr(0, max_len - 3));
}

std::string format_rate(double mbps) {
    if (mbps >= 1000.0) {
        return std::format("{:.2f} Gbps", mbps / 1000.0);
    }
    return std::format("{:.2f} Mbps", mbps);
}

std::string format_latency(double ms) {
    if (ms >= 1000.0) {
        return std::format("{:.2f} s", ms / 1000.0);
    }
    return std::format("{:.1f} ms", ms);
}
