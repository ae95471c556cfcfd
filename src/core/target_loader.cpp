/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/target_loader.hpp"

#include <format>
#include <fstream>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "include/log.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace vantage::core {

namespace {

std::string_view id_key(TargetKind kind) {
    return kind == TargetKind::Dns ? "ip" : "url";
}

std::expected<std::string, std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::format("Cannot open {}", path.string()));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(std::format("Failed to read {}", path.string()));
    }
    return buf.str();
}

void skip(LoadReport& report, std::string problem) {
    Log::debug("Skipping entry: {}", problem);
    ++report.skipped;
    report.problems.push_back(std::move(problem));
}

std::optional<std::size_t> find_column(const std::vector<std::string>& header, std::string_view name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (to_lower(trim_sv(header[i])) == name)
            return i;
    }
    return std::nullopt;
}

}  // namespace

std::expected<std::vector<std::string>, std::string> split_csv_record(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }

    if (quoted) {
        return std::unexpected("unterminated quoted field");
    }
    fields.push_back(std::move(field));
    return fields;
}

std::expected<LoadReport, std::string> parse_csv(std::string_view text, TargetKind kind) {
    LoadReport report;
    std::optional<std::vector<std::string>> header;
    std::size_t id_col = 0;
    std::optional<std::size_t> label_col;
    std::size_t line_no = 0;

    while (!text.empty()) {
        auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        ++line_no;

        if (line.ends_with('\r'))
            line.remove_suffix(1);
        if (trim_sv(line).empty())
            continue;

        auto fields = split_csv_record(line);

        if (!header) {
            if (!fields) {
                return std::unexpected(std::format("Invalid CSV header: {}", fields.error()));
            }
            auto col = find_column(*fields, id_key(kind));
            if (!col) {
                return std::unexpected(std::format("CSV header has no '{}' column", id_key(kind)));
            }
            id_col = *col;
            label_col = find_column(*fields, "name");
            if (!label_col)
                label_col = find_column(*fields, "label");
            header = std::move(*fields);
            continue;
        }

        if (!fields) {
            skip(report, std::format("line {}: {}", line_no, fields.error()));
            continue;
        }
        if (id_col >= fields->size()) {
            skip(report, std::format("line {}: missing '{}' value", line_no, id_key(kind)));
            continue;
        }

        std::string label = (label_col && *label_col < fields->size()) ? trim((*fields)[*label_col]) : "";
        auto target = make_target(kind, trim_sv((*fields)[id_col]), label);
        if (!target) {
            skip(report, std::format("line {}: {}", line_no, target.error()));
            continue;
        }
        report.targets.push_back(std::move(*target));
    }

    if (!header) {
        return std::unexpected("CSV file is empty");
    }
    return report;
}

std::expected<LoadReport, std::string> parse_json(std::string_view text, TargetKind kind) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return std::unexpected("Invalid JSON document");
    }
    if (!doc.is_array()) {
        return std::unexpected("JSON target list must be an array");
    }

    LoadReport report;
    const std::string key(id_key(kind));

    for (std::size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        if (!entry.is_object()) {
            skip(report, std::format("entry {}: not an object", i));
            continue;
        }

        auto it = entry.find(key);
        if (it == entry.end() || !it->is_string()) {
            skip(report, std::format("entry {}: missing '{}' string", i, key));
            continue;
        }

        std::string label;
        if (auto name = entry.find("name"); name != entry.end() && name->is_string()) {
            label = name->get<std::string>();
        } else if (auto lbl = entry.find("label"); lbl != entry.end() && lbl->is_string()) {
            label = lbl->get<std::string>();
        }

        auto target = make_target(kind, trim_sv(it->get_ref<const std::string&>()), trim_sv(label));
        if (!target) {
            skip(report, std::format("entry {}: {}", i, target.error()));
            continue;
        }
        report.targets.push_back(std::move(*target));
    }

    return report;
}

std::expected<LoadReport, std::string> load_csv(const fs::path& path, TargetKind kind) {
    auto text = read_file(path);
    if (!text)
        return std::unexpected(text.error());
    return parse_csv(*text, kind);
}

std::expected<LoadReport, std::string> load_json(const fs::path& path, TargetKind kind) {
    auto text = read_file(path);
    if (!text)
        return std::unexpected(text.error());
    return parse_json(*text, kind);
}

std::expected<LoadReport, std::string> load_file(const fs::path& path, TargetKind kind) {
    if (to_lower(path.extension().string()) == ".json") {
        return load_json(path, kind);
    }
    return load_csv(path, kind);
}

}  // namespace vantage::core
