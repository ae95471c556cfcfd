/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/result_table.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "include/config.hpp"
#include "include/log.hpp"

namespace vantage::core {

namespace {

bool numeric_column(SortColumn column) {
    return column == SortColumn::Latency || column == SortColumn::Throughput;
}

double numeric_key(const ProbeResult& r, SortColumn column) {
    if (column == SortColumn::Latency)
        return r.latency ? r.latency->count() : 0.0;
    return r.throughput_mbps.value_or(0.0);
}

std::string_view text_key(const ProbeResult& r, SortColumn column) {
    if (column == SortColumn::Label)
        return r.target.display_name();
    return r.target.id;
}

}  // namespace

std::string_view to_string(SortColumn column) noexcept {
    switch (column) {
        case SortColumn::Identifier:
            return "IP/URL";
        case SortColumn::Latency:
            return "Latency";
        case SortColumn::Throughput:
            return "Throughput";
        case SortColumn::Label:
            return "Name";
    }
    return "Unknown";
}

std::string_view to_string(SortDirection direction) noexcept {
    return direction == SortDirection::Ascending ? "Ascending" : "Descending";
}

std::string_view to_string(RankPolicy policy) noexcept {
    return policy == RankPolicy::LatencyFirst ? "latency" : "throughput";
}

std::vector<ProbeResult> sort_results(const std::vector<ProbeResult>& results, const SortSpec& spec) {
    std::vector<ProbeResult> view = results;
    const bool ascending = spec.direction == SortDirection::Ascending;

    if (numeric_column(spec.column)) {
        std::ranges::stable_sort(view, [&](const ProbeResult& a, const ProbeResult& b) {
            if (a.is_success() != b.is_success())
                return a.is_success();
            if (!a.is_success())
                return false;
            double ka = numeric_key(a, spec.column);
            double kb = numeric_key(b, spec.column);
            return ascending ? ka < kb : kb < ka;
        });
    } else {
        std::ranges::stable_sort(view, [&](const ProbeResult& a, const ProbeResult& b) {
            auto ka = text_key(a, spec.column);
            auto kb = text_key(b, spec.column);
            return ascending ? ka < kb : kb < ka;
        });
    }
    return view;
}

bool ranks_better(const ProbeResult& a, const ProbeResult& b, RankPolicy policy) {
    const double lat_a = a.latency ? a.latency->count() : 0.0;
    const double lat_b = b.latency ? b.latency->count() : 0.0;
    const double tp_a = a.throughput_mbps.value_or(0.0);
    const double tp_b = b.throughput_mbps.value_or(0.0);

    if (policy == RankPolicy::LatencyFirst) {
        if (lat_a != lat_b)
            return lat_a < lat_b;
        return tp_a > tp_b;
    }

    if (std::abs(tp_a - tp_b) > Config::THROUGHPUT_TIE_MBPS)
        return tp_a > tp_b;
    return lat_a < lat_b;
}

void ResultTable::begin_run(std::vector<Target> targets) {
    targets_ = std::move(targets);
    results_.clear();
    results_.reserve(targets_.size());
    for (std::size_t i = 0; i < targets_.size(); ++i) {
        ProbeResult slot;
        slot.index = i;
        slot.target = targets_[i];
        results_.push_back(std::move(slot));
    }
    completed_ = 0;
    last_index_.reset();
    best_index_.reset();
    status_ = RunStatus::Running;
}

void ResultTable::record(ProbeResult result) {
    if (result.index >= results_.size()) {
        Log::warn("Dropping result for unknown target index {}", result.index);
        return;
    }

    auto& slot = results_[result.index];
    if (slot.is_terminal()) {
        Log::warn("Ignoring second result for {}", slot.target.id);
        return;
    }
    if (!result.is_terminal()) {
        return;
    }

    slot = std::move(result);
    last_index_ = slot.index;

    if (slot.is_success() &&
        (!best_index_ || ranks_better(slot, results_[*best_index_], policy_))) {
        best_index_ = slot.index;
    }
}

bool ResultTable::apply(const WorkerEvent& event) {
    return std::visit(
        [this](const auto& ev) -> bool {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, ResultEvent>) {
                record(ev.result);
                return false;
            } else if constexpr (std::is_same_v<T, ProgressEvent>) {
                completed_ = std::min(ev.completed, results_.size());
                return false;
            } else if constexpr (std::is_same_v<T, RunCompleteEvent>) {
                status_ = RunStatus::Completed;
                return true;
            } else {
                status_ = RunStatus::Cancelled;
                return true;
            }
        },
        event);
}

void ResultTable::reset() {
    results_.clear();
    completed_ = 0;
    last_index_.reset();
    best_index_.reset();
    status_ = RunStatus::Idle;
}

void ResultTable::set_rank_policy(RankPolicy policy) {
    policy_ = policy;
    best_index_.reset();
    for (const auto& r : results_) {
        if (r.is_success() && (!best_index_ || ranks_better(r, results_[*best_index_], policy_)))
            best_index_ = r.index;
    }
}

std::size_t ResultTable::success_count() const noexcept {
    return static_cast<std::size_t>(
        std::ranges::count_if(results_, [](const ProbeResult& r) { return r.is_success(); }));
}

std::vector<ProbeResult> ResultTable::terminal_results() const {
    std::vector<ProbeResult> out;
    for (const auto& r : results_) {
        if (r.is_terminal())
            out.push_back(r);
    }
    return out;
}

const ProbeResult* ResultTable::last_result() const noexcept {
    return last_index_ ? &results_[*last_index_] : nullptr;
}

const ProbeResult* ResultTable::best() const noexcept {
    return best_index_ ? &results_[*best_index_] : nullptr;
}

}  // namespace vantage::core
