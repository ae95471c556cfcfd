/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "benchmark_worker.hpp"
#include "results.hpp"
#include "target.hpp"

namespace vantage::core {

enum class SortColumn { Identifier, Latency, Throughput, Label };
enum class SortDirection { Ascending, Descending };

struct SortSpec {
    SortColumn column = SortColumn::Throughput;
    SortDirection direction = SortDirection::Descending;

    bool operator==(const SortSpec&) const = default;
};

// How "best" is decided for apply and highlighting.
enum class RankPolicy {
    LatencyFirst,     // lowest latency, ties -> higher throughput
    ThroughputFirst,  // higher throughput, near-ties -> lower latency
};

[[nodiscard]] std::string_view to_string(SortColumn column) noexcept;
[[nodiscard]] std::string_view to_string(SortDirection direction) noexcept;
[[nodiscard]] std::string_view to_string(RankPolicy policy) noexcept;

// Stable ordering of `results` under `spec`. Latency/Throughput place every
// non-Success entry after all Success entries in both directions.
[[nodiscard]] std::vector<ProbeResult> sort_results(const std::vector<ProbeResult>& results,
                                                    const SortSpec& spec);

// True when `a` ranks strictly better than `b`; both must be Success.
[[nodiscard]] bool ranks_better(const ProbeResult& a, const ProbeResult& b, RankPolicy policy);

// Run state for one benchmark invocation. Fed by worker events on the
// control thread; never touched by the worker itself.
class ResultTable {
    std::vector<Target> targets_;
    std::vector<ProbeResult> results_;
    RunStatus status_ = RunStatus::Idle;
    std::size_t completed_ = 0;
    std::optional<std::size_t> last_index_;
    std::optional<std::size_t> best_index_;
    RankPolicy policy_ = RankPolicy::LatencyFirst;

    void record(ProbeResult result);

   public:
    ResultTable() = default;
    explicit ResultTable(RankPolicy policy) : policy_(policy) {}

    // Discards prior results and creates one Pending slot per target.
    void begin_run(std::vector<Target> targets);

    // Returns true when the event ended the run.
    bool apply(const WorkerEvent& event);

    // Drops results and returns to Idle, keeping the target list.
    void reset();

    void set_rank_policy(RankPolicy policy);

    [[nodiscard]] const std::vector<Target>& targets() const noexcept { return targets_; }
    [[nodiscard]] const std::vector<ProbeResult>& results() const noexcept { return results_; }
    [[nodiscard]] RunStatus status() const noexcept { return status_; }
    [[nodiscard]] RankPolicy rank_policy() const noexcept { return policy_; }

    [[nodiscard]] std::size_t completed() const noexcept { return completed_; }
    [[nodiscard]] std::size_t total() const noexcept { return targets_.size(); }
    // Index of the target currently being probed while Running.
    [[nodiscard]] std::size_t current_index() const noexcept { return completed_; }

    [[nodiscard]] std::size_t success_count() const noexcept;
    [[nodiscard]] std::vector<ProbeResult> terminal_results() const;

    [[nodiscard]] const ProbeResult* last_result() const noexcept;
    [[nodiscard]] const ProbeResult* best() const noexcept;

    [[nodiscard]] std::vector<ProbeResult> sorted(const SortSpec& spec) const {
        return sort_results(results_, spec);
    }
};

}  // namespace vantage::core
