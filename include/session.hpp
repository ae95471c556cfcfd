/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "benchmark_worker.hpp"
#include "dns_applier.hpp"
#include "prober.hpp"
#include "result_table.hpp"
#include "target.hpp"

namespace vantage::core {

enum class Screen { Input, Running, Results };

using Mode = TargetKind;

struct StatusMessage {
    std::string text;
    bool is_error = false;
};

struct SessionOptions {
    WorkerOptions worker;
    RankPolicy rank = RankPolicy::LatencyFirst;
    SortSpec sort;
    Mode mode = Mode::Dns;
};

[[nodiscard]] std::string_view to_string(Screen screen) noexcept;

// Owns everything one interactive run needs: the per-mode target lists, the
// active worker, the result table and the transient status line. All methods
// are called from the control thread and return without blocking on I/O.
class Session {
    std::shared_ptr<Prober> prober_;
    os::DnsApplier& applier_;
    WorkerOptions worker_options_;

    Screen screen_ = Screen::Input;
    Mode mode_;
    std::vector<Target> dns_targets_;
    std::vector<Target> mirror_targets_;
    ResultTable table_;
    SortSpec sort_;

    std::unique_ptr<BenchmarkWorker> worker_;
    // Workers past their terminal event whose timed-out probes are still
    // unwinding. Released from poll() once they have exited.
    std::vector<std::unique_ptr<BenchmarkWorker>> retired_;
    bool reset_pending_ = false;
    bool quit_requested_ = false;

    std::future<std::expected<void, os::ApplyError>> apply_future_;
    std::string apply_address_;
    std::optional<std::expected<void, os::ApplyError>> last_apply_;

    std::optional<StatusMessage> status_;

    std::vector<Target>& active_targets() noexcept;
    void handle_event(const WorkerEvent& event);
    void finish_run();
    void poll_apply();
    void set_status(std::string text, bool is_error = false);
    bool reject_while_running(std::string_view action);

   public:
    Session(std::shared_ptr<Prober> prober, os::DnsApplier& applier, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Validates `text` for the current mode; duplicates are rejected.
    std::expected<void, std::string> add_target(std::string_view text, std::string_view label = {});

    // Appends each target to the list of its own kind without the duplicate
    // check (file imports, mirror sets). Returns how many were taken.
    std::size_t add_targets(const std::vector<Target>& targets);

    std::optional<Target> remove_last_target();

    // Input or Results -> Running. Requires a non-empty target list.
    bool start();

    // Drains pending worker events and a finished apply. Never blocks.
    void poll();

    // Running -> Results once the worker acknowledges.
    bool cancel();

    // Results -> Input; while Running this cancels first and completes the
    // reset when the worker's terminal event arrives.
    void reset();

    bool toggle_mode();
    void cycle_sort_column();
    void toggle_sort_direction();
    void set_sort(SortSpec spec);
    void set_rank_policy(RankPolicy policy);

    // Applies the best DNS result on a background task. Results screen and
    // Dns mode only.
    bool apply_best();

    void quit();

    // Polls until no run or apply is outstanding. False on timeout.
    bool wait_until_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] Screen screen() const noexcept { return screen_; }
    [[nodiscard]] Mode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::vector<Target>& targets() const noexcept {
        return mode_ == Mode::Dns ? dns_targets_ : mirror_targets_;
    }
    [[nodiscard]] const std::vector<Target>& targets(Mode mode) const noexcept {
        return mode == Mode::Dns ? dns_targets_ : mirror_targets_;
    }
    [[nodiscard]] const ResultTable& table() const noexcept { return table_; }
    [[nodiscard]] const SortSpec& sort() const noexcept { return sort_; }
    [[nodiscard]] std::vector<ProbeResult> sorted_results() const { return table_.sorted(sort_); }

    [[nodiscard]] const std::optional<StatusMessage>& status() const noexcept { return status_; }
    void clear_status() noexcept { status_.reset(); }

    [[nodiscard]] bool busy() const noexcept { return worker_ != nullptr || apply_future_.valid(); }
    [[nodiscard]] bool applying() const noexcept { return apply_future_.valid(); }
    [[nodiscard]] bool reset_pending() const noexcept { return reset_pending_; }
    [[nodiscard]] std::size_t retired_workers() const noexcept { return retired_.size(); }
    [[nodiscard]] bool quit_requested() const noexcept { return quit_requested_; }
    [[nodiscard]] const std::optional<std::expected<void, os::ApplyError>>& last_apply() const noexcept {
        return last_apply_;
    }
    [[nodiscard]] std::string_view platform() const noexcept { return applier_.platform(); }
};

}  // namespace vantage::core
