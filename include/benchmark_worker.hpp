/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <thread>
#include <variant>
#include <vector>

#include "config.hpp"
#include "event_channel.hpp"
#include "prober.hpp"
#include "results.hpp"
#include "target.hpp"

namespace vantage::core {

class TimeoutGuard;

struct ResultEvent {
    ProbeResult result;
};

struct ProgressEvent {
    std::size_t completed = 0;
    std::size_t total = 0;
};

struct RunCompleteEvent {
    std::size_t total = 0;
};

struct CancelledEvent {
    std::size_t completed = 0;
    std::size_t total = 0;
};

using WorkerEvent = std::variant<ResultEvent, ProgressEvent, RunCompleteEvent, CancelledEvent>;

struct WorkerOptions {
    std::chrono::milliseconds deadline = Config::PROBE_DEADLINE;
};

// Probes targets one at a time on a background thread. For every target it
// emits a ResultEvent then a ProgressEvent; the run ends with exactly one
// RunCompleteEvent or CancelledEvent. Cancellation is observed between
// targets only. Timed-out probes are joined after the terminal event, so the
// thread may outlive it.
class BenchmarkWorker {
    std::vector<Target> targets_;
    std::shared_ptr<Prober> prober_;
    WorkerOptions options_;
    std::shared_ptr<EventChannel<WorkerEvent>> events_;
    std::atomic<bool> finished_{false};
    std::atomic<bool> exited_{false};
    std::jthread thread_;

    void run(std::stop_token stop);
    ProbeResult probe_one(TimeoutGuard& guard, std::size_t index);

   public:
    BenchmarkWorker(std::vector<Target> targets,
                    std::shared_ptr<Prober> prober,
                    WorkerOptions options = {});
    ~BenchmarkWorker();

    BenchmarkWorker(const BenchmarkWorker&) = delete;
    BenchmarkWorker& operator=(const BenchmarkWorker&) = delete;

    void start();
    void cancel() noexcept;
    void join();

    [[nodiscard]] bool started() const noexcept { return thread_.joinable(); }
    [[nodiscard]] bool cancel_requested() const noexcept;
    // True once the terminal event has been queued.
    [[nodiscard]] bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }
    // True once every abandoned probe has unwound and join() cannot block.
    [[nodiscard]] bool exited() const noexcept { return exited_.load(std::memory_order_acquire); }
    [[nodiscard]] std::size_t total() const noexcept { return targets_.size(); }

    [[nodiscard]] EventChannel<WorkerEvent>& events() noexcept { return *events_; }
};

}  // namespace vantage::core
