/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/benchmark_worker.hpp"

#include <format>
#include <stdexcept>
#include <utility>

#include "include/log.hpp"
#include "include/timeout_guard.hpp"

namespace vantage::core {

BenchmarkWorker::BenchmarkWorker(std::vector<Target> targets,
                                 std::shared_ptr<Prober> prober,
                                 WorkerOptions options)
    : targets_(std::move(targets)),
      prober_(std::move(prober)),
      options_(options),
      events_(std::make_shared<EventChannel<WorkerEvent>>()) {
    if (!prober_) {
        throw std::invalid_argument("BenchmarkWorker: prober is required");
    }
}

BenchmarkWorker::~BenchmarkWorker() {
    cancel();
    join();
}

void BenchmarkWorker::start() {
    if (thread_.joinable()) {
        throw std::logic_error("BenchmarkWorker already started");
    }
    thread_ = std::jthread([this](std::stop_token stop) {
        run(stop);
        exited_.store(true, std::memory_order_release);
    });
}

void BenchmarkWorker::cancel() noexcept {
    if (thread_.joinable()) {
        thread_.request_stop();
    }
}

bool BenchmarkWorker::cancel_requested() const noexcept {
    return thread_.joinable() && thread_.get_stop_token().stop_requested();
}

void BenchmarkWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

ProbeResult BenchmarkWorker::probe_one(TimeoutGuard& guard, std::size_t index) {
    ProbeResult result;
    result.index = index;
    result.target = targets_[index];

    auto prober = prober_;
    auto target = targets_[index];

    const auto started = std::chrono::steady_clock::now();
    auto outcome = guard.run([prober, target](std::stop_token stop) {
        return prober->probe(target, stop);
    });
    result.elapsed = std::chrono::steady_clock::now() - started;
    result.completed_at = std::chrono::system_clock::now();

    if (!outcome) {
        result.status = ProbeStatus::Timeout;
        result.reason = std::format("Timed out after {:.1f}s",
                                    std::chrono::duration<double>(guard.deadline()).count());
    } else if (!*outcome) {
        result.status = ProbeStatus::Failed;
        result.reason = outcome->error();
    } else {
        result.status = ProbeStatus::Success;
        result.latency = (*outcome)->latency;
        result.throughput_mbps = (*outcome)->throughput_mbps;
    }

    Log::debug("{} -> {} ({:.0f} ms){}",
               result.target.id,
               to_string(result.status),
               result.elapsed.count(),
               result.reason.empty() ? "" : std::format(": {}", result.reason));
    return result;
}

void BenchmarkWorker::run(std::stop_token stop) {
    const std::size_t total = targets_.size();
    std::size_t completed = 0;
    bool cancelled = false;

    // Destroyed after the terminal event is queued; joining stragglers must
    // not hold it back.
    TimeoutGuard guard(options_.deadline);

    for (std::size_t i = 0; i < total; ++i) {
        if (stop.stop_requested()) {
            cancelled = true;
            break;
        }

        events_->push(ResultEvent{probe_one(guard, i)});
        ++completed;
        events_->push(ProgressEvent{completed, total});
    }

    if (cancelled) {
        Log::debug("Run cancelled after {}/{} target(s)", completed, total);
        events_->push(CancelledEvent{completed, total});
    } else {
        events_->push(RunCompleteEvent{total});
    }
    finished_.store(true, std::memory_order_release);
}

}  // namespace vantage::core
